#include "dynrec/compiler/type_mapper.hpp"
#include "dynrec/compiler/schema_compiler.hpp"
#include "dynrec/errors.hpp"

namespace dynrec {

void CompileContext::define(const std::string& full_name, const std::string& identity) {
    auto [it, inserted] = defined.emplace(full_name, identity);
    if (!inserted && it->second != identity) {
        throw ValueMappingException(full_name + ": name already used by a different type (" +
                                    it->second + ", then " + identity + ")");
    }
}

SchemaType TypeMapper::resolve(const TypeRef& declared, const MetadataSet& metadata) const {
    SchemaType base = resolve_base(declared, metadata);

    auto it = metadata.find(MetadataKind::Field);
    if (it != metadata.end() && !std::get<Field>(it->second).required) {
        return SchemaType::nullable(std::move(base));
    }
    return base;
}

SchemaType TypeMapper::resolve_base(const TypeRef& declared, const MetadataSet& metadata) const {
    switch (declared.category) {
        case TypeCategory::Record:
            if (!declared.describe_record) {
                throw ValueMappingException(declared.name + ": record interface without descriptor");
            }
            return compiler_.compile_record(declared.describe_record(), context_);

        case TypeCategory::String:  return SchemaType::string();
        case TypeCategory::Boolean: return SchemaType::boolean();
        case TypeCategory::Int32:   return SchemaType::int32();
        case TypeCategory::Int64:   return SchemaType::int64();
        case TypeCategory::Float32: return SchemaType::float32();
        case TypeCategory::Float64: return SchemaType::float64();
        case TypeCategory::Bytes:   return SchemaType::bytes();

        case TypeCategory::Enum: {
            const std::string& name_space = compiler_.config().default_namespace;
            std::string identity = "enum {";
            for (std::size_t i = 0; i < declared.symbols.size(); ++i) {
                identity += (i ? "," : "") + declared.symbols[i];
            }
            identity += "}";
            context_.define(name_space.empty() ? declared.name : name_space + "." + declared.name, identity);
            return SchemaType::enumeration(declared.name, name_space, declared.symbols);
        }

        case TypeCategory::List:
            if (declared.arguments.size() != 1) {
                throw ValueMappingException(declared.name + ": sequence needs exactly one type argument");
            }
            return SchemaType::array(resolve(declared.arguments[0], metadata));

        case TypeCategory::Map:
            if (declared.arguments.size() != 2) {
                throw ValueMappingException(declared.name + ": map needs a key and a value type argument");
            }
            if (declared.arguments[0].category != TypeCategory::String) {
                throw ValueMappingException(declared.name + ": map keys must be strings, got " +
                                            declared.arguments[0].name);
            }
            return SchemaType::map(resolve(declared.arguments[1], metadata));

        case TypeCategory::Unsupported:
            break;
    }
    throw ValueMappingException(declared.name + ": unsupported type");
}

SchemaType resolve_type(const TypeRef& declared, const MetadataSet& metadata) {
    SchemaCompiler compiler;
    CompileContext context;
    return TypeMapper(compiler, context).resolve(declared, metadata);
}

} // namespace dynrec
