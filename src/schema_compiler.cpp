#include "dynrec/compiler/schema_compiler.hpp"
#include "dynrec/errors.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace dynrec {

namespace {

// Descriptors built without InterfaceBuilder are told apart by their operations
std::string identity_of(const InterfaceDescriptor& descriptor) {
    if (!descriptor.cpp_type.empty()) {
        return descriptor.cpp_type;
    }
    std::string identity = "interface {";
    for (std::size_t i = 0; i < descriptor.operations.size(); ++i) {
        identity += (i ? "," : "") + descriptor.operations[i].name;
    }
    return identity + "}";
}

} // namespace

SchemaDefinition SchemaCompiler::compile(const InterfaceDescriptor& descriptor) const {
    CompileContext context;
    return compile_record(descriptor, context);
}

SchemaType SchemaCompiler::compile_record(const InterfaceDescriptor& descriptor, CompileContext& context) const {
    const std::string name_space = descriptor.name_space.empty() ? config_.default_namespace : descriptor.name_space;
    const std::string full_name = name_space.empty() ? descriptor.name : name_space + "." + descriptor.name;

    context.define(full_name, identity_of(descriptor));

    auto& in_progress = context.in_progress;
    if (std::find(in_progress.begin(), in_progress.end(), full_name) != in_progress.end()) {
        return SchemaType::reference(full_name);
    }
    in_progress.push_back(full_name);

    RecordInterfaceDescriptor partition = partition_operations(descriptor, config_.verbose);
    TypeMapper mapper(*this, context);

    std::vector<SchemaField> fields;
    fields.reserve(partition.fields.size());
    for (const auto& field : partition.fields) {
        try {
            SchemaField compiled{
                .name = field.name,
                .type = mapper.resolve(field.value_type(), field.metadata),
                .default_value = std::nullopt,
                .doc = doc_of(field.metadata),
                .aliases = aliases_of(field.metadata),
            };
            if (!field.required) {
                compiled.default_value = Value::null();
            }
            fields.push_back(std::move(compiled));
        } catch (const ValueMappingException& e) {
            throw ValueMappingException("failed to map field " + field.name + ": " + e.what(),
                                        field.name, std::current_exception());
        }
    }

    in_progress.pop_back();

    if (config_.verbose) {
        std::cout << "[SchemaCompiler] compiled record " << full_name << " with "
                  << fields.size() << " fields\n";
    }
    return SchemaType::record(descriptor.name, name_space, std::move(fields), descriptor.doc);
}

} // namespace dynrec
