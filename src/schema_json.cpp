#include "dynrec/schema/schema_json.hpp"
#include "dynrec/errors.hpp"

#include <fstream>
#include <set>
#include <stdexcept>

namespace dynrec {

namespace {

using Object = rfl::Generic::Object;
using Array = rfl::Generic::Array;

rfl::Generic default_to_generic(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Null:    return rfl::Generic(std::nullopt);
        case ValueKind::Boolean: return rfl::Generic(value.as<bool>());
        case ValueKind::Int:     return rfl::Generic(static_cast<int64_t>(value.as<int32_t>()));
        case ValueKind::Long:    return rfl::Generic(value.as<int64_t>());
        case ValueKind::Float:   return rfl::Generic(static_cast<double>(value.as<float>()));
        case ValueKind::Double:  return rfl::Generic(value.as<double>());
        case ValueKind::String:  return rfl::Generic(value.as<std::string>());
        case ValueKind::Enum:    return rfl::Generic(value.as<EnumSymbol>().symbol);
        case ValueKind::Bytes: {
            // Avro encodes byte defaults as a string of code points 0-255
            std::string text;
            for (std::byte b : value.as<Bytes>()) {
                const auto c = static_cast<unsigned char>(b);
                if (c < 0x80) {
                    text.push_back(static_cast<char>(c));
                } else {
                    text.push_back(static_cast<char>(0xC0 | (c >> 6)));
                    text.push_back(static_cast<char>(0x80 | (c & 0x3F)));
                }
            }
            return rfl::Generic(text);
        }
        case ValueKind::Array: {
            Array items;
            for (const auto& item : value.as<Value::Array>()) {
                items.push_back(default_to_generic(item));
            }
            return rfl::Generic(items);
        }
        case ValueKind::Map: {
            Object entries;
            for (const auto& [key, item] : value.as<Value::Map>()) {
                entries[key] = default_to_generic(item);
            }
            return rfl::Generic(entries);
        }
        case ValueKind::Record:
            break;
    }
    throw InvalidFieldError("record default values cannot be exported");
}

class JsonWriter {
public:
    rfl::Generic write(const SchemaType& type) {
        switch (type.kind()) {
            case SchemaKind::Null:    return rfl::Generic(std::string("null"));
            case SchemaKind::Boolean: return rfl::Generic(std::string("boolean"));
            case SchemaKind::Int:     return rfl::Generic(std::string("int"));
            case SchemaKind::Long:    return rfl::Generic(std::string("long"));
            case SchemaKind::Float:   return rfl::Generic(std::string("float"));
            case SchemaKind::Double:  return rfl::Generic(std::string("double"));
            case SchemaKind::Bytes:   return rfl::Generic(std::string("bytes"));
            case SchemaKind::String:  return rfl::Generic(std::string("string"));
            case SchemaKind::Reference: return rfl::Generic(type.name());
            case SchemaKind::Record:  return write_record(type);
            case SchemaKind::Enum:    return write_enum(type);
            case SchemaKind::Array: {
                Object obj;
                obj["type"] = rfl::Generic(std::string("array"));
                obj["items"] = write(type.items());
                return rfl::Generic(obj);
            }
            case SchemaKind::Map: {
                Object obj;
                obj["type"] = rfl::Generic(std::string("map"));
                obj["values"] = write(type.values());
                return rfl::Generic(obj);
            }
            case SchemaKind::Union: {
                Array branches;
                for (const auto& branch : type.branches()) {
                    branches.push_back(write(branch));
                }
                return rfl::Generic(branches);
            }
        }
        throw std::logic_error("unhandled schema kind");
    }

private:
    // Returns true the first time a named type is seen
    bool first_occurrence(const SchemaType& type) {
        return emitted_.insert(type.full_name()).second;
    }

    // An empty namespace is written as "" inside a namespaced record so
    // readers do not resolve the name against the enclosing namespace
    void write_name(Object& obj, const SchemaType& type) {
        obj["name"] = rfl::Generic(type.name());
        if (!type.name_space().empty() || !enclosing_.empty()) {
            obj["namespace"] = rfl::Generic(type.name_space());
        }
    }

    rfl::Generic write_record(const SchemaType& type) {
        if (!first_occurrence(type)) {
            return rfl::Generic(type.full_name());
        }
        Object obj;
        obj["type"] = rfl::Generic(std::string("record"));
        write_name(obj, type);
        if (!type.doc().empty()) {
            obj["doc"] = rfl::Generic(type.doc());
        }

        const std::string outer = enclosing_;
        enclosing_ = type.name_space();
        Array fields;
        for (const auto& field : type.fields()) {
            Object f;
            f["name"] = rfl::Generic(field.name);
            f["type"] = write(field.type);
            if (!field.doc.empty()) {
                f["doc"] = rfl::Generic(field.doc);
            }
            if (!field.aliases.empty()) {
                Array aliases;
                for (const auto& alias : field.aliases) {
                    aliases.push_back(rfl::Generic(alias));
                }
                f["aliases"] = rfl::Generic(aliases);
            }
            if (field.default_value) {
                f["default"] = default_to_generic(*field.default_value);
            }
            fields.push_back(rfl::Generic(f));
        }
        enclosing_ = outer;
        obj["fields"] = rfl::Generic(fields);
        return rfl::Generic(obj);
    }

    rfl::Generic write_enum(const SchemaType& type) {
        if (!first_occurrence(type)) {
            return rfl::Generic(type.full_name());
        }
        Object obj;
        obj["type"] = rfl::Generic(std::string("enum"));
        write_name(obj, type);

        Array symbols;
        for (const auto& symbol : type.symbols()) {
            symbols.push_back(rfl::Generic(symbol));
        }
        obj["symbols"] = rfl::Generic(symbols);
        return rfl::Generic(obj);
    }

    std::set<std::string> emitted_;
    std::string enclosing_;
};

} // namespace

rfl::Generic to_generic(const SchemaType& schema) {
    return JsonWriter().write(schema);
}

std::string to_json(const SchemaType& schema) {
    return rfl::json::write(to_generic(schema));
}

void write_to_file(const SchemaType& schema, const std::string& filename) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    file << to_json(schema);
}

} // namespace dynrec
