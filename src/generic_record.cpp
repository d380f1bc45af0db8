#include "dynrec/value/generic_record.hpp"
#include "dynrec/errors.hpp"

#include <algorithm>

namespace dynrec {

namespace {

const SchemaType* find_named_record(const SchemaType& type, const std::string& full_name) {
    switch (type.kind()) {
        case SchemaKind::Record:
            if (type.full_name() == full_name) {
                return &type;
            }
            for (const auto& f : type.fields()) {
                if (const auto* found = find_named_record(f.type, full_name)) {
                    return found;
                }
            }
            return nullptr;
        case SchemaKind::Array:
            return find_named_record(type.items(), full_name);
        case SchemaKind::Map:
            return find_named_record(type.values(), full_name);
        case SchemaKind::Union:
            for (const auto& b : type.branches()) {
                if (const auto* found = find_named_record(b, full_name)) {
                    return found;
                }
            }
            return nullptr;
        default:
            return nullptr;
    }
}

} // namespace

bool conforms(const Value& value, const SchemaType& type) {
    switch (type.kind()) {
        case SchemaKind::Null:    return value.is_null();
        case SchemaKind::Boolean: return value.holds<bool>();
        case SchemaKind::Int:     return value.holds<int32_t>();
        case SchemaKind::Long:    return value.holds<int64_t>();
        case SchemaKind::Float:   return value.holds<float>();
        case SchemaKind::Double:  return value.holds<double>();
        case SchemaKind::String:  return value.holds<std::string>();
        case SchemaKind::Bytes:   return value.holds<Bytes>();
        case SchemaKind::Enum: {
            const auto* symbol = value.get_if<EnumSymbol>();
            return symbol && type.has_symbol(symbol->symbol);
        }
        case SchemaKind::Array: {
            const auto* items = value.get_if<Value::Array>();
            return items && std::all_of(items->begin(), items->end(),
                                        [&](const Value& v) { return conforms(v, type.items()); });
        }
        case SchemaKind::Map: {
            const auto* entries = value.get_if<Value::Map>();
            return entries && std::all_of(entries->begin(), entries->end(),
                                          [&](const auto& kv) { return conforms(kv.second, type.values()); });
        }
        case SchemaKind::Union:
            return std::any_of(type.branches().begin(), type.branches().end(),
                               [&](const SchemaType& b) { return conforms(value, b); });
        case SchemaKind::Record: {
            const auto* record = value.get_if<Value::RecordPtr>();
            return record && *record && (*record)->schema().full_name() == type.full_name();
        }
        case SchemaKind::Reference: {
            const auto* record = value.get_if<Value::RecordPtr>();
            return record && *record && (*record)->schema().full_name() == type.name();
        }
    }
    return false;
}

GenericRecord::GenericRecord(std::shared_ptr<const SchemaDefinition> schema)
    : root_(std::move(schema))
    , schema_(root_.get()) {
    if (!schema_ || schema_->kind() != SchemaKind::Record) {
        throw InvalidFieldError("generic record requires a record schema");
    }
    values_.resize(schema_->fields().size());
}

GenericRecord::GenericRecord(ChildTag, std::shared_ptr<const SchemaType> root, const SchemaType* schema)
    : root_(std::move(root))
    , schema_(schema) {
    values_.resize(schema_->fields().size());
}

std::shared_ptr<GenericRecord> GenericRecord::create(std::shared_ptr<const SchemaDefinition> schema) {
    return std::make_shared<GenericRecord>(std::move(schema));
}

std::shared_ptr<GenericRecord> GenericRecord::create(SchemaDefinition schema) {
    return create(std::make_shared<const SchemaDefinition>(std::move(schema)));
}

bool GenericRecord::has_field(std::string_view field) const {
    return schema_->field_index(field).has_value();
}

std::size_t GenericRecord::index_of(std::string_view field) const {
    auto index = schema_->field_index(field);
    if (!index) {
        throw InvalidFieldError("record " + schema_->full_name() + " has no field '" + std::string(field) + "'");
    }
    return *index;
}

const SchemaType& GenericRecord::field_type(std::size_t index) const {
    return schema_->fields()[index].type;
}

const Value& GenericRecord::get(std::string_view field) const {
    return values_[index_of(field)];
}

void GenericRecord::set(std::string_view field, Value value) {
    const std::size_t index = index_of(field);
    if (!conforms(value, field_type(index))) {
        throw InvalidFieldError("value " + value.describe() + " does not match schema " +
                                describe(field_type(index)) + " of field '" + std::string(field) + "'");
    }
    values_[index] = std::move(value);
}

void GenericRecord::append_to(std::string_view field, Value item) {
    const std::size_t index = index_of(field);
    const SchemaType& type = field_type(index).non_null();
    if (type.kind() != SchemaKind::Array) {
        throw InvalidFieldError("field '" + std::string(field) + "' is not an array");
    }
    if (!conforms(item, type.items())) {
        throw InvalidFieldError("item " + item.describe() + " does not match items of field '" +
                                std::string(field) + "'");
    }
    Value& slot = values_[index];
    if (slot.is_null()) {
        slot = Value::array();
    }
    slot.as<Value::Array>().push_back(std::move(item));
}

void GenericRecord::put_into(std::string_view field, std::string key, Value value) {
    const std::size_t index = index_of(field);
    const SchemaType& type = field_type(index).non_null();
    if (type.kind() != SchemaKind::Map) {
        throw InvalidFieldError("field '" + std::string(field) + "' is not a map");
    }
    if (!conforms(value, type.values())) {
        throw InvalidFieldError("value " + value.describe() + " does not match values of field '" +
                                std::string(field) + "'");
    }
    Value& slot = values_[index];
    if (slot.is_null()) {
        slot = Value::map();
    }
    slot.as<Value::Map>().insert_or_assign(std::move(key), std::move(value));
}

bool GenericRecord::remove_from(std::string_view field, const Value& key) {
    const std::size_t index = index_of(field);
    const SchemaType& type = field_type(index).non_null();
    Value& slot = values_[index];

    if (type.kind() == SchemaKind::Map) {
        const auto* name = key.get_if<std::string>();
        if (!name) {
            throw InvalidFieldError("map keys of field '" + std::string(field) + "' are strings, got " +
                                    to_string(key.kind()));
        }
        if (slot.is_null()) {
            return false;
        }
        return slot.as<Value::Map>().erase(*name) > 0;
    }
    if (type.kind() == SchemaKind::Array) {
        if (slot.is_null()) {
            return false;
        }
        auto& items = slot.as<Value::Array>();
        auto it = std::find(items.begin(), items.end(), key);
        if (it == items.end()) {
            return false;
        }
        items.erase(it);
        return true;
    }
    throw InvalidFieldError("field '" + std::string(field) + "' is neither an array nor a map");
}

void GenericRecord::clear(std::string_view field) {
    const std::size_t index = index_of(field);
    if (!field_type(index).is_nullable()) {
        throw InvalidFieldError("field '" + std::string(field) + "' is required and cannot be cleared");
    }
    values_[index] = Value::null();
}

std::shared_ptr<GenericRecord> GenericRecord::create_child(std::string_view field) const {
    const SchemaType* type = &field_type(index_of(field)).non_null();
    if (type->kind() == SchemaKind::Array) {
        type = &type->items().non_null();
    } else if (type->kind() == SchemaKind::Map) {
        type = &type->values().non_null();
    }
    const SchemaType* child = nullptr;
    if (type->kind() == SchemaKind::Record) {
        child = type;
    } else if (type->kind() == SchemaKind::Reference) {
        child = find_named_record(*root_, type->name());
    }
    if (!child) {
        throw InvalidFieldError("field '" + std::string(field) + "' is not a record field");
    }
    return std::make_shared<GenericRecord>(ChildTag{}, root_, child);
}

std::optional<std::string> GenericRecord::first_missing_required() const {
    for (std::size_t i = 0; i < values_.size(); ++i) {
        if (values_[i].is_null() && !field_type(i).is_nullable()) {
            return schema_->fields()[i].name;
        }
    }
    return std::nullopt;
}

void GenericRecord::validate() const {
    if (auto missing = first_missing_required()) {
        throw RequiredFieldMissingException(*missing);
    }
}

bool operator==(const GenericRecord& lhs, const GenericRecord& rhs) {
    return lhs.schema_->full_name() == rhs.schema_->full_name() && lhs.values_ == rhs.values_;
}

} // namespace dynrec
