#include "dynrec/schema/schema.hpp"
#include "dynrec/errors.hpp"

#include <algorithm>
#include <sstream>

namespace dynrec {

SchemaType::SchemaType() : kind_(SchemaKind::Null) {}
SchemaType::SchemaType(SchemaKind kind) : kind_(kind) {}
SchemaType::SchemaType(const SchemaType&) = default;
SchemaType::SchemaType(SchemaType&&) noexcept = default;
SchemaType& SchemaType::operator=(const SchemaType&) = default;
SchemaType& SchemaType::operator=(SchemaType&&) noexcept = default;
SchemaType::~SchemaType() = default;

SchemaType SchemaType::null() { return SchemaType(SchemaKind::Null); }
SchemaType SchemaType::boolean() { return SchemaType(SchemaKind::Boolean); }
SchemaType SchemaType::int32() { return SchemaType(SchemaKind::Int); }
SchemaType SchemaType::int64() { return SchemaType(SchemaKind::Long); }
SchemaType SchemaType::float32() { return SchemaType(SchemaKind::Float); }
SchemaType SchemaType::float64() { return SchemaType(SchemaKind::Double); }
SchemaType SchemaType::bytes() { return SchemaType(SchemaKind::Bytes); }
SchemaType SchemaType::string() { return SchemaType(SchemaKind::String); }

SchemaType SchemaType::record(std::string name, std::string name_space,
                              std::vector<SchemaField> fields, std::string doc) {
    SchemaType type(SchemaKind::Record);
    type.name_ = std::move(name);
    type.namespace_ = std::move(name_space);
    type.fields_ = std::move(fields);
    type.doc_ = std::move(doc);
    return type;
}

SchemaType SchemaType::enumeration(std::string name, std::string name_space,
                                   std::vector<std::string> symbols) {
    SchemaType type(SchemaKind::Enum);
    type.name_ = std::move(name);
    type.namespace_ = std::move(name_space);
    type.symbols_ = std::move(symbols);
    return type;
}

SchemaType SchemaType::array(SchemaType items) {
    SchemaType type(SchemaKind::Array);
    type.children_.push_back(std::move(items));
    return type;
}

SchemaType SchemaType::map(SchemaType values) {
    SchemaType type(SchemaKind::Map);
    type.children_.push_back(std::move(values));
    return type;
}

SchemaType SchemaType::union_of(std::vector<SchemaType> branches) {
    SchemaType type(SchemaKind::Union);
    type.children_ = std::move(branches);
    return type;
}

SchemaType SchemaType::reference(std::string full_name) {
    SchemaType type(SchemaKind::Reference);
    type.name_ = std::move(full_name);
    return type;
}

SchemaType SchemaType::nullable(SchemaType type) {
    if (type.is_nullable()) {
        return type;
    }
    std::vector<SchemaType> branches;
    branches.push_back(SchemaType::null());
    branches.push_back(std::move(type));
    return union_of(std::move(branches));
}

bool SchemaType::is_primitive() const {
    switch (kind_) {
        case SchemaKind::Null:
        case SchemaKind::Boolean:
        case SchemaKind::Int:
        case SchemaKind::Long:
        case SchemaKind::Float:
        case SchemaKind::Double:
        case SchemaKind::Bytes:
        case SchemaKind::String:
            return true;
        default:
            return false;
    }
}

bool SchemaType::is_named() const {
    return kind_ == SchemaKind::Record || kind_ == SchemaKind::Enum;
}

std::string SchemaType::full_name() const {
    if (namespace_.empty()) {
        return name_;
    }
    return namespace_ + "." + name_;
}

const std::vector<SchemaField>& SchemaType::fields() const {
    return fields_;
}

const SchemaField* SchemaType::field(std::string_view name) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const SchemaField& f) { return f.name == name; });
    return it == fields_.end() ? nullptr : &*it;
}

std::optional<std::size_t> SchemaType::field_index(std::string_view name) const {
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

bool SchemaType::has_symbol(std::string_view symbol) const {
    return std::find(symbols_.begin(), symbols_.end(), symbol) != symbols_.end();
}

const SchemaType& SchemaType::items() const {
    if (kind_ != SchemaKind::Array) {
        throw Error(std::string("items() requested on ") + to_string(kind_) + " schema");
    }
    return children_.front();
}

const SchemaType& SchemaType::values() const {
    if (kind_ != SchemaKind::Map) {
        throw Error(std::string("values() requested on ") + to_string(kind_) + " schema");
    }
    return children_.front();
}

bool SchemaType::is_nullable() const {
    if (kind_ == SchemaKind::Null) {
        return true;
    }
    if (kind_ != SchemaKind::Union) {
        return false;
    }
    return std::any_of(children_.begin(), children_.end(),
                       [](const SchemaType& b) { return b.kind() == SchemaKind::Null; });
}

const SchemaType& SchemaType::non_null() const {
    if (kind_ == SchemaKind::Union && children_.size() == 2) {
        if (children_[0].kind() == SchemaKind::Null) {
            return children_[1];
        }
        if (children_[1].kind() == SchemaKind::Null) {
            return children_[0];
        }
    }
    return *this;
}

bool operator==(const SchemaType& lhs, const SchemaType& rhs) {
    return lhs.kind_ == rhs.kind_
        && lhs.name_ == rhs.name_
        && lhs.namespace_ == rhs.namespace_
        && lhs.doc_ == rhs.doc_
        && lhs.fields_ == rhs.fields_
        && lhs.symbols_ == rhs.symbols_
        && lhs.children_ == rhs.children_;
}

bool operator==(const SchemaField& lhs, const SchemaField& rhs) {
    return lhs.name == rhs.name
        && lhs.type == rhs.type
        && lhs.default_value == rhs.default_value
        && lhs.doc == rhs.doc
        && lhs.aliases == rhs.aliases;
}

namespace {

void describe_into(std::ostringstream& out, const SchemaType& type) {
    switch (type.kind()) {
        case SchemaKind::Record:
            out << "record " << type.full_name() << "{";
            for (std::size_t i = 0; i < type.fields().size(); ++i) {
                const auto& f = type.fields()[i];
                out << (i ? ", " : "") << f.name << ":";
                describe_into(out, f.type);
                if (f.default_value) {
                    out << "=" << f.default_value->describe();
                }
            }
            out << "}";
            break;
        case SchemaKind::Enum:
            out << "enum " << type.full_name() << "{";
            for (std::size_t i = 0; i < type.symbols().size(); ++i) {
                out << (i ? "," : "") << type.symbols()[i];
            }
            out << "}";
            break;
        case SchemaKind::Array:
            out << "array<";
            describe_into(out, type.items());
            out << ">";
            break;
        case SchemaKind::Map:
            out << "map<";
            describe_into(out, type.values());
            out << ">";
            break;
        case SchemaKind::Union:
            out << "[";
            for (std::size_t i = 0; i < type.branches().size(); ++i) {
                if (i) {
                    out << ",";
                }
                describe_into(out, type.branches()[i]);
            }
            out << "]";
            break;
        case SchemaKind::Reference:
            out << "ref " << type.name();
            break;
        default:
            out << to_string(type.kind());
            break;
    }
}

} // namespace

std::string describe(const SchemaType& type) {
    std::ostringstream out;
    describe_into(out, type);
    return out.str();
}

std::ostream& operator<<(std::ostream& os, const SchemaType& type) {
    return os << describe(type);
}

} // namespace dynrec
