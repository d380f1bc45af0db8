/**
 * @file schema.hpp
 * @brief Compiled schema model (Avro-compatible)
 *
 * SchemaType is a value-semantic tree describing a schema-format type:
 * primitives, records, enums, arrays, maps, unions and named references.
 * A compiled record interface is a SchemaType of kind Record
 * (SchemaDefinition).
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/value/value.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace dynrec {

enum class SchemaKind {
    Null,
    Boolean,
    Int,
    Long,
    Float,
    Double,
    Bytes,
    String,
    Record,
    Enum,
    Array,
    Map,
    Union,
    Reference   ///< Named reference to a record being defined (recursive types)
};

constexpr const char* to_string(SchemaKind kind) {
    switch (kind) {
        case SchemaKind::Null:      return "null";
        case SchemaKind::Boolean:   return "boolean";
        case SchemaKind::Int:       return "int";
        case SchemaKind::Long:      return "long";
        case SchemaKind::Float:     return "float";
        case SchemaKind::Double:    return "double";
        case SchemaKind::Bytes:     return "bytes";
        case SchemaKind::String:    return "string";
        case SchemaKind::Record:    return "record";
        case SchemaKind::Enum:      return "enum";
        case SchemaKind::Array:     return "array";
        case SchemaKind::Map:       return "map";
        case SchemaKind::Union:     return "union";
        case SchemaKind::Reference: return "reference";
    }
    return "unknown";
}

struct SchemaField;

class SchemaType {
public:
    // ========================================================================
    // Factories
    // ========================================================================

    static SchemaType null();
    static SchemaType boolean();
    static SchemaType int32();
    static SchemaType int64();
    static SchemaType float32();
    static SchemaType float64();
    static SchemaType bytes();
    static SchemaType string();

    static SchemaType record(std::string name, std::string name_space,
                             std::vector<SchemaField> fields, std::string doc = {});
    static SchemaType enumeration(std::string name, std::string name_space,
                                  std::vector<std::string> symbols);
    static SchemaType array(SchemaType items);
    static SchemaType map(SchemaType values);
    static SchemaType union_of(std::vector<SchemaType> branches);
    static SchemaType reference(std::string full_name);

    /// null-or-T union
    static SchemaType nullable(SchemaType type);

    SchemaType();
    SchemaType(const SchemaType&);
    SchemaType(SchemaType&&) noexcept;
    SchemaType& operator=(const SchemaType&);
    SchemaType& operator=(SchemaType&&) noexcept;
    ~SchemaType();

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] SchemaKind kind() const { return kind_; }
    [[nodiscard]] bool is_primitive() const;
    [[nodiscard]] bool is_named() const;

    /// Record/enum simple name, or the referenced full name for Reference
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& name_space() const { return namespace_; }
    [[nodiscard]] std::string full_name() const;
    [[nodiscard]] const std::string& doc() const { return doc_; }

    /// Record fields, in declaration order
    [[nodiscard]] const std::vector<SchemaField>& fields() const;
    [[nodiscard]] const SchemaField* field(std::string_view name) const;
    [[nodiscard]] std::optional<std::size_t> field_index(std::string_view name) const;

    /// Enum symbols, in declaration order
    [[nodiscard]] const std::vector<std::string>& symbols() const { return symbols_; }
    [[nodiscard]] bool has_symbol(std::string_view symbol) const;

    /// Array items
    [[nodiscard]] const SchemaType& items() const;
    /// Map values (keys are always strings)
    [[nodiscard]] const SchemaType& values() const;
    /// Union branches
    [[nodiscard]] const std::vector<SchemaType>& branches() const { return children_; }

    /// True for the null type and for unions containing null
    [[nodiscard]] bool is_nullable() const;

    /// For null-or-T unions, T; otherwise the type itself
    [[nodiscard]] const SchemaType& non_null() const;

    friend bool operator==(const SchemaType& lhs, const SchemaType& rhs);

private:
    explicit SchemaType(SchemaKind kind);

    SchemaKind kind_;
    std::string name_;
    std::string namespace_;
    std::string doc_;
    std::vector<SchemaField> fields_;
    std::vector<std::string> symbols_;
    std::vector<SchemaType> children_;  ///< Union branches, or the single array item / map value type
};

/**
 * @brief One record field
 *
 * default_value is set (to null) for optional fields; required fields carry
 * no default.
 */
struct SchemaField {
    std::string name;
    SchemaType type;
    std::optional<Value> default_value;
    std::string doc;
    std::vector<std::string> aliases;

    friend bool operator==(const SchemaField& lhs, const SchemaField& rhs);
};

/// A compiled record interface: a SchemaType of kind Record
using SchemaDefinition = SchemaType;

/// Compact textual form, e.g. record Person{name:string, age:[null,int]}
std::string describe(const SchemaType& type);

std::ostream& operator<<(std::ostream& os, const SchemaType& type);

} // namespace dynrec
