/**
 * @file generic_record.hpp
 * @brief Schema-shaped key/value record container
 *
 * GenericRecord holds one Value per field of the record schema that shaped
 * it. Every write is checked against the field's schema type; every slot
 * starts out null.
 *
 * The record keeps the root schema alive and points at its own record type
 * inside that tree, so nested records created with create_child() share the
 * same compiled schema.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/schema/schema.hpp"
#include "dynrec/value/value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dynrec {

/// True if value is an instance of schema type
bool conforms(const Value& value, const SchemaType& type);

class GenericRecord {
    struct ChildTag {
        explicit ChildTag() = default;
    };

public:
    /**
     * @brief Create a record shaped by a compiled record schema
     * @throws InvalidFieldError if schema is not a record schema
     */
    explicit GenericRecord(std::shared_ptr<const SchemaDefinition> schema);

    /// Nested record inside root's tree; only create_child() can name ChildTag
    GenericRecord(ChildTag, std::shared_ptr<const SchemaType> root, const SchemaType* schema);

    static std::shared_ptr<GenericRecord> create(std::shared_ptr<const SchemaDefinition> schema);
    static std::shared_ptr<GenericRecord> create(SchemaDefinition schema);

    [[nodiscard]] const SchemaDefinition& schema() const { return *schema_; }
    [[nodiscard]] const std::shared_ptr<const SchemaType>& root_schema() const { return root_; }

    [[nodiscard]] bool has_field(std::string_view field) const;

    /// Current value, null when unset
    [[nodiscard]] const Value& get(std::string_view field) const;

    /// Replace the field value
    void set(std::string_view field, Value value);

    /// Append to an array field (a null field becomes an empty array first)
    void append_to(std::string_view field, Value item);

    /// Insert or replace a map entry (a null field becomes an empty map first)
    void put_into(std::string_view field, std::string key, Value value);

    /**
     * @brief Remove from a collection field
     *
     * Map fields remove the entry keyed by key (which must be a string value),
     * array fields remove the first element equal to key.
     *
     * @return true if something was removed
     */
    bool remove_from(std::string_view field, const Value& key);

    /// Reset a field to null
    void clear(std::string_view field);

    /**
     * @brief Create an empty record for a record-typed field
     *
     * Works for record fields and for arrays/maps of records. The child is not
     * attached; set() it (or append/put it) explicitly.
     */
    [[nodiscard]] std::shared_ptr<GenericRecord> create_child(std::string_view field) const;

    /// First field whose type is not nullable and which still holds null
    [[nodiscard]] std::optional<std::string> first_missing_required() const;

    /// @throws RequiredFieldMissingException naming the first missing required field
    void validate() const;

    friend bool operator==(const GenericRecord& lhs, const GenericRecord& rhs);

private:
    [[nodiscard]] std::size_t index_of(std::string_view field) const;
    [[nodiscard]] const SchemaType& field_type(std::size_t index) const;

    std::shared_ptr<const SchemaType> root_;
    const SchemaType* schema_;
    std::vector<Value> values_;
};

} // namespace dynrec
