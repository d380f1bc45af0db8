/**
 * @file type_mapper.hpp
 * @brief Maps declared value types to schema types
 *
 * Rules, in precedence order:
 * 1. record interface  -> nested record schema (compiled recursively)
 * 2. scalar            -> string/boolean/int/long/float/double/bytes
 * 3. enum              -> enum schema, symbols in declaration order
 * 4. ordered sequence  -> array of the resolved item type
 * 5. key/value         -> map (string keys) of the resolved value type
 * 6. anything else     -> ValueMappingException
 *
 * A field whose Field metadata says required = false is wrapped into a
 * null-or-T union, whatever rule produced T. Sequence items and map values
 * carry the field's metadata, so they are wrapped as well.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/interface/annotations.hpp"
#include "dynrec/interface/type_descriptor.hpp"
#include "dynrec/schema/schema.hpp"

#include <map>
#include <string>
#include <vector>

namespace dynrec {

class SchemaCompiler;

/**
 * @brief State shared across one compile call
 *
 * Tracks the records currently being compiled so a record that reaches
 * itself again becomes a named reference, and which declaration owns each
 * full name so two different types cannot share one.
 */
struct CompileContext {
    std::vector<std::string> in_progress;
    std::map<std::string, std::string> defined;  ///< full name -> identity of its declaration

    /**
     * @brief Claim full_name for the declaration identified by identity
     * @throws ValueMappingException if another declaration already holds it
     */
    void define(const std::string& full_name, const std::string& identity);
};

class TypeMapper {
public:
    TypeMapper(const SchemaCompiler& compiler, CompileContext& context)
        : compiler_(compiler), context_(context) {}

    /**
     * @brief Resolve a declared type, honoring the field's optionality
     * @throws ValueMappingException carrying the offending type's name
     */
    [[nodiscard]] SchemaType resolve(const TypeRef& declared, const MetadataSet& metadata) const;

    /**
     * @brief Resolve without wrapping the type itself
     *
     * metadata still applies to sequence items and map values.
     */
    [[nodiscard]] SchemaType resolve_base(const TypeRef& declared, const MetadataSet& metadata = {}) const;

private:
    const SchemaCompiler& compiler_;
    CompileContext& context_;
};

/**
 * @brief Resolve a single declared type outside of any record compile
 */
SchemaType resolve_type(const TypeRef& declared, const MetadataSet& metadata = {});

} // namespace dynrec
