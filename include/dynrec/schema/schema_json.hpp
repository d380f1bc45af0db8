/**
 * @file schema_json.hpp
 * @brief Avro-compatible JSON rendering of compiled schemas
 *
 * Named types (records, enums) are written in full on first occurrence and
 * by full name afterwards, so recursive and repeated types stay finite.
 *
 * **Example Output:**
 * @code{.json}
 * {"type":"record","name":"Person","namespace":"com.example","fields":[
 *   {"name":"name","type":"string"},
 *   {"name":"nickname","type":["null","string"],"default":null}
 * ]}
 * @endcode
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/schema/schema.hpp"

#include <rfl.hpp>
#include <rfl/json.hpp>

#include <string>

namespace dynrec {

/// Schema as a generic JSON tree
rfl::Generic to_generic(const SchemaType& schema);

/// Schema as JSON text
std::string to_json(const SchemaType& schema);

/**
 * @brief Write the JSON schema to a file
 * @note Creates file if it doesn't exist, overwrites if it does
 */
void write_to_file(const SchemaType& schema, const std::string& filename);

} // namespace dynrec
