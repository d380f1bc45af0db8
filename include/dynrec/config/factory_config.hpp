/**
 * @file factory_config.hpp
 * @brief RecordFactory configuration, loadable from JSON
 *
 * **Example config.json:**
 * @code{.json}
 * {
 *   "default_namespace": "com.example",
 *   "subject_strategy": "topic_value",
 *   "topic": "people",
 *   "verbose": true
 * }
 * @endcode
 * Missing keys keep their defaults.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/compiler/schema_compiler.hpp"

#include <rfl.hpp>
#include <rfl/json.hpp>

#include <stdexcept>
#include <string>

namespace dynrec {

/// How registered schemas are named in a SchemaStore
enum class SubjectStrategy {
    record,      ///< full record name
    topic_value  ///< "<topic>-value"
};

struct FactoryConfig {
    std::string default_namespace;
    SubjectStrategy subject_strategy{SubjectStrategy::record};
    std::string topic;
    bool verbose{false};
    bool validate_on_wrap{true};  // wrap() rejects records with unset required fields

    [[nodiscard]] CompilerConfig compiler_config() const {
        return CompilerConfig{.verbose = verbose, .default_namespace = default_namespace};
    }
};

/**
 * @brief Load a FactoryConfig from a JSON file
 * @throws std::runtime_error if the file is missing or malformed
 */
inline FactoryConfig load_factory_config(const std::string& filename) {
    if (!filename.ends_with(".json")) {
        throw std::runtime_error("Only JSON config files supported (got: " + filename + ")");
    }
    return rfl::json::load<FactoryConfig, rfl::DefaultIfMissing>(filename).value();
}

inline std::string to_json(const FactoryConfig& config) {
    return rfl::json::write(config);
}

} // namespace dynrec
