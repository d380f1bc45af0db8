/**
 * @file schema_compiler.hpp
 * @brief Record interface -> schema definition
 *
 * SchemaCompiler is the public entry point of the interface-to-schema
 * compiler. compile() is a pure function of the interface's declared shape:
 * no caching, no shared mutable state, safe to call concurrently.
 *
 * **Usage:**
 * @code
 * dynrec::SchemaCompiler compiler;
 * dynrec::SchemaDefinition schema = compiler.compile<Person>();
 * std::cout << dynrec::to_json(schema) << "\n";
 * @endcode
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/compiler/record_interface_descriptor.hpp"
#include "dynrec/compiler/type_mapper.hpp"
#include "dynrec/interface/interface_descriptor.hpp"
#include "dynrec/schema/schema.hpp"

#include <string>

namespace dynrec {

struct CompilerConfig {
    /// Log compile decisions and dropped duplicate metadata
    bool verbose{false};

    /// Namespace for records and enums declared without one
    std::string default_namespace{};
};

class SchemaCompiler {
public:
    explicit SchemaCompiler(CompilerConfig config = {}) : config_(std::move(config)) {}

    /**
     * @brief Compile a record interface into a record schema
     *
     * Fields appear in first-discovery order over the declared operations.
     *
     * @throws NamingError if an operation name has no valid accessor prefix
     * @throws ValueMappingException naming the field whose type cannot be mapped
     */
    [[nodiscard]] SchemaDefinition compile(const InterfaceDescriptor& descriptor) const;

    template<RecordInterface T>
    [[nodiscard]] SchemaDefinition compile() const {
        return compile(T::describe());
    }

    [[nodiscard]] const CompilerConfig& config() const { return config_; }

private:
    friend class TypeMapper;

    SchemaType compile_record(const InterfaceDescriptor& descriptor, CompileContext& context) const;

    CompilerConfig config_;
};

} // namespace dynrec
