/**
 * @file schema_cache.hpp
 * @brief Per-interface memo of compiled schemas with single-flight compile
 *
 * Concurrent first requests for the same interface share one compile: the
 * first caller compiles, the others block on its result. A compile that
 * throws is not memoized; every waiter sees the exception and the next
 * request compiles again.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/compiler/schema_compiler.hpp"
#include "dynrec/threading.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <typeindex>

namespace dynrec {

class SchemaCache {
public:
    using SchemaPtr = std::shared_ptr<const SchemaDefinition>;
    using Describe = std::function<InterfaceDescriptor()>;

    explicit SchemaCache(CompilerConfig config = {}) : compiler_(std::move(config)) {}

    // Non-copyable, non-movable
    SchemaCache(const SchemaCache&) = delete;
    SchemaCache& operator=(const SchemaCache&) = delete;

    template<RecordInterface T>
    SchemaPtr get() {
        return get_or_compile(std::type_index(typeid(T)), [] { return InterfaceDescriptor(T::describe()); });
    }

    /**
     * @brief Cached schema for key, compiling it with describe() on first use
     * @throws whatever the compile throws (NamingError, ValueMappingException)
     */
    SchemaPtr get_or_compile(std::type_index key, const Describe& describe);

    /// Completed or in-flight entries
    [[nodiscard]] std::size_t size() const;

    /// Number of successful compiles performed
    [[nodiscard]] std::size_t compile_count() const { return compile_count_.load(); }

    void clear();

    [[nodiscard]] const SchemaCompiler& compiler() const { return compiler_; }

private:
    // The id tells a failing compile whether its entry is still the current one
    struct Entry {
        std::shared_future<SchemaPtr> future;
        std::size_t id;
    };

    SchemaCompiler compiler_;
    mutable Mutex mutex_;
    std::map<std::type_index, Entry> entries_;
    std::size_t next_id_ = 0;
    std::atomic<std::size_t> compile_count_{0};
};

} // namespace dynrec
