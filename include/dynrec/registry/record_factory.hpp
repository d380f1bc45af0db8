/**
 * @file record_factory.hpp
 * @brief Creates and binds typed record handles
 *
 * RecordFactory ties the pieces together: it compiles (and caches) the schema
 * of a record interface, creates generic records shaped by it, binds typed
 * handles to them and optionally registers the schemas with a SchemaStore.
 *
 * **Usage:**
 * @code
 * dynrec::RecordFactory factory(dynrec::load_factory_config("factory.json"),
 *                               std::make_shared<dynrec::InMemorySchemaStore>());
 * Person person = factory.create<Person>();
 * person.setName("Ada");
 * int32_t id = factory.register_schema<Person>();
 * @endcode
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/config/factory_config.hpp"
#include "dynrec/errors.hpp"
#include "dynrec/registry/schema_cache.hpp"
#include "dynrec/registry/schema_store.hpp"
#include "dynrec/value/generic_record.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace dynrec {

class RecordFactory {
public:
    explicit RecordFactory(FactoryConfig config = {}, std::shared_ptr<SchemaStore> store = nullptr)
        : config_(std::move(config))
        , store_(std::move(store))
        , cache_(config_.compiler_config()) {}

    // Non-copyable, non-movable (owns the cache)
    RecordFactory(const RecordFactory&) = delete;
    RecordFactory& operator=(const RecordFactory&) = delete;

    template<RecordInterface T>
    SchemaCache::SchemaPtr schema_for() {
        return cache_.get<T>();
    }

    /// New record with every field unset, bound to T
    template<RecordInterface T>
    T create() {
        return T(GenericRecord::create(schema_for<T>()));
    }

    /**
     * @brief Bind T to an existing record
     * @throws InvalidFieldError if the record has a different schema
     * @throws RequiredFieldMissingException if validate_on_wrap is set and a
     *         required field is unset
     */
    template<RecordInterface T>
    T wrap(std::shared_ptr<GenericRecord> record) {
        if (!record) {
            throw InvalidFieldError("cannot wrap a null record");
        }
        auto schema = schema_for<T>();
        if (record->schema().full_name() != schema->full_name()) {
            throw InvalidFieldError("record " + record->schema().full_name() +
                                    " cannot be bound to " + schema->full_name());
        }
        if (config_.validate_on_wrap) {
            record->validate();
        }
        return T(std::move(record));
    }

    /// Handle for the nested record stored in a record-typed field of parent
    template<RecordInterface T>
    T create_child(const GenericRecord& parent, std::string_view field) {
        return T(parent.create_child(field));
    }

    /**
     * @brief Register T's schema with the store
     * @return Schema id assigned by the store
     * @throws SchemaStoreError if no store is configured
     */
    template<RecordInterface T>
    int32_t register_schema() {
        if (!store_) {
            throw SchemaStoreError("no schema store configured");
        }
        auto schema = schema_for<T>();
        const std::string subject = subject_for(*schema);
        const int32_t id = store_->register_schema(subject, *schema);
        if (config_.verbose) {
            std::cout << "[RecordFactory] registered " << schema->full_name()
                      << " as subject " << subject << " (id " << id << ")\n";
        }
        return id;
    }

    template<RecordInterface T>
    std::string subject_for() {
        return subject_for(*schema_for<T>());
    }

    /// Subject name for a schema under the configured strategy
    [[nodiscard]] std::string subject_for(const SchemaDefinition& schema) const;

    [[nodiscard]] const FactoryConfig& config() const { return config_; }
    [[nodiscard]] const std::shared_ptr<SchemaStore>& store() const { return store_; }
    [[nodiscard]] SchemaCache& cache() { return cache_; }

private:
    FactoryConfig config_;
    std::shared_ptr<SchemaStore> store_;
    SchemaCache cache_;
};

} // namespace dynrec
