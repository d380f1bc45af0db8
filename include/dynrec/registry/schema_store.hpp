/**
 * @file schema_store.hpp
 * @brief Boundary to a schema registry service
 *
 * SchemaStore is the abstract collaborator a RecordFactory registers its
 * schemas with. InMemorySchemaStore keeps subjects and versions in process.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/schema/schema.hpp"
#include "dynrec/threading.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dynrec {

class SchemaStore {
public:
    using SchemaPtr = std::shared_ptr<const SchemaDefinition>;

    virtual ~SchemaStore() = default;

    /**
     * @brief Register a schema under a subject
     * @return Schema id, identical for an identical schema under the same subject
     */
    virtual int32_t register_schema(const std::string& subject, const SchemaDefinition& schema) = 0;

    /**
     * @brief Latest schema registered under a subject
     * @throws SchemaStoreError for unknown subjects
     */
    virtual SchemaPtr fetch(const std::string& subject) const = 0;
};

class InMemorySchemaStore : public SchemaStore {
public:
    int32_t register_schema(const std::string& subject, const SchemaDefinition& schema) override;
    SchemaPtr fetch(const std::string& subject) const override;

    /// @throws SchemaStoreError for unknown ids
    SchemaPtr fetch_by_id(int32_t id) const;

    /// Ids registered under a subject, oldest first
    [[nodiscard]] std::vector<int32_t> versions(const std::string& subject) const;

    [[nodiscard]] std::vector<std::string> subjects() const;

private:
    mutable SharedMutex mutex_;
    std::map<std::string, std::vector<int32_t>> subjects_;
    std::map<int32_t, SchemaPtr> schemas_;
    int32_t next_id_{1};
};

} // namespace dynrec
