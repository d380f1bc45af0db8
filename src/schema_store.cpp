#include "dynrec/registry/schema_store.hpp"
#include "dynrec/errors.hpp"

namespace dynrec {

int32_t InMemorySchemaStore::register_schema(const std::string& subject, const SchemaDefinition& schema) {
    UniqueLockShared lock(mutex_);

    auto& ids = subjects_[subject];
    for (int32_t id : ids) {
        if (*schemas_.at(id) == schema) {
            return id;
        }
    }

    const int32_t id = next_id_++;
    schemas_.emplace(id, std::make_shared<const SchemaDefinition>(schema));
    ids.push_back(id);
    return id;
}

SchemaStore::SchemaPtr InMemorySchemaStore::fetch(const std::string& subject) const {
    SharedLock lock(mutex_);
    auto it = subjects_.find(subject);
    if (it == subjects_.end() || it->second.empty()) {
        throw SchemaStoreError("unknown subject: " + subject);
    }
    return schemas_.at(it->second.back());
}

SchemaStore::SchemaPtr InMemorySchemaStore::fetch_by_id(int32_t id) const {
    SharedLock lock(mutex_);
    auto it = schemas_.find(id);
    if (it == schemas_.end()) {
        throw SchemaStoreError("unknown schema id: " + std::to_string(id));
    }
    return it->second;
}

std::vector<int32_t> InMemorySchemaStore::versions(const std::string& subject) const {
    SharedLock lock(mutex_);
    auto it = subjects_.find(subject);
    return it == subjects_.end() ? std::vector<int32_t>{} : it->second;
}

std::vector<std::string> InMemorySchemaStore::subjects() const {
    SharedLock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(subjects_.size());
    for (const auto& [subject, ids] : subjects_) {
        result.push_back(subject);
    }
    return result;
}

} // namespace dynrec
