#include "dynrec/registry/schema_cache.hpp"

#include <exception>
#include <iostream>

namespace dynrec {

SchemaCache::SchemaPtr SchemaCache::get_or_compile(std::type_index key, const Describe& describe) {
    std::promise<SchemaPtr> promise;
    std::shared_future<SchemaPtr> result;
    bool owner = false;
    std::size_t id = 0;

    {
        Lock lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            result = it->second.future;
        } else {
            result = promise.get_future().share();
            id = next_id_++;
            entries_.emplace(key, Entry{result, id});
            owner = true;
        }
    }

    if (!owner) {
        return result.get();
    }

    try {
        auto schema = std::make_shared<const SchemaDefinition>(compiler_.compile(describe()));
        compile_count_.fetch_add(1);
        if (compiler_.config().verbose) {
            std::cout << "[SchemaCache] cached schema " << schema->full_name() << "\n";
        }
        promise.set_value(std::move(schema));
    } catch (...) {
        {
            // clear() may have let another compile take the slot
            Lock lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end() && it->second.id == id) {
                entries_.erase(it);
            }
        }
        promise.set_exception(std::current_exception());
        throw;
    }
    return result.get();
}

std::size_t SchemaCache::size() const {
    Lock lock(mutex_);
    return entries_.size();
}

void SchemaCache::clear() {
    Lock lock(mutex_);
    entries_.clear();
}

} // namespace dynrec
