#include "dynrec/registry/record_factory.hpp"

namespace dynrec {

std::string RecordFactory::subject_for(const SchemaDefinition& schema) const {
    switch (config_.subject_strategy) {
        case SubjectStrategy::record:
            return schema.full_name();
        case SubjectStrategy::topic_value:
            if (config_.topic.empty()) {
                throw SchemaStoreError("topic_value subject strategy requires a topic");
            }
            return config_.topic + "-value";
    }
    throw SchemaStoreError("unknown subject strategy");
}

} // namespace dynrec
