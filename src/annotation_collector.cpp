#include "dynrec/compiler/annotation_collector.hpp"

#include <iostream>

namespace dynrec {

void AnnotationCollector::add(const std::string& field, const AnnotationList& annotations) {
    auto& set = metadata_[field];

    for (const auto& annotation : annotations) {
        const MetadataKind kind = kind_of(annotation);
        if (set.contains(kind)) {
            ++dropped_;
            if (verbose_) {
                std::cout << "[AnnotationCollector] duplicate " << to_string(kind)
                          << " metadata detected for field " << field << ", keeping the first\n";
            }
            continue;
        }
        set.emplace(kind, annotation);
    }
}

const MetadataSet& AnnotationCollector::metadata_for(const std::string& field) const {
    static const MetadataSet empty;
    auto it = metadata_.find(field);
    return it == metadata_.end() ? empty : it->second;
}

} // namespace dynrec
