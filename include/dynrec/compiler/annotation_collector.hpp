/**
 * @file annotation_collector.hpp
 * @brief Merges per-operation metadata into one MetadataSet per field
 *
 * Getter, setter, adder, putter and remover of a field may all carry
 * metadata. The first value registered for a metadata kind wins; later ones
 * are dropped without error (logged when verbose).
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/interface/annotations.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace dynrec {

class AnnotationCollector {
public:
    explicit AnnotationCollector(bool verbose = false) : verbose_(verbose) {}

    /// Register metadata for field; creates an empty set for unseen fields
    void add(const std::string& field, const AnnotationList& annotations);

    /// Metadata of field, empty when the field was never registered
    [[nodiscard]] const MetadataSet& metadata_for(const std::string& field) const;

    [[nodiscard]] const std::map<std::string, MetadataSet>& metadata() const { return metadata_; }

    /// Number of duplicates dropped so far
    [[nodiscard]] std::size_t dropped_count() const { return dropped_; }

private:
    bool verbose_;
    std::size_t dropped_ = 0;
    std::map<std::string, MetadataSet> metadata_;
};

} // namespace dynrec
