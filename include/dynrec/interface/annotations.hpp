/**
 * @file annotations.hpp
 * @brief Per-operation metadata attached to record interface declarations
 *
 * Metadata is supplied explicitly when an interface is described:
 * @code
 * .DYNREC_OPERATION(getNickname, dynrec::Field{.required = false}, dynrec::Doc{"display name"})
 * .DYNREC_OPERATION(addToTags, dynrec::Param{dynrec::Doc{"one tag"}})
 * @endcode
 *
 * Each metadata kind holds at most one value per field.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace dynrec {

/// Field presence rules; a field without this metadata is required
struct Field {
    bool required = true;

    bool operator==(const Field&) const = default;
};

/// Field documentation, emitted as the schema field "doc"
struct Doc {
    std::string text;

    bool operator==(const Doc&) const = default;
};

/// Alternate field name, emitted into the schema field "aliases"
struct Alias {
    std::string name;

    bool operator==(const Alias&) const = default;
};

using Annotation = std::variant<Field, Doc, Alias>;
using AnnotationList = std::vector<Annotation>;

/// Metadata kind (one per Annotation alternative)
enum class MetadataKind {
    Field,
    Doc,
    Alias
};

constexpr const char* to_string(MetadataKind kind) {
    switch (kind) {
        case MetadataKind::Field: return "Field";
        case MetadataKind::Doc:   return "Doc";
        case MetadataKind::Alias: return "Alias";
    }
    return "Unknown";
}

inline MetadataKind kind_of(const Annotation& annotation) {
    return static_cast<MetadataKind>(annotation.index());
}

/// Deduplicated metadata of one field
using MetadataSet = std::map<MetadataKind, Annotation>;

/**
 * @brief Annotations on the value parameter of an adder or putter
 */
struct Param {
    AnnotationList annotations;

    Param() = default;

    template<typename... Annotations>
        requires (sizeof...(Annotations) > 0 && (std::is_constructible_v<Annotation, Annotations> && ...))
    explicit Param(Annotations... values)
        : annotations{Annotation(std::move(values))...} {}
};

// ============================================================================
// MetadataSet queries
// ============================================================================

/// Explicit required flag: absent metadata means required
inline bool is_required(const MetadataSet& metadata) {
    auto it = metadata.find(MetadataKind::Field);
    if (it == metadata.end()) {
        return true;
    }
    return std::get<Field>(it->second).required;
}

inline std::string doc_of(const MetadataSet& metadata) {
    auto it = metadata.find(MetadataKind::Doc);
    return it == metadata.end() ? std::string{} : std::get<Doc>(it->second).text;
}

inline std::vector<std::string> aliases_of(const MetadataSet& metadata) {
    auto it = metadata.find(MetadataKind::Alias);
    if (it == metadata.end()) {
        return {};
    }
    return {std::get<Alias>(it->second).name};
}

} // namespace dynrec
