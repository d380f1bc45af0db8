/**
 * @file naming_resolver.hpp
 * @brief Accessor-prefix naming conventions
 *
 * Operation names decompose into an operation kind and a field name:
 * getName/isActive -> Getter, setName -> Setter, addToTags -> Adder,
 * putIntoScores -> Putter, removeFromTags -> Remover.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include <array>
#include <string>
#include <string_view>

namespace dynrec {

enum class OperationKind {
    Getter,
    Setter,
    Adder,
    Putter,
    Remover
};

constexpr const char* to_string(OperationKind kind) {
    switch (kind) {
        case OperationKind::Getter:  return "getter";
        case OperationKind::Setter:  return "setter";
        case OperationKind::Adder:   return "adder";
        case OperationKind::Putter:  return "putter";
        case OperationKind::Remover: return "remover";
    }
    return "unknown";
}

struct AccessorPrefix {
    std::string_view prefix;
    OperationKind kind;
};

/// Recognized prefixes, in matching order
inline constexpr std::array<AccessorPrefix, 6> kAccessorPrefixes{{
    {"get", OperationKind::Getter},
    {"is", OperationKind::Getter},
    {"set", OperationKind::Setter},
    {"addTo", OperationKind::Adder},
    {"putInto", OperationKind::Putter},
    {"removeFrom", OperationKind::Remover},
}};

/**
 * @brief Strip prefix and lower-case the leading character of the remainder
 *
 * resolve_field_name("getFirstName", "get") == "firstName"
 *
 * @throws NamingError if operation does not start with prefix or the remainder is empty
 */
std::string resolve_field_name(std::string_view operation, std::string_view prefix);

struct ResolvedOperation {
    OperationKind kind;
    std::string field_name;
};

/**
 * @brief Classify an operation by the first matching accessor prefix
 * @throws NamingError if no prefix matches or the remainder is empty
 */
ResolvedOperation classify_operation(std::string_view operation);

} // namespace dynrec
