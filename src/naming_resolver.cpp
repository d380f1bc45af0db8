#include "dynrec/compiler/naming_resolver.hpp"
#include "dynrec/errors.hpp"

#include <cctype>

namespace dynrec {

std::string resolve_field_name(std::string_view operation, std::string_view prefix) {
    if (!operation.starts_with(prefix)) {
        throw NamingError(std::string(operation), "missing prefix '" + std::string(prefix) + "'");
    }
    std::string field(operation.substr(prefix.size()));
    if (field.empty()) {
        throw NamingError(std::string(operation), "empty field name after prefix '" + std::string(prefix) + "'");
    }
    field[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(field[0])));
    return field;
}

ResolvedOperation classify_operation(std::string_view operation) {
    for (const auto& [prefix, kind] : kAccessorPrefixes) {
        if (operation.starts_with(prefix)) {
            return ResolvedOperation{kind, resolve_field_name(operation, prefix)};
        }
    }
    throw NamingError(std::string(operation), "no accessor prefix (get, is, set, addTo, putInto, removeFrom)");
}

} // namespace dynrec
