/**
 * @file type_name.hpp
 * @brief Compile-time type and enumerator names using reflect-cpp
 *
 * Provides the names DynRec needs when it describes a declared type:
 * record names (unqualified class names), enum schema names and their
 * symbol lists, and full type names for error messages.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include <rfl.hpp>
#include <sertial/containers/fixed_string.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dynrec {

/**
 * @brief Strip namespace qualifiers from a type name
 *
 * Only qualifiers outside template argument lists are removed:
 * "app::Outer<app::Inner>" becomes "Outer<app::Inner>".
 */
constexpr std::string_view strip_namespace(std::string_view name) {
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (depth == 0 && c == ':' && i + 1 < name.size() && name[i + 1] == ':') {
            start = i + 2;
            ++i;
        }
    }
    return name.substr(start);
}

/**
 * @brief Compile-time type name extraction
 *
 * Example:
 * @code
 * namespace app { struct Person; }
 * TypeName<app::Person>::get();          // "app::Person"
 * TypeName<app::Person>::unqualified();  // "Person"
 * @endcode
 */
template<typename T>
struct TypeName {
    static constexpr auto value = sertial::make_fixed(rfl::internal::get_type_name<T>());

    static constexpr std::string_view get() {
        return std::string_view(value);
    }

    static constexpr std::string_view unqualified() {
        return strip_namespace(get());
    }
};

template<typename T>
std::string type_name() {
    return std::string(TypeName<T>::get());
}

template<typename T>
std::string unqualified_type_name() {
    return std::string(TypeName<T>::unqualified());
}

/**
 * @brief Enumerator names of an enum, in declaration order
 *
 * reflect-cpp enumerates by value, so declaration order holds for enums whose
 * values increase with declaration (the default numbering).
 */
template<typename EnumType> requires std::is_enum_v<EnumType>
struct EnumSymbols {
    static constexpr std::size_t count = rfl::get_enumerator_array<EnumType>().size();

    static std::vector<std::string> symbols() {
        constexpr auto enumerator_array = rfl::get_enumerator_array<EnumType>();
        std::vector<std::string> result;
        result.reserve(enumerator_array.size());
        for (const auto& enumerator : enumerator_array) {
            result.emplace_back(enumerator.first);
        }
        return result;
    }

    static std::optional<std::string> name_of(const EnumType value) {
        constexpr auto enumerator_array = rfl::get_enumerator_array<EnumType>();
        for (const auto& [name, val] : enumerator_array) {
            if (val == value) {
                return std::string(name);
            }
        }
        return std::nullopt;
    }

    static std::optional<EnumType> from_name(std::string_view symbol) {
        constexpr auto enumerator_array = rfl::get_enumerator_array<EnumType>();
        for (const auto& [name, val] : enumerator_array) {
            if (name == symbol) {
                return val;
            }
        }
        return std::nullopt;
    }
};

} // namespace dynrec
