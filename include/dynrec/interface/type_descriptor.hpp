/**
 * @file type_descriptor.hpp
 * @brief Declared C++ value types, as seen by the schema compiler
 *
 * describe_type<T>() turns a C++ type into a TypeRef the type mapper can
 * resolve at runtime. TypeTraits<T> also converts between T and Value for
 * the record adapter.
 *
 * Supported declarations:
 * - std::string, bool, int32_t, int64_t, float, double, dynrec::Bytes
 * - enums (symbols reflected in declaration order)
 * - record interfaces (see interface_descriptor.hpp)
 * - std::vector<T>, std::map<K, T>, std::unordered_map<K, T>
 * - std::optional<T> (described as T)
 *
 * Everything else is described as Unsupported and rejected by the mapper.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/errors.hpp"
#include "dynrec/helpers/type_name.hpp"
#include "dynrec/value/value.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace dynrec {

struct InterfaceDescriptor;

enum class TypeCategory {
    String,
    Boolean,
    Int32,
    Int64,
    Float32,
    Float64,
    Bytes,
    Enum,
    Record,
    List,
    Map,
    Unsupported
};

constexpr const char* to_string(TypeCategory category) {
    switch (category) {
        case TypeCategory::String:      return "String";
        case TypeCategory::Boolean:     return "Boolean";
        case TypeCategory::Int32:       return "Int32";
        case TypeCategory::Int64:       return "Int64";
        case TypeCategory::Float32:     return "Float32";
        case TypeCategory::Float64:     return "Float64";
        case TypeCategory::Bytes:       return "Bytes";
        case TypeCategory::Enum:        return "Enum";
        case TypeCategory::Record:      return "Record";
        case TypeCategory::List:        return "List";
        case TypeCategory::Map:         return "Map";
        case TypeCategory::Unsupported: return "Unsupported";
    }
    return "Unknown";
}

/**
 * @brief Runtime description of one declared type
 */
struct TypeRef {
    TypeCategory category = TypeCategory::Unsupported;
    std::string name;                     ///< Declared type name (unqualified for enums and records)
    std::vector<std::string> symbols;     ///< Enum symbols
    std::vector<TypeRef> arguments;       ///< List: {item}; Map: {key, value}
    std::function<InterfaceDescriptor()> describe_record;  ///< Nested record interface, described lazily

    static TypeRef scalar(TypeCategory category, std::string name) {
        TypeRef ref;
        ref.category = category;
        ref.name = std::move(name);
        return ref;
    }

    static TypeRef enumeration(std::string name, std::vector<std::string> symbols) {
        TypeRef ref = scalar(TypeCategory::Enum, std::move(name));
        ref.symbols = std::move(symbols);
        return ref;
    }

    static TypeRef record(std::string name, std::function<InterfaceDescriptor()> describe) {
        TypeRef ref = scalar(TypeCategory::Record, std::move(name));
        ref.describe_record = std::move(describe);
        return ref;
    }

    static TypeRef list(std::string name, TypeRef item) {
        TypeRef ref = scalar(TypeCategory::List, std::move(name));
        ref.arguments.push_back(std::move(item));
        return ref;
    }

    static TypeRef map(std::string name, TypeRef key, TypeRef value) {
        TypeRef ref = scalar(TypeCategory::Map, std::move(name));
        ref.arguments.push_back(std::move(key));
        ref.arguments.push_back(std::move(value));
        return ref;
    }

    static TypeRef unsupported(std::string name) {
        return scalar(TypeCategory::Unsupported, std::move(name));
    }
};

/// Base of every record interface, see DynamicRecord
struct RecordInterfaceTag {};

// ============================================================================
// TypeTraits
// ============================================================================

/// Fallback: any type without a mapping rule
template<typename T>
struct TypeTraits {
    static TypeRef describe() { return TypeRef::unsupported(type_name<T>()); }
};

#define DYNREC_SCALAR_TRAITS(CppType, Category, Factory)                        \
    template<>                                                                  \
    struct TypeTraits<CppType> {                                                \
        static TypeRef describe() {                                             \
            return TypeRef::scalar(TypeCategory::Category, #CppType);           \
        }                                                                       \
        static Value to_value(const CppType& v) { return Value::Factory(v); }   \
        static CppType from_value(const Value& v) { return v.as<CppType>(); }   \
    };

DYNREC_SCALAR_TRAITS(std::string, String, string)
DYNREC_SCALAR_TRAITS(bool, Boolean, boolean)
DYNREC_SCALAR_TRAITS(int32_t, Int32, int32)
DYNREC_SCALAR_TRAITS(int64_t, Int64, int64)
DYNREC_SCALAR_TRAITS(float, Float32, float32)
DYNREC_SCALAR_TRAITS(double, Float64, float64)
DYNREC_SCALAR_TRAITS(Bytes, Bytes, bytes)

#undef DYNREC_SCALAR_TRAITS

template<typename E> requires std::is_enum_v<E>
struct TypeTraits<E> {
    static TypeRef describe() {
        return TypeRef::enumeration(unqualified_type_name<E>(), EnumSymbols<E>::symbols());
    }

    static Value to_value(const E& v) {
        auto symbol = EnumSymbols<E>::name_of(v);
        if (!symbol) {
            throw InvalidFieldError("value " + std::to_string(static_cast<long long>(v)) +
                                    " is not a declared enumerator of " + type_name<E>());
        }
        return Value::enumeration(std::move(*symbol));
    }

    static E from_value(const Value& v) {
        const auto& symbol = v.as<EnumSymbol>().symbol;
        auto value = EnumSymbols<E>::from_name(symbol);
        if (!value) {
            throw InvalidFieldError("'" + symbol + "' is not a symbol of " + type_name<E>());
        }
        return *value;
    }
};

template<typename T>
struct TypeTraits<std::optional<T>> {
    static TypeRef describe() { return TypeTraits<T>::describe(); }

    static Value to_value(const std::optional<T>& v) {
        return v ? TypeTraits<T>::to_value(*v) : Value::null();
    }

    static std::optional<T> from_value(const Value& v) {
        if (v.is_null()) {
            return std::nullopt;
        }
        return TypeTraits<T>::from_value(v);
    }
};

template<typename T>
struct TypeTraits<std::vector<T>> {
    static TypeRef describe() {
        return TypeRef::list(type_name<std::vector<T>>(), TypeTraits<T>::describe());
    }

    static Value to_value(const std::vector<T>& v) {
        Value::Array items;
        items.reserve(v.size());
        for (const auto& item : v) {
            items.push_back(TypeTraits<T>::to_value(item));
        }
        return Value::array(std::move(items));
    }

    static std::vector<T> from_value(const Value& v) {
        std::vector<T> result;
        if (v.is_null()) {
            return result;
        }
        const auto& items = v.as<Value::Array>();
        result.reserve(items.size());
        for (const auto& item : items) {
            result.push_back(TypeTraits<T>::from_value(item));
        }
        return result;
    }
};

/// Shared by std::map and std::unordered_map
template<typename MapType, typename K, typename V>
struct MapTypeTraits {
    static TypeRef describe() {
        return TypeRef::map(type_name<MapType>(), TypeTraits<K>::describe(), TypeTraits<V>::describe());
    }

    static Value to_value(const MapType& v) requires std::is_same_v<K, std::string> {
        Value::Map entries;
        for (const auto& [key, value] : v) {
            entries.emplace(key, TypeTraits<V>::to_value(value));
        }
        return Value::map(std::move(entries));
    }

    static MapType from_value(const Value& v) requires std::is_same_v<K, std::string> {
        MapType result;
        if (v.is_null()) {
            return result;
        }
        for (const auto& [key, value] : v.as<Value::Map>()) {
            result.emplace(key, TypeTraits<V>::from_value(value));
        }
        return result;
    }
};

template<typename K, typename V>
struct TypeTraits<std::map<K, V>> : MapTypeTraits<std::map<K, V>, K, V> {};

template<typename K, typename V>
struct TypeTraits<std::unordered_map<K, V>> : MapTypeTraits<std::unordered_map<K, V>, K, V> {};

// ============================================================================
// Convenience functions
// ============================================================================

template<typename T>
TypeRef describe_type() {
    return TypeTraits<std::remove_cvref_t<T>>::describe();
}

template<typename T>
Value to_value(const T& v) {
    return TypeTraits<std::remove_cvref_t<T>>::to_value(v);
}

template<typename T>
T from_value(const Value& v) {
    return TypeTraits<std::remove_cvref_t<T>>::from_value(v);
}

} // namespace dynrec
