/**
 * @file value.hpp
 * @brief Untyped value held by a generic record field
 *
 * A Value is one of: null, boolean, int, long, float, double, string, bytes,
 * enum symbol, array, map (string keys) or nested generic record. It is the
 * currency of the record adapter's dispatch protocol.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace dynrec {

class GenericRecord;

using Bytes = std::vector<std::byte>;

/// Symbol of an enum-typed field
struct EnumSymbol {
    std::string symbol;

    bool operator==(const EnumSymbol&) const = default;
};

enum class ValueKind {
    Null,
    Boolean,
    Int,
    Long,
    Float,
    Double,
    String,
    Bytes,
    Enum,
    Array,
    Map,
    Record
};

constexpr const char* to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null:    return "null";
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Int:     return "int";
        case ValueKind::Long:    return "long";
        case ValueKind::Float:   return "float";
        case ValueKind::Double:  return "double";
        case ValueKind::String:  return "string";
        case ValueKind::Bytes:   return "bytes";
        case ValueKind::Enum:    return "enum";
        case ValueKind::Array:   return "array";
        case ValueKind::Map:     return "map";
        case ValueKind::Record:  return "record";
    }
    return "unknown";
}

class Value {
public:
    using Array = std::vector<Value>;
    using Map = std::map<std::string, Value>;
    using RecordPtr = std::shared_ptr<GenericRecord>;

    // Alternative order matches ValueKind
    using Storage = std::variant<
        std::monostate,
        bool,
        int32_t,
        int64_t,
        float,
        double,
        std::string,
        Bytes,
        EnumSymbol,
        Array,
        Map,
        RecordPtr
    >;

    Value() = default;
    explicit Value(Storage storage) : storage_(std::move(storage)) {}

    static Value null() { return Value(); }
    static Value boolean(bool v) { return Value(Storage(std::in_place_type<bool>, v)); }
    static Value int32(int32_t v) { return Value(Storage(std::in_place_type<int32_t>, v)); }
    static Value int64(int64_t v) { return Value(Storage(std::in_place_type<int64_t>, v)); }
    static Value float32(float v) { return Value(Storage(std::in_place_type<float>, v)); }
    static Value float64(double v) { return Value(Storage(std::in_place_type<double>, v)); }
    static Value string(std::string v) { return Value(Storage(std::in_place_type<std::string>, std::move(v))); }
    static Value bytes(Bytes v) { return Value(Storage(std::in_place_type<Bytes>, std::move(v))); }
    static Value enumeration(std::string symbol) {
        return Value(Storage(std::in_place_type<EnumSymbol>, EnumSymbol{std::move(symbol)}));
    }
    static Value array(Array items = {}) { return Value(Storage(std::in_place_type<Array>, std::move(items))); }
    static Value map(Map entries = {}) { return Value(Storage(std::in_place_type<Map>, std::move(entries))); }
    static Value record(RecordPtr record) { return Value(Storage(std::in_place_type<RecordPtr>, std::move(record))); }

    [[nodiscard]] ValueKind kind() const { return static_cast<ValueKind>(storage_.index()); }
    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(storage_); }

    template<typename T>
    [[nodiscard]] bool holds() const { return std::holds_alternative<T>(storage_); }

    template<typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&storage_); }

    template<typename T>
    [[nodiscard]] T* get_if() { return std::get_if<T>(&storage_); }

    /**
     * @brief Access the held alternative
     * @throws InvalidFieldError if the value holds a different alternative
     */
    template<typename T>
    [[nodiscard]] const T& as() const {
        if (const T* v = std::get_if<T>(&storage_)) {
            return *v;
        }
        throw_kind_mismatch(kind_of<T>());
    }

    template<typename T>
    [[nodiscard]] T& as() {
        if (T* v = std::get_if<T>(&storage_)) {
            return *v;
        }
        throw_kind_mismatch(kind_of<T>());
    }

    [[nodiscard]] const Storage& storage() const { return storage_; }

    /// Deep equality, nested records are compared by content
    friend bool operator==(const Value& lhs, const Value& rhs);

    /// Short human-readable rendering for logs and error messages
    [[nodiscard]] std::string describe() const;

private:
    template<typename T, typename... Alternatives>
    static constexpr std::size_t index_of(const std::variant<Alternatives...>*) {
        constexpr bool matches[] = {std::is_same_v<T, Alternatives>...};
        for (std::size_t i = 0; i < sizeof...(Alternatives); ++i) {
            if (matches[i]) {
                return i;
            }
        }
        return sizeof...(Alternatives);
    }

    template<typename T>
    static constexpr ValueKind kind_of() {
        return static_cast<ValueKind>(index_of<T>(static_cast<const Storage*>(nullptr)));
    }

    [[noreturn]] void throw_kind_mismatch(ValueKind expected) const;

    Storage storage_;
};

} // namespace dynrec
