/**
 * @file interface_descriptor.hpp
 * @brief Explicit description of a record interface's declared operations
 *
 * A record interface lists its accessor operations once, in a static
 * describe() function. Return and parameter types are deduced from the
 * member-function pointers, so the descriptor cannot drift from the
 * declarations it describes.
 *
 * **Usage:**
 * @code
 * class Person : public dynrec::DynamicRecord<Person> {
 * public:
 *     using DynamicRecord::DynamicRecord;
 *
 *     std::string getName() const { return invoke<std::string>("getName"); }
 *     void setName(const std::string& v) { invoke("setName", v); }
 *     std::optional<std::string> getNickname() const { return invoke<std::optional<std::string>>("getNickname"); }
 *
 *     static dynrec::InterfaceDescriptor describe() {
 *         return dynrec::InterfaceBuilder<Person>()
 *             .in_namespace("com.example")
 *             .DYNREC_OPERATION(getName)
 *             .DYNREC_OPERATION(setName)
 *             .DYNREC_OPERATION(getNickname, dynrec::Field{.required = false});
 *     }
 * };
 * @endcode
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/interface/annotations.hpp"
#include "dynrec/interface/type_descriptor.hpp"

#include <concepts>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace dynrec {

/**
 * @brief One declared operation: (name, parameter types, return type, metadata)
 */
struct OperationDescriptor {
    std::string name;
    std::vector<TypeRef> parameter_types;
    std::optional<TypeRef> return_type;               ///< nullopt for void
    AnnotationList annotations;                       ///< Metadata on the operation
    std::vector<AnnotationList> parameter_annotations; ///< Metadata per parameter
};

/**
 * @brief The declared shape of a record interface
 */
struct InterfaceDescriptor {
    std::string name;
    std::string name_space;
    std::string doc;
    std::vector<OperationDescriptor> operations;
    std::string cpp_type;  ///< Qualified C++ class name, empty for hand-built descriptors

    [[nodiscard]] std::string full_name() const {
        return name_space.empty() ? name : name_space + "." + name;
    }
};

/**
 * @brief Record-interface capability
 *
 * Satisfied by classes deriving from DynamicRecord<T> that describe their
 * operations.
 */
template<typename T>
concept RecordInterface = std::is_base_of_v<RecordInterfaceTag, T> && requires {
    { T::describe() } -> std::convertible_to<InterfaceDescriptor>;
};

template<typename T> requires RecordInterface<T>
struct TypeTraits<T> {
    static TypeRef describe() {
        return TypeRef::record(unqualified_type_name<T>(), [] { return InterfaceDescriptor(T::describe()); });
    }

    static Value to_value(const T& v) { return Value::record(v.record_ptr()); }

    static T from_value(const Value& v) { return T(v.as<Value::RecordPtr>()); }
};

namespace detail {

template<typename M>
struct MethodTraits;

template<typename C, typename R, typename... Args>
struct MethodTraits<R (C::*)(Args...)> {
    using Class = C;
    using Return = R;

    static std::vector<TypeRef> parameter_types() { return {describe_type<Args>()...}; }
};

template<typename C, typename R, typename... Args>
struct MethodTraits<R (C::*)(Args...) const> : MethodTraits<R (C::*)(Args...)> {};

template<typename C, typename R, typename... Args>
struct MethodTraits<R (C::*)(Args...) noexcept> : MethodTraits<R (C::*)(Args...)> {};

template<typename C, typename R, typename... Args>
struct MethodTraits<R (C::*)(Args...) const noexcept> : MethodTraits<R (C::*)(Args...)> {};

} // namespace detail

/**
 * @brief Fluent builder for InterfaceDescriptor
 *
 * @tparam Self The record interface being described
 */
template<typename Self>
class InterfaceBuilder {
public:
    /// Record named after the unqualified class name
    InterfaceBuilder() {
        descriptor_.name = unqualified_type_name<Self>();
        descriptor_.cpp_type = type_name<Self>();
    }

    explicit InterfaceBuilder(std::string name) {
        descriptor_.name = std::move(name);
        descriptor_.cpp_type = type_name<Self>();
    }

    InterfaceBuilder& in_namespace(std::string name_space) {
        descriptor_.name_space = std::move(name_space);
        return *this;
    }

    InterfaceBuilder& doc(std::string text) {
        descriptor_.doc = std::move(text);
        return *this;
    }

    /**
     * @brief Declare an operation backed by a member function
     *
     * @tparam Method Member-function pointer, e.g. &Person::getName
     * @param name Operation name (accessor-prefixed)
     * @param metadata Field/Doc/Alias for the operation, Param{...} for its value parameter
     */
    template<auto Method, typename... Metadata>
    InterfaceBuilder& operation(std::string name, Metadata&&... metadata) {
        using Traits = detail::MethodTraits<decltype(Method)>;
        static_assert(std::is_base_of_v<typename Traits::Class, Self>,
                      "operation must be a member of the described interface");

        OperationDescriptor op;
        op.name = std::move(name);
        op.parameter_types = Traits::parameter_types();
        if constexpr (!std::is_void_v<typename Traits::Return>) {
            op.return_type = describe_type<typename Traits::Return>();
        }
        op.parameter_annotations.resize(op.parameter_types.size());
        (attach(op, std::forward<Metadata>(metadata)), ...);
        descriptor_.operations.push_back(std::move(op));
        return *this;
    }

    /// Declare an operation from an explicit descriptor
    InterfaceBuilder& operation(OperationDescriptor op) {
        descriptor_.operations.push_back(std::move(op));
        return *this;
    }

    [[nodiscard]] InterfaceDescriptor build() const { return descriptor_; }

    operator InterfaceDescriptor() const { return descriptor_; }

private:
    static void attach(OperationDescriptor& op, Annotation annotation) {
        op.annotations.push_back(std::move(annotation));
    }

    // Parameter metadata belongs to the value parameter, which is the last one
    static void attach(OperationDescriptor& op, Param param) {
        if (op.parameter_annotations.empty()) {
            throw std::logic_error("operation " + op.name + " has no parameter to annotate");
        }
        auto& target = op.parameter_annotations.back();
        for (auto& annotation : param.annotations) {
            target.push_back(std::move(annotation));
        }
    }

    InterfaceDescriptor descriptor_;
};

} // namespace dynrec

/**
 * @brief Declare a member-function operation, using the method name as operation name
 *
 * Only valid inside a record interface (it refers to DynamicRecord's Self alias).
 */
#define DYNREC_OPERATION(method, ...) \
    operation<&Self::method>(#method __VA_OPT__(,) __VA_ARGS__)
