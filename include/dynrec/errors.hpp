/**
 * @file errors.hpp
 * @brief Exception types raised by DynRec
 *
 * All errors are permanent, caller-visible failures. Nothing inside DynRec
 * retries or recovers from them.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace dynrec {

/**
 * @brief Common base for every DynRec exception
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Operation name does not decompose into a field name
 *
 * Raised by the naming resolver when an operation has no recognized accessor
 * prefix, or when the prefix is followed by an empty remainder ("get", "is").
 */
class NamingError : public Error {
public:
    NamingError(std::string operation, const std::string& reason)
        : Error("cannot derive field name from operation '" + operation + "': " + reason)
        , operation_(std::move(operation)) {}

    [[nodiscard]] const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief No schema type could be determined for a declared type or field
 *
 * Raised by the type mapper when no mapping rule applies, and re-raised by the
 * schema compiler with the failing field name. The original failure stays
 * reachable through cause().
 */
class ValueMappingException : public Error {
public:
    explicit ValueMappingException(const std::string& reason)
        : Error(reason) {}

    ValueMappingException(const std::string& reason, std::string field_name, std::exception_ptr cause)
        : Error(reason)
        , field_name_(std::move(field_name))
        , cause_(std::move(cause)) {}

    [[nodiscard]] const std::optional<std::string>& field_name() const { return field_name_; }
    [[nodiscard]] std::exception_ptr cause() const { return cause_; }

    /// Rethrows the chained cause, if any
    void rethrow_cause() const {
        if (cause_) {
            std::rethrow_exception(cause_);
        }
    }

private:
    std::optional<std::string> field_name_;
    std::exception_ptr cause_;
};

/**
 * @brief A required field was read while it holds no value
 */
class RequiredFieldMissingException : public Error {
public:
    explicit RequiredFieldMissingException(std::string field_name)
        : Error("required field '" + field_name + "' has no value")
        , field_name_(std::move(field_name)) {}

    [[nodiscard]] const std::string& field_name() const { return field_name_; }

private:
    std::string field_name_;
};

/**
 * @brief Misuse of a generic record: unknown field, wrong value shape,
 *        unknown operation or wrong argument count
 */
class InvalidFieldError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Schema store lookup or registration failure
 */
class SchemaStoreError : public Error {
public:
    using Error::Error;
};

} // namespace dynrec
