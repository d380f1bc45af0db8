/**
 * @file record_adapter.hpp
 * @brief Dispatches record-interface operations onto one generic record
 *
 * The dispatch table (operation name -> kind, field, required flag) is built
 * once at construction from the interface descriptor. After that the adapter
 * only touches the bound record; it adds no locking of its own.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/compiler/naming_resolver.hpp"
#include "dynrec/interface/interface_descriptor.hpp"
#include "dynrec/value/generic_record.hpp"

#include <map>
#include <span>
#include <string>
#include <string_view>

namespace dynrec {

class RecordAdapter {
public:
    struct Binding {
        OperationKind kind;
        std::string field;
        bool required;
    };

    /**
     * @param descriptor Interface whose operations are dispatched
     * @param record Record to bind; must outlive the adapter
     * @throws NamingError if an operation is not an accessor
     */
    RecordAdapter(const InterfaceDescriptor& descriptor, GenericRecord& record);

    /**
     * @brief Invoke one operation
     *
     * @return Field value for getters, boolean "removed" for removers, null otherwise
     * @throws RequiredFieldMissingException reading an unset required field
     * @throws InvalidFieldError for unknown operations, wrong arity or values
     *         the record's schema rejects
     */
    Value dispatch(std::string_view operation, std::span<const Value> args);

    [[nodiscard]] bool handles(std::string_view operation) const;

    [[nodiscard]] const Binding& binding(std::string_view operation) const;

    [[nodiscard]] GenericRecord& record() const { return record_; }

private:
    std::map<std::string, Binding, std::less<>> table_;
    GenericRecord& record_;
};

} // namespace dynrec
