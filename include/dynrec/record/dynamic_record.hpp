/**
 * @file dynamic_record.hpp
 * @brief CRTP base for typed record interfaces
 *
 * A record interface derives from DynamicRecord<Self>, declares its accessors
 * as thin invoke() wrappers and lists them in a static describe(). Copies of
 * a handle share the bound record.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/errors.hpp"
#include "dynrec/interface/interface_descriptor.hpp"
#include "dynrec/record/record_adapter.hpp"
#include "dynrec/value/generic_record.hpp"

#include <array>
#include <memory>
#include <string_view>
#include <type_traits>

namespace dynrec {

template<typename Derived>
class DynamicRecord : public RecordInterfaceTag {
public:
    using Self = Derived;

    explicit DynamicRecord(std::shared_ptr<GenericRecord> record)
        : record_(std::move(record)) {
        if (!record_) {
            throw InvalidFieldError("cannot bind " + unqualified_type_name<Derived>() + " to a null record");
        }
        adapter_ = std::make_shared<RecordAdapter>(descriptor(), *record_);
    }

    /// Interface descriptor, built on first use
    static const InterfaceDescriptor& descriptor() {
        static const InterfaceDescriptor instance = Derived::describe();
        return instance;
    }

    [[nodiscard]] GenericRecord& record() const { return *record_; }
    [[nodiscard]] const std::shared_ptr<GenericRecord>& record_ptr() const { return record_; }

protected:
    /**
     * @brief Dispatch an operation, converting arguments and result
     */
    template<typename R = void, typename... Args>
    R invoke(std::string_view operation, const Args&... args) const {
        const std::array<Value, sizeof...(Args)> values{to_value(args)...};
        Value result = adapter_->dispatch(operation, values);
        if constexpr (!std::is_void_v<R>) {
            return from_value<R>(result);
        }
    }

private:
    std::shared_ptr<GenericRecord> record_;
    std::shared_ptr<RecordAdapter> adapter_;
};

} // namespace dynrec
