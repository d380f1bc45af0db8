#include "dynrec/record/record_adapter.hpp"
#include "dynrec/compiler/record_interface_descriptor.hpp"
#include "dynrec/errors.hpp"

namespace dynrec {

namespace {

std::size_t arity_of(OperationKind kind) {
    switch (kind) {
        case OperationKind::Getter:  return 0;
        case OperationKind::Putter:  return 2;
        case OperationKind::Setter:
        case OperationKind::Adder:
        case OperationKind::Remover: return 1;
    }
    return 0;
}

} // namespace

RecordAdapter::RecordAdapter(const InterfaceDescriptor& descriptor, GenericRecord& record)
    : record_(record) {
    const RecordInterfaceDescriptor partition = partition_operations(descriptor);
    for (const auto& [name, resolved] : partition.operations) {
        const FieldDescriptor* field = partition.field(resolved.field_name);
        table_.emplace(name, Binding{
            .kind = resolved.kind,
            .field = resolved.field_name,
            .required = field ? field->required : true,
        });
    }
}

bool RecordAdapter::handles(std::string_view operation) const {
    return table_.find(operation) != table_.end();
}

const RecordAdapter::Binding& RecordAdapter::binding(std::string_view operation) const {
    auto it = table_.find(operation);
    if (it == table_.end()) {
        throw InvalidFieldError("record " + record_.schema().full_name() +
                                " has no operation '" + std::string(operation) + "'");
    }
    return it->second;
}

Value RecordAdapter::dispatch(std::string_view operation, std::span<const Value> args) {
    const Binding& b = binding(operation);

    if (args.size() != arity_of(b.kind)) {
        throw InvalidFieldError(std::string(operation) + " expects " + std::to_string(arity_of(b.kind)) +
                                " argument(s), got " + std::to_string(args.size()));
    }

    switch (b.kind) {
        case OperationKind::Getter: {
            const Value& current = record_.get(b.field);
            if (current.is_null() && b.required) {
                throw RequiredFieldMissingException(b.field);
            }
            return current;
        }
        case OperationKind::Setter:
            record_.set(b.field, args[0]);
            return Value::null();
        case OperationKind::Adder:
            record_.append_to(b.field, args[0]);
            return Value::null();
        case OperationKind::Putter:
            record_.put_into(b.field, args[0].as<std::string>(), args[1]);
            return Value::null();
        case OperationKind::Remover:
            return Value::boolean(record_.remove_from(b.field, args[0]));
    }
    return Value::null();
}

} // namespace dynrec
