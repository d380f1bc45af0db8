#include "dynrec/compiler/record_interface_descriptor.hpp"
#include "dynrec/errors.hpp"

#include <algorithm>
#include <iostream>

namespace dynrec {

const TypeRef& FieldDescriptor::value_type() const {
    if (getter) {
        if (!getter->return_type) {
            throw ValueMappingException("getter " + getter->name + " of field " + name + " returns void");
        }
        return *getter->return_type;
    }
    if (setter && setter->parameter_types.size() == 1) {
        return setter->parameter_types.front();
    }
    throw ValueMappingException("No getter or setter found for field " + name);
}

const FieldDescriptor* RecordInterfaceDescriptor::field(const std::string& name) const {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const FieldDescriptor& f) { return f.name == name; });
    return it == fields.end() ? nullptr : &*it;
}

namespace {

FieldDescriptor& field_slot(RecordInterfaceDescriptor& result, const std::string& name) {
    auto it = std::find_if(result.fields.begin(), result.fields.end(),
                           [&](const FieldDescriptor& f) { return f.name == name; });
    if (it != result.fields.end()) {
        return *it;
    }
    result.fields.push_back(FieldDescriptor{.name = name});
    return result.fields.back();
}

void bind(const OperationDescriptor*& slot, const OperationDescriptor& op,
          const std::string& field, bool verbose) {
    if (slot) {
        if (verbose) {
            std::cout << "[SchemaCompiler] " << op.name << " ignored, field " << field
                      << " already bound to " << slot->name << "\n";
        }
        return;
    }
    slot = &op;
}

} // namespace

RecordInterfaceDescriptor partition_operations(const InterfaceDescriptor& descriptor, bool verbose) {
    RecordInterfaceDescriptor result;
    result.source = &descriptor;
    AnnotationCollector collector(verbose);

    for (const auto& op : descriptor.operations) {
        ResolvedOperation resolved = classify_operation(op.name);
        FieldDescriptor& field = field_slot(result, resolved.field_name);

        switch (resolved.kind) {
            case OperationKind::Getter:
                bind(field.getter, op, field.name, verbose);
                break;
            case OperationKind::Setter:
                bind(field.setter, op, field.name, verbose);
                break;
            case OperationKind::Adder:
                bind(field.adder, op, field.name, verbose);
                break;
            case OperationKind::Putter:
                bind(field.putter, op, field.name, verbose);
                break;
            case OperationKind::Remover:
                bind(field.remover, op, field.name, verbose);
                break;
        }

        // Adders and putters also carry metadata on their value parameter
        if ((resolved.kind == OperationKind::Adder || resolved.kind == OperationKind::Putter) &&
            !op.parameter_annotations.empty()) {
            collector.add(field.name, op.parameter_annotations.back());
        }
        collector.add(field.name, op.annotations);

        result.operations.emplace(op.name, std::move(resolved));
    }

    for (auto& field : result.fields) {
        field.metadata = collector.metadata_for(field.name);
        field.required = is_required(field.metadata);
    }
    return result;
}

} // namespace dynrec
