/**
 * @file record_interface_descriptor.hpp
 * @brief Operations of a record interface, partitioned by kind and field
 *
 * Built once per compile (and once per adapter dispatch table). Holds
 * pointers into the InterfaceDescriptor it was built from, so it must not
 * outlive it.
 *
 * @author DynRec Development Team
 * @date March 3, 2026
 */

#pragma once

#include "dynrec/compiler/annotation_collector.hpp"
#include "dynrec/compiler/naming_resolver.hpp"
#include "dynrec/interface/interface_descriptor.hpp"

#include <map>
#include <string>
#include <vector>

namespace dynrec {

/**
 * @brief Everything known about one field before type resolution
 */
struct FieldDescriptor {
    std::string name;
    const OperationDescriptor* getter = nullptr;
    const OperationDescriptor* setter = nullptr;
    const OperationDescriptor* adder = nullptr;
    const OperationDescriptor* putter = nullptr;
    const OperationDescriptor* remover = nullptr;
    MetadataSet metadata;
    bool required = true;

    /**
     * @brief Declared value type: getter return type, else single setter parameter
     * @throws ValueMappingException if neither is available
     */
    [[nodiscard]] const TypeRef& value_type() const;
};

struct RecordInterfaceDescriptor {
    const InterfaceDescriptor* source = nullptr;

    /// Fields in first-discovery order
    std::vector<FieldDescriptor> fields;

    /// Operation name -> (kind, field)
    std::map<std::string, ResolvedOperation, std::less<>> operations;

    [[nodiscard]] const FieldDescriptor* field(const std::string& name) const;
};

/**
 * @brief Classify every operation and collect per-field metadata
 *
 * @throws NamingError for operation names without a valid accessor prefix
 */
RecordInterfaceDescriptor partition_operations(const InterfaceDescriptor& descriptor, bool verbose = false);

} // namespace dynrec
