#pragma once

/**
 * @file dynrec.hpp
 * @brief Main DynRec header - include this to get everything you need
 *
 * This header provides:
 * - DynamicRecord base and InterfaceBuilder for declaring record interfaces
 * - Field / Doc / Alias / Param metadata
 * - SchemaCompiler and Avro-compatible JSON export
 * - GenericRecord, the schema-shaped value container
 * - RecordFactory with schema cache and schema store
 *
 * Users include this + their record interface headers, that's it!
 */

#include "dynrec/errors.hpp"
#include "dynrec/value/value.hpp"
#include "dynrec/value/generic_record.hpp"
#include "dynrec/schema/schema.hpp"
#include "dynrec/schema/schema_json.hpp"
#include "dynrec/interface/annotations.hpp"
#include "dynrec/interface/type_descriptor.hpp"
#include "dynrec/interface/interface_descriptor.hpp"
#include "dynrec/compiler/naming_resolver.hpp"
#include "dynrec/compiler/annotation_collector.hpp"
#include "dynrec/compiler/type_mapper.hpp"
#include "dynrec/compiler/schema_compiler.hpp"
#include "dynrec/record/record_adapter.hpp"
#include "dynrec/record/dynamic_record.hpp"
#include "dynrec/config/factory_config.hpp"
#include "dynrec/registry/schema_cache.hpp"
#include "dynrec/registry/schema_store.hpp"
#include "dynrec/registry/record_factory.hpp"

/**
 * @namespace dynrec
 * @brief DynRec - typed record interfaces over schema-shaped generic records
 *
 * Key Features:
 * - Record schemas compiled from declared accessor operations
 * - Naming-convention field discovery (get/is/set/addTo/putInto/removeFrom)
 * - Optional fields as null-or-T unions with a null default
 * - Nested, repeated and recursive record types
 * - Typed handles dispatching onto a GenericRecord with required-field checks
 */
