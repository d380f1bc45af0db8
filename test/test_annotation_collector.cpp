/**
 * @file test_annotation_collector.cpp
 * @brief Per-field metadata accumulation and operation partitioning
 *
 * Validates:
 * - First registration wins per metadata kind, duplicates are dropped
 * - Metadata from getter, setter and adder/putter value parameters is merged
 * - Fields are discovered in declaration order
 */

#include "dynrec/compiler/annotation_collector.hpp"
#include "dynrec/compiler/record_interface_descriptor.hpp"
#include "dynrec/errors.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace dynrec;

// Accessors are only described here, never invoked
struct Inventory : RecordInterfaceTag {
    std::vector<std::string> getItems() const { return {}; }
    void addToItems(const std::string&) {}
    std::map<std::string, int32_t> getStock() const { return {}; }
    void putIntoStock(const std::string&, int32_t) {}
    void setOwner(const std::string&) {}
    std::string getOwner() const { return {}; }
    void getNothing() const {}
    void setPair(const std::string&, const std::string&) {}
};

int main() {
    std::cout << "=== Annotation Collector Tests ===\n\n";

    // Test 1: first registration wins
    {
        std::cout << "Test 1: duplicate metadata dropped\n";
        AnnotationCollector collector(true);
        collector.add("name", {Field{.required = false}, Doc{"first"}});
        collector.add("name", {Field{.required = true}, Doc{"second"}, Alias{"fullName"}});

        const auto& set = collector.metadata_for("name");
        assert(set.size() == 3);
        assert(!is_required(set));
        assert(doc_of(set) == "first");
        assert(aliases_of(set) == std::vector<std::string>{"fullName"});
        assert(collector.dropped_count() == 2);
        std::cout << "  PASS\n\n";
    }

    // Test 2: unknown fields and defaults
    {
        std::cout << "Test 2: absent metadata\n";
        AnnotationCollector collector;
        assert(collector.metadata_for("missing").empty());
        assert(is_required(collector.metadata_for("missing")));
        assert(doc_of(collector.metadata_for("missing")).empty());
        assert(aliases_of(collector.metadata_for("missing")).empty());
        std::cout << "  PASS\n\n";
    }

    // Test 3: parameter metadata on adders and putters
    {
        std::cout << "Test 3: value-parameter metadata\n";
        InterfaceDescriptor descriptor = InterfaceBuilder<Inventory>()
            .operation<&Inventory::getItems>("getItems")
            .operation<&Inventory::addToItems>("addToItems", Param{Doc{"item names"}})
            .operation<&Inventory::getStock>("getStock", Doc{"from getter"})
            .operation<&Inventory::putIntoStock>("putIntoStock", Param{Field{.required = false}, Doc{"from param"}});

        auto partition = partition_operations(descriptor, true);
        assert(partition.fields.size() == 2);
        assert(partition.fields[0].name == "items");
        assert(partition.fields[1].name == "stock");

        const auto* items = partition.field("items");
        assert(items && items->getter && items->adder);
        assert(doc_of(items->metadata) == "item names");
        assert(items->required);

        const auto* stock = partition.field("stock");
        assert(stock && stock->putter);
        assert(doc_of(stock->metadata) == "from getter");
        assert(!stock->required);
        std::cout << "  PASS\n\n";
    }

    // Test 4: field discovery order and value types
    {
        std::cout << "Test 4: discovery order\n";
        InterfaceDescriptor descriptor = InterfaceBuilder<Inventory>()
            .operation<&Inventory::setOwner>("setOwner")
            .operation<&Inventory::getItems>("getItems")
            .operation<&Inventory::getOwner>("getOwner");

        auto partition = partition_operations(descriptor);
        assert(partition.fields.size() == 2);
        assert(partition.fields[0].name == "owner");
        assert(partition.fields[1].name == "items");
        assert(partition.fields[0].value_type().category == TypeCategory::String);
        assert(partition.operations.at("setOwner").kind == OperationKind::Setter);
        std::cout << "  PASS\n\n";
    }

    // Test 5: fields without a usable value type
    {
        std::cout << "Test 5: missing value type\n";
        InterfaceDescriptor void_getter = InterfaceBuilder<Inventory>()
            .operation<&Inventory::getNothing>("getNothing");
        auto partition = partition_operations(void_getter);
        bool threw = false;
        try {
            (void)partition.fields[0].value_type();
        } catch (const ValueMappingException&) {
            threw = true;
        }
        assert(threw);

        InterfaceDescriptor two_params = InterfaceBuilder<Inventory>()
            .operation<&Inventory::setPair>("setPair");
        partition = partition_operations(two_params);
        threw = false;
        try {
            (void)partition.fields[0].value_type();
        } catch (const ValueMappingException& e) {
            threw = true;
            assert(std::string(e.what()).find("pair") != std::string::npos);
        }
        assert(threw);
        std::cout << "  PASS\n\n";
    }

    // Test 6: operations without accessor prefix
    {
        std::cout << "Test 6: non-accessor operation\n";
        InterfaceDescriptor descriptor = InterfaceBuilder<Inventory>()
            .operation<&Inventory::getOwner>("owner");
        bool threw = false;
        try {
            (void)partition_operations(descriptor);
        } catch (const NamingError& e) {
            threw = true;
            assert(e.operation() == "owner");
        }
        assert(threw);
        std::cout << "  PASS\n\n";
    }

    std::cout << "=== All Annotation Collector Tests Passed! ===\n";
    return 0;
}
