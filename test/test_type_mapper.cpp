/**
 * @file test_type_mapper.cpp
 * @brief Declared type -> schema type mapping rules
 *
 * Validates:
 * - Every supported scalar, enum, record, sequence and map resolves
 * - Optionality wrapping applies whatever rule produced the base type
 * - Unsupported types raise ValueMappingException naming the type
 */

#include "test_records.hpp"

#include <array>
#include <cassert>
#include <iostream>
#include <set>
#include <unordered_map>

using namespace dynrec;
using namespace test_records;

struct NotARecord {
    int x;
};

template<typename T>
bool mapping_fails() {
    try {
        (void)resolve_type(describe_type<T>());
    } catch (const ValueMappingException& e) {
        std::cout << "  rejected: " << e.what() << "\n";
        return true;
    }
    return false;
}

const MetadataSet kOptional{{MetadataKind::Field, Field{.required = false}}};

int main() {
    std::cout << "=== Type Mapper Tests ===\n\n";

    // Test 1: scalars
    {
        std::cout << "Test 1: scalar kinds\n";
        assert(resolve_type(describe_type<std::string>()).kind() == SchemaKind::String);
        assert(resolve_type(describe_type<bool>()).kind() == SchemaKind::Boolean);
        assert(resolve_type(describe_type<int32_t>()).kind() == SchemaKind::Int);
        assert(resolve_type(describe_type<int64_t>()).kind() == SchemaKind::Long);
        assert(resolve_type(describe_type<float>()).kind() == SchemaKind::Float);
        assert(resolve_type(describe_type<double>()).kind() == SchemaKind::Double);
        assert(resolve_type(describe_type<Bytes>()).kind() == SchemaKind::Bytes);
        std::cout << "  PASS\n\n";
    }

    // Test 2: enums keep declaration order
    {
        std::cout << "Test 2: enumerations\n";
        SchemaType color = resolve_type(describe_type<Color>());
        assert(color.kind() == SchemaKind::Enum);
        assert(color.name() == "Color");
        assert((color.symbols() == std::vector<std::string>{"Red", "Green", "Blue"}));
        std::cout << "  PASS\n\n";
    }

    // Test 3: nested record interfaces
    {
        std::cout << "Test 3: nested record\n";
        SchemaType address = resolve_type(describe_type<Address>());
        assert(address.kind() == SchemaKind::Record);
        assert(address.full_name() == "test.records.Address");
        assert(address.fields().size() == 2);
        std::cout << "  PASS\n\n";
    }

    // Test 4: sequences and maps of every scalar
    {
        std::cout << "Test 4: containers\n";
        SchemaType strings = resolve_type(describe_type<std::vector<std::string>>());
        assert(strings.kind() == SchemaKind::Array);
        assert(strings.items().kind() == SchemaKind::String);

        SchemaType longs = resolve_type(describe_type<std::vector<int64_t>>());
        assert(longs.items().kind() == SchemaKind::Long);

        SchemaType doubles = resolve_type(describe_type<std::map<std::string, double>>());
        assert(doubles.kind() == SchemaKind::Map);
        assert(doubles.values().kind() == SchemaKind::Double);

        SchemaType flags = resolve_type(describe_type<std::unordered_map<std::string, bool>>());
        assert(flags.kind() == SchemaKind::Map);
        assert(flags.values().kind() == SchemaKind::Boolean);

        SchemaType nested = resolve_type(describe_type<std::vector<std::map<std::string, Address>>>());
        assert(nested.items().values().kind() == SchemaKind::Record);
        std::cout << "  PASS\n\n";
    }

    // Test 5: optionality wrapping
    {
        std::cout << "Test 5: nullable wrapping\n";
        SchemaType name = resolve_type(describe_type<std::string>(), kOptional);
        assert(name.kind() == SchemaKind::Union);
        assert(name.branches().size() == 2);
        assert(name.branches()[0].kind() == SchemaKind::Null);
        assert(name.branches()[1].kind() == SchemaKind::String);

        SchemaType tags = resolve_type(describe_type<std::vector<std::string>>(), kOptional);
        assert(tags.is_nullable());
        assert(tags.non_null().kind() == SchemaKind::Array);
        assert(tags.non_null().items() == SchemaType::nullable(SchemaType::string()));

        // Map values and nested sequence items carry the field's optionality too
        SchemaType scores = resolve_type(describe_type<std::map<std::string, int64_t>>(), kOptional);
        assert(scores == SchemaType::nullable(SchemaType::map(SchemaType::nullable(SchemaType::int64()))));

        SchemaType matrix = resolve_type(describe_type<std::vector<std::vector<double>>>(), kOptional);
        assert(matrix.non_null().items().non_null().items() == SchemaType::nullable(SchemaType::float64()));

        // Required containers keep plain items
        SchemaType plain = resolve_type(describe_type<std::vector<std::string>>());
        assert(plain == SchemaType::array(SchemaType::string()));

        SchemaType address = resolve_type(describe_type<std::optional<Address>>(), kOptional);
        assert(address.non_null().kind() == SchemaKind::Record);

        const MetadataSet required{{MetadataKind::Field, Field{.required = true}}};
        assert(resolve_type(describe_type<std::string>(), required).kind() == SchemaKind::String);
        std::cout << "  PASS\n\n";
    }

    // Test 6: unsupported types
    {
        std::cout << "Test 6: unsupported types\n";
        assert(mapping_fails<NotARecord>());
        assert(mapping_fails<char>());
        assert(mapping_fails<uint64_t>());
        assert(mapping_fails<std::set<std::string>>());
        assert((mapping_fails<std::array<int32_t, 4>>()));
        assert((mapping_fails<std::map<int32_t, std::string>>()));
        assert(mapping_fails<std::vector<NotARecord>>());

        try {
            (void)resolve_type(describe_type<NotARecord>());
            assert(false);
        } catch (const ValueMappingException& e) {
            assert(std::string(e.what()).find("NotARecord") != std::string::npos);
        }
        std::cout << "  PASS\n\n";
    }

    std::cout << "=== All Type Mapper Tests Passed! ===\n";
    return 0;
}
