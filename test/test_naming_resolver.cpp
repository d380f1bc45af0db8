/**
 * @file test_naming_resolver.cpp
 * @brief Accessor-name to field-name resolution
 *
 * Validates:
 * - Every prefix strips correctly and lower-cases the first character
 * - Empty remainders and unknown prefixes raise NamingError
 * - Prefix matching order
 */

#include "dynrec/compiler/naming_resolver.hpp"
#include "dynrec/errors.hpp"

#include <cassert>
#include <cctype>
#include <iostream>
#include <string>

using namespace dynrec;

int main() {
    std::cout << "=== Naming Resolver Tests ===\n\n";

    // Test 1: every prefix with a valid remainder
    {
        std::cout << "Test 1: prefix stripping\n";
        for (const auto& [prefix, kind] : kAccessorPrefixes) {
            for (std::string remainder : {"Name", "FirstName", "X", "url"}) {
                std::string expected = remainder;
                expected[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(expected[0])));
                assert(resolve_field_name(std::string(prefix) + remainder, prefix) == expected);
            }
        }
        assert(resolve_field_name("getFirstName", "get") == "firstName");
        assert(resolve_field_name("isActive", "is") == "active");
        assert(resolve_field_name("putIntoScores", "putInto") == "scores");
        std::cout << "  PASS\n\n";
    }

    // Test 2: empty remainder fails
    {
        std::cout << "Test 2: empty remainder\n";
        for (const auto& [prefix, kind] : kAccessorPrefixes) {
            bool threw = false;
            try {
                (void)resolve_field_name(prefix, prefix);
            } catch (const NamingError& e) {
                threw = true;
                assert(e.operation() == std::string(prefix));
            }
            assert(threw);
        }
        std::cout << "  PASS\n\n";
    }

    // Test 3: classification
    {
        std::cout << "Test 3: classify_operation\n";
        auto getter = classify_operation("getName");
        assert(getter.kind == OperationKind::Getter && getter.field_name == "name");

        auto is_getter = classify_operation("isActive");
        assert(is_getter.kind == OperationKind::Getter && is_getter.field_name == "active");

        auto setter = classify_operation("setName");
        assert(setter.kind == OperationKind::Setter && setter.field_name == "name");

        auto adder = classify_operation("addToTags");
        assert(adder.kind == OperationKind::Adder && adder.field_name == "tags");

        auto putter = classify_operation("putIntoScores");
        assert(putter.kind == OperationKind::Putter && putter.field_name == "scores");

        auto remover = classify_operation("removeFromTags");
        assert(remover.kind == OperationKind::Remover && remover.field_name == "tags");
        std::cout << "  PASS\n\n";
    }

    // Test 4: names without an accessor prefix
    {
        std::cout << "Test 4: unknown prefixes\n";
        for (const char* name : {"name", "fetchName", "toString", "add", "put", ""}) {
            bool threw = false;
            try {
                (void)classify_operation(name);
            } catch (const NamingError&) {
                threw = true;
            }
            assert(threw);
        }

        bool threw = false;
        try {
            (void)classify_operation("get");
        } catch (const NamingError& e) {
            threw = true;
            assert(std::string(e.what()).find("empty field name") != std::string::npos);
        }
        assert(threw);
        std::cout << "  PASS\n\n";
    }

    std::cout << "=== All Naming Resolver Tests Passed! ===\n";
    return 0;
}
