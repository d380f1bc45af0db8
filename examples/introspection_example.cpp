/**
 * @file introspection_example.cpp
 * @brief Demonstrates DynRec introspection - exporting record schemas
 *
 * Shows how to:
 * 1. Export a record schema to JSON
 * 2. Walk the compiled fields
 * 3. Write schemas to file
 */

#include "records/library_records.hpp"
#include <iostream>

using namespace dynrec;

int main(int argc, char** argv) {
    SchemaCompiler compiler(CompilerConfig{.verbose = true, .default_namespace = "org.library"});

    std::cout << "=== Book schema (JSON) ===\n";
    SchemaDefinition book = compiler.compile<library::Book>();
    std::cout << to_json(book) << "\n\n";

    std::cout << "=== Fields ===\n";
    for (const auto& field : book.fields()) {
        std::cout << "  " << field.name << ": " << describe(field.type);
        if (field.default_value) {
            std::cout << " = " << field.default_value->describe();
        }
        if (!field.doc.empty()) {
            std::cout << "  // " << field.doc;
        }
        std::cout << "\n";
    }

    const std::string filename = argc > 1 ? argv[1] : "book_schema.json";
    try {
        write_to_file(book, filename);
        std::cout << "\nSchema written to " << filename << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Failed to write schema: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
