#include "records/library_records.hpp"
#include <iostream>

using namespace dynrec;
using namespace library;

int main() {
    std::cout << "DynRec Simple Usage Examples\n";
    std::cout << "============================\n\n";

    // ========================================================================
    // Example 1: Compile a record interface
    // ========================================================================

    std::cout << "=== Example 1: Compile Book ===\n\n";

    SchemaCompiler compiler(CompilerConfig{.default_namespace = "org.library"});
    auto schema = std::make_shared<const SchemaDefinition>(compiler.compile<Book>());

    std::cout << "Compiled: " << *schema << "\n\n";

    // ========================================================================
    // Example 2: Typed handle over a generic record
    // ========================================================================

    std::cout << "=== Example 2: Fill a Book ===\n\n";

    Book book(GenericRecord::create(schema));
    book.setTitle("The Structure of Scientific Revolutions");
    book.setGenre(Genre::Science);

    Author author(book.record().create_child("author"));
    author.setName("Thomas Kuhn");
    author.setBorn(1922);
    book.setAuthor(author);

    book.addToKeywords("paradigm");
    book.addToKeywords("philosophy");
    book.putIntoRatings("critics", 4.6);
    book.putIntoRatings("readers", 4.1);

    std::cout << "Title: " << book.getTitle() << "\n";
    std::cout << "Author: " << book.getAuthor().getName()
              << " (born " << book.getAuthor().getBorn().value_or(0) << ")\n";
    std::cout << "Keywords:";
    for (const auto& k : book.getKeywords()) {
        std::cout << " " << k;
    }
    std::cout << "\nRatings:";
    for (const auto& [source, rating] : book.getRatings()) {
        std::cout << " " << source << "=" << rating;
    }
    std::cout << "\nSubtitle: " << book.getSubtitle().value_or("<none>") << "\n\n";

    // ========================================================================
    // Example 3: Required-field enforcement
    // ========================================================================

    std::cout << "=== Example 3: Missing required field ===\n\n";

    Book draft(GenericRecord::create(schema));
    try {
        std::cout << draft.getTitle() << "\n";
    } catch (const RequiredFieldMissingException& e) {
        std::cout << "Caught: " << e.what() << "\n";
    }

    try {
        draft.record().validate();
    } catch (const RequiredFieldMissingException& e) {
        std::cout << "Validation failed on field: " << e.field_name() << "\n";
    }

    std::cout << "\nDone.\n";
    return 0;
}
