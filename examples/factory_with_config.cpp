/**
 * @file factory_with_config.cpp
 * @brief RecordFactory driven by a JSON config file
 *
 * Usage: ./factory_with_config <config.json>
 *
 * Example config.json:
 * @code{.json}
 * { "default_namespace": "org.library", "subject_strategy": "topic_value", "topic": "books", "verbose": true }
 * @endcode
 */

#include "records/library_records.hpp"
#include <iostream>

using namespace dynrec;

int main(int argc, char** argv) {
    try {
        FactoryConfig config;
        if (argc == 2) {
            config = load_factory_config(argv[1]);
        } else {
            std::cerr << "No config given, using defaults\n";
            std::cerr << "Usage: " << argv[0] << " <config.json>\n";
        }
        std::cout << "Config: " << to_json(config) << "\n";

        auto store = std::make_shared<InMemorySchemaStore>();
        RecordFactory factory(config, store);

        library::Book book = factory.create<library::Book>();
        book.setTitle("Leaves of Grass");
        book.setGenre(library::Genre::Poetry);
        auto author = factory.create_child<library::Author>(book.record(), "author");
        author.setName("Walt Whitman");
        book.setAuthor(author);
        book.addToKeywords("verse");

        const int32_t id = factory.register_schema<library::Book>();
        std::cout << "Registered " << factory.subject_for<library::Book>() << " with id " << id << "\n";

        // A second handle over the same record
        library::Book view = factory.wrap<library::Book>(book.record_ptr());
        view.addToKeywords("poetry");
        std::cout << "Keywords on original handle: " << book.getKeywords().size() << "\n";
        std::cout << "Latest schema: " << to_json(*store->fetch(factory.subject_for<library::Book>())) << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
