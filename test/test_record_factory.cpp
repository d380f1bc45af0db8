/**
 * @file test_record_factory.cpp
 * @brief RecordFactory with JSON configuration and schema store
 *
 * Validates:
 * - FactoryConfig loads from JSON, missing keys keep defaults
 * - create/wrap bind typed handles to generic records
 * - Schemas register under the configured subject strategy
 */

#include "test_records.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace dynrec;
using namespace test_records;

namespace {

std::string write_config(const std::string& name, const std::string& json) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path) << json;
    return path.string();
}

} // namespace

int main() {
    std::cout << "=== Record Factory Tests ===\n\n";

    // Test 1: config loading
    {
        std::cout << "Test 1: load_factory_config\n";
        const auto path = write_config("dynrec_factory.json", R"({
            "default_namespace": "com.example",
            "subject_strategy": "topic_value",
            "topic": "people",
            "verbose": true
        })");
        FactoryConfig config = load_factory_config(path);
        assert(config.default_namespace == "com.example");
        assert(config.subject_strategy == SubjectStrategy::topic_value);
        assert(config.topic == "people");
        assert(config.verbose);
        assert(config.validate_on_wrap);
        std::filesystem::remove(path);

        std::cout << "  " << to_json(config) << "\n";

        bool threw = false;
        try {
            (void)load_factory_config("factory.yaml");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        std::cout << "  PASS\n\n";
    }

    // Test 2: create
    {
        std::cout << "Test 2: create\n";
        RecordFactory factory(FactoryConfig{.default_namespace = "com.example"});
        OptionalRequired record = factory.create<OptionalRequired>();
        assert(record.record().schema().full_name() == "com.example.OptionalRequired");
        record.setRequiredValue("my_value");
        assert(record.getRequiredValue() == "my_value");
        assert(!record.getOptionalValue());

        // Cached schema shared between records
        OptionalRequired other = factory.create<OptionalRequired>();
        assert(&other.record().schema() == &record.record().schema());
        assert(factory.cache().compile_count() == 1);
        std::cout << "  PASS\n\n";
    }

    // Test 3: wrap
    {
        std::cout << "Test 3: wrap\n";
        RecordFactory factory;
        auto generic = GenericRecord::create(factory.schema_for<Tagged>());
        generic->set("tags", Value::array({Value::string("a")}));

        Tagged tagged = factory.wrap<Tagged>(generic);
        tagged.addToTags("b");
        assert((tagged.getTags() == std::vector<std::string>{"a", "b"}));
        assert(generic->get("tags").as<Value::Array>().size() == 2);

        bool threw = false;
        try {
            (void)factory.wrap<OptionalRequired>(generic);
        } catch (const InvalidFieldError&) {
            threw = true;
        }
        assert(threw);

        // Required fields checked on wrap
        threw = false;
        try {
            (void)factory.wrap<OptionalRequired>(GenericRecord::create(factory.schema_for<OptionalRequired>()));
        } catch (const RequiredFieldMissingException& e) {
            threw = true;
            assert(e.field_name() == "requiredValue");
        }
        assert(threw);

        RecordFactory lenient(FactoryConfig{.validate_on_wrap = false});
        auto unset = lenient.wrap<OptionalRequired>(GenericRecord::create(lenient.schema_for<OptionalRequired>()));
        assert(!unset.getOptionalValue());
        std::cout << "  PASS\n\n";
    }

    // Test 4: nested handles
    {
        std::cout << "Test 4: create_child\n";
        RecordFactory factory;
        Person person = factory.create<Person>();
        Address address = factory.create_child<Address>(person.record(), "address");
        address.setStreet("Elm St 5");
        person.setAddress(address);
        assert(person.getAddress().getStreet() == "Elm St 5");

        // A separately created Address has the same schema name
        Address standalone = factory.create<Address>();
        standalone.setStreet("Oak St 9");
        person.setAddress(standalone);
        assert(person.getAddress().getStreet() == "Oak St 9");
        std::cout << "  PASS\n\n";
    }

    // Test 5: registration
    {
        std::cout << "Test 5: register_schema\n";
        auto store = std::make_shared<InMemorySchemaStore>();

        RecordFactory by_record(FactoryConfig{.verbose = true}, store);
        assert(by_record.subject_for<Person>() == "test.records.Person");
        const int32_t person_id = by_record.register_schema<Person>();
        assert(person_id == 1);
        assert(by_record.register_schema<Person>() == person_id);
        assert(*store->fetch("test.records.Person") == *by_record.schema_for<Person>());

        RecordFactory by_topic(FactoryConfig{.subject_strategy = SubjectStrategy::topic_value, .topic = "tags"}, store);
        assert(by_topic.subject_for<Tagged>() == "tags-value");
        assert(by_topic.register_schema<Tagged>() == 2);
        assert(store->fetch("tags-value")->name() == "Tagged");

        RecordFactory no_topic(FactoryConfig{.subject_strategy = SubjectStrategy::topic_value}, store);
        bool threw = false;
        try {
            (void)no_topic.register_schema<Tagged>();
        } catch (const SchemaStoreError&) {
            threw = true;
        }
        assert(threw);

        RecordFactory no_store;
        threw = false;
        try {
            (void)no_store.register_schema<Tagged>();
        } catch (const SchemaStoreError&) {
            threw = true;
        }
        assert(threw);
        std::cout << "  PASS\n\n";
    }

    std::cout << "=== All Record Factory Tests Passed! ===\n";
    return 0;
}
