/**
 * @file test_schema_cache.cpp
 * @brief Memoized schema compile
 *
 * Validates:
 * - One compile per interface, shared result
 * - Concurrent first access compiles exactly once
 * - Failed compiles are not cached
 * - A failed compile leaves a newer entry for the same key alone
 */

#include "test_records.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <thread>
#include <typeindex>
#include <vector>

using namespace dynrec;
using namespace test_records;

int main() {
    std::cout << "=== Schema Cache Tests ===\n\n";

    // Test 1: memoization
    {
        std::cout << "Test 1: repeated get\n";
        SchemaCache cache(CompilerConfig{.verbose = true});
        auto first = cache.get<Person>();
        auto second = cache.get<Person>();
        assert(first.get() == second.get());
        assert(cache.compile_count() == 1);

        (void)cache.get<Tagged>();
        assert(cache.size() == 2);
        assert(cache.compile_count() == 2);

        cache.clear();
        assert(cache.size() == 0);
        auto third = cache.get<Person>();
        assert(*third == *first);
        assert(cache.compile_count() == 3);
        std::cout << "  PASS\n\n";
    }

    // Test 2: single flight
    {
        std::cout << "Test 2: concurrent first access\n";
        SchemaCache cache;
        std::atomic<int> describe_calls{0};
        const auto slow_describe = [&] {
            ++describe_calls;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return Person::describe();
        };

        std::vector<std::thread> threads;
        std::vector<SchemaCache::SchemaPtr> results(8);
        for (std::size_t i = 0; i < results.size(); ++i) {
            threads.emplace_back([&, i] {
                results[i] = cache.get_or_compile(std::type_index(typeid(Person)), slow_describe);
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        assert(describe_calls == 1);
        assert(cache.compile_count() == 1);
        for (const auto& r : results) {
            assert(r.get() == results.front().get());
        }
        std::cout << "  PASS\n\n";
    }

    // Test 3: errors are not cached
    {
        std::cout << "Test 3: failed compile retried\n";
        SchemaCache cache;
        int attempts = 0;
        const auto flaky = [&] {
            if (++attempts == 1) {
                throw ValueMappingException("first attempt fails");
            }
            return Tagged::describe();
        };

        bool threw = false;
        try {
            (void)cache.get_or_compile(std::type_index(typeid(Tagged)), flaky);
        } catch (const ValueMappingException&) {
            threw = true;
        }
        assert(threw);
        assert(cache.size() == 0);

        auto schema = cache.get_or_compile(std::type_index(typeid(Tagged)), flaky);
        assert(schema->name() == "Tagged");
        assert(attempts == 2);
        assert(cache.compile_count() == 1);
        std::cout << "  PASS\n\n";
    }

    // Test 4: failure after clear() keeps the replacement entry
    {
        std::cout << "Test 4: failed compile does not evict a newer entry\n";
        SchemaCache cache;
        const std::type_index key(typeid(Tagged));
        std::promise<void> started;
        std::promise<void> release;
        std::shared_future<void> released = release.get_future().share();
        std::thread second;
        SchemaCache::SchemaPtr second_result;

        const auto blocking = [&] {
            started.set_value();
            released.wait();
            return Tagged::describe();
        };
        const auto failing = [&]() -> InterfaceDescriptor {
            cache.clear();
            second = std::thread([&] { second_result = cache.get_or_compile(key, blocking); });
            started.get_future().wait();
            throw ValueMappingException("stale compile fails");
        };

        bool threw = false;
        try {
            (void)cache.get_or_compile(key, failing);
        } catch (const ValueMappingException&) {
            threw = true;
        }
        assert(threw);
        assert(cache.size() == 1);

        release.set_value();
        second.join();
        assert(second_result && second_result->name() == "Tagged");

        int later_calls = 0;
        auto cached = cache.get_or_compile(key, [&] {
            ++later_calls;
            return Tagged::describe();
        });
        assert(later_calls == 0);
        assert(cached.get() == second_result.get());
        assert(cache.compile_count() == 1);
        std::cout << "  PASS\n\n";
    }

    std::cout << "=== All Schema Cache Tests Passed! ===\n";
    return 0;
}
