#include <catch2/catch_all.hpp>
#include <od/dict.h>
#include <od/json.h>

#include <string>
#include <thread>
#include <vector>

using namespace od;

TEST_CASE("concurrent set keeps the index and entries consistent", "[dict][threads]") {
    auto d = make_dict();
    constexpr int threads = 8;
    constexpr int per_thread = 500;

    std::vector<std::thread> pool;
    for (int t = 0; t < threads; ++t) {
        pool.emplace_back([d, t]() {
            for (int k = 0; k < per_thread; ++k) {
                std::string key = "t" + std::to_string(t) + "-" + std::to_string(k);
                d->set(key, k);
                // Re-setting and deleting forces tombstones and compactions.
                if (k % 3 == 0) d->set(key, -k);
                if (k % 5 == 0) d->erase(key);
                d->set("shared", t);
            }
        });
    }
    for (auto& th : pool) th.join();

    size_t expected = 1; // "shared"
    for (int k = 0; k < per_thread; ++k)
        if (k % 5 != 0) expected += threads;

    REQUIRE(d->size() == expected);
    REQUIRE(d->keys().size() == d->size());
    REQUIRE(d->values().size() == d->size());
    REQUIRE(d->tombstones() < Dict::kCompactThreshold);
}

TEST_CASE("readers run alongside a writer", "[dict][threads]") {
    auto d = make_dict();
    std::thread writer([d]() {
        for (int k = 0; k < 2000; ++k) d->set("k" + std::to_string(k % 50), k);
    });
    std::thread reader([d]() {
        for (int k = 0; k < 2000; ++k) {
            auto items = d->items();
            auto keys = d->keys();
            (void)dump_json(*d);
            (void)items;
            (void)keys;
        }
    });
    writer.join();
    reader.join();

    REQUIRE(d->size() == 50);
    auto back = parse_json(d->dump());
    REQUIRE(back->keys() == d->keys());
}
