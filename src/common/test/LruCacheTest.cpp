#include "LruCache.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace {
std::vector<int> keys_of(const LruCache<int, std::string> &cache) {
    std::vector<int> keys;
    for (auto &[key, value] : cache)
        keys.push_back(key);
    return keys;
}
}

TEST_CASE("lru cache") {
    LruCache<int, std::string> cache(3);
    cache.set(1, "one");
    cache.set(2, "two");
    cache.set(3, "three");

    SECTION("holds up to its capacity") {
        CHECK(cache.size() == 3);
        CHECK(keys_of(cache) == std::vector<int>{1, 2, 3});
    }
    SECTION("evicts the least recently used entry on overflow") {
        cache.set(4, "four");
        CHECK(cache.size() == 3);
        CHECK(!cache.has(1));
        CHECK(keys_of(cache) == std::vector<int>{2, 3, 4});
    }
    SECTION("get promotes") {
        CHECK(cache.get(1) == "one");
        cache.set(4, "four");
        CHECK(cache.has(1));
        CHECK(!cache.has(2));
    }
    SECTION("has does not promote") {
        CHECK(cache.has(1));
        cache.set(4, "four");
        CHECK(!cache.has(1));
    }
    SECTION("set on an existing key updates and promotes") {
        cache.set(1, "uno");
        cache.set(4, "four");
        CHECK(cache.get(1) == "uno");
        CHECK(!cache.has(2));
    }
    SECTION("missing keys give nothing") { CHECK(!cache.get(42)); }
    SECTION("remove") {
        CHECK(cache.remove(2));
        CHECK(!cache.remove(2));
        CHECK(keys_of(cache) == std::vector<int>{1, 3});
    }
    SECTION("clear") {
        cache.clear();
        CHECK(cache.empty());
        CHECK(!cache.has(1));
    }
    SECTION("shrinking evicts from the least recently used end") {
        (void)cache.get(1);
        cache.set_max_size(1);
        CHECK(keys_of(cache) == std::vector<int>{1});
    }
    SECTION("capacity is at least one") {
        cache.set_max_size(0);
        CHECK(cache.max_size() == 1);
        CHECK(cache.size() == 1);
        LruCache<int, int> tiny(0);
        tiny.set(1, 1);
        tiny.set(2, 2);
        CHECK(tiny.size() == 1);
        CHECK(tiny.has(2));
    }
}
