#include <doctest/doctest.h>
#include "netbeacon/aging_queue.hpp"
#include "netbeacon/uuid.hpp"

#include <string>
#include <vector>

using namespace netbeacon;

static constexpr int64_t NOW = 1700000000000LL;

static std::string uuid_at(int64_t ms) {
    return Uuid::generate(static_cast<uint64_t>(ms)).to_string();
}

static std::vector<int> values(const AgingQueue<int>& q) {
    std::vector<int> out;
    for (const auto& e : q) out.push_back(e.value);
    return out;
}

TEST_CASE("Entries keep insertion order; updates keep their position") {
    AgingQueue<int> q;
    const auto a = uuid_at(NOW), b = uuid_at(NOW), c = uuid_at(NOW);
    REQUIRE(q.remember(a, 1, NOW));
    REQUIRE(q.remember(b, 2, NOW));
    REQUIRE(q.remember(c, 3, NOW));
    CHECK(values(q) == std::vector<int>{1, 2, 3});

    REQUIRE(q.remember(a, 10, NOW));
    CHECK(values(q) == std::vector<int>{10, 2, 3});
    CHECK(q.size() == 3);
    REQUIRE(q.find(b) != nullptr);
    CHECK(*q.find(b) == 2);
    CHECK(q.contains(c));
}

TEST_CASE("age_out drops expired entries and preserves survivor order") {
    AgingQueue<int> q(120000);
    REQUIRE(q.remember(uuid_at(NOW - 100000), 1, NOW));
    REQUIRE(q.remember(uuid_at(NOW), 2, NOW));
    REQUIRE(q.remember(uuid_at(NOW - 110000), 3, NOW));
    REQUIRE(q.remember(uuid_at(NOW + 1000), 4, NOW));

    CHECK(q.age_out(NOW + 30000) == 2);
    CHECK(values(q) == std::vector<int>{2, 4});
}

TEST_CASE("Window boundary is inclusive") {
    AgingQueue<int> q(120000);
    const auto u = uuid_at(NOW);
    REQUIRE(q.remember(u, 1, NOW));
    CHECK(q.age_out(NOW + 120000) == 0);
    CHECK(q.age_out(NOW + 120001) == 1);
    CHECK(q.empty());
}

TEST_CASE("Entries from the far future are treated as expired") {
    AgingQueue<int> q(120000);
    CHECK_FALSE(q.remember(uuid_at(NOW + 200000), 1, NOW));
    CHECK(q.empty());

    // Accepted while in range, purged once the local clock steps far back.
    REQUIRE(q.remember(uuid_at(NOW), 2, NOW));
    CHECK(q.age_out(NOW - 200000) == 1);
}

TEST_CASE("Stale and malformed UUIDs are not stored") {
    AgingQueue<int> q;
    CHECK_FALSE(q.remember(uuid_at(NOW - 121000), 1, NOW));
    CHECK_FALSE(q.remember("not-a-uuid", 2, NOW));
    CHECK_FALSE(q.remember("123e4567-e89b-42d3-a456-426614174000", 3, NOW));
    CHECK(q.empty());
}

TEST_CASE("remember ages the queue before inserting") {
    AgingQueue<int> q(1000);
    REQUIRE(q.remember(uuid_at(NOW), 1, NOW));
    REQUIRE(q.remember(uuid_at(NOW + 5000), 2, NOW + 5000));
    CHECK(values(q) == std::vector<int>{2});
}
