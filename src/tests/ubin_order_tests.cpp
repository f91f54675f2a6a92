#include <catch2/catch_test_macros.hpp>

#include <ubin/ubin.hpp>

#include <bit>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace ubin;

TEST_CASE("float total order", "[ubin][order]") {
    constexpr double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    const std::vector<double> ascending {-inf, -1e300, -1.0, -std::numeric_limits<double>::denorm_min(), -0.0, 0.0, std::numeric_limits<double>::denorm_min(), 1.0, 1e300, inf, nan};

    for (std::size_t i = 0; i + 1 < ascending.size(); ++i) {
        INFO("index " << i);
        CHECK(total_cmp(ascending[i], ascending[i + 1]) < 0);
        CHECK(total_cmp(ascending[i + 1], ascending[i]) > 0);
        CHECK(total_cmp(ascending[i], ascending[i]) == 0);
    }

    const double other_nan = std::bit_cast<double>(0xFFF0000000000001ull);
    CHECK(total_cmp(nan, other_nan) == 0);
    CHECK(total_order_key(nan) == total_order_key(other_nan));
    CHECK(total_cmp(-0.0f, 0.0f) < 0);
}

TEST_CASE("canonicalize keeps non-NaN bits", "[ubin][order]") {
    CHECK(std::bit_cast<std::uint64_t>(canonicalize(-0.0)) == 0x8000000000000000ull);
    CHECK(std::bit_cast<std::uint64_t>(canonicalize(std::bit_cast<double>(0x7FF00000000000FFull))) == kCanonicalNan64);
    CHECK(std::bit_cast<std::uint32_t>(canonicalize(std::bit_cast<float>(0xFF800001u))) == kCanonicalNan32);
    CHECK(canonicalize(1.25) == 1.25);
}

TEST_CASE("integers compare by value across signedness", "[ubin][order]") {
    const auto s5 = Int::from_i64(5);
    const auto u5 = Int::from_u64(5);
    CHECK(s5 == u5);
    CHECK(hash_int(s5) == hash_int(u5));

    CHECK(compare(Int::from_i64(-1), Int::from_u64(0)) < 0);
    CHECK(compare(Int::from_u64(std::numeric_limits<std::uint64_t>::max()), Int::from_i64(std::numeric_limits<std::int64_t>::max())) > 0);
    CHECK(compare(Int::from_i64(std::numeric_limits<std::int64_t>::min()), Int::from_i64(-1)) < 0);
    CHECK_FALSE(Int::from_i64(-1) == Int::from_u64(std::numeric_limits<std::uint64_t>::max()));

    CHECK(Int::from_u64(std::numeric_limits<std::uint64_t>::max()).wire_bits() == std::numeric_limits<std::uint64_t>::max());
    CHECK(Int::from_i64(-1).wire_bits() == 1);
}

TEST_CASE("f32 and f64 of the same number are equal", "[ubin][order]") {
    CHECK(Float::from_f32(1.5f) == Float::from_f64(1.5));
    CHECK(hash_float(Float::from_f32(1.5f)) == hash_float(Float::from_f64(1.5)));
    CHECK_FALSE(Float::from_f64(0.1) == Float::from_f32(0.1f));
    CHECK_FALSE(Float::from_f64(-0.0) == Float::from_f64(0.0));
    CHECK(Float::from_f64(std::nan("")) == Float::from_f32(std::nanf("")));
}

TEST_CASE("value kinds are ranked", "[ubin][order]") {
    ValueBuilder b;
    const std::vector<Node*> ranked {
        b.null(), b.unit(), b.boolean(false), b.boolean(true), b.integer(-7), b.uinteger(3), b.f64(-1.0), b.f64(2.0), b.bytes(std::vector<std::uint8_t> {0}), b.string(""), b.string("a"), b.string("ab"), b.seq(), b.map(),
    };

    for (std::size_t i = 0; i + 1 < ranked.size(); ++i) {
        INFO("index " << i);
        CHECK(compare(b.view(ranked[i]), b.view(ranked[i + 1])) < 0);
        CHECK(compare(b.view(ranked[i + 1]), b.view(ranked[i])) > 0);
    }
}

TEST_CASE("sequences compare lexicographically", "[ubin][order]") {
    ValueBuilder b;
    Node* short_seq = b.seq();
    Node* long_seq = b.seq();
    Node* bigger = b.seq();
    REQUIRE(b.push(short_seq, b.uinteger(1)));
    REQUIRE(b.push(long_seq, b.uinteger(1)));
    REQUIRE(b.push(long_seq, b.uinteger(0)));
    REQUIRE(b.push(bigger, b.uinteger(2)));

    CHECK(compare(b.view(short_seq), b.view(long_seq)) < 0);
    CHECK(compare(b.view(long_seq), b.view(bigger)) < 0);
}

TEST_CASE("maps compare as sets", "[ubin][order]") {
    ValueBuilder b;
    Node* ordered = b.map(MapOrder::Insertion);
    Node* reversed = b.map(MapOrder::Insertion);
    Node* hashed = b.map(MapOrder::Hashed);

    const char* keys[] = {"x", "y", "z"};
    for (int i = 0; i < 3; ++i) {
        REQUIRE(b.insert(ordered, keys[i], b.integer(i)));
        REQUIRE(b.insert(reversed, keys[2 - i], b.integer(2 - i)));
        REQUIRE(b.insert(hashed, keys[i], b.uinteger(static_cast<std::uint64_t>(i))));
    }

    CHECK(b.view(ordered) == b.view(reversed));
    CHECK(b.view(ordered) == b.view(hashed));
    CHECK(compare(b.view(ordered), b.view(hashed)) == 0);
    CHECK(hash_value(b.view(ordered)) == hash_value(b.view(reversed)));
    CHECK(hash_value(b.view(ordered)) == hash_value(b.view(hashed)));

    Node* smaller = b.map();
    REQUIRE(b.insert(smaller, "x", b.integer(0)));
    REQUIRE(b.insert(smaller, "y", b.integer(1)));
    REQUIRE(b.insert(smaller, "z", b.integer(1)));
    CHECK(compare(b.view(smaller), b.view(ordered)) < 0);
    CHECK_FALSE(b.view(smaller) == b.view(ordered));
}

TEST_CASE("float map keys use the total order", "[ubin][map]") {
    for (const auto order : {MapOrder::Insertion, MapOrder::Hashed}) {
        ValueBuilder b;
        Node* m = b.map(order);
        REQUIRE(b.insert(m, b.f64(std::nan("")), b.string("nan")));
        REQUIRE(b.insert(m, b.f64(-0.0), b.string("neg")));
        REQUIRE(b.insert(m, b.f64(0.0), b.string("pos")));
        REQUIRE(b.insert(m, b.f64(std::bit_cast<double>(0x7FF8000000000042ull)), b.string("nan2")));

        const auto v = b.view(m);
        CHECK(v.size() == 3);
        CHECK(v.find(b.view(b.f32(std::nanf("")))).as_string() == "nan2");
        CHECK(v.find(b.view(b.f64(-0.0))).as_string() == "neg");
        CHECK(v.find(b.view(b.f32(0.0f))).as_string() == "pos");
    }
}

TEST_CASE("hashed strategy grows and finds every key", "[ubin][map]") {
    ValueBuilder b;
    Node* m = b.map(MapOrder::Hashed);
    for (int i = 0; i < 1000; ++i)
        REQUIRE(b.insert(m, b.integer(i), b.integer(i * 2)));

    const auto v = b.view(m);
    REQUIRE(v.size() == 1000);
    for (int i = 0; i < 1000; ++i)
        REQUIRE(v.get(Int::from_u64(static_cast<std::uint64_t>(i))).as_i64() == i * 2);
    REQUIRE_FALSE(v.get(Int::from_i64(1000)).valid());

    std::size_t seen = 0;
    for (const auto e : v.members()) {
        (void)e;
        ++seen;
    }
    REQUIRE(seen == 1000);
}

TEST_CASE("ordered strategy keeps positions across growth", "[ubin][map]") {
    ValueBuilder b;
    Node* m = b.map(MapOrder::Insertion);
    for (int i = 0; i < 500; ++i)
        REQUIRE(b.insert(m, std::to_string(i), b.integer(i)));
    for (int i = 0; i < 500; i += 7)
        REQUIRE(b.insert(m, std::to_string(i), b.integer(-i)));

    const auto v = b.view(m);
    REQUIRE(v.size() == 500);

    int expect = 0;
    for (const auto e : v.members()) {
        REQUIRE(e.key.as_string() == std::to_string(expect));
        REQUIRE(e.value.as_i64() == (expect % 7 == 0 ? -expect : expect));
        ++expect;
    }
}

TEST_CASE("map strategies share one interface", "[ubin][map]") {
    NewAllocator<> heap;
    Arena arena {heap};

    auto exercise = [&]<MapStrategy Strategy>() {
        Node map;
        REQUIRE(Strategy::init(arena, map, 2));
        REQUIRE(map.order == Strategy::kOrder);

        Node k1;
        k1.type = Type::String;
        k1.data.str = "a";
        Node k2 = k1;
        Node v1;
        v1.type = Type::Null;
        Node v2;
        v2.type = Type::Unit;

        REQUIRE(Strategy::insert(arena, map, &k1, &v1, DuplicateKeys::Reject) == InsertResult::Inserted);
        REQUIRE(Strategy::insert(arena, map, &k2, &v2, DuplicateKeys::Reject) == InsertResult::Duplicate);
        REQUIRE(Strategy::insert(arena, map, &k2, &v2, DuplicateKeys::Overwrite) == InsertResult::Replaced);

        const MapEntry* e = Strategy::find(map, k1, hash_node(k1));
        REQUIRE(e != nullptr);
        REQUIRE(e->value == &v2);
        REQUIRE(e->key == &k1);
    };

    exercise.operator()<OrderedMap>();
    exercise.operator()<HashedMap>();
}

TEST_CASE("depth guard counts", "[ubin][depth]") {
    DepthGuard g {2};
    REQUIRE(g.remaining() == 2);
    REQUIRE(g.enter());
    REQUIRE(g.enter());
    REQUIRE_FALSE(g.enter());
    REQUIRE(g.depth() == 2);
    REQUIRE(g.remaining() == 0);
    REQUIRE(g.leave());
    REQUIRE(g.leave());
    REQUIRE_FALSE(g.leave());
    REQUIRE(g.depth() == 0);

    DepthGuard open {kUnboundedDepth};
    REQUIRE(open.unbounded());
    for (int i = 0; i < 10000; ++i)
        REQUIRE(open.enter());
    REQUIRE(open.depth() == 10000);
}
