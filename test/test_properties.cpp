// test_properties.cpp - Randomized property tests over generated documents
// Every generator is seeded, so failures are reproducible.

#include <catch2/catch_all.hpp>
#include <json_ivm/json_ivm.h>

#include <random>
#include <string>
#include <vector>

using namespace json_ivm;

namespace {

constexpr int kIterations = 200;

class DocGenerator
{
public:
    explicit DocGenerator(std::uint32_t seed) : rng_(seed) {}

    int uniform(int lo, int hi) { return std::uniform_int_distribution<int>{lo, hi}(rng_); }

    Value scalar()
    {
        switch (uniform(0, 4)) {
            case 0: return Value{};
            case 1: return Value{uniform(0, 1) == 1};
            case 2: return Value{uniform(-1000, 1000)};
            case 3: return Value{uniform(-1000, 1000) / 8.0};
            default: return Value{"s" + std::to_string(uniform(0, 50))};
        }
    }

    Value any(int depth)
    {
        if (depth <= 0) {
            return scalar();
        }
        switch (uniform(0, 3)) {
            case 0: return scalar();
            case 1: {
                auto t = ValueVector{}.transient();
                const int n = uniform(0, 3);
                for (int i = 0; i < n; ++i) {
                    t.push_back(ValueBox{any(depth - 1)});
                }
                return Value{t.persistent()};
            }
            default: return object(depth - 1);
        }
    }

    /// Object with keys drawn from a small alphabet so documents overlap.
    Value object(int depth, const std::string& prefix = "k")
    {
        auto t = ValueMap{}.transient();
        const int n = uniform(0, 4);
        for (int i = 0; i < n; ++i) {
            t.set(prefix + std::to_string(uniform(0, 5)), ValueBox{any(depth)});
        }
        return Value{t.persistent()};
    }

    /// Object following a fixed schema: "o*" keys always hold objects,
    /// "v*" keys always hold scalars or arrays.
    Value schema_object(int depth)
    {
        auto t = ValueMap{}.transient();
        const int n = uniform(0, 4);
        for (int i = 0; i < n; ++i) {
            const int k = uniform(0, 5);
            if (k < 3 && depth > 0) {
                t.set("o" + std::to_string(k), ValueBox{schema_object(depth - 1)});
            } else {
                t.set("v" + std::to_string(k), ValueBox{uniform(0, 3) == 0 ? any(0) : scalar()});
            }
        }
        return Value{t.persistent()};
    }

    /// Array of {"id": <int or other>} elements of the given length
    ValueVector id_array(std::size_t n, int id_range)
    {
        auto t = ValueVector{}.transient();
        for (std::size_t i = 0; i < n; ++i) {
            switch (uniform(0, 9)) {
                case 0: t.push_back(ValueBox{Value{uniform(0, 5)}}); break;
                case 1: t.push_back(ValueBox{Value::object({{"other", uniform(0, id_range)}})}); break;
                case 2: t.push_back(ValueBox{Value::object({{"id", std::to_string(uniform(0, id_range))}})}); break;
                case 3: t.push_back(ValueBox{Value::object({{"id", static_cast<double>(uniform(0, id_range))}})}); break;
                default: t.push_back(ValueBox{Value::object({{"id", uniform(0, id_range)}})}); break;
            }
        }
        return t.persistent();
    }

private:
    std::mt19937 rng_;
};

bool disjoint_keys(const Value& a, const Value& b)
{
    for (const auto& [key, box] : a.as_object()) {
        if (b.contains(key)) {
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================
// Merge properties
// ============================================================

TEST_CASE("Empty source is identity", "[properties][merge]") {
    DocGenerator gen{1};
    for (int i = 0; i < kIterations; ++i) {
        auto t = gen.object(3);
        INFO(value_to_string(t));
        REQUIRE(merge_shallow(t, Value::object({})) == t);
        REQUIRE(deep_merge(t, Value::object({})) == t);
        REQUIRE(smart_patch(t, Value::object({})) == t);
    }
}

TEST_CASE("smart_patch is idempotent", "[properties][merge]") {
    DocGenerator gen{2};
    for (int i = 0; i < kIterations; ++i) {
        auto t = gen.object(3);
        auto s = gen.object(3);
        INFO(value_to_string(t) << " <- " << value_to_string(s));
        auto once = smart_patch(t, s);
        REQUIRE(smart_patch(once, s) == once);
    }
}

TEST_CASE("merge_shallow commutes on disjoint keys", "[properties][merge]") {
    DocGenerator gen{3};
    for (int i = 0; i < kIterations; ++i) {
        auto a = gen.object(2, "a");
        auto b = gen.object(2, "b");
        REQUIRE(disjoint_keys(a, b));
        REQUIRE(merge_shallow(a, b) == merge_shallow(b, a));
    }
}

TEST_CASE("deep_merge is associative for schema-consistent documents", "[properties][merge]") {
    DocGenerator gen{4};
    for (int i = 0; i < kIterations; ++i) {
        auto a = gen.schema_object(3);
        auto b = gen.schema_object(3);
        auto c = gen.schema_object(3);
        INFO(value_to_string(a) << " | " << value_to_string(b) << " | " << value_to_string(c));
        REQUIRE(deep_merge(deep_merge(a, b), c) == deep_merge(a, deep_merge(b, c)));
    }
}

TEST_CASE("deep_merge keeps every source leaf", "[properties][merge]") {
    DocGenerator gen{5};
    for (int i = 0; i < kIterations; ++i) {
        auto t = gen.schema_object(3);
        auto s = gen.schema_object(3);
        auto merged = deep_merge(t, s);
        for (const auto& [key, box] : s.as_object()) {
            if (!box.get().is_object()) {
                REQUIRE(merged.at(key) == box.get());
            }
        }
    }
}

// ============================================================
// Array length invariants
// ============================================================

TEST_CASE("Array operation length invariants", "[properties][array]") {
    DocGenerator gen{6};
    for (int i = 0; i < kIterations; ++i) {
        const auto n = static_cast<std::size_t>(gen.uniform(0, 40));
        const Value doc = Value::object({{"items", Value{gen.id_array(n, 20)}}});
        const MatchPredicate pred{"id", gen.uniform(0, 20)};
        const bool present = contains(doc, "items", pred);

        auto deleted = delete_where(doc, "items", pred);
        REQUIRE(deleted.at("items").size() == (present ? n - 1 : n));

        auto inserted = insert_where(doc, "items", Value::object({{"id", gen.uniform(0, 20)}}), std::string{"id"},
                                     gen.uniform(0, 1) == 0 ? SortOrder::Ascending : SortOrder::Descending);
        REQUIRE(inserted.at("items").size() == n + 1);

        auto updated = update_where(doc, "items", pred, Value::object({{"touched", true}}));
        REQUIRE(updated.at("items").size() == n);
        REQUIRE(contains(updated, "items", MatchPredicate{"touched", true}) == present);
    }
}

TEST_CASE("Sorted insertion keeps the array sorted", "[properties][array]") {
    DocGenerator gen{7};
    for (const auto order : {SortOrder::Ascending, SortOrder::Descending}) {
        Value doc = Value::object({{"items", Value::array({})}});
        for (int i = 0; i < 60; ++i) {
            doc = insert_where(doc, "items", Value::object({{"rank", gen.uniform(-50, 50)}}),
                               std::string{"rank"}, order);
        }
        const auto items = doc.at("items").as_array();
        for (std::size_t i = 1; i < items.size(); ++i) {
            const auto cmp = compare_values(items[i - 1].get().at("rank"), items[i].get().at("rank"));
            REQUIRE((order == SortOrder::Ascending ? cmp <= 0 : cmp >= 0));
        }
    }
}

// ============================================================
// Locator equivalence
// ============================================================

// Exercises the AVX2 kernel only when built with JSON_IVM_ENABLE_AVX2=ON,
// the portable kernel otherwise.
TEST_CASE("Lane locator agrees with the scalar locator", "[properties][locator]") {
    DocGenerator gen{8};
    const std::vector<std::size_t> lengths{0, 1, 7, 8, 9, 31, 32, 33, 63, 64, 65, 200};
    for (const auto length : lengths) {
        for (int i = 0; i < 50; ++i) {
            const auto arr = gen.id_array(length, 40);
            const std::int64_t target = gen.uniform(-1, 41);
            const MatchPredicate pred{"id", target};
            INFO("length " << length << " target " << target);

            const auto scalar = locate_scalar(arr, pred);
            REQUIRE(locate_int_lanes(arr, "id", target) == scalar);
            REQUIRE(locate(arr, pred) == scalar);
        }
    }
}

TEST_CASE("Batch update matches sequential updates on unique ids", "[properties][batch]") {
    DocGenerator gen{9};
    for (int i = 0; i < kIterations; ++i) {
        const auto n = static_cast<std::size_t>(gen.uniform(1, 40));
        auto t = ValueVector{}.transient();
        for (std::size_t k = 0; k < n; ++k) {
            t.push_back(ValueBox{Value::object({{"id", static_cast<std::int64_t>(k)}, {"v", 0}})});
        }
        const Value doc = Value::object({{"items", Value{t.persistent()}}});

        std::vector<UpdateSpec> specs;
        Value sequential = doc;
        const int m = gen.uniform(0, 8);
        for (int j = 0; j < m; ++j) {
            UpdateSpec spec{gen.uniform(0, static_cast<int>(n) + 3), Value::object({{"v", j + 1}})};
            sequential = update_where(sequential, "items", MatchPredicate{"id", spec.match_value}, spec.patch);
            specs.push_back(std::move(spec));
        }
        REQUIRE(update_where_batch(doc, "items", "id", specs) == sequential);
    }
}
