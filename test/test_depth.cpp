// test_depth.cpp - Tests for nesting-depth measurement and the recursion guard

#include <catch2/catch_all.hpp>
#include <json_ivm/depth.h>
#include <json_ivm/errors.h>
#include <json_ivm/merge.h>

using namespace json_ivm;

namespace {

/// {"a": {"a": ... 1}} with `levels` objects around the scalar
Value nested_objects(std::size_t levels)
{
    Value current{1};
    for (std::size_t i = 0; i < levels; ++i) {
        current = Value::object({{"a", current}});
    }
    return current;
}

} // namespace

TEST_CASE("max_depth", "[depth]") {
    SECTION("scalars have depth 0") {
        REQUIRE(max_depth(Value{}) == 0);
        REQUIRE(max_depth(Value{"x"}) == 0);
    }

    SECTION("containers add one level each") {
        REQUIRE(max_depth(Value::object({{"a", 1}})) == 1);
        REQUIRE(max_depth(Value::array({Value::object({{"a", Value::array({1})}})})) == 3);
    }

    SECTION("empty containers count as their own level only") {
        REQUIRE(max_depth(Value::object({})) == 0);
        REQUIRE(max_depth(Value::array({Value::array({})})) == 1);
    }

    SECTION("deepest branch wins") {
        auto doc = Value::object({{"shallow", 1}, {"deep", nested_objects(4)}});
        REQUIRE(max_depth(doc) == 5);
    }
}

TEST_CASE("validate_depth", "[depth][guard]") {
    SECTION("at the limit is accepted") {
        REQUIRE_NOTHROW(validate_depth(nested_objects(10), 10));
    }

    SECTION("one past the limit is rejected") {
        REQUIRE_THROWS_AS(validate_depth(nested_objects(11), 10), MaxDepthExceededError);
    }

    SECTION("error reports the limit") {
        try {
            validate_depth(nested_objects(6), 5);
            FAIL("expected MaxDepthExceededError");
        } catch (const MaxDepthExceededError& e) {
            REQUIRE(e.limit() == 5);
            REQUIRE(std::string{e.what()} == "JSON nesting too deep (max 5, found >5)");
        }
    }
}

TEST_CASE("Merge operations reject over-deep sources", "[depth][merge]") {
    const auto target = Value::object({{"x", 1}});

    SECTION("1001 levels are rejected") {
        auto source = nested_objects(1001);
        REQUIRE_THROWS_AS(deep_merge(target, source), MaxDepthExceededError);
        REQUIRE_THROWS_AS(smart_patch(target, source), MaxDepthExceededError);
        REQUIRE_THROWS_AS(merge_shallow(target, source), MaxDepthExceededError);
    }

    SECTION("999 levels are accepted") {
        auto source = nested_objects(999);
        auto merged = deep_merge(target, source);
        REQUIRE(max_depth(merged) == 999);
        REQUIRE(merged.at("x").as_int64() == 1);
    }

    SECTION("limit comes from the options") {
        EngineOptions options;
        options.max_depth = 3;
        REQUIRE_THROWS_AS(deep_merge(target, nested_objects(4), options), MaxDepthExceededError);
        REQUIRE_NOTHROW(deep_merge(target, nested_objects(3), options));
    }
}
