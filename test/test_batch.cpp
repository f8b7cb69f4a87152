// test_batch.cpp - Tests for batch updates and multi-document fan-out

#include <catch2/catch_all.hpp>
#include <json_ivm/batch.h>
#include <json_ivm/array_ops.h>
#include <json_ivm/errors.h>

using namespace json_ivm;

namespace {

Value posts_doc()
{
    return Value::object({{"posts", Value::array({
        Value::object({{"id", 1}, {"title", "a"}}),
        Value::object({{"id", 2}, {"title", "b"}}),
        Value::object({{"id", 3}, {"title", "c"}}),
    })}});
}

const Value& post(const Value& doc, std::size_t i)
{
    return *doc.find("posts")->find(i);
}

} // namespace

// ============================================================
// Spec decoding
// ============================================================

TEST_CASE("parse_update_specs", "[batch][parse]") {
    SECTION("well-formed entries") {
        auto specs = parse_update_specs(Value::array({
            Value::object({{"match_value", 1}, {"updates", Value::object({{"title", "x"}})}}),
            Value::object({{"match_value", "uuid-2"}, {"updates", Value::object({})}}),
        }));
        REQUIRE(specs.size() == 2);
        REQUIRE(specs[0].match_value == Value{1});
        REQUIRE(specs[1].match_value == Value{"uuid-2"});
        REQUIRE(specs[0].patch == Value::object({{"title", "x"}}));
    }

    SECTION("malformed entries are skipped") {
        auto specs = parse_update_specs(Value::array({
            Value{5},
            Value::object({{"updates", Value::object({})}}),
            Value::object({{"match_value", 1}}),
            Value::object({{"match_value", 1}, {"updates", Value::array({})}}),
            Value::object({{"match_value", 2}, {"updates", Value::object({{"ok", true}})}}),
        }));
        REQUIRE(specs.size() == 1);
        REQUIRE(specs[0].match_value == Value{2});
    }

    SECTION("container must be an array") {
        REQUIRE_THROWS_AS(parse_update_specs(Value::object({})), InvalidArgumentError);
        REQUIRE_THROWS_AS(parse_update_specs(Value{}), InvalidArgumentError);
    }
}

// ============================================================
// update_where_batch
// ============================================================

TEST_CASE("update_where_batch", "[batch][update]") {
    const auto doc = posts_doc();

    SECTION("applies each spec to its element in one pass") {
        auto result = update_where_batch(doc, "posts", "id", std::vector<UpdateSpec>{
            {1, Value::object({{"title", "A"}})},
            {3, Value::object({{"title", "C"}, {"pinned", true}})},
        });
        REQUIRE(post(result, 0) == Value::object({{"id", 1}, {"title", "A"}}));
        REQUIRE(post(result, 1) == post(doc, 1));
        REQUIRE(post(result, 2) == Value::object({{"id", 3}, {"title", "C"}, {"pinned", true}}));
    }

    SECTION("equivalent to sequential update_where on unique ids") {
        std::vector<UpdateSpec> specs{
            {2, Value::object({{"title", "B"}})},
            {1, Value::object({{"views", 10}})},
        };
        Value sequential = doc;
        for (const auto& spec : specs) {
            sequential = update_where(sequential, "posts", MatchPredicate{"id", spec.match_value}, spec.patch);
        }
        REQUIRE(update_where_batch(doc, "posts", "id", specs) == sequential);
    }

    SECTION("updates every element sharing a match value") {
        auto dup = insert_where(doc, "posts", Value::object({{"id", 2}, {"title", "b2"}}));
        auto result = update_where_batch(dup, "posts", "id", std::vector<UpdateSpec>{
            {2, Value::object({{"seen", true}})},
        });
        REQUIRE(post(result, 1).at("seen").as_bool());
        REQUIRE(post(result, 3).at("seen").as_bool());
    }

    SECTION("duplicate specs are combined in order") {
        auto result = update_where_batch(doc, "posts", "id", std::vector<UpdateSpec>{
            {1, Value::object({{"title", "first"}, {"a", 1}})},
            {1, Value::object({{"title", "second"}, {"b", 2}})},
        });
        REQUIRE(post(result, 0) == Value::object({{"id", 1}, {"title", "second"}, {"a", 1}, {"b", 2}}));
    }

    SECTION("integral doubles match integer ids") {
        auto result = update_where_batch(doc, "posts", "id", std::vector<UpdateSpec>{
            {2.0, Value::object({{"title", "float"}})},
        });
        REQUIRE(post(result, 1).at("title").as_string() == "float");
    }

    SECTION("unknown match values are ignored") {
        auto result = update_where_batch(doc, "posts", "id", std::vector<UpdateSpec>{
            {99, Value::object({{"x", 1}})},
        });
        REQUIRE(result == doc);
    }

    SECTION("missing field and empty batch are no-ops") {
        REQUIRE(update_where_batch(doc, "comments", "id",
                                   std::vector<UpdateSpec>{{1, Value::object({{"x", 1}})}}) == doc);
        REQUIRE(update_where_batch(doc, "posts", "id", std::vector<UpdateSpec>{}) == doc);
    }

    SECTION("non-object patch is rejected") {
        REQUIRE_THROWS_AS(update_where_batch(doc, "posts", "id", std::vector<UpdateSpec>{{1, Value{3}}}),
                          TypeMismatchError);
    }

    SECTION("wire-shape overload") {
        auto updates = Value::array({
            Value::object({{"match_value", 2}, {"updates", Value::object({{"title", "wire"}})}}),
            Value{"garbage"},
        });
        auto result = update_where_batch(doc, "posts", "id", updates);
        REQUIRE(post(result, 1).at("title").as_string() == "wire");
    }
}

// ============================================================
// update_multi_document
// ============================================================

TEST_CASE("update_multi_document", "[batch][multi]") {
    const auto with_match = posts_doc();
    const auto without_match = Value::object({{"posts", Value::array({Value::object({{"id", 7}})})}});
    const auto patch = Value::object({{"title", "edited"}});

    SECTION("preserves positions and passes nulls through") {
        auto results = update_multi_document({with_match, Value{}, without_match}, "posts",
                                             MatchPredicate{"id", 1}, patch);
        REQUIRE(results.size() == 3);
        REQUIRE(post(results[0], 0).at("title").as_string() == "edited");
        REQUIRE(results[1].is_null());
        REQUIRE(results[2] == without_match);
    }

    SECTION("matches update_where per document") {
        auto results = update_multi_document({with_match}, "posts", MatchPredicate{"id", 3}, patch);
        REQUIRE(results[0] == update_where(with_match, "posts", MatchPredicate{"id", 3}, patch));
    }

    SECTION("empty input") {
        REQUIRE(update_multi_document({}, "posts", MatchPredicate{"id", 1}, patch).empty());
    }

    SECTION("non-object patch is rejected") {
        REQUIRE_THROWS_AS(update_multi_document({with_match}, "posts", MatchPredicate{"id", 1}, Value{1}),
                          TypeMismatchError);
    }
}
