// main.cpp
// CQRS Feed Example - keeping a denormalized read model up to date
//
// A "user feed" document embeds the user's posts as an array. Upstream
// write-side events are folded into that document with surgical edits
// instead of rebuilding it from scratch:
//
//   PostCreated        -> insert_where (sorted by creation time, newest first)
//   PostEdited         -> update_where
//   PostStatsRefreshed -> update_where_batch (many posts, one pass)
//   AuthorRenamed      -> smart_patch_at_path
//   PostDeleted        -> delete_where
//
// Finally one change is fanned out to several feeds with update_multi_document.
//
// The read model lives in a lager store; every event is dispatched as an
// action and the reducer applies the matching json_ivm operation.

#include <json_ivm/json_ivm.h>

#include <lager/store.hpp>
#include <lager/event_loop/manual.hpp>

#include <iostream>
#include <string>
#include <variant>
#include <vector>

using namespace json_ivm;

// ============================================================
// Read model and events
// ============================================================

struct FeedState
{
    Value feed;
    std::size_t applied = 0;

    friend bool operator==(const FeedState&, const FeedState&) = default;
};

struct PostCreated
{
    Value post;
};

struct PostEdited
{
    std::int64_t id;
    Value patch;
};

struct PostStatsRefreshed
{
    Value updates; // [{"match_value": id, "updates": {...}}, ...]
};

struct AuthorRenamed
{
    std::string name;
};

struct PostDeleted
{
    std::int64_t id;
};

using Event = std::variant<PostCreated, PostEdited, PostStatsRefreshed, AuthorRenamed, PostDeleted>;

FeedState create_initial_state()
{
    return FeedState{
        Value::object({
            {"id", 7},
            {"author", Value::object({{"id", 7}, {"name", "alice"}, {"handle", "@alice"}})},
            {"posts", Value::array({})},
        }),
        0,
    };
}

// ============================================================
// Reducer
// ============================================================

FeedState reducer(FeedState state, Event event)
{
    state.feed = std::visit(
        [&](auto&& ev) -> Value {
            using T = std::decay_t<decltype(ev)>;

            if constexpr (std::is_same_v<T, PostCreated>) {
                return insert_where(state.feed, "posts", ev.post, std::string{"created_at"},
                                    SortOrder::Descending);
            } else if constexpr (std::is_same_v<T, PostEdited>) {
                return update_where(state.feed, "posts", MatchPredicate{"id", ev.id}, ev.patch);
            } else if constexpr (std::is_same_v<T, PostStatsRefreshed>) {
                return update_where_batch(state.feed, "posts", "id", ev.updates);
            } else if constexpr (std::is_same_v<T, AuthorRenamed>) {
                return smart_patch_at_path(state.feed, Value::object({{"name", ev.name}}),
                                           make_path({"author"}));
            } else {
                static_assert(std::is_same_v<T, PostDeleted>);
                return delete_where(state.feed, "posts", MatchPredicate{"id", ev.id});
            }
        },
        event);
    ++state.applied;
    return state;
}

// ============================================================
// Main Application
// ============================================================

namespace {

Value post(std::int64_t id, const std::string& title, std::int64_t created_at)
{
    return Value::object({
        {"id", id},
        {"title", title},
        {"created_at", created_at},
        {"stats", Value::object({{"likes", 0}, {"views", 0}})},
    });
}

void print_feed(const FeedState& state, const std::string& step)
{
    std::cout << "[" << state.applied << "] " << step << "\n    " << state.feed << "\n";
}

} // namespace

int main()
{
    auto loop  = lager::with_manual_event_loop{};
    auto store = lager::make_store<Event>(
        create_initial_state(),
        loop,
        lager::with_reducer(reducer)
    );

    std::cout << "=== CQRS Feed Example ===\n";
    print_feed(store.get(), "initial");

    store.dispatch(PostCreated{post(1, "hello", 100)});
    store.dispatch(PostCreated{post(3, "third", 300)});
    store.dispatch(PostCreated{post(2, "second", 200)});
    print_feed(store.get(), "three posts created, newest first");

    store.dispatch(PostEdited{2, Value::object({{"title", "second (edited)"}})});
    print_feed(store.get(), "post 2 edited");

    store.dispatch(PostStatsRefreshed{Value::array({
        Value::object({{"match_value", 1}, {"updates", Value::object({{"stats", Value::object({{"likes", 4}, {"views", 40}})}})}}),
        Value::object({{"match_value", 3}, {"updates", Value::object({{"stats", Value::object({{"likes", 9}, {"views", 90}})}})}}),
    })});
    print_feed(store.get(), "stats refreshed for posts 1 and 3");

    store.dispatch(AuthorRenamed{"alice.b"});
    print_feed(store.get(), "author renamed");

    store.dispatch(PostDeleted{1});
    store.dispatch(PostDeleted{1}); // already gone: no-op
    print_feed(store.get(), "post 1 deleted (twice)");

    const Value feed = store.get().feed;
    std::cout << "\ncontains post 2: " << std::boolalpha
              << contains(feed, "posts", MatchPredicate{"id", 2}) << "\n";
    std::cout << "contains post 1: " << contains(feed, "posts", MatchPredicate{"id", 1}) << "\n";
    std::cout << "feed id: " << extract_id(feed).value_or("<none>") << "\n";

    // Fan one upstream change out to several read models at once; the null
    // entry stands for a row that was deleted concurrently.
    std::vector<Value> feeds{feed, Value{}, create_initial_state().feed};
    auto refreshed = update_multi_document(feeds, "posts", MatchPredicate{"id", 3},
                                           Value::object({{"pinned", true}}));
    std::cout << "\nmulti-document update:\n";
    for (const auto& doc : refreshed) {
        std::cout << "    " << doc << "\n";
    }

    try {
        (void)merge_shallow(feed, Value::array({}));
    } catch (const Error& e) {
        std::cout << "\nmerge_shallow rejected a non-object: " << e.what() << "\n";
    }

    return 0;
}
