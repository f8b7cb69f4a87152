// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Path navigation over Value trees.
///
/// A Path is a sequence of segments, each either an object key or an array
/// index. make_path() builds key-only paths; parse_path() also yields index
/// segments from text such as "orders[0].items[1].price".
///
/// ## Resolution
///
/// Resolution never throws. It stops at the first segment that is missing
/// or that meets a value of the wrong kind, and reports absence:
///
/// ```cpp
/// const Value* owner = resolve(doc, make_path({"billing", "owner"}));
/// if (!owner) { /* path did not resolve */ }
/// ```
///
/// ## Editing
///
/// Values are persistent, so "editing at a path" means rebuilding the spine
/// from the root to the edited node while sharing every other subtree.
/// set_at_path() only replaces a location that already exists;
/// set_path() creates missing intermediate nodes.

#pragma once

#include <json_ivm/value.h>
#include <json_ivm/api.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace json_ivm {

/// A single path segment: an object key or an array index
using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

/// Build a key-only path, e.g. make_path({"billing", "subscription"})
[[nodiscard]] JSON_IVM_API Path make_path(std::initializer_list<std::string> keys);
[[nodiscard]] JSON_IVM_API Path make_path(const std::vector<std::string>& keys);

/// @brief Parse dot/bracket notation: "a.b", "a[0]", "orders[0].items[1].price"
/// @throws PathSyntaxError on empty paths, "a..b", "a[]", "a]", "a[x]", "a[0"
[[nodiscard]] JSON_IVM_API Path parse_path(std::string_view text);

/// Convert Path to dot-notation string (e.g., "users[0].name")
[[nodiscard]] JSON_IVM_API std::string path_to_string(const Path& path);

// ============================================================
// Resolution
// ============================================================

/// Follow a single segment. Keys apply to objects, indices to arrays.
[[nodiscard]] inline const Value* step(const Value& current, const PathElement& elem)
{
    if (auto* key = std::get_if<std::string>(&elem)) {
        return current.find(*key);
    }
    return current.find(std::get<std::size_t>(elem));
}

/// @brief Locate the value at a path
/// @return Pointer into root, or nullptr when any segment fails to resolve
[[nodiscard]] inline const Value* resolve(const Value& root, const Path& path)
{
    const Value* current = &root;
    for (const auto& elem : path) {
        current = step(*current, elem);
        if (!current) [[unlikely]] {
            return nullptr;
        }
    }
    return current;
}

/// Copy of the value at a path, or null Value when it does not resolve.
[[nodiscard]] inline Value get_at_path(const Value& root, const Path& path)
{
    if (const Value* found = resolve(root, path)) {
        return *found;
    }
    return Value{};
}

/// @brief Replace the value at an existing location
/// @return New root; root unchanged when the path does not resolve
[[nodiscard]] JSON_IVM_API Value set_at_path(const Value& root, const Path& path, Value new_val);

/// @brief Set a value at a path, creating what is missing
///
/// Missing or wrongly-typed intermediate nodes are replaced by an object
/// (next segment is a key) or an array (next segment is an index); arrays
/// are padded with null up to the index.
/// @example
///   set_path(Value::object({}), parse_path("user.tags[1]"), "x")
///   // {"user": {"tags": [null, "x"]}}
[[nodiscard]] JSON_IVM_API Value set_path(const Value& root, const Path& path, Value new_val);

// ============================================================
// Lenses
// ============================================================

using ValueLens = lager::lens<Value, Value>;

/// Lens focusing an object key (null when absent; set is a no-op on non-objects)
[[nodiscard]] JSON_IVM_API ValueLens key_lens(const std::string& key);

/// Lens focusing an array index (null when out of range; set is a no-op then)
[[nodiscard]] JSON_IVM_API ValueLens index_lens(std::size_t index);

/// Lens composed from the segments of a path; the empty path is identity.
[[nodiscard]] JSON_IVM_API ValueLens path_lens(const Path& path);

} // namespace json_ivm
