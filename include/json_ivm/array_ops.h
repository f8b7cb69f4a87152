// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_ops.h
/// @brief Surgical edits of an array field held directly by a document.
///
/// Each operation addresses target[array_field] one level below the root
/// and finds elements with locate(). Lookup failures are never errors:
/// value-returning operations return target unchanged and contains()
/// returns false.

#pragma once

#include <json_ivm/value.h>
#include <json_ivm/array_locator.h>
#include <json_ivm/options.h>
#include <json_ivm/path.h>
#include <json_ivm/api.h>

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace json_ivm {

enum class SortOrder { Ascending, Descending };

/// @brief "ASC" / "DESC", case-insensitive
/// @throws InvalidArgumentError for anything else
[[nodiscard]] JSON_IVM_API SortOrder parse_sort_order(std::string_view text);

/// @brief Total order over JSON values used for sorted insertion
///
/// Numbers compare numerically (exactly when both are integers), strings
/// lexically, false < true. Across kinds: null < boolean < number < string,
/// with arrays and objects after strings and equivalent to each other.
[[nodiscard]] JSON_IVM_API std::weak_ordering compare_values(const Value& a, const Value& b);

/// @brief Position that keeps array ordered by sort_key after inserting a
///        value whose sort field is new_sort_value
///
/// The first element that sorts strictly after the new one (before, for
/// descending order) wins, so equal keys keep insertion order. Elements
/// without the sort key are skipped. A null new_sort_value means append.
[[nodiscard]] JSON_IVM_API std::size_t find_insertion_point(
    const ValueVector& array, const Value* new_sort_value,
    const std::string& sort_key, SortOrder order);

/// @brief Remove the first element matching pred
/// @return target unchanged if the field is absent, not an array, or nothing matches
[[nodiscard]] JSON_IVM_API Value delete_where(
    const Value& target, const std::string& array_field, const MatchPredicate& pred,
    const EngineOptions& options = default_options());

/// @brief Insert element, keeping the array sorted by sort_key when given,
///        appending otherwise
/// @return target unchanged when target[array_field] is not an array, unless
///         options.insert_creates_missing_array is set and the field is absent
[[nodiscard]] JSON_IVM_API Value insert_where(
    const Value& target, const std::string& array_field, const Value& element,
    const std::optional<std::string>& sort_key = std::nullopt,
    SortOrder order = SortOrder::Ascending,
    const EngineOptions& options = default_options());

/// True iff target[array_field] is an array with an element matching pred.
[[nodiscard]] JSON_IVM_API bool contains(
    const Value& target, const std::string& array_field, const MatchPredicate& pred,
    const EngineOptions& options = default_options());

/// @brief Shallow-merge patch into the first element matching pred
/// @throws TypeMismatchError if patch is not an object
/// @return target unchanged if the field is absent, not an array, or nothing matches
[[nodiscard]] JSON_IVM_API Value update_where(
    const Value& target, const std::string& array_field, const MatchPredicate& pred,
    const Value& patch, const EngineOptions& options = default_options());

/// @brief Set value at update_path inside the first element matching pred,
///        creating missing intermediate nodes like set_path()
[[nodiscard]] JSON_IVM_API Value update_where_path(
    const Value& target, const std::string& array_field, const MatchPredicate& pred,
    const Path& update_path, const Value& value,
    const EngineOptions& options = default_options());

} // namespace json_ivm
