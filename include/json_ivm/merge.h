// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file merge.h
/// @brief Merge operations: shallow merge, smart patch and deep merge.
///
/// All operations return a new Value and leave their arguments untouched.
///
/// | operation            | nested objects           | arrays / scalars | failure policy            |
/// |----------------------|--------------------------|------------------|---------------------------|
/// | merge_shallow        | replaced                 | replaced         | TypeMismatchError on any non-object, null included |
/// | smart_patch          | merged one level deep    | replaced         | null-strict               |
/// | smart_patch_at_path  | as smart_patch, at path  | replaced         | null-strict; unchanged if unresolved |
/// | smart_patch_array    | as smart_patch, on match | replaced         | TypeMismatchError on non-object source; unchanged if no match |
/// | deep_merge           | merged at every level    | replaced         | null-strict               |
/// | merge_at_path        | replaced, at path        | replaced         | null-strict; TypeMismatchError |
///
/// "Null-strict": a null target or source yields a null result before any
/// other argument is examined. Sources are depth-checked against
/// EngineOptions::max_depth (MaxDepthExceededError) before any recursion.

#pragma once

#include <json_ivm/value.h>
#include <json_ivm/array_locator.h>
#include <json_ivm/options.h>
#include <json_ivm/path.h>
#include <json_ivm/api.h>

#include <string>

namespace json_ivm {

/// @brief Copy every top-level key of source into target
/// @throws TypeMismatchError if either argument is not an object (a null
///         argument included)
/// @example merge_shallow({"a":1,"b":2}, {"b":99,"c":3}) == {"a":1,"b":99,"c":3}
[[nodiscard]] JSON_IVM_API Value merge_shallow(
    const Value& target, const Value& source,
    const EngineOptions& options = default_options());

/// @brief Merge source into target; where both sides hold objects under the
///        same key those two objects are shallow-merged, anything else is
///        replaced by the source value.
/// Non-object arguments: the source replaces the target.
[[nodiscard]] JSON_IVM_API Value smart_patch(
    const Value& target, const Value& source,
    const EngineOptions& options = default_options());

/// @brief smart_patch applied to the value found at path
/// @return target unchanged when path does not fully resolve
[[nodiscard]] JSON_IVM_API Value smart_patch_at_path(
    const Value& target, const Value& source, const Path& path,
    const EngineOptions& options = default_options());

/// @brief smart_patch applied to the first element of target[array_field]
///        matching pred
/// @throws TypeMismatchError if source is not an object
/// @return target unchanged when the field is absent, not an array, or
///         nothing matches
[[nodiscard]] JSON_IVM_API Value smart_patch_array(
    const Value& target, const Value& source,
    const std::string& array_field, const MatchPredicate& pred,
    const EngineOptions& options = default_options());

/// @brief Recursive merge: objects present on both sides are merged at
///        every level, everything else is replaced by the source value
/// @throws MaxDepthExceededError when source is nested deeper than allowed
/// @example deep_merge({"a":{"b":1,"c":2}}, {"a":{"c":3,"d":4}}) == {"a":{"b":1,"c":3,"d":4}}
[[nodiscard]] JSON_IVM_API Value deep_merge(
    const Value& target, const Value& source,
    const EngineOptions& options = default_options());

/// @brief Shallow-merge source into the object at path, creating missing
///        intermediate objects. The empty path merges at the root.
/// @throws TypeMismatchError if source is not an object, or an existing
///         value along the path is not an object
[[nodiscard]] JSON_IVM_API Value merge_at_path(
    const Value& target, const Value& source, const Path& path,
    const EngineOptions& options = default_options());

namespace detail {

/// merge_shallow without argument checks; both must be objects.
[[nodiscard]] ValueMap shallow_merge_maps(const ValueMap& target, const ValueMap& source);

} // namespace detail

} // namespace json_ivm
