// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file depth.h
/// @brief Nesting-depth measurement and the recursion guard.
///
/// Depth counts container levels: a scalar has depth 0, {"a": 1} depth 1,
/// [{"a": [1, 2]}] depth 3.

#pragma once

#include <json_ivm/value.h>
#include <json_ivm/api.h>

#include <cstddef>

namespace json_ivm {

/// Deepest nesting level found anywhere in val.
[[nodiscard]] JSON_IVM_API std::size_t max_depth(const Value& val);

/// @brief Reject documents nested deeper than limit
/// @throws MaxDepthExceededError when any branch is deeper than limit
/// @note Traversal stops as soon as the limit is crossed, so the check
///       itself never recurses more than limit + 1 levels.
JSON_IVM_API void validate_depth(const Value& val, std::size_t limit);

} // namespace json_ivm
