// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file array_locator.h
/// @brief Predicate search over JSON arrays.
///
/// locate() finds the first element e with e[key] == value. It dispatches
/// between two searches that always agree on the result:
///
/// - **Scalar**: linear scan with structural equality. Used for
///   non-integer predicates and for arrays shorter than
///   EngineOptions::simd_threshold.
/// - **Integer lanes**: elements are taken JSON_IVM_LANE_WIDTH at a time,
///   the key's integer value is extracted from each (kLaneSentinel when
///   absent or not an integer) and the whole lane is compared against the
///   target at once (AVX2 when available). A hit is pinned down by a short
///   scan of the lane. The tail that does not fill a lane is scanned
///   element by element.
///
/// Both searches are exposed so they can be checked against each other.

#pragma once

#include <json_ivm/value.h>
#include <json_ivm/options.h>
#include <json_ivm/api.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace json_ivm {

/// Matches an element e iff e is an object and e[key] == value.
struct MatchPredicate {
    std::string key;
    Value value;
};

enum class LocateStrategy { Scalar, IntegerLanes };

/// Lane placeholder for elements whose key is absent or not an integer.
/// A predicate equal to this value never takes the lane path.
inline constexpr std::int64_t kLaneSentinel = std::numeric_limits<std::int64_t>::min();

[[nodiscard]] inline bool element_matches(const Value& element, const MatchPredicate& pred)
{
    const Value* field = element.find(pred.key);
    return field && *field == pred.value;
}

/// Which search locate() would run for this array and predicate.
[[nodiscard]] JSON_IVM_API LocateStrategy select_strategy(
    const ValueVector& array, const MatchPredicate& pred, const EngineOptions& options);

/// Index of the first matching element.
[[nodiscard]] JSON_IVM_API std::optional<std::size_t> locate(
    const ValueVector& array, const MatchPredicate& pred,
    const EngineOptions& options = default_options());

[[nodiscard]] JSON_IVM_API std::optional<std::size_t> locate_scalar(
    const ValueVector& array, const MatchPredicate& pred);

/// Lane search for an integer target. Usable on any array length.
[[nodiscard]] JSON_IVM_API std::optional<std::size_t> locate_int_lanes(
    const ValueVector& array, const std::string& key, std::int64_t target);

// ============================================================
// Array field helpers
// ============================================================

/// The array stored directly under target[field], or nullptr when target is
/// not an object, the field is absent, or it holds something else.
[[nodiscard]] JSON_IVM_API const ValueVector* find_array_field(
    const Value& target, const std::string& field);

} // namespace json_ivm
