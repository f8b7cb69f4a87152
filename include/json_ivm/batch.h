// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file batch.h
/// @brief Batched updates: many patches against one array in a single pass,
///        and one patch fanned out across many documents.

#pragma once

#include <json_ivm/value.h>
#include <json_ivm/array_locator.h>
#include <json_ivm/options.h>
#include <json_ivm/api.h>

#include <string>
#include <vector>

namespace json_ivm {

/// One logical update of a batch: elements whose match key equals
/// match_value get patch shallow-merged in.
struct UpdateSpec
{
    Value match_value;
    Value patch;
};

/// @brief Decode the wire shape [{"match_value": v, "updates": {...}}, ...]
///
/// Entries that are not objects, lack "match_value", or whose "updates" is
/// not an object are skipped.
/// @throws InvalidArgumentError if specs is not an array
[[nodiscard]] JSON_IVM_API std::vector<UpdateSpec> parse_update_specs(const Value& specs);

/// @brief Apply every spec to target[array_field] in one pass over the array
///
/// Each element whose match_key value equals a spec's match_value receives
/// that spec's patch. Specs sharing a match value have their patches
/// combined in order, later keys winning.
/// @throws TypeMismatchError if a spec's patch is not an object
/// @return target unchanged if the field is absent or not an array
[[nodiscard]] JSON_IVM_API Value update_where_batch(
    const Value& target, const std::string& array_field, const std::string& match_key,
    const std::vector<UpdateSpec>& updates,
    const EngineOptions& options = default_options());

/// Wire-shape overload, see parse_update_specs().
[[nodiscard]] JSON_IVM_API Value update_where_batch(
    const Value& target, const std::string& array_field, const std::string& match_key,
    const Value& updates,
    const EngineOptions& options = default_options());

/// @brief update_where() applied to each document independently
///
/// The result has one entry per input, in order. Null documents are passed
/// through unchanged.
/// @throws TypeMismatchError if patch is not an object
[[nodiscard]] JSON_IVM_API std::vector<Value> update_multi_document(
    const std::vector<Value>& targets, const std::string& array_field,
    const MatchPredicate& pred, const Value& patch,
    const EngineOptions& options = default_options());

} // namespace json_ivm
