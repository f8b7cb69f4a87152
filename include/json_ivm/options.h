// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file options.h
/// @brief Run-time tunables shared by the merge and array engines.

#pragma once

#include <json_ivm/json_ivm_config.h>
#include <json_ivm/api.h>

#include <cstddef>

namespace json_ivm {

struct EngineOptions {
    /// Deepest nesting accepted for documents that drive recursion.
    std::size_t max_depth = JSON_IVM_MAX_DEPTH;

    /// Arrays shorter than this are searched with the scalar locator even
    /// for integer predicates.
    std::size_t simd_threshold = JSON_IVM_SIMD_THRESHOLD;

    /// insert_where on an absent field creates a one-element array instead
    /// of returning the target unchanged.
    bool insert_creates_missing_array = false;
};

/// Options built from the compile-time defaults in json_ivm_config.h.
[[nodiscard]] inline const EngineOptions& default_options() noexcept
{
    static const EngineOptions options{};
    return options;
}

} // namespace json_ivm
