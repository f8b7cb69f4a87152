// identifier.h - Identifier extraction from documents

#pragma once

#include <json_ivm/value.h>
#include <json_ivm/api.h>

#include <optional>
#include <string>

namespace json_ivm {

/// @brief String form of doc[key] when it is a string or a number
///
/// Numbers are rendered the way value_to_string() renders them (42, 1.5).
/// An integral double has no fractional part in its text: 42.0 gives "42".
/// Any other kind, a missing key, or a non-object doc yields nullopt.
[[nodiscard]] JSON_IVM_API std::optional<std::string> extract_id(
    const Value& doc, const std::string& key = "id");

} // namespace json_ivm
