// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief JSON Value type used by every transformation in json_ivm.
///
/// A Value is a closed tagged union over the six JSON kinds:
/// - Null (std::monostate)
/// - Boolean (bool)
/// - Number (int64_t for integers, double otherwise)
/// - String (std::string)
/// - Array (immer::flex_vector of boxed Values)
/// - Object (immer::map from std::string to boxed Values)
///
/// Containers are immer's persistent structures. Every "edit" produces a new
/// Value that shares all untouched subtrees with its input, so a caller's
/// document is never modified or aliased by an operation.

#pragma once

#include <json_ivm/json_ivm_config.h>
#include <json_ivm/api.h>

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace json_ivm {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_IVM_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_IVM_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

struct Value;

using ValueBox    = immer::box<Value>;
using ValueMap    = immer::map<std::string, ValueBox>;
using ValueVector = immer::flex_vector<ValueBox>;

/// The six JSON kinds, in the order used for mixed-type ordering.
enum class ValueType : std::uint8_t { Null, Boolean, Number, String, Array, Object };

struct JSON_IVM_CLASS Value
{
    std::variant<std::int64_t,
                 double,
                 bool,
                 std::string,
                 ValueMap,
                 ValueVector,
                 std::monostate>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T v) noexcept : data(static_cast<std::int64_t>(v)) {}

    template <std::floating_point T>
    Value(T v) noexcept : data(static_cast<double>(v)) {}

    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(ValueVector v) : data(std::move(v)) {}

    /// Build an object. Later duplicates of a key win.
    static Value object(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value array(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueType type() const noexcept;

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_int() const noexcept { return is<std::int64_t>(); }
    [[nodiscard]] bool is_double() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_number() const noexcept { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<ValueVector>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<ValueMap>(); }

    /// Object field lookup. Arrays and scalars yield nullptr.
    [[nodiscard]] const Value* find(const std::string& key) const {
        if (auto* m = get_if<ValueMap>()) {
            if (auto* found = m->find(key)) return &found->get();
        }
        return nullptr;
    }

    /// Array element lookup. Objects and scalars yield nullptr.
    [[nodiscard]] const Value* find(std::size_t index) const {
        if (auto* v = get_if<ValueVector>()) {
            if (index < v->size()) return &(*v)[index].get();
        }
        return nullptr;
    }

    [[nodiscard]] Value at(const std::string& key) const {
        if (auto* found = find(key)) return *found;
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return Value{};
    }

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }

    /// Returns a copy with key set. Non-objects are returned unchanged.
    [[nodiscard]] Value set(const std::string& key, Value val) const {
        if (auto* m = get_if<ValueMap>()) return m->set(key, ValueBox{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-object type");
        return *this;
    }

    /// Element count for arrays and objects, 0 otherwise.
    [[nodiscard]] std::size_t size() const noexcept {
        if (auto* m = get_if<ValueMap>()) return m->size();
        if (auto* v = get_if<ValueVector>()) return v->size();
        return 0;
    }

    /// The integer this number denotes exactly, if any.
    /// Doubles qualify only when integral and inside the int64 range.
    [[nodiscard]] std::optional<std::int64_t> exact_int() const noexcept;

    [[nodiscard]] std::int64_t as_int64(std::int64_t default_val = 0) const noexcept {
        if (auto* p = get_if<std::int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const noexcept {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<std::int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const noexcept {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] ValueMap as_object(ValueMap default_val = {}) const {
        if (auto* p = get_if<ValueMap>()) return *p;
        return default_val;
    }

    [[nodiscard]] ValueVector as_array(ValueVector default_val = {}) const {
        if (auto* p = get_if<ValueVector>()) return *p;
        return default_val;
    }
};

// ============================================================
// Equality
//
// Structural: same kind, same contents, object key order irrelevant.
// Numbers compare by numeric value, so 2 == 2.0.
// ============================================================

[[nodiscard]] JSON_IVM_API bool operator==(const Value& a, const Value& b);

[[nodiscard]] JSON_IVM_API bool numbers_equal(const Value& a, const Value& b) noexcept;

/// Hash consistent with operator== (2 and 2.0 hash alike).
struct JSON_IVM_CLASS ValueHash {
    [[nodiscard]] std::size_t operator()(const Value& v) const;
};

// ============================================================
// Utility functions
// ============================================================

/// "null", "boolean", "number", "string", "array" or "object"
[[nodiscard]] JSON_IVM_API std::string_view value_type_name(const Value& val) noexcept;

/// Compact JSON-like text with object keys sorted, for diagnostics.
[[nodiscard]] JSON_IVM_API std::string value_to_string(const Value& val);

/// Canonical text of a number ("42", "1.5"); empty for non-numbers.
[[nodiscard]] JSON_IVM_API std::string number_to_string(const Value& val);

JSON_IVM_API std::ostream& operator<<(std::ostream& os, const Value& val);

} // namespace json_ivm
