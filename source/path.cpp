// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.cpp
/// @brief Path parsing, path editing and path lenses.

#include <json_ivm/path.h>
#include <json_ivm/errors.h>

#include <zug/compose.hpp>

#include <charconv>

namespace json_ivm {

// ============================================================
// Construction and parsing
// ============================================================

Path make_path(std::initializer_list<std::string> keys)
{
    Path path;
    path.reserve(keys.size());
    for (const auto& key : keys) {
        path.emplace_back(key);
    }
    return path;
}

Path make_path(const std::vector<std::string>& keys)
{
    Path path;
    path.reserve(keys.size());
    for (const auto& key : keys) {
        path.emplace_back(key);
    }
    return path;
}

Path parse_path(std::string_view text)
{
    Path segments;
    std::string current_key;

    auto flush_key = [&] {
        if (!current_key.empty()) {
            segments.emplace_back(std::move(current_key));
            current_key.clear();
        }
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        switch (ch) {
            case '.':
                flush_key();
                if (i + 1 < text.size() && text[i + 1] == '.') {
                    throw PathSyntaxError(std::string{text}, "consecutive dots");
                }
                break;
            case '[': {
                flush_key();
                const auto close = text.find(']', i + 1);
                if (close == std::string_view::npos) {
                    throw PathSyntaxError(std::string{text}, "unterminated array index");
                }
                const auto digits = text.substr(i + 1, close - i - 1);
                if (digits.empty()) {
                    throw PathSyntaxError(std::string{text}, "empty array index");
                }
                std::size_t index = 0;
                auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
                if (ec != std::errc{} || end != digits.data() + digits.size()) {
                    throw PathSyntaxError(std::string{text},
                                          "invalid array index '" + std::string{digits} + "'");
                }
                segments.emplace_back(index);
                i = close;
                break;
            }
            case ']':
                throw PathSyntaxError(std::string{text}, "unexpected closing bracket");
            default:
                current_key.push_back(ch);
        }
    }
    flush_key();

    if (segments.empty()) {
        throw PathSyntaxError(std::string{text}, "empty path");
    }
    return segments;
}

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        if (auto* key = std::get_if<std::string>(&elem)) {
            if (!result.empty()) {
                result += '.';
            }
            result += *key;
        } else {
            result += '[' + std::to_string(std::get<std::size_t>(elem)) + ']';
        }
    }
    return result;
}

// ============================================================
// Editing
// ============================================================

namespace {

Value set_element(const Value& current, const PathElement& elem, Value new_val)
{
    if (auto* key = std::get_if<std::string>(&elem)) {
        return current.set(*key, std::move(new_val));
    }
    const auto index = std::get<std::size_t>(elem);
    if (auto* v = current.get_if<ValueVector>()) {
        if (index < v->size()) {
            return v->set(index, ValueBox{std::move(new_val)});
        }
    }
    return current;
}

Value set_at_path_recursive(const Value& node, const Path& path, std::size_t depth, Value new_val)
{
    if (depth == path.size()) {
        return new_val;
    }
    const auto& elem = path[depth];
    const Value* child = step(node, elem);
    if (!child) {
        return node;
    }
    Value new_child = set_at_path_recursive(*child, path, depth + 1, std::move(new_val));
    return set_element(node, elem, std::move(new_child));
}

/// Make `node` a container able to hold `elem`, keeping it if it already is one.
Value container_for(const Value& node, const PathElement& elem)
{
    if (std::holds_alternative<std::string>(elem)) {
        return node.is_object() ? node : Value{ValueMap{}};
    }
    return node.is_array() ? node : Value{ValueVector{}};
}

Value set_element_vivify(const Value& node, const PathElement& elem, Value new_val)
{
    Value container = container_for(node, elem);
    if (auto* key = std::get_if<std::string>(&elem)) {
        return container.set(*key, std::move(new_val));
    }
    const auto index = std::get<std::size_t>(elem);
    const auto& vec = std::get<ValueVector>(container.data);
    if (index < vec.size()) {
        return vec.set(index, ValueBox{std::move(new_val)});
    }
    auto trans = vec.transient();
    while (trans.size() < index) {
        trans.push_back(ValueBox{});
    }
    trans.push_back(ValueBox{std::move(new_val)});
    return trans.persistent();
}

Value set_path_recursive(const Value& node, const Path& path, std::size_t depth, Value new_val)
{
    if (depth == path.size()) {
        return new_val;
    }
    const auto& elem = path[depth];
    const Value* child = step(node, elem);
    Value new_child = set_path_recursive(child ? *child : Value{}, path, depth + 1, std::move(new_val));
    return set_element_vivify(node, elem, std::move(new_child));
}

} // anonymous namespace

Value set_at_path(const Value& root, const Path& path, Value new_val)
{
    if (path.empty()) {
        return new_val;
    }
    return set_at_path_recursive(root, path, 0, std::move(new_val));
}

Value set_path(const Value& root, const Path& path, Value new_val)
{
    if (path.empty()) {
        return new_val;
    }
    return set_path_recursive(root, path, 0, std::move(new_val));
}

// ============================================================
// Lenses
// ============================================================

ValueLens key_lens(const std::string& key)
{
    return lager::lenses::getset(
        [key](const Value& obj) -> Value {
            if (const Value* found = obj.find(key)) {
                return *found;
            }
            return Value{};
        },
        [key](Value obj, Value value) -> Value {
            if (auto* map = obj.get_if<ValueMap>()) {
                return map->set(key, ValueBox{std::move(value)});
            }
            return obj;
        });
}

ValueLens index_lens(std::size_t index)
{
    return lager::lenses::getset(
        [index](const Value& arr) -> Value {
            if (const Value* found = arr.find(index)) {
                return *found;
            }
            return Value{};
        },
        [index](Value arr, Value value) -> Value {
            if (auto* vec = arr.get_if<ValueVector>()) {
                if (index < vec->size()) {
                    return vec->set(index, ValueBox{std::move(value)});
                }
            }
            return arr;
        });
}

// Note: zug::comp() is used instead of operator| because ADL may not find
// zug's operator| when both operands are lager::lens<> (lager namespace).
ValueLens path_lens(const Path& path)
{
    ValueLens lens = zug::identity;
    for (const auto& elem : path) {
        ValueLens inner = std::visit(
            [](const auto& segment) -> ValueLens {
                using T = std::decay_t<decltype(segment)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    return key_lens(segment);
                } else {
                    return index_lens(segment);
                }
            },
            elem);
        lens = zug::comp(lens, inner);
    }
    return lens;
}

} // namespace json_ivm
