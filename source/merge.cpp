// Copyright (c) 2025 json_ivm authors. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file merge.cpp
/// @brief Implementation of the merge operations.

#include <json_ivm/merge.h>
#include <json_ivm/depth.h>
#include <json_ivm/errors.h>

#include <vector>

namespace json_ivm {

namespace detail {

ValueMap shallow_merge_maps(const ValueMap& target, const ValueMap& source)
{
    if (source.empty()) {
        return target;
    }
    auto t = target.transient();
    for (const auto& [key, box] : source) {
        t.set(key, box);
    }
    return t.persistent();
}

} // namespace detail

namespace {

const ValueMap& require_object(const Value& val, const char* argument)
{
    if (auto* m = val.get_if<ValueMap>()) {
        return *m;
    }
    throw TypeMismatchError(argument, "object", std::string{value_type_name(val)});
}

/// smart_patch without the null check, for values found inside documents
Value smart_patch_impl(const Value& target, const Value& source)
{
    auto* tm = target.get_if<ValueMap>();
    auto* sm = source.get_if<ValueMap>();
    if (!tm || !sm) {
        return source;
    }
    auto t = tm->transient();
    for (const auto& [key, box] : *sm) {
        const ValueBox* existing = tm->find(key);
        auto* existing_map = existing ? existing->get().get_if<ValueMap>() : nullptr;
        auto* source_map = box.get().get_if<ValueMap>();
        if (existing_map && source_map) {
            t.set(key, ValueBox{Value{detail::shallow_merge_maps(*existing_map, *source_map)}});
        } else {
            t.set(key, box);
        }
    }
    return t.persistent();
}

Value deep_merge_impl(const Value& target, const Value& source)
{
    auto* tm = target.get_if<ValueMap>();
    auto* sm = source.get_if<ValueMap>();
    if (!tm || !sm) {
        return source;
    }
    auto t = tm->transient();
    for (const auto& [key, box] : *sm) {
        const ValueBox* existing = tm->find(key);
        if (existing && existing->get().is_object() && box.get().is_object()) {
            t.set(key, ValueBox{deep_merge_impl(existing->get(), box.get())});
        } else {
            t.set(key, box);
        }
    }
    return t.persistent();
}

} // anonymous namespace

Value merge_shallow(const Value& target, const Value& source, const EngineOptions& options)
{
    const auto& target_map = require_object(target, "target");
    const auto& source_map = require_object(source, "source");
    validate_depth(source, options.max_depth);
    return detail::shallow_merge_maps(target_map, source_map);
}

Value smart_patch(const Value& target, const Value& source, const EngineOptions& options)
{
    if (target.is_null() || source.is_null()) {
        return Value{};
    }
    validate_depth(source, options.max_depth);
    return smart_patch_impl(target, source);
}

Value smart_patch_at_path(const Value& target, const Value& source, const Path& path,
                          const EngineOptions& options)
{
    if (target.is_null() || source.is_null()) {
        return Value{};
    }
    if (!resolve(target, path)) {
        detail::log_access_error("smart_patch_at_path",
                                 "path '" + path_to_string(path) + "' does not resolve, target unchanged");
        return target;
    }
    validate_depth(source, options.max_depth);
    return lager::over(path_lens(path), target,
                       [&source](const Value& at) { return smart_patch_impl(at, source); });
}

Value smart_patch_array(const Value& target, const Value& source,
                        const std::string& array_field, const MatchPredicate& pred,
                        const EngineOptions& options)
{
    require_object(source, "source");
    const ValueVector* array = find_array_field(target, array_field);
    if (!array) {
        return target;
    }
    auto index = locate(*array, pred, options);
    if (!index) {
        detail::log_key_error("smart_patch_array", pred.key, "no element matches, target unchanged");
        return target;
    }
    validate_depth(source, options.max_depth);
    Value patched = smart_patch_impl((*array)[*index].get(), source);
    return target.set(array_field, array->set(*index, ValueBox{std::move(patched)}));
}

Value deep_merge(const Value& target, const Value& source, const EngineOptions& options)
{
    // Null check comes first: a null source must not cause target to be inspected
    if (source.is_null() || target.is_null()) {
        return Value{};
    }
    validate_depth(source, options.max_depth);
    return deep_merge_impl(target, source);
}

Value merge_at_path(const Value& target, const Value& source, const Path& path,
                    const EngineOptions& options)
{
    if (target.is_null() || source.is_null()) {
        return Value{};
    }
    const auto& source_map = require_object(source, "source");
    validate_depth(source, options.max_depth);

    if (path.empty()) {
        return detail::shallow_merge_maps(require_object(target, "target"), source_map);
    }

    // Walk down, recording each object on the spine so it can be rebuilt
    std::vector<ValueMap> spine;
    spine.reserve(path.size());
    ValueMap current = require_object(target, "target");
    for (std::size_t i = 0; i < path.size(); ++i) {
        auto* key = std::get_if<std::string>(&path[i]);
        if (!key) {
            throw TypeMismatchError("path segment " + std::to_string(i), "object key", "array index");
        }
        spine.push_back(current);
        const ValueBox* child = current.find(*key);
        if (!child) {
            current = ValueMap{};
            continue;
        }
        if (auto* child_map = child->get().get_if<ValueMap>()) {
            current = *child_map;
        } else {
            throw TypeMismatchError("value at '" + path_to_string(Path(path.begin(), path.begin() + i + 1)) + "'",
                                    "object", std::string{value_type_name(child->get())});
        }
    }

    Value rebuilt{detail::shallow_merge_maps(current, source_map)};
    for (std::size_t i = path.size(); i-- > 0;) {
        rebuilt = spine[i].set(std::get<std::string>(path[i]), ValueBox{std::move(rebuilt)});
    }
    return rebuilt;
}

} // namespace json_ivm
