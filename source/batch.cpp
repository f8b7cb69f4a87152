// batch.cpp - Single-pass batch update and multi-document fan-out

#include <json_ivm/batch.h>
#include <json_ivm/array_ops.h>
#include <json_ivm/depth.h>
#include <json_ivm/errors.h>
#include <json_ivm/merge.h>

#include <unordered_map>

namespace json_ivm {

namespace {

using PatchIndex = std::unordered_map<Value, ValueMap, ValueHash>;

PatchIndex build_patch_index(const std::vector<UpdateSpec>& updates, const EngineOptions& options)
{
    PatchIndex index;
    index.reserve(updates.size());
    for (const auto& spec : updates) {
        auto* patch = spec.patch.get_if<ValueMap>();
        if (!patch) {
            throw TypeMismatchError("patch", "object", std::string{value_type_name(spec.patch)});
        }
        validate_depth(spec.patch, options.max_depth);
        auto [it, inserted] = index.try_emplace(spec.match_value, *patch);
        if (!inserted) {
            it->second = detail::shallow_merge_maps(it->second, *patch);
        }
    }
    return index;
}

} // anonymous namespace

std::vector<UpdateSpec> parse_update_specs(const Value& specs)
{
    auto* entries = specs.get_if<ValueVector>();
    if (!entries) {
        throw InvalidArgumentError("updates must be a JSON array, got: " +
                                   std::string{value_type_name(specs)});
    }

    std::vector<UpdateSpec> result;
    result.reserve(entries->size());
    for (const auto& box : *entries) {
        const Value& entry = box.get();
        const Value* match_value = entry.find("match_value");
        const Value* patch = entry.find("updates");
        if (!match_value || !patch || !patch->is_object()) {
            detail::log_access_error("parse_update_specs",
                                     "skipping malformed update spec " + value_to_string(entry));
            continue;
        }
        result.push_back(UpdateSpec{*match_value, *patch});
    }
    return result;
}

Value update_where_batch(const Value& target, const std::string& array_field,
                         const std::string& match_key, const std::vector<UpdateSpec>& updates,
                         const EngineOptions& options)
{
    const PatchIndex patches = build_patch_index(updates, options);

    const ValueVector* array = find_array_field(target, array_field);
    if (!array || patches.empty()) {
        return target;
    }

    auto t = array->transient();
    bool changed = false;
    std::size_t index = 0;
    for (const auto& box : *array) {
        auto* element = box.get().get_if<ValueMap>();
        const ValueBox* key_value = element ? element->find(match_key) : nullptr;
        if (key_value) {
            auto it = patches.find(key_value->get());
            if (it != patches.end()) {
                t.set(index, ValueBox{Value{detail::shallow_merge_maps(*element, it->second)}});
                changed = true;
            }
        }
        ++index;
    }
    if (!changed) {
        detail::log_key_error("update_where_batch", match_key, "no element matches, target unchanged");
        return target;
    }
    return target.set(array_field, t.persistent());
}

Value update_where_batch(const Value& target, const std::string& array_field,
                         const std::string& match_key, const Value& updates,
                         const EngineOptions& options)
{
    return update_where_batch(target, array_field, match_key, parse_update_specs(updates), options);
}

std::vector<Value> update_multi_document(const std::vector<Value>& targets,
                                         const std::string& array_field, const MatchPredicate& pred,
                                         const Value& patch, const EngineOptions& options)
{
    if (!patch.is_object()) {
        throw TypeMismatchError("patch", "object", std::string{value_type_name(patch)});
    }

    std::vector<Value> results;
    results.reserve(targets.size());
    for (const auto& target : targets) {
        if (target.is_null()) {
            results.push_back(target);
            continue;
        }
        results.push_back(update_where(target, array_field, pred, patch, options));
    }
    return results;
}

} // namespace json_ivm
