// array_ops.cpp - delete / insert / contains / update on array fields

#include <json_ivm/array_ops.h>
#include <json_ivm/depth.h>
#include <json_ivm/errors.h>
#include <json_ivm/merge.h>

#include <algorithm>
#include <cctype>

namespace json_ivm {

namespace {

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// Rank of each kind in the cross-kind order
int kind_rank(const Value& v)
{
    switch (v.type()) {
        case ValueType::Null:    return 0;
        case ValueType::Boolean: return 1;
        case ValueType::Number:  return 2;
        case ValueType::String:  return 3;
        case ValueType::Array:
        case ValueType::Object:  return 4;
    }
    return 4;
}

std::weak_ordering compare_numbers(const Value& a, const Value& b)
{
    auto* ai = a.get_if<std::int64_t>();
    auto* bi = b.get_if<std::int64_t>();
    if (ai && bi) {
        return *ai <=> *bi;
    }
    const double ad = a.as_double();
    const double bd = b.as_double();
    if (ad < bd) return std::weak_ordering::less;
    if (ad > bd) return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}

} // anonymous namespace

SortOrder parse_sort_order(std::string_view text)
{
    if (iequals(text, "ASC")) {
        return SortOrder::Ascending;
    }
    if (iequals(text, "DESC")) {
        return SortOrder::Descending;
    }
    throw InvalidArgumentError("sort order must be 'ASC' or 'DESC', got: '" + std::string{text} + "'");
}

std::weak_ordering compare_values(const Value& a, const Value& b)
{
    const int ra = kind_rank(a);
    const int rb = kind_rank(b);
    if (ra != rb) {
        return ra <=> rb;
    }
    switch (a.type()) {
        case ValueType::Number:
            return compare_numbers(a, b);
        case ValueType::String:
            return std::get<std::string>(a.data).compare(std::get<std::string>(b.data)) <=> 0;
        case ValueType::Boolean:
            return static_cast<int>(a.as_bool()) <=> static_cast<int>(b.as_bool());
        default:
            return std::weak_ordering::equivalent;
    }
}

std::size_t find_insertion_point(const ValueVector& array, const Value* new_sort_value,
                                 const std::string& sort_key, SortOrder order)
{
    if (!new_sort_value) {
        return array.size();
    }
    std::size_t index = 0;
    for (const auto& box : array) {
        if (const Value* elem_value = box.get().find(sort_key)) {
            const auto cmp = compare_values(*new_sort_value, *elem_value);
            const bool before = order == SortOrder::Ascending ? cmp < 0 : cmp > 0;
            if (before) {
                return index;
            }
        }
        ++index;
    }
    return array.size();
}

Value delete_where(const Value& target, const std::string& array_field, const MatchPredicate& pred,
                   const EngineOptions& options)
{
    const ValueVector* array = find_array_field(target, array_field);
    if (!array) {
        return target;
    }
    auto index = locate(*array, pred, options);
    if (!index) {
        detail::log_key_error("delete_where", pred.key, "no element matches, target unchanged");
        return target;
    }
    return target.set(array_field, array->erase(*index));
}

Value insert_where(const Value& target, const std::string& array_field, const Value& element,
                   const std::optional<std::string>& sort_key, SortOrder order,
                   const EngineOptions& options)
{
    const ValueVector* array = find_array_field(target, array_field);
    if (!array) {
        if (options.insert_creates_missing_array && target.is_object() && !target.contains(array_field)) {
            return target.set(array_field, ValueVector{}.push_back(ValueBox{element}));
        }
        return target;
    }

    if (!sort_key) {
        return target.set(array_field, array->push_back(ValueBox{element}));
    }
    const auto position = find_insertion_point(*array, element.find(*sort_key), *sort_key, order);
    return target.set(array_field, array->insert(position, ValueBox{element}));
}

bool contains(const Value& target, const std::string& array_field, const MatchPredicate& pred,
              const EngineOptions& options)
{
    const ValueVector* array = find_array_field(target, array_field);
    return array && locate(*array, pred, options).has_value();
}

Value update_where(const Value& target, const std::string& array_field, const MatchPredicate& pred,
                   const Value& patch, const EngineOptions& options)
{
    auto* patch_map = patch.get_if<ValueMap>();
    if (!patch_map) {
        throw TypeMismatchError("patch", "object", std::string{value_type_name(patch)});
    }
    validate_depth(patch, options.max_depth);

    const ValueVector* array = find_array_field(target, array_field);
    if (!array) {
        return target;
    }
    auto index = locate(*array, pred, options);
    if (!index) {
        detail::log_key_error("update_where", pred.key, "no element matches, target unchanged");
        return target;
    }
    // A matched element is an object by construction of the predicate
    const auto& element = std::get<ValueMap>((*array)[*index].get().data);
    Value merged{detail::shallow_merge_maps(element, *patch_map)};
    return target.set(array_field, array->set(*index, ValueBox{std::move(merged)}));
}

Value update_where_path(const Value& target, const std::string& array_field, const MatchPredicate& pred,
                        const Path& update_path, const Value& value, const EngineOptions& options)
{
    validate_depth(value, options.max_depth);

    const ValueVector* array = find_array_field(target, array_field);
    if (!array) {
        return target;
    }
    auto index = locate(*array, pred, options);
    if (!index) {
        detail::log_key_error("update_where_path", pred.key, "no element matches, target unchanged");
        return target;
    }
    Value updated = set_path((*array)[*index].get(), update_path, value);
    return target.set(array_field, array->set(*index, ValueBox{std::move(updated)}));
}

} // namespace json_ivm
