// depth.cpp - Nesting-depth measurement and validation

#include <json_ivm/depth.h>
#include <json_ivm/errors.h>

#include <algorithm>

namespace json_ivm {

namespace {

std::size_t measure(const Value& val, std::size_t current)
{
    std::size_t deepest = current;
    if (auto* m = val.get_if<ValueMap>()) {
        for (const auto& [key, box] : *m) {
            deepest = std::max(deepest, measure(box.get(), current + 1));
        }
    } else if (auto* v = val.get_if<ValueVector>()) {
        for (const auto& box : *v) {
            deepest = std::max(deepest, measure(box.get(), current + 1));
        }
    }
    return deepest;
}

void check(const Value& val, std::size_t current, std::size_t limit)
{
    if (current > limit) {
        throw MaxDepthExceededError(limit);
    }
    if (auto* m = val.get_if<ValueMap>()) {
        for (const auto& [key, box] : *m) {
            check(box.get(), current + 1, limit);
        }
    } else if (auto* v = val.get_if<ValueVector>()) {
        for (const auto& box : *v) {
            check(box.get(), current + 1, limit);
        }
    }
}

} // anonymous namespace

std::size_t max_depth(const Value& val)
{
    return measure(val, 0);
}

void validate_depth(const Value& val, std::size_t limit)
{
    check(val, 0, limit);
}

} // namespace json_ivm
