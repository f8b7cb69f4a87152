// value.cpp - Value equality, hashing and diagnostics text

#include <json_ivm/value.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <functional>
#include <limits>
#include <sstream>
#include <vector>

namespace json_ivm {

namespace {

// 2^63 as a double; any double >= this is outside the int64 range.
constexpr double kInt64Bound = 9223372036854775808.0;

std::string format_double(double d)
{
    if (!std::isfinite(d)) {
        return "null";
    }
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc{}) {
        std::ostringstream oss;
        oss << d;
        return oss.str();
    }
    return std::string(buf, end);
}

void escape_string(const std::string& s, std::ostringstream& oss)
{
    oss << '"';
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    oss << buf;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
}

void to_string_impl(const Value& val, std::ostringstream& oss)
{
    std::visit([&oss](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << format_double(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            escape_string(arg, oss);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            oss << '[';
            bool first = true;
            for (const auto& box : arg) {
                if (!first) oss << ',';
                first = false;
                to_string_impl(box.get(), oss);
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            // immer::map iteration order is hash order; sort for stable output
            std::vector<const std::pair<std::string, ValueBox>*> entries;
            entries.reserve(arg.size());
            for (const auto& entry : arg) {
                entries.push_back(&entry);
            }
            std::sort(entries.begin(), entries.end(),
                      [](const auto* a, const auto* b) { return a->first < b->first; });
            oss << '{';
            bool first = true;
            for (const auto* entry : entries) {
                if (!first) oss << ',';
                first = false;
                escape_string(entry->first, oss);
                oss << ':';
                to_string_impl(entry->second.get(), oss);
            }
            oss << '}';
        }
    }, val.data);
}

bool maps_equal(const ValueMap& a, const ValueMap& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, box] : a) {
        const ValueBox* other = b.find(key);
        if (!other) {
            return false;
        }
        // Shared subtree: identical by construction
        if (&box.get() == &other->get()) {
            continue;
        }
        if (!(box.get() == other->get())) {
            return false;
        }
    }
    return true;
}

bool vectors_equal(const ValueVector& a, const ValueVector& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    auto it_b = b.begin();
    for (auto it_a = a.begin(); it_a != a.end(); ++it_a, ++it_b) {
        if (&it_a->get() == &it_b->get()) {
            continue;
        }
        if (!(it_a->get() == it_b->get())) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

ValueType Value::type() const noexcept
{
    return std::visit([](const auto& arg) -> ValueType {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return ValueType::Null;
        } else if constexpr (std::is_same_v<T, bool>) {
            return ValueType::Boolean;
        } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
            return ValueType::Number;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return ValueType::String;
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return ValueType::Array;
        } else {
            static_assert(std::is_same_v<T, ValueMap>, "unhandled Value alternative");
            return ValueType::Object;
        }
    }, data);
}

std::optional<std::int64_t> Value::exact_int() const noexcept
{
    if (auto* i = get_if<std::int64_t>()) {
        return *i;
    }
    if (auto* d = get_if<double>()) {
        if (std::isfinite(*d) && std::trunc(*d) == *d &&
            *d >= -kInt64Bound && *d < kInt64Bound) {
            return static_cast<std::int64_t>(*d);
        }
    }
    return std::nullopt;
}

bool numbers_equal(const Value& a, const Value& b) noexcept
{
    if (auto* ai = a.get_if<std::int64_t>()) {
        if (auto* bi = b.get_if<std::int64_t>()) {
            return *ai == *bi;
        }
        auto bi = b.exact_int();
        return bi && *bi == *ai;
    }
    if (auto* ad = a.get_if<double>()) {
        if (auto* bd = b.get_if<double>()) {
            return *ad == *bd;
        }
        if (auto* bi = b.get_if<std::int64_t>()) {
            auto ai = a.exact_int();
            return ai && *ai == *bi;
        }
    }
    return false;
}

bool operator==(const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number()) {
        return numbers_equal(a, b);
    }
    if (a.data.index() != b.data.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return maps_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return vectors_equal(lhs, rhs);
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

std::size_t ValueHash::operator()(const Value& v) const
{
    constexpr std::size_t kMix = 0x9e3779b97f4a7c15ULL;
    if (auto i = v.exact_int()) {
        return std::hash<std::int64_t>{}(*i);
    }
    return std::visit([&](const auto& arg) -> std::size_t {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return kMix;
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            // Order-independent combination over entries
            std::size_t h = kMix ^ arg.size();
            for (const auto& [key, box] : arg) {
                h += std::hash<std::string>{}(key) ^ ((*this)(box.get()) * kMix);
            }
            return h;
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            std::size_t h = arg.size();
            for (const auto& box : arg) {
                h = h * 31 + (*this)(box.get());
            }
            return h;
        } else {
            return std::hash<T>{}(arg);
        }
    }, v.data);
}

std::string_view value_type_name(const Value& val) noexcept
{
    switch (val.type()) {
        case ValueType::Null:    return "null";
        case ValueType::Boolean: return "boolean";
        case ValueType::Number:  return "number";
        case ValueType::String:  return "string";
        case ValueType::Array:   return "array";
        case ValueType::Object:  return "object";
    }
    return "unknown";
}

std::string value_to_string(const Value& val)
{
    std::ostringstream oss;
    to_string_impl(val, oss);
    return oss.str();
}

std::string number_to_string(const Value& val)
{
    if (auto* i = val.get_if<std::int64_t>()) {
        return std::to_string(*i);
    }
    if (auto* d = val.get_if<double>()) {
        return format_double(*d);
    }
    return {};
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    return os << value_to_string(val);
}

} // namespace json_ivm
