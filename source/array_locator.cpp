// array_locator.cpp - Scalar and lane-vectorized element search

#include <json_ivm/array_locator.h>

#include <array>

#if defined(__AVX2__)
#include <immintrin.h>
#endif

namespace json_ivm {

namespace {

constexpr std::size_t kLaneWidth = JSON_IVM_LANE_WIDTH;

using Lane = std::array<std::int64_t, kLaneWidth>;

[[nodiscard]] inline std::int64_t lane_key(const Value& element, const std::string& key)
{
    if (const Value* field = element.find(key)) {
        if (auto i = field->exact_int()) {
            return *i;
        }
    }
    return kLaneSentinel;
}

/// Bit i set when lane[i] == target.
[[nodiscard]] inline unsigned lane_mask(const Lane& lane, std::int64_t target)
{
#if defined(__AVX2__)
    static_assert(kLaneWidth == 8, "AVX2 kernel compares two 4x64 registers");
    const __m256i needle = _mm256_set1_epi64x(target);
    const __m256i lo = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(lane.data()));
    const __m256i hi = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(lane.data() + 4));
    const int lo_mask = _mm256_movemask_pd(_mm256_castsi256_pd(_mm256_cmpeq_epi64(lo, needle)));
    const int hi_mask = _mm256_movemask_pd(_mm256_castsi256_pd(_mm256_cmpeq_epi64(hi, needle)));
    return static_cast<unsigned>(lo_mask) | (static_cast<unsigned>(hi_mask) << 4);
#else
    unsigned mask = 0;
    for (std::size_t i = 0; i < kLaneWidth; ++i) {
        mask |= static_cast<unsigned>(lane[i] == target) << i;
    }
    return mask;
#endif
}

} // anonymous namespace

LocateStrategy select_strategy(const ValueVector& array, const MatchPredicate& pred,
                               const EngineOptions& options)
{
    if (auto* target = pred.value.get_if<std::int64_t>()) {
        if (*target != kLaneSentinel && array.size() >= options.simd_threshold) {
            return LocateStrategy::IntegerLanes;
        }
    }
    return LocateStrategy::Scalar;
}

std::optional<std::size_t> locate(const ValueVector& array, const MatchPredicate& pred,
                                  const EngineOptions& options)
{
    switch (select_strategy(array, pred, options)) {
        case LocateStrategy::IntegerLanes:
            return locate_int_lanes(array, pred.key, std::get<std::int64_t>(pred.value.data));
        case LocateStrategy::Scalar:
            break;
    }
    return locate_scalar(array, pred);
}

std::optional<std::size_t> locate_scalar(const ValueVector& array, const MatchPredicate& pred)
{
    std::size_t index = 0;
    for (const auto& box : array) {
        if (element_matches(box.get(), pred)) {
            return index;
        }
        ++index;
    }
    return std::nullopt;
}

std::optional<std::size_t> locate_int_lanes(const ValueVector& array, const std::string& key,
                                            std::int64_t target)
{
    if (target == kLaneSentinel) {
        return locate_scalar(array, MatchPredicate{key, Value{target}});
    }

    const std::size_t full_lanes = array.size() / kLaneWidth;
    auto it = array.begin();
    Lane lane{};

    for (std::size_t l = 0; l < full_lanes; ++l) {
        for (std::size_t i = 0; i < kLaneWidth; ++i, ++it) {
            lane[i] = lane_key(it->get(), key);
        }
        if (lane_mask(lane, target) != 0) {
            for (std::size_t i = 0; i < kLaneWidth; ++i) {
                if (lane[i] == target) {
                    return l * kLaneWidth + i;
                }
            }
        }
    }

    std::size_t index = full_lanes * kLaneWidth;
    for (; it != array.end(); ++it, ++index) {
        if (lane_key(it->get(), key) == target) {
            return index;
        }
    }
    return std::nullopt;
}

const ValueVector* find_array_field(const Value& target, const std::string& field)
{
    const Value* found = target.find(field);
    if (!found) {
        detail::log_key_error("find_array_field", field, "absent or target is not an object");
        return nullptr;
    }
    if (auto* vec = found->get_if<ValueVector>()) {
        return vec;
    }
    detail::log_key_error("find_array_field", field, "does not hold an array");
    return nullptr;
}

} // namespace json_ivm
