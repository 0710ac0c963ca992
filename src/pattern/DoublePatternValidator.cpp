#include "pattern/DoublePatternValidator.h"
#include "analytics/ExtremaFinder.h"
#include <cmath>
#include <utility>

namespace chartsense {
namespace pattern {

DoublePatternValidator::DoublePatternValidator(
    DoublePatternConfig config,
    std::shared_ptr<const IConfidencePolicy> policy
)
    : config_(config)
    , policy_(std::move(policy))
{}

DoublePatternValidation DoublePatternValidator::validate(
    const std::vector<Candle>& candles,
    const ExtremumPoint& first,
    const ExtremumPoint& second,
    bool top
) const {
    DoublePatternValidation result;

    if (first.index >= second.index || second.index >= candles.size() || first.value <= 0.0) {
        return result;
    }

    // 두 고점(저점) 가격 차이 1% 이내
    const double price_diff = std::abs(first.value - second.value) / first.value;
    if (price_diff > config_.max_price_diff) {
        return result;
    }

    // 사이의 넥라인: top이면 최저 low, bottom이면 최고 high
    auto between = analytics::ExtremaFinder::findValleyBetween(candles, first.index, second.index, !top);
    if (!between) {
        return result;
    }

    result.is_valid = true;
    result.price_diff = price_diff;
    result.neckline_index = *between;
    result.confidence = policy_->doublePattern(price_diff);
    return result;
}

} // namespace pattern
} // namespace chartsense
