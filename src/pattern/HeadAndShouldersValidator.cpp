#include "pattern/HeadAndShouldersValidator.h"
#include "analytics/ExtremaFinder.h"
#include <algorithm>
#include <utility>
#include <cmath>

namespace chartsense {
namespace pattern {

HeadAndShouldersValidator::HeadAndShouldersValidator(
    HeadAndShouldersConfig config,
    std::shared_ptr<const IConfidencePolicy> policy
)
    : config_(config)
    , policy_(std::move(policy))
{}

HeadAndShouldersValidation HeadAndShouldersValidator::validate(
    const std::vector<Candle>& candles,
    std::size_t left_shoulder,
    std::size_t head,
    std::size_t right_shoulder,
    bool inverse
) const {
    HeadAndShouldersValidation result;

    if (!(left_shoulder < head && head < right_shoulder && right_shoulder < candles.size())) {
        return result;
    }

    auto extremeOf = [inverse](const Candle& c) { return inverse ? c.low : c.high; };
    auto necklineOf = [inverse](const Candle& c) { return inverse ? c.high : c.low; };

    const double left_price = extremeOf(candles[left_shoulder]);
    const double head_price = extremeOf(candles[head]);
    const double right_price = extremeOf(candles[right_shoulder]);

    // 1. 머리가 양 어깨보다 높아야 함 (inverse: 낮아야 함)
    if (inverse) {
        if (head_price >= left_price || head_price >= right_price) return result;
    } else {
        if (head_price <= left_price || head_price <= right_price) return result;
    }

    // 2. 어깨 높이 차이 3% 이내
    if (left_price <= 0.0) return result;
    const double shoulder_diff = std::abs(left_price - right_price) / left_price;
    if (shoulder_diff > config_.max_shoulder_diff) return result;

    // 3. 어깨-머리 사이 넥라인 지점
    auto left_valley = analytics::ExtremaFinder::findValleyBetween(candles, left_shoulder, head, inverse);
    auto right_valley = analytics::ExtremaFinder::findValleyBetween(candles, head, right_shoulder, inverse);
    if (!left_valley || !right_valley) return result;

    // 4. 넥라인 기울기는 신뢰도에만 반영
    const double left_neckline = necklineOf(candles[*left_valley]);
    const double right_neckline = necklineOf(candles[*right_valley]);
    if (left_neckline <= 0.0) return result;
    const double neckline_diff = std::abs(left_neckline - right_neckline) / left_neckline;

    const double left_span = static_cast<double>(head - left_shoulder);
    const double right_span = static_cast<double>(right_shoulder - head);
    const double time_symmetry = 1.0 - std::abs(left_span - right_span) / std::max(left_span, right_span);

    result.is_valid = true;
    result.confidence = policy_->headAndShoulders(shoulder_diff, neckline_diff, time_symmetry);
    result.shoulder_diff = shoulder_diff;
    result.neckline_diff = neckline_diff;
    result.left_neckline_index = *left_valley;
    result.right_neckline_index = *right_valley;
    return result;
}

} // namespace pattern
} // namespace chartsense
