#include "pattern/PatternBuilder.h"
#include <algorithm>
#include <utility>
#include <cmath>

namespace chartsense {
namespace pattern {

namespace {
const char* const COLOR_RED = "#ff0000";
const char* const COLOR_GREEN = "#00ff00";
const char* const COLOR_BLUE = "#0000ff";

PatternKeyPoint makeKeyPoint(TimeSec time, Price value, KeyPointKind kind, std::string label) {
    PatternKeyPoint point;
    point.time = time;
    point.value = value;
    point.kind = kind;
    point.label = std::move(label);
    return point;
}

PatternLine dashedOutline(std::size_t from, std::size_t to) {
    PatternLine line;
    line.from_index = from;
    line.to_index = to;
    line.role = LineRole::OUTLINE;
    line.style.dashed = true;
    return line;
}

PatternLine solidLine(std::size_t from, std::size_t to, LineRole role, const char* color) {
    PatternLine line;
    line.from_index = from;
    line.to_index = to;
    line.role = role;
    line.style.color = color;
    line.style.line_width = 2;
    return line;
}

// 목표가 포인트는 마지막 캔들 시점 (패턴 종료 이후일 때만)
void appendTarget(PatternVisualization& viz, const std::vector<Candle>& candles,
                  std::size_t end_index, Price target) {
    if (candles.empty() || end_index + 1 >= candles.size()) {
        return;
    }
    viz.key_points.push_back(makeKeyPoint(candles.back().time, target, KeyPointKind::TARGET, "T"));
}
}

PatternAnalysis PatternBuilder::buildHeadAndShoulders(
    const std::vector<Candle>& candles,
    std::size_t left_shoulder,
    std::size_t head,
    std::size_t right_shoulder,
    const HeadAndShouldersValidation& validation,
    bool inverse
) {
    const std::size_t left_valley = validation.left_neckline_index;
    const std::size_t right_valley = validation.right_neckline_index;

    auto extremeOf = [inverse](const Candle& c) { return inverse ? c.low : c.high; };
    auto necklineOf = [inverse](const Candle& c) { return inverse ? c.high : c.low; };
    const KeyPointKind shoulder_kind = inverse ? KeyPointKind::TROUGH : KeyPointKind::PEAK;
    const KeyPointKind neck_kind = inverse ? KeyPointKind::PEAK : KeyPointKind::TROUGH;

    const Price ls_price = extremeOf(candles[left_shoulder]);
    const Price head_price = extremeOf(candles[head]);
    const Price rs_price = extremeOf(candles[right_shoulder]);
    const Price lv_price = necklineOf(candles[left_valley]);
    const Price rv_price = necklineOf(candles[right_valley]);

    PatternVisualization viz;
    viz.key_points = {
        makeKeyPoint(candles[left_shoulder].time, ls_price, shoulder_kind, "LS"),
        makeKeyPoint(candles[left_valley].time, lv_price, neck_kind, "LV"),
        makeKeyPoint(candles[head].time, head_price, shoulder_kind, "H"),
        makeKeyPoint(candles[right_valley].time, rv_price, neck_kind, "RV"),
        makeKeyPoint(candles[right_shoulder].time, rs_price, shoulder_kind, "RS")
    };

    // 넥라인 / 목표가
    const Price neckline = (lv_price + rv_price) / 2.0;
    const Price height = std::abs(head_price - neckline);
    const Price target = inverse ? neckline + height : neckline - height;

    appendTarget(viz, candles, right_shoulder, target);

    viz.lines = {
        dashedOutline(0, 1),
        dashedOutline(1, 2),
        dashedOutline(2, 3),
        dashedOutline(3, 4),
        solidLine(1, 3, LineRole::NECKLINE, COLOR_RED)
    };

    PatternArea area;
    area.points = {0, 1, 2, 3, 4};
    area.fill_color = inverse ? COLOR_GREEN : COLOR_RED;
    area.opacity = 0.1;
    viz.areas.push_back(area);

    HeadAndShouldersMetrics metrics;
    metrics.formation_period = static_cast<int>(right_shoulder - left_shoulder + 1);
    metrics.symmetry = ls_price > 0.0 ? 1.0 - std::abs(ls_price - rs_price) / ls_price : 0.0;
    metrics.breakout_level = neckline;
    metrics.target_level = target;
    metrics.stop_loss = head_price;
    metrics.left_shoulder_price = ls_price;
    metrics.head_price = head_price;
    metrics.right_shoulder_price = rs_price;
    metrics.left_neckline_price = lv_price;
    metrics.right_neckline_price = rv_price;

    PatternAnalysis analysis;
    analysis.kind = inverse ? PatternKind::INVERSE_HEAD_AND_SHOULDERS : PatternKind::HEAD_AND_SHOULDERS;
    analysis.start_time = candles[left_shoulder].time;
    analysis.end_time = candles[right_shoulder].time;
    analysis.start_index = left_shoulder;
    analysis.end_index = right_shoulder;
    analysis.confidence = validation.confidence;
    analysis.visualization = std::move(viz);
    analysis.metrics = metrics;
    analysis.bias = inverse ? DirectionalBias::BULLISH : DirectionalBias::BEARISH;
    return analysis;
}

PatternAnalysis PatternBuilder::buildTriangle(
    const std::vector<Candle>& candles,
    const std::vector<ExtremumPoint>& highs,
    const std::vector<ExtremumPoint>& lows,
    const TriangleValidation& validation,
    PatternKind kind
) {
    const std::size_t start_idx = std::min(highs.front().index, lows.front().index);
    const std::size_t end_idx = std::max(highs.back().index, lows.back().index);

    // 고점/저점을 시간순으로 병합 (H1.., L1..)
    PatternVisualization viz;
    std::size_t first_high = 0, last_high = 0, first_low = 0, last_low = 0;
    std::size_t hi = 0, lo = 0;
    while (hi < highs.size() || lo < lows.size()) {
        const bool take_high = lo >= lows.size() ||
                               (hi < highs.size() && highs[hi].index <= lows[lo].index);
        const std::size_t position = viz.key_points.size();
        if (take_high) {
            const auto& h = highs[hi];
            viz.key_points.push_back(makeKeyPoint(candles[h.index].time, h.value, KeyPointKind::PEAK,
                                                  "H" + std::to_string(hi + 1)));
            if (hi == 0) first_high = position;
            last_high = position;
            ++hi;
        } else {
            const auto& l = lows[lo];
            viz.key_points.push_back(makeKeyPoint(candles[l.index].time, l.value, KeyPointKind::TROUGH,
                                                  "L" + std::to_string(lo + 1)));
            if (lo == 0) first_low = position;
            last_low = position;
            ++lo;
        }
    }

    viz.lines = {
        solidLine(first_high, last_high, LineRole::RESISTANCE, COLOR_RED),
        solidLine(first_low, last_low, LineRole::SUPPORT, COLOR_GREEN)
    };

    PatternArea area;
    for (std::size_t i = 0; i < viz.key_points.size(); ++i) {
        area.points.push_back(i);
    }
    area.fill_color = kind == PatternKind::ASCENDING_TRIANGLE ? COLOR_GREEN
                    : kind == PatternKind::DESCENDING_TRIANGLE ? COLOR_RED
                    : COLOR_BLUE;
    area.opacity = 0.1;
    viz.areas.push_back(area);

    const Price last_high_price = highs.back().value;
    const Price last_low_price = lows.back().value;

    TriangleMetrics metrics;
    metrics.formation_period = static_cast<int>(end_idx - start_idx + 1);
    metrics.upper_slope = validation.upper.slope;
    metrics.upper_intercept = validation.upper.intercept;
    metrics.lower_slope = validation.lower.slope;
    metrics.lower_intercept = validation.lower.intercept;
    metrics.upper_bound = validation.upper.valueAt(static_cast<double>(end_idx));
    metrics.lower_bound = validation.lower.valueAt(static_cast<double>(end_idx));

    // 삼각형의 가장 넓은 폭 (시작 지점의 추세선 간격)
    const double start_x = static_cast<double>(start_idx);
    metrics.pattern_height = std::max(0.0, validation.upper.valueAt(start_x) - validation.lower.valueAt(start_x));

    PatternAnalysis analysis;
    analysis.kind = kind;

    switch (kind) {
        case PatternKind::ASCENDING_TRIANGLE:
            metrics.breakout_level = last_high_price;
            metrics.target_level = last_high_price + metrics.pattern_height;
            metrics.stop_loss = last_low_price;
            analysis.bias = DirectionalBias::BULLISH;
            break;
        case PatternKind::DESCENDING_TRIANGLE:
            metrics.breakout_level = last_low_price;
            metrics.target_level = last_low_price - metrics.pattern_height;
            metrics.stop_loss = last_high_price;
            analysis.bias = DirectionalBias::BEARISH;
            break;
        default:
            metrics.breakout_level = (last_high_price + last_low_price) / 2.0;
            metrics.target_level = metrics.breakout_level + metrics.pattern_height;
            metrics.downside_target_level = metrics.breakout_level - metrics.pattern_height;
            metrics.stop_loss = last_low_price;
            analysis.bias = DirectionalBias::NEUTRAL;
            break;
    }

    analysis.start_time = candles[start_idx].time;
    analysis.end_time = candles[end_idx].time;
    analysis.start_index = start_idx;
    analysis.end_index = end_idx;
    analysis.confidence = validation.confidence;
    analysis.visualization = std::move(viz);
    analysis.metrics = metrics;
    return analysis;
}

PatternAnalysis PatternBuilder::buildDoublePattern(
    const std::vector<Candle>& candles,
    const ExtremumPoint& first,
    const ExtremumPoint& second,
    const DoublePatternValidation& validation,
    bool top
) {
    const std::size_t between = validation.neckline_index;
    const Price neckline = top ? candles[between].low : candles[between].high;
    const KeyPointKind outer_kind = top ? KeyPointKind::PEAK : KeyPointKind::TROUGH;
    const KeyPointKind inner_kind = top ? KeyPointKind::TROUGH : KeyPointKind::PEAK;

    PatternVisualization viz;
    viz.key_points = {
        makeKeyPoint(candles[first.index].time, first.value, outer_kind, top ? "T1" : "B1"),
        makeKeyPoint(candles[between].time, neckline, inner_kind, "N"),
        makeKeyPoint(candles[second.index].time, second.value, outer_kind, top ? "T2" : "B2")
    };

    const Price height = std::abs(first.value - neckline);
    const Price target = top ? neckline - height : neckline + height;

    appendTarget(viz, candles, second.index, target);

    // 넥라인은 N에서 수평으로 연장 (렌더러 측)
    viz.lines = {
        dashedOutline(0, 1),
        dashedOutline(1, 2),
        solidLine(1, 1, LineRole::NECKLINE, COLOR_RED)
    };

    DoublePatternMetrics metrics;
    metrics.formation_period = static_cast<int>(second.index - first.index + 1);
    metrics.breakout_level = neckline;
    metrics.target_level = target;
    metrics.stop_loss = top ? std::max(first.value, second.value) : std::min(first.value, second.value);
    metrics.first_peak_price = first.value;
    metrics.second_peak_price = second.value;
    metrics.valley_price = neckline;

    PatternAnalysis analysis;
    analysis.kind = top ? PatternKind::DOUBLE_TOP : PatternKind::DOUBLE_BOTTOM;
    analysis.start_time = candles[first.index].time;
    analysis.end_time = candles[second.index].time;
    analysis.start_index = first.index;
    analysis.end_index = second.index;
    analysis.confidence = validation.confidence;
    analysis.visualization = std::move(viz);
    analysis.metrics = metrics;
    analysis.bias = top ? DirectionalBias::BEARISH : DirectionalBias::BULLISH;
    return analysis;
}

} // namespace pattern
} // namespace chartsense
