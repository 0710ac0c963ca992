#include "pattern/TriangleDetector.h"
#include "analytics/ExtremaFinder.h"
#include "pattern/PatternBuilder.h"
#include <algorithm>
#include <set>
#include <utility>

namespace chartsense {
namespace pattern {

namespace {
std::vector<ExtremumPoint> sinceIndex(const std::vector<ExtremumPoint>& points, std::size_t first_index) {
    std::vector<ExtremumPoint> out;
    for (const auto& p : points) {
        if (p.index >= first_index) {
            out.push_back(p);
        }
    }
    return out;
}

// 한 캔들이 고점이자 저점(outside bar)이면 삼각형 경계로 쓰지 않음
bool sharesIndex(const std::vector<ExtremumPoint>& highs, const std::vector<ExtremumPoint>& lows) {
    for (const auto& h : highs) {
        for (const auto& l : lows) {
            if (h.index == l.index) return true;
        }
    }
    return false;
}
}

TriangleDetector::TriangleDetector(
    ExtremaConfig extrema,
    TriangleConfig config,
    std::shared_ptr<const IConfidencePolicy> policy
)
    : extrema_(extrema)
    , config_(config)
    , validator_(config, std::move(policy))
{}

bool TriangleDetector::supports(PatternKind kind) const {
    return kind == PatternKind::ASCENDING_TRIANGLE ||
           kind == PatternKind::DESCENDING_TRIANGLE ||
           kind == PatternKind::SYMMETRICAL_TRIANGLE;
}

std::vector<PatternAnalysis> TriangleDetector::detect(
    const std::vector<Candle>& candles,
    PatternKind kind
) const {
    std::vector<PatternAnalysis> patterns;
    if (!supports(kind)) return patterns;

    const int n = static_cast<int>(candles.size());
    if (config_.min_bars < 1 || n < config_.min_bars) return patterns;

    const auto highs = analytics::ExtremaFinder::findPeaks(candles, extrema_.radius);
    const auto lows = analytics::ExtremaFinder::findTroughs(candles, extrema_.radius);
    if (highs.size() < 2 || lows.size() < 2) return patterns;

    const int step = std::max(config_.window_step, 1);
    const int last_window = std::min(config_.max_window, n);

    // 같은 스윙 집합을 보는 창은 한 번만 채택
    std::set<std::pair<std::size_t, std::size_t>> seen_starts;

    for (int window = config_.min_bars; window <= last_window; window += step) {
        const std::size_t first_index = static_cast<std::size_t>(n - window);
        const auto recent_highs = sinceIndex(highs, first_index);
        const auto recent_lows = sinceIndex(lows, first_index);

        if (recent_highs.size() < 2 || recent_lows.size() < 2) continue;
        if (sharesIndex(recent_highs, recent_lows)) continue;

        if (!seen_starts.insert({recent_highs.front().index, recent_lows.front().index}).second) continue;

        const auto validation = validator_.validate(recent_highs, recent_lows, kind);
        if (!validation.is_valid) continue;

        patterns.push_back(PatternBuilder::buildTriangle(candles, recent_highs, recent_lows, validation, kind));
    }

    keepTopByConfidence(patterns, config_.max_results);
    return patterns;
}

} // namespace pattern
} // namespace chartsense
