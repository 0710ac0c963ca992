#include "pattern/DoublePatternDetector.h"
#include "analytics/ExtremaFinder.h"
#include "pattern/PatternBuilder.h"
#include <utility>

namespace chartsense {
namespace pattern {

DoublePatternDetector::DoublePatternDetector(
    ExtremaConfig extrema,
    DoublePatternConfig config,
    std::shared_ptr<const IConfidencePolicy> policy
)
    : extrema_(extrema)
    , config_(config)
    , validator_(config, std::move(policy))
{}

bool DoublePatternDetector::supports(PatternKind kind) const {
    return kind == PatternKind::DOUBLE_TOP || kind == PatternKind::DOUBLE_BOTTOM;
}

std::vector<PatternAnalysis> DoublePatternDetector::detect(
    const std::vector<Candle>& candles,
    PatternKind kind
) const {
    std::vector<PatternAnalysis> patterns;
    if (!supports(kind)) return patterns;

    const bool top = kind == PatternKind::DOUBLE_TOP;
    const auto extremes = top
        ? analytics::ExtremaFinder::findPeaks(candles, extrema_.radius)
        : analytics::ExtremaFinder::findTroughs(candles, extrema_.radius);

    if (extremes.size() < 2) return patterns;

    // 비슷한 높이의 극값 쌍
    for (std::size_t i = 0; i + 1 < extremes.size(); ++i) {
        for (std::size_t j = i + 1; j < extremes.size(); ++j) {
            const auto validation = validator_.validate(candles, extremes[i], extremes[j], top);
            if (!validation.is_valid || validation.confidence < config_.min_candidate_confidence) {
                continue;
            }
            patterns.push_back(PatternBuilder::buildDoublePattern(
                candles, extremes[i], extremes[j], validation, top));
        }
    }

    keepTopByConfidence(patterns, config_.max_results);
    return patterns;
}

} // namespace pattern
} // namespace chartsense
