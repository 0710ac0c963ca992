#include "pattern/HeadAndShouldersDetector.h"
#include "analytics/ExtremaFinder.h"
#include "pattern/PatternBuilder.h"
#include <algorithm>
#include <utility>

namespace chartsense {
namespace pattern {

HeadAndShouldersDetector::HeadAndShouldersDetector(
    ExtremaConfig extrema,
    HeadAndShouldersConfig config,
    std::shared_ptr<const IConfidencePolicy> policy
)
    : extrema_(extrema)
    , config_(config)
    , validator_(config, std::move(policy))
{}

bool HeadAndShouldersDetector::supports(PatternKind kind) const {
    return kind == PatternKind::HEAD_AND_SHOULDERS ||
           kind == PatternKind::INVERSE_HEAD_AND_SHOULDERS;
}

std::vector<PatternAnalysis> HeadAndShouldersDetector::detect(
    const std::vector<Candle>& candles,
    PatternKind kind
) const {
    std::vector<PatternAnalysis> patterns;
    if (!supports(kind)) return patterns;
    if (candles.size() < static_cast<std::size_t>(std::max(config_.min_bars, 0))) return patterns;

    const bool inverse = kind == PatternKind::INVERSE_HEAD_AND_SHOULDERS;
    const auto extremes = inverse
        ? analytics::ExtremaFinder::findTroughs(candles, extrema_.radius)
        : analytics::ExtremaFinder::findPeaks(candles, extrema_.radius);

    // 어깨 2 + 머리 1
    if (extremes.size() < 3) return patterns;

    for (std::size_t i = 0; i + 2 < extremes.size(); ++i) {
        for (std::size_t j = i + 1; j + 1 < extremes.size(); ++j) {
            for (std::size_t k = j + 1; k < extremes.size(); ++k) {
                const auto validation = validator_.validate(
                    candles, extremes[i].index, extremes[j].index, extremes[k].index, inverse);

                if (validation.is_valid && validation.confidence >= config_.min_candidate_confidence) {
                    patterns.push_back(PatternBuilder::buildHeadAndShoulders(
                        candles, extremes[i].index, extremes[j].index, extremes[k].index,
                        validation, inverse));
                }
            }
        }
    }

    keepTopByConfidence(patterns, config_.max_results);
    return patterns;
}

} // namespace pattern
} // namespace chartsense
