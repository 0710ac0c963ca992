#include "pattern/PatternDetector.h"
#include "analytics/CandleSeries.h"
#include "common/Logger.h"
#include "pattern/DoublePatternDetector.h"
#include "pattern/HeadAndShouldersDetector.h"
#include "pattern/TriangleDetector.h"
#include <algorithm>
#include <utility>

namespace chartsense {
namespace pattern {

PatternDetector::PatternDetector(
    const DetectionConfig& config,
    std::shared_ptr<const IConfidencePolicy> policy
) {
    if (!policy) {
        policy = std::make_shared<DefaultConfidencePolicy>();
    }

    registerFamily(std::make_shared<HeadAndShouldersDetector>(
        config.extrema, config.head_and_shoulders, policy));
    registerFamily(std::make_shared<TriangleDetector>(
        config.extrema, config.triangle, policy));
    registerFamily(std::make_shared<DoublePatternDetector>(
        config.extrema, config.double_pattern, policy));
}

void PatternDetector::registerFamily(std::shared_ptr<IPatternFamily> family) {
    if (!family) return;
    LOG_DEBUG("Pattern family registered: {}", family->name());
    families_.push_back(std::move(family));
}

std::vector<std::string> PatternDetector::getFamilyNames() const {
    std::vector<std::string> names;
    for (const auto& family : families_) {
        names.push_back(family->name());
    }
    return names;
}

std::vector<PatternKind> PatternDetector::requestedKinds(const DetectionParams& params) const {
    if (!params.pattern_kinds) {
        return allPatternKinds();
    }

    // 중복 제거 + 표준 순서
    std::vector<PatternKind> kinds;
    for (auto kind : allPatternKinds()) {
        const auto& wanted = *params.pattern_kinds;
        if (std::find(wanted.begin(), wanted.end(), kind) != wanted.end()) {
            kinds.push_back(kind);
        }
    }
    return kinds;
}

std::vector<PatternAnalysis> PatternDetector::detect(
    const std::vector<Candle>& candles,
    const DetectionParams& params
) const {
    validateDetectionParams(params);
    analytics::CandleSeries::validate(candles);

    std::vector<PatternAnalysis> patterns;
    if (candles.empty()) {
        return patterns;
    }

    const auto recent = analytics::CandleSeries::tail(candles, static_cast<std::size_t>(params.lookback_period));
    const std::size_t offset = candles.size() - recent.size();

    for (auto kind : requestedKinds(params)) {
        for (const auto& family : families_) {
            if (!family->supports(kind)) continue;

            try {
                auto found = family->detect(recent, kind);
                for (auto& p : found) {
                    if (!(p.confidence >= 0.0 && p.confidence <= 1.0)) {
                        LOG_WARN("{} produced out-of-range confidence {} for {}, dropped",
                                 family->name(), p.confidence, toString(kind));
                        continue;
                    }
                    if (p.confidence < params.min_confidence) continue;

                    p.start_index += offset;
                    p.end_index += offset;
                    patterns.push_back(std::move(p));
                }
            } catch (const std::exception& e) {
                LOG_ERROR("{} detection failed for {}: {}", family->name(), toString(kind), e.what());
            }
        }
    }

    LOG_DEBUG("Pattern detection complete: {} candles, lookback {}, {} patterns (min confidence {:.2f})",
              candles.size(), params.lookback_period, patterns.size(), params.min_confidence);

    return patterns;
}

} // namespace pattern
} // namespace chartsense
