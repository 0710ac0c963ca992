#pragma once

#include "analytics/TrendLineFitter.h"
#include "common/Types.h"
#include "pattern/ConfidencePolicy.h"
#include "pattern/DetectionConfig.h"
#include <memory>
#include <vector>

namespace chartsense {
namespace pattern {

struct TriangleValidation {
    bool is_valid = false;
    double confidence = 0.0;
    analytics::TrendLine upper;     // fitted to swing highs
    analytics::TrendLine lower;     // fitted to swing lows
};

class TriangleValidator {
public:
    TriangleValidator(TriangleConfig config, std::shared_ptr<const IConfidencePolicy> policy);

    // kind must be one of the triangle kinds; any other kind is never valid.
    // A candidate scoring below min_candidate_confidence is not valid.
    TriangleValidation validate(const std::vector<ExtremumPoint>& highs,
                                const std::vector<ExtremumPoint>& lows,
                                PatternKind kind) const;

private:
    bool isFlat(double slope) const;
    bool isRising(double slope) const;
    bool isFalling(double slope) const;

    TriangleConfig config_;
    std::shared_ptr<const IConfidencePolicy> policy_;
};

} // namespace pattern
} // namespace chartsense
