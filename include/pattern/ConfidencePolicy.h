#pragma once

#include "pattern/PatternTypes.h"

namespace chartsense {
namespace pattern {

// Confidence scoring for each family. Implementations must return values in [0, 1].
class IConfidencePolicy {
public:
    virtual ~IConfidencePolicy() = default;

    // shoulder_diff, neckline_diff: relative price differences.
    // time_symmetry: 1 - |leftSpan - rightSpan| / max(leftSpan, rightSpan)
    virtual double headAndShoulders(double shoulder_diff,
                                    double neckline_diff,
                                    double time_symmetry) const = 0;

    virtual double triangle(PatternKind kind, double high_slope, double low_slope) const = 0;

    virtual double doublePattern(double price_diff) const = 0;
};

// Linear blends with base 0.7.
class DefaultConfidencePolicy : public IConfidencePolicy {
public:
    static constexpr double BASE_CONFIDENCE = 0.7;
    static constexpr double HEAD_AND_SHOULDERS_CAP = 0.95;

    double headAndShoulders(double shoulder_diff,
                            double neckline_diff,
                            double time_symmetry) const override;

    double triangle(PatternKind kind, double high_slope, double low_slope) const override;

    double doublePattern(double price_diff) const override;
};

} // namespace pattern
} // namespace chartsense
