#pragma once

#include "pattern/IPatternFamily.h"
#include "pattern/TriangleValidator.h"
#include <memory>

namespace chartsense {
namespace pattern {

// Ascending / descending / symmetrical triangles over trailing windows
// (min_bars, min_bars + step, ... up to max_window).
class TriangleDetector : public IPatternFamily {
public:
    TriangleDetector(ExtremaConfig extrema,
                     TriangleConfig config,
                     std::shared_ptr<const IConfidencePolicy> policy);

    std::string name() const override { return "Triangle"; }
    bool supports(PatternKind kind) const override;
    std::vector<PatternAnalysis> detect(const std::vector<Candle>& candles,
                                        PatternKind kind) const override;

private:
    ExtremaConfig extrema_;
    TriangleConfig config_;
    TriangleValidator validator_;
};

} // namespace pattern
} // namespace chartsense
