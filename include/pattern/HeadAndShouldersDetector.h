#pragma once

#include "pattern/IPatternFamily.h"
#include "pattern/HeadAndShouldersValidator.h"
#include <memory>

namespace chartsense {
namespace pattern {

// Head-and-shoulders / inverse head-and-shoulders.
// Every ordered (left, head, right) triple of extrema is evaluated, O(n^3) in extrema count;
// the facade's lookback keeps n small.
class HeadAndShouldersDetector : public IPatternFamily {
public:
    HeadAndShouldersDetector(ExtremaConfig extrema,
                             HeadAndShouldersConfig config,
                             std::shared_ptr<const IConfidencePolicy> policy);

    std::string name() const override { return "HeadAndShoulders"; }
    bool supports(PatternKind kind) const override;
    std::vector<PatternAnalysis> detect(const std::vector<Candle>& candles,
                                        PatternKind kind) const override;

private:
    ExtremaConfig extrema_;
    HeadAndShouldersConfig config_;
    HeadAndShouldersValidator validator_;
};

} // namespace pattern
} // namespace chartsense
