#pragma once

#include "pattern/IPatternFamily.h"
#include "pattern/DoublePatternValidator.h"
#include <memory>

namespace chartsense {
namespace pattern {

class DoublePatternDetector : public IPatternFamily {
public:
    DoublePatternDetector(ExtremaConfig extrema,
                          DoublePatternConfig config,
                          std::shared_ptr<const IConfidencePolicy> policy);

    std::string name() const override { return "DoublePattern"; }
    bool supports(PatternKind kind) const override;
    std::vector<PatternAnalysis> detect(const std::vector<Candle>& candles,
                                        PatternKind kind) const override;

private:
    ExtremaConfig extrema_;
    DoublePatternConfig config_;
    DoublePatternValidator validator_;
};

} // namespace pattern
} // namespace chartsense
