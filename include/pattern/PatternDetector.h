#pragma once

#include "common/Types.h"
#include "pattern/ConfidencePolicy.h"
#include "pattern/DetectionConfig.h"
#include "pattern/IPatternFamily.h"
#include "pattern/PatternTypes.h"
#include <memory>
#include <vector>

namespace chartsense {
namespace pattern {

// Runs every registered family over the trailing lookback window.
// detect() keeps no state between calls and may run concurrently on one instance.
class PatternDetector {
public:
    // Registers the head-and-shoulders, triangle and double-pattern families.
    // policy == nullptr selects DefaultConfidencePolicy.
    explicit PatternDetector(const DetectionConfig& config = DetectionConfig(),
                             std::shared_ptr<const IConfidencePolicy> policy = nullptr);

    void registerFamily(std::shared_ptr<IPatternFamily> family);
    std::vector<std::string> getFamilyNames() const;

    // Throws DetectionParamsError for invalid params and CandleInputError for malformed
    // candles, before any scan. start_index/end_index of the results index into `candles`.
    std::vector<PatternAnalysis> detect(const std::vector<Candle>& candles,
                                        const DetectionParams& params) const;

private:
    std::vector<PatternKind> requestedKinds(const DetectionParams& params) const;

    std::vector<std::shared_ptr<IPatternFamily>> families_;
};

} // namespace pattern
} // namespace chartsense
