#pragma once

#include "common/Types.h"
#include "pattern/ConfidencePolicy.h"
#include "pattern/DetectionConfig.h"
#include <cstddef>
#include <memory>
#include <vector>

namespace chartsense {
namespace pattern {

struct DoublePatternValidation {
    bool is_valid = false;
    double confidence = 0.0;
    double price_diff = 0.0;
    std::size_t neckline_index = 0;    // valley for a top, peak for a bottom
};

class DoublePatternValidator {
public:
    DoublePatternValidator(DoublePatternConfig config, std::shared_ptr<const IConfidencePolicy> policy);

    // top == true: first/second are peaks, neckline is the lowest low between them.
    DoublePatternValidation validate(const std::vector<Candle>& candles,
                                     const ExtremumPoint& first,
                                     const ExtremumPoint& second,
                                     bool top) const;

private:
    DoublePatternConfig config_;
    std::shared_ptr<const IConfidencePolicy> policy_;
};

} // namespace pattern
} // namespace chartsense
