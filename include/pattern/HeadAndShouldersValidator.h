#pragma once

#include "common/Types.h"
#include "pattern/ConfidencePolicy.h"
#include "pattern/DetectionConfig.h"
#include <cstddef>
#include <memory>
#include <vector>

namespace chartsense {
namespace pattern {

struct HeadAndShouldersValidation {
    bool is_valid = false;
    double confidence = 0.0;
    double shoulder_diff = 0.0;
    double neckline_diff = 0.0;
    std::size_t left_neckline_index = 0;
    std::size_t right_neckline_index = 0;
};

class HeadAndShouldersValidator {
public:
    HeadAndShouldersValidator(HeadAndShouldersConfig config,
                              std::shared_ptr<const IConfidencePolicy> policy);

    // inverse == false: shoulders/head from high, neckline from low.
    // inverse == true:  shoulders/head from low, neckline from high.
    HeadAndShouldersValidation validate(const std::vector<Candle>& candles,
                                        std::size_t left_shoulder,
                                        std::size_t head,
                                        std::size_t right_shoulder,
                                        bool inverse) const;

private:
    HeadAndShouldersConfig config_;
    std::shared_ptr<const IConfidencePolicy> policy_;
};

} // namespace pattern
} // namespace chartsense
