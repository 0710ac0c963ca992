#pragma once

#include "common/Types.h"
#include "pattern/DoublePatternValidator.h"
#include "pattern/HeadAndShouldersValidator.h"
#include "pattern/PatternTypes.h"
#include "pattern/TriangleValidator.h"
#include <cstddef>
#include <vector>

namespace chartsense {
namespace pattern {

// Builds PatternAnalysis records (key points, lines, metrics, bias) from validated candidates.
// Indices in the result are relative to `candles`.
class PatternBuilder {
public:
    static PatternAnalysis buildHeadAndShoulders(const std::vector<Candle>& candles,
                                                 std::size_t left_shoulder,
                                                 std::size_t head,
                                                 std::size_t right_shoulder,
                                                 const HeadAndShouldersValidation& validation,
                                                 bool inverse);

    static PatternAnalysis buildTriangle(const std::vector<Candle>& candles,
                                         const std::vector<ExtremumPoint>& highs,
                                         const std::vector<ExtremumPoint>& lows,
                                         const TriangleValidation& validation,
                                         PatternKind kind);

    static PatternAnalysis buildDoublePattern(const std::vector<Candle>& candles,
                                              const ExtremumPoint& first,
                                              const ExtremumPoint& second,
                                              const DoublePatternValidation& validation,
                                              bool top);
};

} // namespace pattern
} // namespace chartsense
