#pragma once

#include "common/Types.h"
#include "pattern/PatternTypes.h"
#include <string>
#include <vector>

namespace chartsense {
namespace pattern {

// One detector per pattern group (head-and-shoulders, triangles, double top/bottom).
class IPatternFamily {
public:
    virtual ~IPatternFamily() = default;

    virtual std::string name() const = 0;

    virtual bool supports(PatternKind kind) const = 0;

    // Candidates of `kind` in `candles`, sorted by confidence (descending) and capped.
    // Indices are relative to `candles`.
    virtual std::vector<PatternAnalysis> detect(const std::vector<Candle>& candles,
                                                PatternKind kind) const = 0;
};

} // namespace pattern
} // namespace chartsense
