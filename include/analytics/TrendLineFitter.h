#pragma once

#include "common/Types.h"
#include <vector>

namespace chartsense {
namespace analytics {

struct TrendLine {
    double slope;       // 가격 / 캔들 1개
    double intercept;

    TrendLine() : slope(0), intercept(0) {}
    TrendLine(double s, double i) : slope(s), intercept(i) {}

    double valueAt(double index) const { return slope * index + intercept; }
};

// 최소제곱 추세선 (value on index)
class TrendLineFitter {
public:
    // 2개 미만이면 slope=0, intercept=0
    static TrendLine fit(const std::vector<ExtremumPoint>& points);
};

} // namespace analytics
} // namespace chartsense
