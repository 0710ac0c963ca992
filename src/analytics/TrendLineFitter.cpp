#include "analytics/TrendLineFitter.h"
#include <cmath>

namespace chartsense {
namespace analytics {

TrendLine TrendLineFitter::fit(const std::vector<ExtremumPoint>& points) {
    if (points.size() < 2) {
        return TrendLine();
    }

    const double n = static_cast<double>(points.size());
    double sum_x = 0.0;
    double sum_y = 0.0;
    double sum_xy = 0.0;
    double sum_xx = 0.0;

    for (const auto& p : points) {
        const double x = static_cast<double>(p.index);
        sum_x += x;
        sum_y += p.value;
        sum_xy += x * p.value;
        sum_xx += x * x;
    }

    const double denominator = n * sum_xx - sum_x * sum_x;
    if (std::abs(denominator) < 1e-12) {
        // 모든 점이 같은 인덱스 - 평균가를 지나는 수평선
        return TrendLine(0.0, sum_y / n);
    }

    const double slope = (n * sum_xy - sum_x * sum_y) / denominator;
    const double intercept = (sum_y - slope * sum_x) / n;

    return TrendLine(slope, intercept);
}

} // namespace analytics
} // namespace chartsense
