#include "analytics/ExtremaFinder.h"

namespace chartsense {
namespace analytics {

std::vector<ExtremumPoint> ExtremaFinder::findPeaks(const std::vector<Candle>& candles, int radius) {
    std::vector<ExtremumPoint> peaks;
    if (radius < 1) return peaks;

    const std::size_t r = static_cast<std::size_t>(radius);
    if (candles.size() <= r * 2) return peaks;

    for (std::size_t i = r; i < candles.size() - r; ++i) {
        if (isLocalMaximum(candles, i, radius)) {
            peaks.emplace_back(i, candles[i].high);
        }
    }

    return peaks;
}

std::vector<ExtremumPoint> ExtremaFinder::findTroughs(const std::vector<Candle>& candles, int radius) {
    std::vector<ExtremumPoint> troughs;
    if (radius < 1) return troughs;

    const std::size_t r = static_cast<std::size_t>(radius);
    if (candles.size() <= r * 2) return troughs;

    for (std::size_t i = r; i < candles.size() - r; ++i) {
        if (isLocalMinimum(candles, i, radius)) {
            troughs.emplace_back(i, candles[i].low);
        }
    }

    return troughs;
}

std::optional<std::size_t> ExtremaFinder::findValleyBetween(
    const std::vector<Candle>& candles,
    std::size_t start,
    std::size_t end,
    bool inverse
) {
    if (end <= start + 1 || end > candles.size()) {
        return std::nullopt;
    }

    std::size_t best_idx = start + 1;
    double best_value = inverse ? candles[best_idx].high : candles[best_idx].low;

    for (std::size_t i = start + 2; i < end; ++i) {
        const double value = inverse ? candles[i].high : candles[i].low;
        if (inverse ? value > best_value : value < best_value) {
            best_value = value;
            best_idx = i;
        }
    }

    return best_idx;
}

// 호출 측에서 [index - radius, index + radius] 범위가 유효함을 보장
bool ExtremaFinder::isLocalMaximum(const std::vector<Candle>& candles, std::size_t index, int radius) {
    const double value = candles[index].high;

    for (int k = 1; k <= radius; ++k) {
        if (candles[index - k].high >= value) return false;
        if (candles[index + k].high >= value) return false;
    }

    return true;
}

bool ExtremaFinder::isLocalMinimum(const std::vector<Candle>& candles, std::size_t index, int radius) {
    const double value = candles[index].low;

    for (int k = 1; k <= radius; ++k) {
        if (candles[index - k].low <= value) return false;
        if (candles[index + k].low <= value) return false;
    }

    return true;
}

} // namespace analytics
} // namespace chartsense
