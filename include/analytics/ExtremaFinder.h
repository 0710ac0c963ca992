#pragma once

#include "common/Types.h"
#include <cstddef>
#include <optional>
#include <vector>

namespace chartsense {
namespace analytics {

// 로컬 극값 탐지 - 고정 반경 슬라이딩 비교
class ExtremaFinder {
public:
    static constexpr int DEFAULT_RADIUS = 5;

    // high 기준 로컬 최대 (반경 내 모든 high보다 strictly 큼)
    static std::vector<ExtremumPoint> findPeaks(const std::vector<Candle>& candles,
                                                int radius = DEFAULT_RADIUS);

    // low 기준 로컬 최소 (반경 내 모든 low보다 strictly 작음)
    static std::vector<ExtremumPoint> findTroughs(const std::vector<Candle>& candles,
                                                  int radius = DEFAULT_RADIUS);

    // start, end 사이(양끝 제외)의 최저 low 인덱스. inverse면 최고 high.
    // 사이에 캔들이 없으면 nullopt. 동률은 앞쪽 인덱스.
    static std::optional<std::size_t> findValleyBetween(const std::vector<Candle>& candles,
                                                        std::size_t start,
                                                        std::size_t end,
                                                        bool inverse);

private:
    static bool isLocalMaximum(const std::vector<Candle>& candles, std::size_t index, int radius);
    static bool isLocalMinimum(const std::vector<Candle>& candles, std::size_t index, int radius);
};

} // namespace analytics
} // namespace chartsense
