#pragma once

#include "common/Types.h"
#include <cstddef>
#include <vector>
#include <nlohmann/json.hpp>

namespace chartsense {
namespace analytics {

class CandleSeries {
public:
    // 입력 계약 검사: time 엄격 증가, OHLC 유한/비음수, high >= low.
    // 위반 시 CandleInputError
    static void validate(const std::vector<Candle>& candles);

    // 마지막 lookback개 (부족하면 전체)
    static std::vector<Candle> tail(const std::vector<Candle>& candles, std::size_t lookback);

    // Helper: JSON 배열 -> Candle
    // 각 원소: { "time" | "timestamp", "open", "high", "low", "close", "volume" }
    // 숫자 또는 숫자 문자열. volume 생략 시 0.
    static std::vector<Candle> fromJson(const nlohmann::json& json_candles);
};

} // namespace analytics
} // namespace chartsense
