#include "analytics/CandleSeries.h"
#include "common/Errors.h"
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace chartsense {
namespace analytics {

namespace {
bool isValidPrice(double v) {
    return std::isfinite(v) && v >= 0.0;
}

double getDouble(const nlohmann::json& candle, const char* key, std::size_t row) {
    if (!candle.contains(key)) {
        throw CandleInputError("candle[" + std::to_string(row) + "] missing field '" + key + "'");
    }

    const auto& val = candle.at(key);
    if (val.is_number()) {
        return val.get<double>();
    }
    if (val.is_string()) {
        const auto text = val.get<std::string>();
        std::size_t consumed = 0;
        try {
            const double parsed = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return parsed;
            }
        } catch (const std::logic_error&) {
            // 아래에서 CandleInputError로 보고
        }
    }
    throw CandleInputError("candle[" + std::to_string(row) + "] field '" + key + "' is not numeric");
}

// epoch seconds: 정수만 허용 (소수 초, NaN/inf, long long 범위 밖은 거부)
TimeSec getTime(const nlohmann::json& candle, const char* key, std::size_t row) {
    if (candle.contains(key)) {
        const auto& val = candle.at(key);
        if (val.is_number_unsigned()) {
            const auto raw = val.get<std::uint64_t>();
            if (raw > static_cast<std::uint64_t>(std::numeric_limits<TimeSec>::max())) {
                throw CandleInputError("candle[" + std::to_string(row) + "] time is out of range");
            }
            return static_cast<TimeSec>(raw);
        }
        if (val.is_number_integer()) {
            return val.get<TimeSec>();
        }
    }

    const double raw = getDouble(candle, key, row);
    if (!std::isfinite(raw)) {
        throw CandleInputError("candle[" + std::to_string(row) + "] time is not finite");
    }
    if (raw != std::floor(raw)) {
        throw CandleInputError("candle[" + std::to_string(row) + "] time is not a whole second");
    }
    // [-2^63, 2^63) 는 double로 정확히 표현됨
    if (raw < static_cast<double>(std::numeric_limits<TimeSec>::min()) ||
        raw >= static_cast<double>(std::numeric_limits<TimeSec>::max())) {
        throw CandleInputError("candle[" + std::to_string(row) + "] time is out of range");
    }
    return static_cast<TimeSec>(raw);
}
}

void CandleSeries::validate(const std::vector<Candle>& candles) {
    for (std::size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        if (!isValidPrice(c.open) || !isValidPrice(c.high) ||
            !isValidPrice(c.low) || !isValidPrice(c.close)) {
            throw CandleInputError("candle[" + std::to_string(i) + "] has a non-finite or negative price");
        }
        if (c.high < c.low) {
            throw CandleInputError("candle[" + std::to_string(i) + "] has high below low");
        }
        if (i > 0 && c.time <= candles[i - 1].time) {
            throw CandleInputError("candle[" + std::to_string(i) + "] time " + std::to_string(c.time) +
                                   " is not after " + std::to_string(candles[i - 1].time));
        }
    }
}

std::vector<Candle> CandleSeries::tail(const std::vector<Candle>& candles, std::size_t lookback) {
    if (lookback >= candles.size()) {
        return candles;
    }
    return std::vector<Candle>(candles.end() - static_cast<std::ptrdiff_t>(lookback), candles.end());
}

std::vector<Candle> CandleSeries::fromJson(const nlohmann::json& json_candles) {
    if (!json_candles.is_array()) {
        throw CandleInputError("candles JSON must be an array");
    }

    std::vector<Candle> candles;
    candles.reserve(json_candles.size());

    for (std::size_t row = 0; row < json_candles.size(); ++row) {
        const auto& jc = json_candles[row];
        if (!jc.is_object()) {
            throw CandleInputError("candle[" + std::to_string(row) + "] is not an object");
        }

        Candle c;
        const char* time_key = jc.contains("time") ? "time" : "timestamp";
        c.time = getTime(jc, time_key, row);
        c.open = getDouble(jc, "open", row);
        c.high = getDouble(jc, "high", row);
        c.low = getDouble(jc, "low", row);
        c.close = getDouble(jc, "close", row);
        c.volume = jc.contains("volume") ? getDouble(jc, "volume", row) : 0.0;

        candles.push_back(c);
    }

    return candles;
}

} // namespace analytics
} // namespace chartsense
