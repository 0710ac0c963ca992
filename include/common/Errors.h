#pragma once

#include <stdexcept>
#include <string>

namespace chartsense {

// Invalid DetectionParams (lookback <= 0, min confidence outside [0,1]).
class DetectionParamsError : public std::invalid_argument {
public:
    explicit DetectionParamsError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Candle input that breaks the caller contract (time order, prices, JSON fields).
class CandleInputError : public std::invalid_argument {
public:
    explicit CandleInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace chartsense
