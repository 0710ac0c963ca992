#pragma once

#include <cstddef>

namespace chartsense {

using Price = double;
using Volume = double;
using TimeSec = long long;

// OHLCV 캔들 (time: epoch seconds, 오름차순)
struct Candle {
    TimeSec time;
    double open;
    double high;
    double low;
    double close;
    double volume;

    Candle() : time(0), open(0), high(0), low(0), close(0), volume(0) {}

    Candle(TimeSec t, double o, double h, double l, double c, double v)
        : time(t), open(o), high(h), low(l), close(c), volume(v) {}
};

// 로컬 극값 (peak: high 기준, trough: low 기준)
struct ExtremumPoint {
    std::size_t index;
    Price value;

    ExtremumPoint() : index(0), value(0) {}
    ExtremumPoint(std::size_t i, Price v) : index(i), value(v) {}
};

} // namespace chartsense
