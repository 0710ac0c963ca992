#include "pattern/TriangleDetector.h"
#include "pattern/TriangleValidator.h"
#include "TestCandles.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <variant>

using namespace chartsense;
using namespace chartsense::pattern;
namespace ct = chartsense::testing;

namespace {
bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) < tol;
}

// 저항 110 수평, 지지 100 -> 106 상승
std::vector<Candle> ascendingTriangleCandles() {
    return ct::candlesFromAnchors({
        {0, 99.0}, {6, 109.5}, {12, 100.5}, {18, 109.5}, {24, 102.5}, {30, 109.5},
        {36, 104.5}, {42, 109.5}, {48, 106.5}, {54, 109.5}, {59, 107.0}
    });
}

// 지지 100 수평, 저항 110 -> 104 하락
std::vector<Candle> descendingTriangleCandles() {
    return ct::candlesFromAnchors({
        {0, 111.0}, {6, 100.5}, {12, 109.5}, {18, 100.5}, {24, 107.5}, {30, 100.5},
        {36, 105.5}, {42, 100.5}, {48, 103.5}, {54, 100.5}, {59, 103.0}
    });
}

// 고점 110 -> 104, 저점 96 -> 101
std::vector<Candle> symmetricalTriangleCandles() {
    return ct::candlesFromAnchors({
        {0, 100.0}, {6, 109.5}, {12, 96.5}, {18, 107.5}, {24, 98.5}, {30, 105.5},
        {36, 100.5}, {42, 103.5}, {48, 101.5}, {59, 104.0}
    });
}

void checkKeyPointsAscending(const PatternAnalysis& p) {
    const auto& kp = p.visualization.key_points;
    for (std::size_t i = 1; i < kp.size(); ++i) {
        assert(kp[i - 1].time < kp[i].time);
    }
}
}

int main() {
    auto policy = std::make_shared<DefaultConfidencePolicy>();
    const TriangleConfig config;

    // 검증기 분류
    {
        TriangleValidator validator(config, policy);
        std::vector<ExtremumPoint> flat_highs = {ExtremumPoint(6, 110.0), ExtremumPoint(18, 110.0)};
        std::vector<ExtremumPoint> rising_lows = {ExtremumPoint(12, 100.0), ExtremumPoint(24, 102.0)};

        auto v = validator.validate(flat_highs, rising_lows, PatternKind::ASCENDING_TRIANGLE);
        assert(v.is_valid);
        assert(near(v.confidence, 0.85));
        assert(near(v.upper.slope, 0.0));
        assert(v.lower.slope > 0.1);

        assert(!validator.validate(flat_highs, rising_lows, PatternKind::DESCENDING_TRIANGLE).is_valid);
        assert(!validator.validate(flat_highs, rising_lows, PatternKind::SYMMETRICAL_TRIANGLE).is_valid);
        assert(!validator.validate(flat_highs, rising_lows, PatternKind::DOUBLE_TOP).is_valid);
        assert(!validator.validate({ExtremumPoint(6, 110.0)}, rising_lows,
                                   PatternKind::ASCENDING_TRIANGLE).is_valid);
    }

    // 기울기 비대칭이 큰 대칭 삼각형은 거부 (-0.4 vs +0.1)
    {
        TriangleValidator validator(config, policy);
        std::vector<ExtremumPoint> falling_highs = {
            ExtremumPoint(10, 110.0), ExtremumPoint(20, 106.0), ExtremumPoint(30, 102.0)
        };
        std::vector<ExtremumPoint> rising_lows = {
            ExtremumPoint(15, 90.0), ExtremumPoint(25, 91.0), ExtremumPoint(35, 92.0)
        };
        auto v = validator.validate(falling_highs, rising_lows, PatternKind::SYMMETRICAL_TRIANGLE);
        assert(near(v.upper.slope, -0.4));
        assert(near(v.lower.slope, 0.1));
        assert(!v.is_valid);

        // 균형 잡힌 수렴은 통과
        std::vector<ExtremumPoint> balanced_lows = {
            ExtremumPoint(15, 90.0), ExtremumPoint(25, 94.0), ExtremumPoint(35, 98.0)
        };
        auto balanced = validator.validate(falling_highs, balanced_lows, PatternKind::SYMMETRICAL_TRIANGLE);
        assert(balanced.is_valid);
        assert(near(balanced.confidence, 0.85));
    }

    // 상승 삼각형
    {
        TriangleDetector detector(ExtremaConfig(), config, policy);
        auto candles = ascendingTriangleCandles();
        auto patterns = detector.detect(candles, PatternKind::ASCENDING_TRIANGLE);
        assert(!patterns.empty());
        assert(patterns.size() <= static_cast<std::size_t>(config.max_results));

        for (const auto& p : patterns) {
            assert(p.kind == PatternKind::ASCENDING_TRIANGLE);
            assert(p.bias == DirectionalBias::BULLISH);
            assert(near(p.confidence, 0.85));
            assert(p.start_index < p.end_index && p.end_index < candles.size());
            checkKeyPointsAscending(p);

            const auto& m = std::get<TriangleMetrics>(p.metrics);
            assert(std::abs(m.upper_slope) < 0.001);
            assert(m.lower_slope > 0.001);
            assert(near(m.breakout_level, 110.0));
            assert(m.pattern_height > 0.0);
            assert(near(m.target_level, 110.0 + m.pattern_height));
            assert(near(m.stop_loss, 106.0));
            assert(!m.downside_target_level);

            assert(p.visualization.lines.size() == 2);
            assert(p.visualization.lines[0].role == LineRole::RESISTANCE);
            assert(p.visualization.lines[1].role == LineRole::SUPPORT);
            assert(p.visualization.areas[0].fill_color == "#00ff00");
        }

        // 가장 짧은 창: L1(36) H1(42) L2(48) H2(54)
        const auto& first = patterns[0];
        assert(first.start_index == 36 && first.end_index == 54);
        assert(first.visualization.key_points.size() == 4);
        assert(first.visualization.key_points[0].label == "L1");
        assert(first.visualization.key_points[1].label == "H1");
        assert(near(std::get<TriangleMetrics>(first.metrics).pattern_height, 6.0));

        assert(detector.detect(candles, PatternKind::DESCENDING_TRIANGLE).empty());
        assert(detector.detect(candles, PatternKind::SYMMETRICAL_TRIANGLE).empty());
    }

    // 하락 삼각형
    {
        TriangleDetector detector(ExtremaConfig(), config, policy);
        auto candles = descendingTriangleCandles();
        auto patterns = detector.detect(candles, PatternKind::DESCENDING_TRIANGLE);
        assert(!patterns.empty());
        for (const auto& p : patterns) {
            assert(p.bias == DirectionalBias::BEARISH);
            assert(near(p.confidence, 0.85));
            checkKeyPointsAscending(p);
            const auto& m = std::get<TriangleMetrics>(p.metrics);
            assert(std::abs(m.lower_slope) < 0.001);
            assert(near(m.breakout_level, 100.0));
            assert(near(m.target_level, 100.0 - m.pattern_height));
            assert(near(m.stop_loss, 104.0));
            assert(p.visualization.areas[0].fill_color == "#ff0000");
        }
        assert(detector.detect(candles, PatternKind::ASCENDING_TRIANGLE).empty());
    }

    // 대칭 삼각형
    {
        TriangleDetector detector(ExtremaConfig(), config, policy);
        auto candles = symmetricalTriangleCandles();
        auto patterns = detector.detect(candles, PatternKind::SYMMETRICAL_TRIANGLE);
        assert(!patterns.empty());
        for (const auto& p : patterns) {
            assert(p.bias == DirectionalBias::NEUTRAL);
            assert(p.confidence >= 0.6 && p.confidence <= 0.85 + 1e-9);
            checkKeyPointsAscending(p);
            const auto& m = std::get<TriangleMetrics>(p.metrics);
            assert(m.upper_slope < -0.001 && m.lower_slope > 0.001);
            assert(m.downside_target_level);
            assert(*m.downside_target_level < m.breakout_level);
            assert(m.breakout_level < m.target_level);
            assert(m.upper_bound > m.lower_bound);
            assert(p.visualization.areas[0].fill_color == "#0000ff");
        }
        for (std::size_t i = 1; i < patterns.size(); ++i) {
            assert(patterns[i - 1].confidence >= patterns[i].confidence);
        }
        assert(detector.detect(candles, PatternKind::ASCENDING_TRIANGLE).empty());
        assert(detector.detect(candles, PatternKind::DESCENDING_TRIANGLE).empty());
    }

    // 최소 캔들 수 미만
    {
        TriangleDetector detector(ExtremaConfig(), config, policy);
        auto candles = ascendingTriangleCandles();
        candles.resize(19);
        assert(detector.detect(candles, PatternKind::ASCENDING_TRIANGLE).empty());
    }

    std::cout << "[TEST] Triangle PASSED\n";
    return 0;
}
