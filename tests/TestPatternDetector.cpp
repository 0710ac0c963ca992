#include "pattern/PatternDetector.h"
#include "pattern/PatternJson.h"
#include "common/Errors.h"
#include "TestCandles.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>

using namespace chartsense;
using namespace chartsense::pattern;
namespace ct = chartsense::testing;

namespace {
class ThrowingFamily : public IPatternFamily {
public:
    std::string name() const override { return "Throwing"; }
    bool supports(PatternKind kind) const override { return kind == PatternKind::HEAD_AND_SHOULDERS; }
    std::vector<PatternAnalysis> detect(const std::vector<Candle>&, PatternKind) const override {
        throw std::runtime_error("family failure");
    }
};

class OutOfRangePolicy : public DefaultConfidencePolicy {
public:
    double headAndShoulders(double, double, double) const override { return 1.5; }
};

DetectionParams paramsFor(int lookback, double min_confidence) {
    DetectionParams params;
    params.lookback_period = lookback;
    params.min_confidence = min_confidence;
    return params;
}

bool rejectsParams(const PatternDetector& detector, const DetectionParams& params) {
    try {
        detector.detect(ct::headAndShouldersCandles(), params);
    } catch (const DetectionParamsError&) {
        return true;
    }
    return false;
}

bool rejectsCandles(const PatternDetector& detector, const std::vector<Candle>& candles) {
    try {
        detector.detect(candles, DetectionParams());
    } catch (const CandleInputError&) {
        return true;
    }
    return false;
}

std::size_t countKind(const std::vector<PatternAnalysis>& patterns, PatternKind kind) {
    std::size_t count = 0;
    for (const auto& p : patterns) {
        if (p.kind == kind) ++count;
    }
    return count;
}

void checkInvariants(const std::vector<PatternAnalysis>& patterns,
                     const std::vector<Candle>& candles,
                     double min_confidence) {
    for (const auto& p : patterns) {
        assert(p.confidence >= min_confidence && p.confidence <= 1.0);
        assert(p.start_index < p.end_index);
        assert(p.end_index < candles.size());
        assert(p.start_time == candles[p.start_index].time);
        assert(p.end_time == candles[p.end_index].time);
        assert(p.start_time < p.end_time);

        const auto& kp = p.visualization.key_points;
        for (std::size_t i = 1; i < kp.size(); ++i) {
            assert(kp[i - 1].time < kp[i].time);
        }
        for (const auto& line : p.visualization.lines) {
            assert(line.from_index < kp.size() && line.to_index < kp.size());
        }
        for (const auto& area : p.visualization.areas) {
            for (auto idx : area.points) assert(idx < kp.size());
        }
    }
}
}

int main() {
    PatternDetector detector;

    {
        auto names = detector.getFamilyNames();
        assert(names.size() == 3);
        assert(names[0] == "HeadAndShoulders" && names[1] == "Triangle" && names[2] == "DoublePattern");
    }

    // 파라미터 검증
    {
        assert(rejectsParams(detector, paramsFor(0, 0.6)));
        assert(rejectsParams(detector, paramsFor(-5, 0.6)));
        assert(rejectsParams(detector, paramsFor(60, 1.5)));
        assert(rejectsParams(detector, paramsFor(60, -0.1)));
        assert(rejectsParams(detector, paramsFor(60, std::numeric_limits<double>::quiet_NaN())));
        assert(!rejectsParams(detector, paramsFor(1, 0.0)));
        assert(!rejectsParams(detector, paramsFor(60, 1.0)));
    }

    // 캔들 검증
    {
        auto candles = ct::headAndShouldersCandles();
        std::swap(candles[3], candles[4]);
        assert(rejectsCandles(detector, candles));

        candles = ct::headAndShouldersCandles();
        candles[7].high = std::numeric_limits<double>::infinity();
        assert(rejectsCandles(detector, candles));
    }

    // 빈 입력 / 짧은 입력
    {
        assert(detector.detect({}, DetectionParams()).empty());
        auto candles = ct::headAndShouldersCandles();
        candles.resize(10);
        assert(detector.detect(candles, paramsFor(60, 0.0)).empty());
    }

    // H&S 한 개
    {
        auto candles = ct::headAndShouldersCandles();
        auto params = paramsFor(100, 0.6);
        params.pattern_kinds = std::vector<PatternKind>{PatternKind::HEAD_AND_SHOULDERS};
        auto patterns = detector.detect(candles, params);
        assert(patterns.size() == 1);
        assert(patterns[0].kind == PatternKind::HEAD_AND_SHOULDERS);
        assert(std::abs(patterns[0].confidence - 0.95) < 1e-9);
        assert(patterns[0].bias == DirectionalBias::BEARISH);
        assert(std::abs(std::get<HeadAndShouldersMetrics>(patterns[0].metrics).target_level - 80.0) < 1e-9);

        auto all = detector.detect(candles, paramsFor(100, 0.6));
        assert(countKind(all, PatternKind::HEAD_AND_SHOULDERS) == 1);
        checkInvariants(all, candles, 0.6);

        // 임계값 필터
        assert(countKind(detector.detect(candles, paramsFor(100, 0.96)), PatternKind::HEAD_AND_SHOULDERS) == 0);
    }

    // 종류 필터: 빈 집합, 중복, 순서
    {
        auto candles = ct::headAndShouldersCandles();
        auto params = paramsFor(100, 0.0);
        params.pattern_kinds = std::vector<PatternKind>{};
        assert(detector.detect(candles, params).empty());

        params.pattern_kinds = std::vector<PatternKind>{
            PatternKind::DOUBLE_BOTTOM, PatternKind::HEAD_AND_SHOULDERS, PatternKind::HEAD_AND_SHOULDERS
        };
        auto patterns = detector.detect(candles, params);
        assert(countKind(patterns, PatternKind::HEAD_AND_SHOULDERS) == 1);
        for (const auto& p : patterns) {
            assert(p.kind == PatternKind::HEAD_AND_SHOULDERS || p.kind == PatternKind::DOUBLE_BOTTOM);
        }
        assert(patterns.front().kind == PatternKind::HEAD_AND_SHOULDERS);
    }

    // lookback 절단 후 인덱스는 입력 기준
    {
        auto candles = ct::candlesFromAnchors({
            {0, 70.0}, {50, 88.0}, {70, 99.5}, {85, 95.5}, {100, 109.5}, {115, 95.5}, {130, 99.5}, {149, 88.0}
        });
        auto params = paramsFor(100, 0.6);
        params.pattern_kinds = std::vector<PatternKind>{PatternKind::HEAD_AND_SHOULDERS};
        auto patterns = detector.detect(candles, params);
        assert(patterns.size() == 1);
        assert(patterns[0].start_index == 70);
        assert(patterns[0].end_index == 130);
        assert(patterns[0].start_time == candles[70].time);

        // 짧은 lookback은 패턴을 잘라냄
        params.lookback_period = 40;
        assert(detector.detect(candles, params).empty());
    }

    // 단조 증가: 패턴 없음
    {
        std::vector<Candle> candles;
        for (int i = 0; i < 100; ++i) {
            const double mid = 50.0 + 0.5 * i;
            candles.emplace_back(ct::BASE_TIME + i * ct::BAR_SECONDS, mid, mid + 0.3, mid - 0.3, mid, 100.0);
        }
        assert(detector.detect(candles, paramsFor(100, 0.0)).empty());
    }

    // 노이즈 데이터, 높은 임계값.
    // H&S(<= 0.95)와 삼각형(<= 0.85)은 0.99에 도달할 수 없음.
    // 이중 패턴은 가격 차이 1% 이내만 채택되므로 항상 0.997 이상 -> 임계값으로 걸러지지 않음.
    {
        for (std::uint32_t seed = 1; seed <= 20; ++seed) {
            auto candles = ct::randomWalkCandles(300, seed);

            auto params = paramsFor(60, 0.99);
            params.pattern_kinds = std::vector<PatternKind>{
                PatternKind::HEAD_AND_SHOULDERS, PatternKind::INVERSE_HEAD_AND_SHOULDERS,
                PatternKind::ASCENDING_TRIANGLE, PatternKind::DESCENDING_TRIANGLE,
                PatternKind::SYMMETRICAL_TRIANGLE
            };
            assert(detector.detect(candles, params).empty());

            for (const auto& p : detector.detect(candles, paramsFor(60, 0.0))) {
                const bool is_double = p.kind == PatternKind::DOUBLE_TOP || p.kind == PatternKind::DOUBLE_BOTTOM;
                if (is_double) {
                    assert(p.confidence >= 0.997 - 1e-12);
                } else {
                    assert(p.confidence < 0.99);
                }
            }
        }
    }

    // 실패하는 family 격리
    {
        PatternDetector isolated;
        isolated.registerFamily(std::make_shared<ThrowingFamily>());
        isolated.registerFamily(nullptr);
        assert(isolated.getFamilyNames().size() == 4);

        auto params = paramsFor(100, 0.6);
        params.pattern_kinds = std::vector<PatternKind>{PatternKind::HEAD_AND_SHOULDERS};
        auto patterns = isolated.detect(ct::headAndShouldersCandles(), params);
        assert(patterns.size() == 1);
    }

    // 범위를 벗어난 신뢰도는 버림
    {
        PatternDetector strict(DetectionConfig(), std::make_shared<OutOfRangePolicy>());
        auto params = paramsFor(100, 0.0);
        params.pattern_kinds = std::vector<PatternKind>{PatternKind::HEAD_AND_SHOULDERS};
        assert(strict.detect(ct::headAndShouldersCandles(), params).empty());
    }

    // 랜덤 워크: 불변식 + 멱등성
    {
        for (std::uint32_t seed = 1; seed <= 5; ++seed) {
            auto candles = ct::randomWalkCandles(300, seed);
            auto params = paramsFor(60, 0.0);
            auto first = detector.detect(candles, params);
            auto second = detector.detect(candles, params);
            checkInvariants(first, candles, 0.0);
            for (const auto& p : first) {
                assert(p.start_index >= 240);
            }
            assert(toJson(first).dump() == toJson(second).dump());
        }
    }

    std::cout << "[TEST] PatternDetector PASSED\n";
    return 0;
}
