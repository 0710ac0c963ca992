#include "pattern/PatternDetector.h"
#include "pattern/PatternJson.h"
#include "analytics/CandleSeries.h"
#include "TestCandles.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace chartsense;
using namespace chartsense::pattern;
namespace ct = chartsense::testing;

int main() {
    // 이름 변환
    {
        assert(toString(PatternKind::HEAD_AND_SHOULDERS) == "headAndShoulders");
        assert(toString(PatternKind::INVERSE_HEAD_AND_SHOULDERS) == "inverseHeadAndShoulders");
        assert(toString(PatternKind::SYMMETRICAL_TRIANGLE) == "symmetricalTriangle");
        assert(toString(PatternKind::DOUBLE_BOTTOM) == "doubleBottom");
        for (auto kind : allPatternKinds()) {
            auto parsed = patternKindFromString(toString(kind));
            assert(parsed && *parsed == kind);
        }
        assert(!patternKindFromString("wedge"));
        assert(toString(DirectionalBias::NEUTRAL) == "neutral");
    }

    // 캔들 JSON -> 탐지 -> 결과 JSON
    {
        nlohmann::json input = nlohmann::json::array();
        for (const auto& c : ct::headAndShouldersCandles()) {
            input.push_back({{"time", c.time}, {"open", c.open}, {"high", c.high},
                             {"low", c.low}, {"close", c.close}, {"volume", c.volume}});
        }
        auto candles = analytics::CandleSeries::fromJson(input);
        assert(candles.size() == 100);

        DetectionParams params;
        params.lookback_period = 100;
        params.pattern_kinds = std::vector<PatternKind>{PatternKind::HEAD_AND_SHOULDERS};

        PatternDetector detector;
        auto out = toJson(detector.detect(candles, params));
        assert(out.is_array() && out.size() == 1);

        const auto& p = out[0];
        assert(p["kind"] == "headAndShoulders");
        assert(p["directional_bias"] == "bearish");
        assert(p["start_index"] == 20 && p["end_index"] == 80);
        assert(p["start_time"] == candles[20].time);
        assert(std::abs(p["confidence"].get<double>() - 0.95) < 1e-9);

        const auto& viz = p["visualization"];
        assert(viz["key_points"].size() == 6);
        assert(viz["key_points"][0]["label"] == "LS");
        assert(viz["key_points"][0]["kind"] == "peak");
        assert(viz["key_points"][5]["kind"] == "target");
        assert(viz["lines"].size() == 5);
        assert(viz["lines"][0]["style"]["line_style"] == "dashed");
        assert(!viz["lines"][0]["style"].contains("color"));
        assert(viz["lines"][4]["role"] == "neckline");
        assert(viz["lines"][4]["style"]["color"] == "#ff0000");
        assert(viz["lines"][4]["style"]["line_width"] == 2);
        assert(viz["areas"].size() == 1);
        assert(viz["areas"][0]["points"].size() == 5);

        const auto& m = p["metrics"];
        assert(std::abs(m["target_level"].get<double>() - 80.0) < 1e-9);
        assert(std::abs(m["stop_loss"].get<double>() - 110.0) < 1e-9);
        assert(m.contains("symmetry"));
        assert(!m.contains("pattern_height"));
    }

    // 삼각형 / 이중 패턴 메트릭 필드
    {
        TriangleMetrics tm;
        tm.downside_target_level = 90.0;
        nlohmann::json tj = tm;
        assert(tj["downside_target_level"] == 90.0);
        assert(tj.contains("upper_slope") && tj.contains("lower_bound"));

        TriangleMetrics no_downside;
        nlohmann::json nj = no_downside;
        assert(!nj.contains("downside_target_level"));

        DoublePatternMetrics dm;
        dm.valley_price = 94.0;
        nlohmann::json dj = dm;
        assert(dj["valley_price"] == 94.0);

        PatternVisualization empty_viz;
        nlohmann::json vj = empty_viz;
        assert(!vj.contains("areas"));
        assert(vj["key_points"].is_array());
    }

    assert(toJson({}).is_array() && toJson({}).empty());

    std::cout << "[TEST] PatternJson PASSED\n";
    return 0;
}
