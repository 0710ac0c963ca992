#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

namespace chartsense {

namespace {
void requireAtLeast(int value, int minimum, const char* key) {
    if (value < minimum) {
        throw DetectionParamsError(std::string(key) + " must be >= " + std::to_string(minimum) +
                                   ", got " + std::to_string(value));
    }
}

void requireNonNegative(double value, const char* key) {
    if (!(value >= 0.0)) {
        throw DetectionParamsError(std::string(key) + " must be >= 0, got " + std::to_string(value));
    }
}

void requireUnit(double value, const char* key) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw DetectionParamsError(std::string(key) + " must be within [0, 1], got " + std::to_string(value));
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    log_level_ = "info";
    log_dir_ = "logs";
    detection_params_ = pattern::DetectionParams();
    detection_config_ = pattern::DetectionConfig();
}

bool Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return false;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            return false;
        }

        nlohmann::json j;
        file >> j;

        apply(j);

        std::cout << "Config loaded: lookback=" << detection_params_.lookback_period
                  << ", min_confidence=" << detection_params_.min_confidence << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
        return false;
    }
}

// 전부 검증한 뒤에만 반영
void Config::apply(const nlohmann::json& j) {
    std::string log_level = log_level_;
    std::string log_dir = log_dir_;
    pattern::DetectionParams params = detection_params_;
    pattern::DetectionConfig dc = detection_config_;

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_level = l.value("level", log_level);
        log_dir = l.value("dir", log_dir);
    }

    if (j.contains("detection")) {
        const auto& d = j["detection"];
        params.lookback_period = d.value("lookback_period", params.lookback_period);
        params.min_confidence = d.value("min_confidence", params.min_confidence);

        if (d.contains("pattern_kinds")) {
            std::vector<pattern::PatternKind> kinds;
            for (const auto& name : d["pattern_kinds"].get<std::vector<std::string>>()) {
                auto kind = pattern::patternKindFromString(name);
                if (!kind) {
                    throw DetectionParamsError("unknown pattern kind: " + name);
                }
                kinds.push_back(*kind);
            }
            params.pattern_kinds = kinds;
        }
    }

    if (j.contains("extrema")) {
        dc.extrema.radius = j["extrema"].value("radius", dc.extrema.radius);
    }

    if (j.contains("head_and_shoulders")) {
        const auto& s = j["head_and_shoulders"];
        dc.head_and_shoulders.min_bars = s.value("min_bars", dc.head_and_shoulders.min_bars);
        dc.head_and_shoulders.max_shoulder_diff = s.value("max_shoulder_diff", dc.head_and_shoulders.max_shoulder_diff);
        dc.head_and_shoulders.min_candidate_confidence =
            s.value("min_candidate_confidence", dc.head_and_shoulders.min_candidate_confidence);
        dc.head_and_shoulders.max_results = s.value("max_results", dc.head_and_shoulders.max_results);
    }

    if (j.contains("triangle")) {
        const auto& s = j["triangle"];
        dc.triangle.min_bars = s.value("min_bars", dc.triangle.min_bars);
        dc.triangle.max_window = s.value("max_window", dc.triangle.max_window);
        dc.triangle.window_step = s.value("window_step", dc.triangle.window_step);
        dc.triangle.slope_threshold = s.value("slope_threshold", dc.triangle.slope_threshold);
        dc.triangle.min_candidate_confidence = s.value("min_candidate_confidence", dc.triangle.min_candidate_confidence);
        dc.triangle.max_results = s.value("max_results", dc.triangle.max_results);
    }

    if (j.contains("double_pattern")) {
        const auto& s = j["double_pattern"];
        dc.double_pattern.max_price_diff = s.value("max_price_diff", dc.double_pattern.max_price_diff);
        dc.double_pattern.min_candidate_confidence =
            s.value("min_candidate_confidence", dc.double_pattern.min_candidate_confidence);
        dc.double_pattern.max_results = s.value("max_results", dc.double_pattern.max_results);
    }

    if (!Logger::isKnownLevel(log_level)) {
        throw DetectionParamsError("logging.level: unknown level '" + log_level + "'");
    }
    pattern::validateDetectionParams(params);
    requireAtLeast(dc.extrema.radius, 1, "extrema.radius");
    requireAtLeast(dc.head_and_shoulders.min_bars, 1, "head_and_shoulders.min_bars");
    requireNonNegative(dc.head_and_shoulders.max_shoulder_diff, "head_and_shoulders.max_shoulder_diff");
    requireUnit(dc.head_and_shoulders.min_candidate_confidence, "head_and_shoulders.min_candidate_confidence");
    requireAtLeast(dc.head_and_shoulders.max_results, 0, "head_and_shoulders.max_results");
    requireAtLeast(dc.triangle.min_bars, 1, "triangle.min_bars");
    requireAtLeast(dc.triangle.max_window, dc.triangle.min_bars, "triangle.max_window");
    requireAtLeast(dc.triangle.window_step, 1, "triangle.window_step");
    requireNonNegative(dc.triangle.slope_threshold, "triangle.slope_threshold");
    requireUnit(dc.triangle.min_candidate_confidence, "triangle.min_candidate_confidence");
    requireAtLeast(dc.triangle.max_results, 0, "triangle.max_results");
    requireNonNegative(dc.double_pattern.max_price_diff, "double_pattern.max_price_diff");
    requireUnit(dc.double_pattern.min_candidate_confidence, "double_pattern.min_candidate_confidence");
    requireAtLeast(dc.double_pattern.max_results, 0, "double_pattern.max_results");

    log_level_ = log_level;
    log_dir_ = log_dir;
    detection_params_ = params;
    detection_config_ = dc;
}

} // namespace chartsense
