#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "pattern/DetectionConfig.h"
#include "pattern/PatternTypes.h"

namespace chartsense {

class Config {
public:
    static Config& getInstance();

    // false: 파일 없음/파싱 실패/값 검증 실패 (기존 값 유지)
    bool load(const std::string& config_path);

    // 기본값 복원
    void reset();

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

    pattern::DetectionParams getDetectionParams() const { return detection_params_; }
    pattern::DetectionConfig getDetectionConfig() const { return detection_config_; }

private:
    Config() = default;

    void apply(const nlohmann::json& j);

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    pattern::DetectionParams detection_params_;
    pattern::DetectionConfig detection_config_;
};

} // namespace chartsense
