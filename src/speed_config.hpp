#pragma once

#include <string>

namespace orbit {
    struct SpeedConfig {
        /// 地球半径 (km)，haversine 的球体半径
        double earth_radius_km = 6371.0;
        /// 轨道高度 (km)，叠加在地球半径上；0 表示按地面轨迹计算
        double orbit_altitude_km = 0.0;
        /// 经验修正系数，乘在平均速度上，用于补偿测量方法的系统误差
        double correction_factor = 1.05;
        /// 写出结果前要求的最少速度样本数
        int min_samples = 1;
        /// 丢弃距离为 0 的配对（同一位置被重复记录）
        bool skip_stationary_pairs = false;
        /// 结果文件中保留的小数位数
        int result_precision = 2;

        [[nodiscard]] double effectiveRadiusKm() const { return earth_radius_km + orbit_altitude_km; }
    };

    /// Named presets: "ground" (default), "iss", "raw". Unknown names fall back to "ground".
    SpeedConfig loadSpeedConfig(const std::string &profile = "ground");

    /// Overrides fields from a cv::FileStorage file (YAML, JSON or XML). Keys are the field names.
    void applySpeedConfigFile(SpeedConfig &config, const std::string &path);

    /// Overrides fields from ORBIT_* environment variables.
    void applySpeedConfigEnv(SpeedConfig &config);

    /// Checks only what the estimator reads: effective radius and correction factor.
    void validateSpeedModel(const SpeedConfig &config);

    void validateSpeedConfig(const SpeedConfig &config);

    std::string describeSpeedConfig(const SpeedConfig &config);
} // namespace orbit
