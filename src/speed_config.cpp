#include "speed_config.hpp"

#include <opencv2/core.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace orbit {
    namespace {
        std::string normalizeProfile(const std::string &profile) {
            std::string normalized;
            normalized.reserve(profile.size());
            for (const unsigned char c: profile) {
                if (std::isalnum(c)) {
                    normalized.push_back(static_cast<char>(std::tolower(c)));
                }
            }
            return normalized;
        }

        void applyIssPreset(SpeedConfig &config) {
            // WGS84 equatorial radius plus the mean ISS altitude
            config.earth_radius_km = 6378.137;
            config.orbit_altitude_km = 400.0;
            config.correction_factor = 1.05;
            config.skip_stationary_pairs = true;
        }

        void applyRawPreset(SpeedConfig &config) {
            config.correction_factor = 1.0;
        }

        bool envEnabled(const char *name, const bool default_value = false) {
            const char *value = std::getenv(name);
            if (!value) {
                return default_value;
            }
            const std::string text(value);
            if (text == "1" || text == "true" || text == "TRUE" || text == "on" || text == "ON") {
                return true;
            }
            if (text == "0" || text == "false" || text == "FALSE" || text == "off" || text == "OFF") {
                return false;
            }
            return default_value;
        }

        int envIntOr(const char *name, const int default_value, const int min_value) {
            const char *value = std::getenv(name);
            if (!value) {
                return default_value;
            }
            char *end = nullptr;
            const long parsed = std::strtol(value, &end, 10);
            if (end == value || *end != '\0') {
                return default_value;
            }
            if (parsed < min_value) {
                return min_value;
            }
            return static_cast<int>(parsed);
        }

        double envDoubleOr(const char *name, const double default_value, const double min_value) {
            const char *value = std::getenv(name);
            if (!value) {
                return default_value;
            }
            char *end = nullptr;
            const double parsed = std::strtod(value, &end);
            if (end == value || *end != '\0' || !std::isfinite(parsed)) {
                return default_value;
            }
            if (parsed < min_value) {
                return min_value;
            }
            return parsed;
        }

        void readNumber(const cv::FileStorage &fs, const char *key, double &target) {
            const cv::FileNode node = fs[key];
            if (node.empty()) {
                return;
            }
            if (!node.isReal() && !node.isInt()) {
                throw std::runtime_error(std::string("config key '") + key + "' must be a number");
            }
            target = static_cast<double>(node);
        }

        void readInt(const cv::FileStorage &fs, const char *key, int &target) {
            const cv::FileNode node = fs[key];
            if (node.empty()) {
                return;
            }
            if (!node.isInt()) {
                throw std::runtime_error(std::string("config key '") + key + "' must be an integer");
            }
            target = static_cast<int>(node);
        }

        void readFlag(const cv::FileStorage &fs, const char *key, bool &target) {
            const cv::FileNode node = fs[key];
            if (node.empty()) {
                return;
            }
            if (node.isInt()) {
                target = static_cast<int>(node) != 0;
                return;
            }
            if (node.isString()) {
                const std::string text = normalizeProfile(static_cast<std::string>(node));
                if (text == "true" || text == "on" || text == "yes") {
                    target = true;
                    return;
                }
                if (text == "false" || text == "off" || text == "no") {
                    target = false;
                    return;
                }
            }
            throw std::runtime_error(std::string("config key '") + key + "' must be a boolean");
        }
    }

    SpeedConfig loadSpeedConfig(const std::string &profile) {
        SpeedConfig config;

        const std::string normalized = normalizeProfile(profile);
        if (normalized == "iss" || normalized == "orbit" || normalized == "orbital") {
            applyIssPreset(config);
        } else if (normalized == "raw" || normalized == "uncorrected") {
            applyRawPreset(config);
        }
        // "ground" and anything unrecognised keep the defaults

        return config;
    }

    void applySpeedConfigFile(SpeedConfig &config, const std::string &path) {
        cv::FileStorage fs;
        try {
            fs.open(path, cv::FileStorage::READ);
        } catch (const cv::Exception &e) {
            throw std::runtime_error("config file unreadable: " + path + " (" + e.what() + ")");
        }
        if (!fs.isOpened()) {
            throw std::runtime_error("config file not found: " + path);
        }

        readNumber(fs, "earth_radius_km", config.earth_radius_km);
        readNumber(fs, "orbit_altitude_km", config.orbit_altitude_km);
        readNumber(fs, "correction_factor", config.correction_factor);
        readInt(fs, "min_samples", config.min_samples);
        readFlag(fs, "skip_stationary_pairs", config.skip_stationary_pairs);
        readInt(fs, "result_precision", config.result_precision);
    }

    void applySpeedConfigEnv(SpeedConfig &config) {
        config.earth_radius_km = envDoubleOr("ORBIT_EARTH_RADIUS_KM", config.earth_radius_km, 1.0);
        config.orbit_altitude_km = envDoubleOr("ORBIT_ALTITUDE_KM", config.orbit_altitude_km, 0.0);
        config.correction_factor = envDoubleOr("ORBIT_CORRECTION", config.correction_factor, 0.01);
        config.min_samples = envIntOr("ORBIT_MIN_SAMPLES", config.min_samples, 0);
        config.skip_stationary_pairs = envEnabled("ORBIT_SKIP_STATIONARY", config.skip_stationary_pairs);
        config.result_precision = envIntOr("ORBIT_RESULT_PRECISION", config.result_precision, 0);
    }

    void validateSpeedModel(const SpeedConfig &config) {
        if (!std::isfinite(config.effectiveRadiusKm()) || config.effectiveRadiusKm() <= 0.0) {
            throw std::invalid_argument("effective radius must be positive");
        }
        if (!std::isfinite(config.correction_factor) || config.correction_factor <= 0.0) {
            throw std::invalid_argument("correction factor must be positive");
        }
    }

    void validateSpeedConfig(const SpeedConfig &config) {
        validateSpeedModel(config);
        if (config.min_samples < 0) {
            throw std::invalid_argument("min_samples must not be negative");
        }
        if (config.result_precision < 0 || config.result_precision > 9) {
            throw std::invalid_argument("result_precision must be within [0, 9]");
        }
    }

    std::string describeSpeedConfig(const SpeedConfig &config) {
        std::ostringstream oss;
        oss << "radius=" << config.earth_radius_km << "km"
                << ", altitude=" << config.orbit_altitude_km << "km"
                << ", correction=" << config.correction_factor
                << ", min_samples=" << config.min_samples
                << ", skip_stationary=" << (config.skip_stationary_pairs ? "on" : "off")
                << ", precision=" << config.result_precision;
        return oss.str();
    }
} // namespace orbit
