#undef NDEBUG

#include "../speed_config.hpp"

#include <opencv2/core.hpp>

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

using namespace orbit;

namespace fs = std::filesystem;

void test_presets() {
    std::cout << "Testing presets..." << std::endl;
    const SpeedConfig ground = loadSpeedConfig();
    assert(ground.earth_radius_km == 6371.0);
    assert(ground.orbit_altitude_km == 0.0);
    assert(ground.correction_factor == 1.05);
    assert(ground.min_samples == 1);
    assert(!ground.skip_stationary_pairs);

    const SpeedConfig iss = loadSpeedConfig(" ISS ");
    assert(iss.earth_radius_km == 6378.137);
    assert(iss.orbit_altitude_km == 400.0);
    assert(iss.effectiveRadiusKm() == 6378.137 + 400.0);
    assert(iss.skip_stationary_pairs);

    assert(loadSpeedConfig("raw").correction_factor == 1.0);
    assert(loadSpeedConfig("unknown").correction_factor == ground.correction_factor);
}

void test_config_file() {
    std::cout << "Testing config file..." << std::endl;
    const fs::path path = fs::temp_directory_path() / "orbit_speed_verify_config.yml";
    {
        cv::FileStorage out(path.string(), cv::FileStorage::WRITE);
        out << "correction_factor" << 1.02;
        out << "orbit_altitude_km" << 408.5;
        out << "min_samples" << 5;
        out << "skip_stationary_pairs" << 1;
    }
    SpeedConfig config = loadSpeedConfig();
    applySpeedConfigFile(config, path.string());
    assert(config.correction_factor == 1.02);
    assert(config.orbit_altitude_km == 408.5);
    assert(config.min_samples == 5);
    assert(config.skip_stationary_pairs);
    assert(config.earth_radius_km == 6371.0);   // untouched
    fs::remove(path);

    const fs::path bad_path = fs::temp_directory_path() / "orbit_speed_verify_bad.yml";
    {
        cv::FileStorage out(bad_path.string(), cv::FileStorage::WRITE);
        out << "correction_factor" << "high";
    }
    bool threw = false;
    try {
        applySpeedConfigFile(config, bad_path.string());
    } catch (const std::runtime_error &) {
        threw = true;
    }
    assert(threw);
    fs::remove(bad_path);

    threw = false;
    try {
        applySpeedConfigFile(config, (fs::temp_directory_path() / "orbit_speed_no_such_config.yml").string());
    } catch (const std::runtime_error &) {
        threw = true;
    }
    assert(threw);
}

void test_env_overrides() {
    std::cout << "Testing environment overrides..." << std::endl;
    setenv("ORBIT_CORRECTION", "1.1", 1);
    setenv("ORBIT_MIN_SAMPLES", "-4", 1);
    setenv("ORBIT_ALTITUDE_KM", "not-a-number", 1);
    setenv("ORBIT_SKIP_STATIONARY", "on", 1);
    SpeedConfig config = loadSpeedConfig();
    applySpeedConfigEnv(config);
    assert(config.correction_factor == 1.1);
    assert(config.min_samples == 0);             // clamped
    assert(config.orbit_altitude_km == 0.0);     // ignored
    assert(config.skip_stationary_pairs);
    unsetenv("ORBIT_CORRECTION");
    unsetenv("ORBIT_MIN_SAMPLES");
    unsetenv("ORBIT_ALTITUDE_KM");
    unsetenv("ORBIT_SKIP_STATIONARY");
}

void test_validation() {
    std::cout << "Testing validation..." << std::endl;
    validateSpeedConfig(loadSpeedConfig("iss"));

    auto expectInvalid = [](const SpeedConfig &config) {
        bool threw = false;
        try {
            validateSpeedConfig(config);
        } catch (const std::invalid_argument &e) {
            std::cout << "  rejected: " << e.what() << std::endl;
            threw = true;
        }
        assert(threw);
    };

    SpeedConfig config;
    config.earth_radius_km = -1.0;
    expectInvalid(config);

    config = SpeedConfig{};
    config.correction_factor = -0.5;
    expectInvalid(config);

    config = SpeedConfig{};
    config.min_samples = -1;
    expectInvalid(config);

    config = SpeedConfig{};
    config.result_precision = 12;
    expectInvalid(config);
}

int main() {
    test_presets();
    test_config_file();
    test_env_overrides();
    test_validation();
    std::cout << "Speed Config Verification Passed" << std::endl;
    return 0;
}
