#include "speed_app.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "fix_reader.hpp"
#include "fix_sequence_processor.hpp"
#include "result_writer.hpp"
#include "speed_config.hpp"

namespace orbit {
    namespace {
        const char *const kKeys =
                "{help h usage ? |            | print this message}"
                "{fixes f        | fixes.txt  | image metadata log, one line per captured image}"
                "{output o       | result.txt | result text file}"
                "{samples s      |            | optional CSV report of every accepted pair}"
                "{profile p      | ground     | parameter preset: ground, iss, raw}"
                "{config c       |            | YAML/JSON file overriding the preset}"
                "{append a       |            | append to the result file instead of overwriting}";

        SpeedConfig resolveConfig(const std::string &profile, const std::string &config_path) {
            SpeedConfig config = loadSpeedConfig(profile);
            if (!config_path.empty()) {
                std::cout << "[Config] file: " << config_path << std::endl;
                applySpeedConfigFile(config, config_path);
            }
            applySpeedConfigEnv(config);
            validateSpeedConfig(config);
            return config;
        }
    } // namespace

    int runSpeedApplication(const int argc, const char *const argv[]) {
        cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_SILENT);

        cv::CommandLineParser parser(argc, argv, kKeys);
        parser.about("Estimates orbital ground-track speed from timestamped image position fixes.");
        if (parser.has("help")) {
            parser.printMessage();
            return 0;
        }

        const auto fixes_path = parser.get<std::string>("fixes");
        const auto output_path = parser.get<std::string>("output");
        const auto samples_path = parser.get<std::string>("samples");
        const auto profile = parser.get<std::string>("profile");
        const auto config_path = parser.get<std::string>("config");
        const bool append = parser.has("append");
        if (!parser.check()) {
            parser.printErrors();
            return 1;
        }

        try {
            const SpeedConfig config = resolveConfig(profile, config_path);
            std::cout << "[Main] metadata log: " << fixes_path << std::endl;
            std::cout << "[Main] output: " << output_path << (append ? " (append)" : "") << std::endl;
            std::cout << "[Main] profile: " << profile << ", " << describeSpeedConfig(config) << std::endl;

            const FixLog log = FixReader::load(fixes_path);
            const FixSequenceProcessor processor(config);
            const FixSequenceReport report = processor.processDetailed(log.fixes);

            if (!samples_path.empty()) {
                writeSampleReport(samples_path, report, log);
            }

            const SpeedEstimate &estimate = report.estimate;
            if (estimate.sample_count < static_cast<size_t>(config.min_samples)) {
                throw std::runtime_error(
                    "too few speed samples: got " + std::to_string(estimate.sample_count)
                    + ", need " + std::to_string(config.min_samples));
            }

            std::cout << "[Main] raw average: " << std::fixed << std::setprecision(3)
                    << estimate.raw_average_km_per_sec << " km/s, correction x" << config.correction_factor
                    << std::endl;
            writeSpeedResult(output_path, estimate, config.result_precision, append);
            std::cout << "[Finish] average speed: " << std::fixed << std::setprecision(3)
                    << estimate.average_km_per_sec << " km/s (" << estimate.sample_count << " samples)"
                    << std::endl;
        } catch (const std::exception &e) {
            std::cerr << "[Error] " << e.what() << std::endl;
            return 1;
        }

        return 0;
    }
} // namespace orbit
