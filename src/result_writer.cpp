#include "result_writer.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace orbit {
    namespace {
        std::string idAt(const FixLog &log, const size_t idx) {
            if (idx >= log.ids.size()) {
                return "img#" + std::to_string(idx);
            }
            return log.ids[idx];
        }

        std::string timeAt(const FixLog &log, const size_t idx) {
            if (idx >= log.fixes.size() || !log.fixes[idx]) {
                return "";
            }
            return formatExifTimestamp(log.fixes[idx]->timestamp);
        }
    }

    std::string formatSpeedResult(const SpeedEstimate &estimate, const int precision) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << estimate.average_km_per_sec << " km/s";
        return oss.str();
    }

    std::optional<double> parseSpeedResult(const std::string &text) {
        std::istringstream iss(text);
        double value = 0;
        if (!(iss >> value) || !std::isfinite(value)) {
            return std::nullopt;
        }
        std::string unit;
        if (iss >> unit && unit != "km/s") {
            return std::nullopt;
        }
        std::string trailing;
        if (iss >> trailing) {
            return std::nullopt;
        }
        return value;
    }

    void writeSpeedResult(const std::string &path, const SpeedEstimate &estimate, const int precision,
                          const bool append) {
        std::ofstream file(path, append ? std::ios::app : std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open result file: " + path);
        }
        file << formatSpeedResult(estimate, precision) << '\n';
        if (!file) {
            throw std::runtime_error("failed writing result file: " + path);
        }
        std::cout << "[Result] written: " << path << std::endl;
    }

    void writeSampleReport(const std::string &path, const FixSequenceReport &report, const FixLog &log) {
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open sample report: " + path);
        }
        file << "from_id,to_id,from_time,to_time,distance_km,elapsed_s,speed_km_s\n";
        file << std::fixed << std::setprecision(6);
        for (const auto &sample: report.samples) {
            file << idAt(log, sample.earlier_index) << ','
                    << idAt(log, sample.later_index) << ','
                    << timeAt(log, sample.earlier_index) << ','
                    << timeAt(log, sample.later_index) << ','
                    << sample.distance_km << ','
                    << sample.elapsed_seconds << ','
                    << sample.speed_km_per_sec << '\n';
        }
        if (!file) {
            throw std::runtime_error("failed writing sample report: " + path);
        }
        std::cout << "[Result] sample report: " << path << " (" << report.samples.size() << " rows)" << std::endl;
    }
} // namespace orbit
