#include "fix_reader.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "geodesic.hpp"

namespace orbit {
    namespace {
        std::optional<double> parseNumber(const std::string &text) {
            if (text.empty()) {
                return std::nullopt;
            }
            size_t consumed = 0;
            double value = 0;
            try {
                value = std::stod(text, &consumed);
            } catch (const std::exception &) {
                return std::nullopt;
            }
            if (consumed != text.size() || !std::isfinite(value)) {
                return std::nullopt;
            }
            return value;
        }

        std::optional<PositionFix> parseFix(const std::vector<std::string> &parts) {
            if (parts.size() < 7) {
                return std::nullopt;
            }
            const auto timestamp = parseExifTimestamp(parts[1], parts[2]);
            const auto latitude = FixReader::parseAngle(parts[3], parts[4]);
            const auto longitude = FixReader::parseAngle(parts[5], parts[6]);
            if (!timestamp || !latitude || !longitude) {
                return std::nullopt;
            }
            // 经纬度超出范围视为解码失败
            if (!isValidCoordinate(*latitude, *longitude)) {
                return std::nullopt;
            }
            PositionFix fix;
            fix.latitude = *latitude;
            fix.longitude = *longitude;
            fix.timestamp = *timestamp;
            return fix;
        }
    }

    std::optional<double> FixReader::parseAngle(const std::string &value, const std::string &ref) {
        double sign = 1.0;
        if (ref == "S" || ref == "W") {
            sign = -1.0;
        } else if (ref != "N" && ref != "E") {
            return std::nullopt;
        }

        std::vector<std::string> fields;
        std::istringstream iss(value);
        std::string field;
        while (std::getline(iss, field, ':')) {
            fields.push_back(field);
        }
        if (fields.empty() || fields.size() > 3 || value.back() == ':') {
            return std::nullopt;
        }

        double degrees = 0.0;
        double scale = 1.0;
        for (size_t i = 0; i < fields.size(); ++i) {
            const auto number = parseNumber(fields[i]);
            if (!number || *number < 0.0) {
                return std::nullopt;
            }
            // only the last field may carry a fraction; minutes and seconds stay below 60
            const bool is_last = i + 1 == fields.size();
            if (!is_last && std::floor(*number) != *number) {
                return std::nullopt;
            }
            if (i > 0 && *number >= 60.0) {
                return std::nullopt;
            }
            degrees += *number / scale;
            scale *= 60.0;
        }
        return sign * degrees;
    }

    FixLog FixReader::load(const std::string &log_path) {
        std::ifstream file(log_path);
        if (!file.is_open()) {
            throw std::runtime_error("metadata log not found: " + log_path);
        }
        std::cout << "[Fix] reading: " << log_path << std::endl;
        return load(file);
    }

    FixLog FixReader::load(std::istream &input) {
        FixLog log;
        std::string line;
        int total_lines = 0;
        int skipped_lines = 0;
        int missing = 0;

        while (std::getline(input, line)) {
            ++total_lines;
            std::istringstream iss(line);
            std::vector<std::string> parts;
            std::string part;
            while (iss >> part) {
                parts.push_back(part);
            }
            if (parts.empty() || parts[0].front() == '#') {
                ++skipped_lines;
                continue;
            }

            auto fix = parseFix(parts);
            if (!fix) {
                ++missing;
                std::cout << "[Fix] no usable position/time for image " << parts[0] << std::endl;
            }
            log.ids.push_back(parts[0]);
            log.fixes.push_back(fix);
        }

        std::cout << "[Fix] done: images=" << log.fixes.size()
                << ", valid=" << (log.fixes.size() - static_cast<size_t>(missing))
                << ", missing=" << missing
                << ", total_lines=" << total_lines << ", skipped=" << skipped_lines << std::endl;
        return log;
    }
} // namespace orbit
