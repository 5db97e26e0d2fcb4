#pragma once

#include <optional>
#include <string>

#include "fix_reader.hpp"
#include "fix_record.hpp"
#include "fix_sequence_processor.hpp"

namespace orbit {
    /// "7.66 km/s"
    std::string formatSpeedResult(const SpeedEstimate &estimate, int precision = 2);

    /// Inverse of formatSpeedResult; the unit is optional.
    std::optional<double> parseSpeedResult(const std::string &text);

    void writeSpeedResult(const std::string &path, const SpeedEstimate &estimate, int precision = 2,
                          bool append = false);

    /// One CSV row per accepted pair, image ids and timestamps taken from the log.
    void writeSampleReport(const std::string &path, const FixSequenceReport &report, const FixLog &log);
} // namespace orbit
