#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace orbit {
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    /// One decoded image observation. Absent observations are std::nullopt, never zeros.
    struct PositionFix {
        double latitude = 0;    // degrees, [-90, 90]
        double longitude = 0;   // degrees, [-180, 180]
        TimePoint timestamp;    // capture time (EXIF DateTimeOriginal)
    };

    /// Two consecutive valid fixes. Only usable when later.timestamp > earlier.timestamp.
    struct FixPair {
        PositionFix earlier;
        PositionFix later;
    };

    struct SpeedSample {
        double distance_km = 0;
        double elapsed_seconds = 0;
        double speed_km_per_sec = 0;

        // Positions of the two fixes in the input sequence, filled by the processor.
        std::size_t earlier_index = 0;
        std::size_t later_index = 0;
    };

    struct SpeedEstimate {
        double average_km_per_sec = 0;
        double raw_average_km_per_sec = 0;   // before the correction factor
        std::size_t sample_count = 0;

        [[nodiscard]] bool hasSamples() const { return sample_count > 0; }
    };

    /// Parses EXIF "YYYY:MM:DD" + "HH:MM:SS" (UTC). Returns nullopt on malformed input.
    std::optional<TimePoint> parseExifTimestamp(const std::string &date, const std::string &time);

    std::string formatExifTimestamp(TimePoint timestamp);

    [[nodiscard]] double elapsedSeconds(const FixPair &pair);
} // namespace orbit
