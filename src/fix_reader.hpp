#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "fix_record.hpp"

namespace orbit {
    /// Decoded metadata log, one entry per captured image in capture order.
    struct FixLog {
        std::vector<std::optional<PositionFix> > fixes;
        std::vector<std::string> ids;
    };

    /// Line format: <image_id> <YYYY:MM:DD> <HH:MM:SS> <lat> <N|S> <lon> <E|W>
    /// Angles are decimal degrees or EXIF "deg:min:sec". A line whose fields are missing or
    /// malformed still counts as an image, with an absent fix.
    class FixReader {
    public:
        static FixLog load(const std::string &log_path);

        static FixLog load(std::istream &input);

        /// "51:30:26.4" or "51.5" plus hemisphere reference; nullopt when malformed.
        static std::optional<double> parseAngle(const std::string &value, const std::string &ref);
    };
} // namespace orbit
