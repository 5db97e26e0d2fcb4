#include "fix_record.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace orbit {
    namespace {
        // "dddd?dd?dd" with a fixed separator, e.g. 2024:02:19 or 10:15:30
        bool hasFieldLayout(const std::string &text, const size_t first_width, const char separator) {
            if (text.size() != first_width + 6) {
                return false;
            }
            for (size_t i = 0; i < text.size(); ++i) {
                const bool is_separator = i == first_width || i == first_width + 3;
                if (is_separator) {
                    if (text[i] != separator) {
                        return false;
                    }
                } else if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
                    return false;
                }
            }
            return true;
        }
    }

    std::optional<TimePoint> parseExifTimestamp(const std::string &date, const std::string &time) {
        if (!hasFieldLayout(date, 4, ':') || !hasFieldLayout(time, 2, ':')) {
            return std::nullopt;
        }
        const int y = std::stoi(date.substr(0, 4));
        const int mo = std::stoi(date.substr(5, 2));
        const int d = std::stoi(date.substr(8, 2));
        const int h = std::stoi(time.substr(0, 2));
        const int mi = std::stoi(time.substr(3, 2));
        const int s = std::stoi(time.substr(6, 2));

        const std::chrono::year_month_day ymd{
            std::chrono::year{y},
            std::chrono::month{static_cast<unsigned>(mo)},
            std::chrono::day{static_cast<unsigned>(d)}
        };
        if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
            return std::nullopt;
        }
        const auto capture_time = std::chrono::sys_days{ymd}
                             + std::chrono::hours{h} + std::chrono::minutes{mi} + std::chrono::seconds{s};
        return TimePoint{capture_time};
    }

    std::string formatExifTimestamp(const TimePoint timestamp) {
        const auto day_start = std::chrono::floor<std::chrono::days>(timestamp);
        const std::chrono::year_month_day ymd{day_start};
        const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::seconds>(timestamp - day_start)};

        std::ostringstream oss;
        oss << std::setfill('0')
                << std::setw(4) << static_cast<int>(ymd.year()) << ':'
                << std::setw(2) << static_cast<unsigned>(ymd.month()) << ':'
                << std::setw(2) << static_cast<unsigned>(ymd.day()) << ' '
                << std::setw(2) << hms.hours().count() << ':'
                << std::setw(2) << hms.minutes().count() << ':'
                << std::setw(2) << hms.seconds().count();
        return oss.str();
    }

    double elapsedSeconds(const FixPair &pair) {
        return std::chrono::duration<double>(pair.later.timestamp - pair.earlier.timestamp).count();
    }
} // namespace orbit
