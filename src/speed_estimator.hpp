#pragma once

#include <stdexcept>
#include <vector>

#include "fix_record.hpp"
#include "speed_config.hpp"

namespace orbit {
    /// Non-positive elapsed time between the two fixes of a pair.
    class DegenerateInterval : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class SpeedEstimator {
    public:
        explicit SpeedEstimator(const SpeedConfig &config);

        /// Distance over elapsed time for one pair. Throws DegenerateInterval if elapsed <= 0.
        [[nodiscard]] SpeedSample sampleSpeed(const FixPair &pair) const;

        /// Mean speed times the correction factor. An empty input gives a zero estimate
        /// with sample_count == 0.
        [[nodiscard]] SpeedEstimate aggregate(const std::vector<SpeedSample> &samples) const;

        [[nodiscard]] double radiusKm() const { return radius_km_; }
        [[nodiscard]] double correctionFactor() const { return correction_factor_; }

    private:
        double radius_km_;
        double correction_factor_;
    };
} // namespace orbit
