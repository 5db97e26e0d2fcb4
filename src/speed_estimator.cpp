#include "speed_estimator.hpp"

#include <sstream>

#include "geodesic.hpp"

namespace orbit {
    SpeedEstimator::SpeedEstimator(const SpeedConfig &config)
        : radius_km_(config.effectiveRadiusKm()), correction_factor_(config.correction_factor) {
        validateSpeedModel(config);
    }

    SpeedSample SpeedEstimator::sampleSpeed(const FixPair &pair) const {
        const double elapsed = elapsedSeconds(pair);
        if (!(elapsed > 0.0)) {
            std::ostringstream oss;
            oss << "non-positive interval between fixes: " << elapsed << "s ("
                    << formatExifTimestamp(pair.earlier.timestamp) << " -> "
                    << formatExifTimestamp(pair.later.timestamp) << ")";
            throw DegenerateInterval(oss.str());
        }

        SpeedSample sample;
        sample.distance_km = haversineDistanceKm(pair.earlier, pair.later, radius_km_);
        sample.elapsed_seconds = elapsed;
        sample.speed_km_per_sec = sample.distance_km / elapsed;
        return sample;
    }

    SpeedEstimate SpeedEstimator::aggregate(const std::vector<SpeedSample> &samples) const {
        SpeedEstimate estimate;
        if (samples.empty()) {
            return estimate;
        }

        double sum = 0.0;
        for (const auto &sample: samples) {
            sum += sample.speed_km_per_sec;
        }
        estimate.sample_count = samples.size();
        estimate.raw_average_km_per_sec = sum / static_cast<double>(samples.size());
        estimate.average_km_per_sec = estimate.raw_average_km_per_sec * correction_factor_;
        return estimate;
    }
} // namespace orbit
