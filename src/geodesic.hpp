#pragma once

#include <stdexcept>

#include "fix_record.hpp"

namespace orbit {
    constexpr double kMeanEarthRadiusKm = 6371.0;

    /// Latitude/longitude outside the valid range, or not finite.
    class InvalidCoordinate : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    [[nodiscard]] bool isValidCoordinate(double latitude, double longitude);

    /// Throws InvalidCoordinate naming the offending value.
    void requireValidCoordinate(double latitude, double longitude);

    /// Great-circle distance (haversine) between two points given in degrees.
    /// sqrt(a) is clamped into [0, 1] so identical and antipodal points stay finite.
    double haversineDistanceKm(double lat1, double lon1, double lat2, double lon2,
                               double radius_km = kMeanEarthRadiusKm);

    double haversineDistanceKm(const PositionFix &a, const PositionFix &b,
                               double radius_km = kMeanEarthRadiusKm);
} // namespace orbit
