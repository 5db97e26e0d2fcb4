#include "geodesic.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace orbit {
    namespace {
        double degreeToRadian(const double degree) {
            return degree * CV_PI / 180.0;
        }
    }

    bool isValidCoordinate(const double latitude, const double longitude) {
        return std::isfinite(latitude) && std::isfinite(longitude)
               && latitude >= -90.0 && latitude <= 90.0
               && longitude >= -180.0 && longitude <= 180.0;
    }

    void requireValidCoordinate(const double latitude, const double longitude) {
        if (!isValidCoordinate(latitude, longitude)) {
            std::ostringstream oss;
            oss << "invalid coordinate: lat=" << latitude << ", lon=" << longitude;
            throw InvalidCoordinate(oss.str());
        }
    }

    double haversineDistanceKm(const double lat1, const double lon1, const double lat2, const double lon2,
                               const double radius_km) {
        requireValidCoordinate(lat1, lon1);
        requireValidCoordinate(lat2, lon2);
        if (!std::isfinite(radius_km) || radius_km <= 0.0) {
            throw std::invalid_argument("sphere radius must be positive");
        }

        const double phi1 = degreeToRadian(lat1);
        const double phi2 = degreeToRadian(lat2);
        const double dphi = degreeToRadian(lat2 - lat1);
        const double dlambda = degreeToRadian(lon2 - lon1);

        const double sin_dphi = std::sin(dphi / 2.0);
        const double sin_dlambda = std::sin(dlambda / 2.0);
        const double a = sin_dphi * sin_dphi + std::cos(phi1) * std::cos(phi2) * sin_dlambda * sin_dlambda;
        const double root = std::clamp(std::sqrt(a), 0.0, 1.0);
        return 2.0 * radius_km * std::asin(root);
    }

    double haversineDistanceKm(const PositionFix &a, const PositionFix &b, const double radius_km) {
        return haversineDistanceKm(a.latitude, a.longitude, b.latitude, b.longitude, radius_km);
    }
} // namespace orbit
