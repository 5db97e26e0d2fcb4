#undef NDEBUG

#include "../geodesic.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace orbit;

namespace {
    constexpr double kPi = 3.14159265358979323846;

    struct Point {
        double lat;
        double lon;
    };

    double antipodeLongitude(const double lon) {
        return lon > 0.0 ? lon - 180.0 : lon + 180.0;
    }
}

void test_equator_degree() {
    std::cout << "Testing one degree of longitude at the equator..." << std::endl;
    const double d = haversineDistanceKm(0.0, 0.0, 0.0, 1.0);
    std::cout << "  distance: " << d << " km (Expected ~111.19)" << std::endl;
    assert(std::abs(d - 111.19) < 0.01);
}

void test_identity_and_symmetry() {
    std::cout << "Testing identity and symmetry..." << std::endl;
    const std::vector<Point> points = {
        {0.0, 0.0}, {51.4778, -0.0015}, {-33.8688, 151.2093}, {89.9, 179.9}, {-90.0, -180.0}, {12.5, -97.25}
    };
    for (const auto &p: points) {
        assert(haversineDistanceKm(p.lat, p.lon, p.lat, p.lon) == 0.0);
        for (const auto &q: points) {
            const double ab = haversineDistanceKm(p.lat, p.lon, q.lat, q.lon);
            const double ba = haversineDistanceKm(q.lat, q.lon, p.lat, p.lon);
            assert(ab >= 0.0);
            assert(std::abs(ab - ba) < 1e-9);
        }
    }
}

void test_antipodes() {
    std::cout << "Testing antipodal points..." << std::endl;
    const std::vector<Point> points = {{0.0, 0.0}, {45.0, 90.0}, {-12.3, -170.0}, {90.0, 0.0}, {33.3, 180.0}};
    const double half_circumference = kPi * kMeanEarthRadiusKm;
    for (const auto &p: points) {
        const double d = haversineDistanceKm(p.lat, p.lon, -p.lat, antipodeLongitude(p.lon));
        std::cout << "  (" << p.lat << ", " << p.lon << "): " << d << " km (Expected " << half_circumference << ")"
                << std::endl;
        assert(std::isfinite(d));
        assert(std::abs(d - half_circumference) < 1e-3);
    }
}

void test_custom_radius() {
    std::cout << "Testing radius scaling..." << std::endl;
    const double ground = haversineDistanceKm(10.0, 20.0, 11.0, 21.0, 6371.0);
    const double orbit = haversineDistanceKm(10.0, 20.0, 11.0, 21.0, 6771.0);
    assert(std::abs(orbit / ground - 6771.0 / 6371.0) < 1e-12);

    bool threw = false;
    try {
        (void) haversineDistanceKm(0.0, 0.0, 0.0, 1.0, 0.0);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
}

void test_invalid_coordinates() {
    std::cout << "Testing invalid coordinates..." << std::endl;
    const std::vector<Point> bad = {{90.5, 0.0}, {-91.0, 0.0}, {0.0, 180.01}, {0.0, -200.0}, {NAN, 0.0}, {0.0, INFINITY}};
    for (const auto &p: bad) {
        assert(!isValidCoordinate(p.lat, p.lon));
        bool threw = false;
        try {
            (void) haversineDistanceKm(p.lat, p.lon, 0.0, 0.0);
        } catch (const InvalidCoordinate &) {
            threw = true;
        }
        assert(threw);
    }
    assert(isValidCoordinate(90.0, 180.0));
    assert(isValidCoordinate(-90.0, -180.0));
}

void test_fix_overload() {
    std::cout << "Testing PositionFix overload..." << std::endl;
    PositionFix a;
    a.latitude = 48.8566;
    a.longitude = 2.3522;
    PositionFix b;
    b.latitude = 51.5074;
    b.longitude = -0.1278;
    const double d = haversineDistanceKm(a, b);
    std::cout << "  Paris-London: " << d << " km (Expected ~343.5)" << std::endl;
    assert(std::abs(d - 343.5) < 1.0);
    assert(d == haversineDistanceKm(a.latitude, a.longitude, b.latitude, b.longitude));
}

int main() {
    test_equator_degree();
    test_identity_and_symmetry();
    test_antipodes();
    test_custom_radius();
    test_invalid_coordinates();
    test_fix_overload();
    std::cout << "Geodesic Verification Passed" << std::endl;
    return 0;
}
