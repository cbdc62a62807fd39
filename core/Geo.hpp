#pragma once

#include "GeoTypes.hpp"

namespace visits {

// Geodesy on the WGS-84 ellipsoid (Vincenty's formulae).
class Geo {
public:
    // Inverse problem. Throws NoConvergence for near-antipodal pairs.
    static double distanceKm(const GeoPoint& from, const GeoPoint& to);

    // Direct problem: point reached from `from` on the initial bearing after `distanceKm`.
    static GeoPoint destination(const GeoPoint& from, double bearingDeg, double distanceKm);

    static constexpr double WGS84_A = 6378137.0;
    static constexpr double WGS84_F = 1.0 / 298.257223563;
    static constexpr double WGS84_B = (1.0 - WGS84_F) * WGS84_A;

private:
    static constexpr int MAX_ITERATIONS = 200;
    static constexpr double CONVERGENCE = 1e-12;

    static double toRadians(double degrees);
    static double toDegrees(double radians);
    static double wrapRadians(double radians);
};

} // namespace visits
