#include "Geo.hpp"
#include "Errors.hpp"
#include <cmath>
#include <sstream>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace visits {

double Geo::distanceKm(const GeoPoint& from, const GeoPoint& to) {
    const double f = WGS84_F;
    const double phi1 = toRadians(from.lat);
    const double phi2 = toRadians(to.lat);
    const double L = wrapRadians(toRadians(to.lon - from.lon));

    const double tanU1 = (1 - f) * std::tan(phi1);
    const double cosU1 = 1 / std::sqrt(1 + tanU1 * tanU1);
    const double sinU1 = tanU1 * cosU1;
    const double tanU2 = (1 - f) * std::tan(phi2);
    const double cosU2 = 1 / std::sqrt(1 + tanU2 * tanU2);
    const double sinU2 = tanU2 * cosU2;

    const bool antipodal = std::abs(L) > M_PI / 2 || std::abs(phi2 - phi1) > M_PI / 2;

    double lambda = L;
    double sinSigma = 0.0;
    double cosSigma = antipodal ? -1.0 : 1.0;
    double sigma = antipodal ? M_PI : 0.0;
    double cosSqAlpha = 1.0;
    double cos2SigmaM = 1.0;

    int iterations = 0;
    double previous = 0.0;
    do {
        const double sinLambda = std::sin(lambda);
        const double cosLambda = std::cos(lambda);
        const double t = cosU1 * sinU2 - sinU1 * cosU2 * cosLambda;
        const double sinSqSigma = (cosU2 * sinLambda) * (cosU2 * sinLambda) + t * t;
        if (std::abs(sinSqSigma) < 1e-24) {
            return 0.0; // coincident
        }
        sinSigma = std::sqrt(sinSqSigma);
        cosSigma = sinU1 * sinU2 + cosU1 * cosU2 * cosLambda;
        sigma = std::atan2(sinSigma, cosSigma);
        const double sinAlpha = cosU1 * cosU2 * sinLambda / sinSigma;
        cosSqAlpha = 1 - sinAlpha * sinAlpha;
        // equatorial line: cosSqAlpha == 0
        cos2SigmaM = (cosSqAlpha != 0.0) ? cosSigma - 2 * sinU1 * sinU2 / cosSqAlpha : 0.0;
        const double C = f / 16 * cosSqAlpha * (4 + f * (4 - 3 * cosSqAlpha));
        previous = lambda;
        lambda = L + (1 - C) * f * sinAlpha *
            (sigma + C * sinSigma * (cos2SigmaM + C * cosSigma * (-1 + 2 * cos2SigmaM * cos2SigmaM)));

        const double iterationCheck = antipodal ? std::abs(lambda) - M_PI : std::abs(lambda);
        if (iterationCheck > M_PI) {
            std::ostringstream ss;
            ss << "vincenty formula failed to converge (lambda > pi) between ("
               << from.lat << ", " << from.lon << ") and (" << to.lat << ", " << to.lon << ")";
            throw NoConvergence(ss.str());
        }
    } while (std::abs(lambda - previous) > CONVERGENCE && ++iterations < MAX_ITERATIONS);

    if (iterations >= MAX_ITERATIONS) {
        std::ostringstream ss;
        ss << "vincenty formula failed to converge after " << MAX_ITERATIONS
           << " iterations between (" << from.lat << ", " << from.lon << ") and ("
           << to.lat << ", " << to.lon << ")";
        throw NoConvergence(ss.str());
    }

    const double a2 = WGS84_A * WGS84_A;
    const double b2 = WGS84_B * WGS84_B;
    const double uSq = cosSqAlpha * (a2 - b2) / b2;
    const double A = 1 + uSq / 16384 * (4096 + uSq * (-768 + uSq * (320 - 175 * uSq)));
    const double B = uSq / 1024 * (256 + uSq * (-128 + uSq * (74 - 47 * uSq)));
    const double deltaSigma = B * sinSigma * (cos2SigmaM + B / 4 *
        (cosSigma * (-1 + 2 * cos2SigmaM * cos2SigmaM) -
         B / 6 * cos2SigmaM * (-3 + 4 * sinSigma * sinSigma) * (-3 + 4 * cos2SigmaM * cos2SigmaM)));

    const double meters = WGS84_B * A * (sigma - deltaSigma);
    return meters / 1000.0;
}

GeoPoint Geo::destination(const GeoPoint& from, double bearingDeg, double distanceKm) {
    const double f = WGS84_F;
    const double s = distanceKm * 1000.0;
    const double alpha1 = toRadians(bearingDeg);
    const double sinAlpha1 = std::sin(alpha1);
    const double cosAlpha1 = std::cos(alpha1);

    const double tanU1 = (1 - f) * std::tan(toRadians(from.lat));
    const double cosU1 = 1 / std::sqrt(1 + tanU1 * tanU1);
    const double sinU1 = tanU1 * cosU1;

    const double sigma1 = std::atan2(tanU1, cosAlpha1);
    const double sinAlpha = cosU1 * sinAlpha1;
    const double cosSqAlpha = 1 - sinAlpha * sinAlpha;
    const double a2 = WGS84_A * WGS84_A;
    const double b2 = WGS84_B * WGS84_B;
    const double uSq = cosSqAlpha * (a2 - b2) / b2;
    const double A = 1 + uSq / 16384 * (4096 + uSq * (-768 + uSq * (320 - 175 * uSq)));
    const double B = uSq / 1024 * (256 + uSq * (-128 + uSq * (74 - 47 * uSq)));

    double sigma = s / (WGS84_B * A);
    double sinSigma = 0.0;
    double cosSigma = 1.0;
    double cos2SigmaM = 1.0;
    double previous = 0.0;
    int iterations = 0;
    do {
        cos2SigmaM = std::cos(2 * sigma1 + sigma);
        sinSigma = std::sin(sigma);
        cosSigma = std::cos(sigma);
        const double deltaSigma = B * sinSigma * (cos2SigmaM + B / 4 *
            (cosSigma * (-1 + 2 * cos2SigmaM * cos2SigmaM) -
             B / 6 * cos2SigmaM * (-3 + 4 * sinSigma * sinSigma) * (-3 + 4 * cos2SigmaM * cos2SigmaM)));
        previous = sigma;
        sigma = s / (WGS84_B * A) + deltaSigma;
    } while (std::abs(sigma - previous) > CONVERGENCE && ++iterations < MAX_ITERATIONS);

    if (iterations >= MAX_ITERATIONS) {
        throw NoConvergence("vincenty direct formula failed to converge");
    }

    const double x = sinU1 * sinSigma - cosU1 * cosSigma * cosAlpha1;
    const double phi2 = std::atan2(sinU1 * cosSigma + cosU1 * sinSigma * cosAlpha1,
                                   (1 - f) * std::sqrt(sinAlpha * sinAlpha + x * x));
    const double lambda = std::atan2(sinSigma * sinAlpha1,
                                     cosU1 * cosSigma - sinU1 * sinSigma * cosAlpha1);
    const double C = f / 16 * cosSqAlpha * (4 + f * (4 - 3 * cosSqAlpha));
    const double L = lambda - (1 - C) * f * sinAlpha *
        (sigma + C * sinSigma * (cos2SigmaM + C * cosSigma * (-1 + 2 * cos2SigmaM * cos2SigmaM)));

    GeoPoint result;
    result.lat = toDegrees(phi2);
    result.lon = toDegrees(wrapRadians(toRadians(from.lon) + L));
    return result;
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double Geo::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

double Geo::wrapRadians(double radians) {
    if (radians > M_PI) {
        return radians - 2 * M_PI;
    }
    if (radians < -M_PI) {
        return radians + 2 * M_PI;
    }
    return radians;
}

} // namespace visits
