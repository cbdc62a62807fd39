#pragma once

#include "GeoTypes.hpp"
#include <string>

namespace visits {

enum class Direction {
    North,
    South,
    East,
    West
};

std::string directionToString(Direction direction);

/**
 * @brief Finds a lat/long rectangle enclosing a geodesic disk
 *
 * Each cardinal extreme is located in two phases: a doubling expansion away
 * from the centre until the ellipsoidal distance exceeds the radius, then a
 * bisection between the last inside and first outside coordinate until the
 * distance is within BISECTION_TOLERANCE_KM of the radius.
 *
 * The search runs along the centre's own meridian and parallel, so away from
 * the equator the east/west extremes slightly understate the disk's true
 * longitudinal extent. Callers needing a strict superset pad the radius.
 */
class BoundingBoxSolver {
public:
    static constexpr double INITIAL_STEP_DEG = 1e-6;
    static constexpr double BISECTION_TOLERANCE_KM = 0.0001;
    static constexpr int MAX_BISECTION_STEPS = 200;

    /**
     * @throws TooCloseToPoleOrMeridian if a search passes +-90 lat or +-180 long
     * @throws NoConvergence if a distance evaluation fails
     */
    static BoundingBox solve(const GeoPoint& center, double radiusKm);

    // Extreme coordinate (latitude for North/South, longitude for East/West).
    static double findExtreme(const GeoPoint& center, Direction direction, double radiusKm);

    // Coordinates straddling the radius: `inside` is closer than it, `outside` farther.
    struct Bracket {
        double inside = 0.0;
        double outside = 0.0;
    };

    static Bracket expand(const GeoPoint& center, Direction direction, double radiusKm);
    static double bisect(const GeoPoint& center, Direction direction, double radiusKm, Bracket bracket);

private:
    static GeoPoint at(const GeoPoint& center, Direction direction, double coordinate);
    static double coordinateOf(const GeoPoint& point, Direction direction);
    static double sign(Direction direction);
    static double limit(Direction direction);
};

} // namespace visits
