#include "BoundingBox.hpp"
#include "Geo.hpp"
#include "Errors.hpp"
#include <cmath>
#include <sstream>

namespace visits {

std::string directionToString(Direction direction) {
    switch (direction) {
        case Direction::North: return "north";
        case Direction::South: return "south";
        case Direction::East: return "east";
        case Direction::West: return "west";
    }
    return "unknown";
}

BoundingBox BoundingBoxSolver::solve(const GeoPoint& center, double radiusKm) {
    const double north = findExtreme(center, Direction::North, radiusKm);
    const double south = findExtreme(center, Direction::South, radiusKm);
    const double east = findExtreme(center, Direction::East, radiusKm);
    const double west = findExtreme(center, Direction::West, radiusKm);

    BoundingBox box;
    box.northEast = GeoPoint{north, east};
    box.southWest = GeoPoint{south, west};
    return box;
}

double BoundingBoxSolver::findExtreme(const GeoPoint& center, Direction direction, double radiusKm) {
    return bisect(center, direction, radiusKm, expand(center, direction, radiusKm));
}

BoundingBoxSolver::Bracket BoundingBoxSolver::expand(const GeoPoint& center, Direction direction,
                                                     double radiusKm) {
    const double origin = coordinateOf(center, direction);
    const double s = sign(direction);
    double step = INITIAL_STEP_DEG;
    double coordinate = origin;

    while (true) {
        const double next = coordinate + step * s;
        if (next * s > limit(direction) * s) {
            std::ostringstream ss;
            ss << "too close to a pole or meridian: searching " << directionToString(direction)
               << " from (" << center.lat << ", " << center.lon << ") for " << radiusKm
               << "km passes " << limit(direction);
            throw TooCloseToPoleOrMeridian(ss.str());
        }
        if (Geo::distanceKm(center, at(center, direction, next)) > radiusKm) {
            return Bracket{origin, next};
        }
        coordinate = next;
        step *= 2;
    }
}

double BoundingBoxSolver::bisect(const GeoPoint& center, Direction direction, double radiusKm,
                                 Bracket bracket) {
    for (int i = 0; i < MAX_BISECTION_STEPS; ++i) {
        const double mid = (bracket.inside + bracket.outside) / 2;
        const double d = Geo::distanceKm(center, at(center, direction, mid));
        if (std::abs(d - radiusKm) < BISECTION_TOLERANCE_KM) {
            return mid;
        }
        bracket = (d > radiusKm) ? Bracket{bracket.inside, mid} : Bracket{mid, bracket.outside};
    }

    std::ostringstream ss;
    ss << "bisection " << directionToString(direction) << " did not converge within "
       << MAX_BISECTION_STEPS << " steps";
    throw NoConvergence(ss.str());
}

GeoPoint BoundingBoxSolver::at(const GeoPoint& center, Direction direction, double coordinate) {
    GeoPoint p = center;
    if (direction == Direction::North || direction == Direction::South) {
        p.lat = coordinate;
    } else {
        p.lon = coordinate;
    }
    return p;
}

double BoundingBoxSolver::coordinateOf(const GeoPoint& point, Direction direction) {
    return (direction == Direction::North || direction == Direction::South) ? point.lat : point.lon;
}

double BoundingBoxSolver::sign(Direction direction) {
    return (direction == Direction::North || direction == Direction::East) ? 1.0 : -1.0;
}

double BoundingBoxSolver::limit(Direction direction) {
    switch (direction) {
        case Direction::North: return 90.0;
        case Direction::South: return -90.0;
        case Direction::East: return 180.0;
        case Direction::West: return -180.0;
    }
    return 0.0;
}

} // namespace visits
