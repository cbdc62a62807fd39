#include <gtest/gtest.h>
#include "../core/Geo.hpp"
#include "../core/Errors.hpp"

using namespace visits;

namespace {

// Vincenty's own test line: Flinders Peak -> Buninyong.
const GeoPoint kFlindersPeak = {-(37 + 57.0 / 60 + 3.72030 / 3600), 144 + 25.0 / 60 + 29.52440 / 3600};
const GeoPoint kBuninyong = {-(37 + 39.0 / 60 + 10.15610 / 3600), 143 + 55.0 / 60 + 35.38390 / 3600};

} // namespace

TEST(GeoTest, VincentyReferenceDistance) {
    EXPECT_NEAR(Geo::distanceKm(kFlindersPeak, kBuninyong), 54.972271, 1e-5);
}

TEST(GeoTest, DistanceIsSymmetric) {
    EXPECT_NEAR(Geo::distanceKm(kFlindersPeak, kBuninyong),
                Geo::distanceKm(kBuninyong, kFlindersPeak), 1e-9);
}

TEST(GeoTest, CoincidentPointsAreZeroApart) {
    EXPECT_EQ(Geo::distanceKm({51.5, -0.12}, {51.5, -0.12}), 0.0);
}

TEST(GeoTest, OneDegreeAlongEquatorMatchesSemiMajorAxis) {
    // Arc of the equator: a * pi / 180
    EXPECT_NEAR(Geo::distanceKm({0, 0}, {0, 1}), 111.319491, 1e-6);
}

TEST(GeoTest, OneDegreeOfLatitudeAtEquator) {
    EXPECT_NEAR(Geo::distanceKm({0, 0}, {1, 0}), 110.574, 0.001);
}

TEST(GeoTest, CrossingAntimeridianTakesShortWay) {
    EXPECT_NEAR(Geo::distanceKm({0, 179.5}, {0, -179.5}), 111.319491, 1e-6);
}

TEST(GeoTest, NearAntipodalPointsDoNotConverge) {
    EXPECT_THROW(Geo::distanceKm({0, 0}, {0.5, 179.7}), NoConvergence);
}

TEST(GeoTest, DestinationSolvesReferenceLine) {
    const double bearing = 306 + 52.0 / 60 + 5.37 / 3600;
    const GeoPoint p = Geo::destination(kFlindersPeak, bearing, 54.972271);
    EXPECT_NEAR(p.lat, kBuninyong.lat, 1e-7);
    EXPECT_NEAR(p.lon, kBuninyong.lon, 1e-7);
}

TEST(GeoTest, DestinationDistanceAgreesWithInverse) {
    const GeoPoint start = {36.461755, -116.866612};
    for (double bearing : {0.0, 45.0, 135.0, 270.0}) {
        const GeoPoint p = Geo::destination(start, bearing, 0.25);
        EXPECT_NEAR(Geo::distanceKm(start, p), 0.25, 1e-7) << "bearing " << bearing;
    }
}
