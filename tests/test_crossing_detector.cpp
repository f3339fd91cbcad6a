#include <gtest/gtest.h>
#include "../core/domain/CrossingDetector.hpp"
#include "../core/domain/BoundarySampler.hpp"
#include "../core/CircleError.hpp"
#include "../core/Geo.hpp"
#include <algorithm>

using namespace geocircle;

class CrossingDetectorTest : public ::testing::Test {
protected:
    static std::vector<BoundaryPoint> ring(double lat, double lon, double radius) {
        return domain::BoundarySampler::sample(lat, lon, radius, Geo::DEFAULT_EARTH_RADIUS_METERS, 120);
    }

    static BoundaryPoint point(double sequence, double lat, double lon) {
        BoundaryPoint p;
        p.sequence = sequence;
        p.lat = lat;
        p.lon = lon;
        return p;
    }
};

TEST_F(CrossingDetectorTest, RingAwayFromSeamHasNoCrossings) {
    domain::CrossingDetector detector;

    EXPECT_TRUE(detector.detect(ring(51.5072, -0.1276, 900000.0)).empty());
    EXPECT_TRUE(detector.detect(ring(28.3636, 77.1348, 5000000.0)).empty());
}

TEST_F(CrossingDetectorTest, ChukotkaCrossesTwice) {
    domain::CrossingDetector detector;
    auto crossings = detector.detect(ring(67.017, -178.242, 450000.0));

    ASSERT_EQ(crossings.size(), 2u);

    EXPECT_EQ(crossings[0].index, 64u);
    EXPECT_EQ(crossings[0].modifier, 1);
    EXPECT_EQ(crossings[0].direction, CrossingDirection::Westbound);
    EXPECT_DOUBLE_EQ(crossings[0].longitude, 180.0);
    EXPECT_NEAR(crossings[0].latitude, 63.039082286593846, 1e-9);

    EXPECT_EQ(crossings[1].index, 118u);
    EXPECT_EQ(crossings[1].modifier, -1);
    EXPECT_EQ(crossings[1].direction, CrossingDirection::Eastbound);
    EXPECT_DOUBLE_EQ(crossings[1].longitude, -180.0);
    EXPECT_NEAR(crossings[1].latitude, 71.01371559854268, 1e-9);
}

TEST_F(CrossingDetectorTest, FijiCrossesEastThenWest) {
    domain::CrossingDetector detector;
    auto crossings = detector.detect(ring(-18.1, 178.27, 200000.0));

    ASSERT_EQ(crossings.size(), 2u);
    EXPECT_EQ(crossings[0].index, 23u);
    EXPECT_EQ(crossings[0].direction, CrossingDirection::Eastbound);
    EXPECT_NEAR(crossings[0].latitude, -17.379840295028146, 1e-9);

    EXPECT_EQ(crossings[1].index, 39u);
    EXPECT_EQ(crossings[1].direction, CrossingDirection::Westbound);
    EXPECT_NEAR(crossings[1].latitude, -18.835875802240878, 1e-9);
}

TEST_F(CrossingDetectorTest, InterpolatedLatitudeLiesBetweenNeighbours) {
    domain::CrossingDetector detector;
    auto points = ring(67.017, -178.242, 450000.0);

    for (const auto& crossing : detector.detect(points)) {
        double a = points[crossing.index - 1].lat;
        double b = points[crossing.index].lat;
        EXPECT_GE(crossing.latitude, std::min(a, b));
        EXPECT_LE(crossing.latitude, std::max(a, b));
    }
}

TEST_F(CrossingDetectorTest, InterpolatedIsTheDefaultFormula) {
    EXPECT_EQ(CircleSettings{}.crossingFormula, CrossingFormula::Interpolated);
    EXPECT_EQ(domain::CrossingDetector().formula(), CrossingFormula::Interpolated);

    for (const auto& crossing : domain::CrossingDetector().detect(ring(-18.1, 178.27, 200000.0))) {
        EXPECT_GE(crossing.latitude, -90.0);
        EXPECT_LE(crossing.latitude, 90.0);
    }
}

TEST_F(CrossingDetectorTest, ReferenceFormulaReproducesLegacyValues) {
    domain::CrossingDetector detector(CrossingFormula::Reference);
    EXPECT_EQ(detector.formula(), CrossingFormula::Reference);

    auto crossings = detector.detect(ring(67.017, -178.242, 450000.0));
    ASSERT_EQ(crossings.size(), 2u);
    EXPECT_NEAR(crossings[0].latitude, -2258.326757393, 1e-6);
    EXPECT_NEAR(crossings[1].latitude, -1591.610488761, 1e-6);

    crossings = detector.detect(ring(-18.1, 178.27, 200000.0));
    ASSERT_EQ(crossings.size(), 2u);
    EXPECT_NEAR(crossings[0].latitude, 72304.880990910, 1e-5);
    EXPECT_NEAR(crossings[1].latitude, 65495.523105135, 1e-5);
}

TEST_F(CrossingDetectorTest, ExamineSinglePair) {
    domain::CrossingDetector detector;

    EXPECT_FALSE(detector.examine(point(0, 10.0, 170.0), point(1, 11.0, 175.0), 1).has_value());

    auto east = detector.examine(point(4, 10.0, 179.0), point(5, 12.0, -179.0), 5);
    ASSERT_TRUE(east.has_value());
    EXPECT_EQ(east->index, 5u);
    EXPECT_EQ(east->modifier, -1);
    EXPECT_EQ(east->direction, CrossingDirection::Eastbound);
    EXPECT_DOUBLE_EQ(east->latitude, 11.0);

    auto west = detector.examine(point(7, 12.0, -179.0), point(8, 10.0, 179.0), 8);
    ASSERT_TRUE(west.has_value());
    EXPECT_EQ(west->modifier, 1);
    EXPECT_EQ(west->direction, CrossingDirection::Westbound);
    EXPECT_DOUBLE_EQ(west->latitude, 11.0);
}

TEST_F(CrossingDetectorTest, SyntheticSeamPointsStayOnTheirSide) {
    domain::CrossingDetector detector;
    auto event = detector.examine(point(4, 10.0, 179.0), point(5, 12.0, -179.0), 5);
    ASSERT_TRUE(event.has_value());

    EXPECT_DOUBLE_EQ(event->anchor(), 4.5);

    BoundaryPoint approach = event->approachPoint();
    EXPECT_DOUBLE_EQ(approach.sequence, 4.4);
    EXPECT_DOUBLE_EQ(approach.lon, 180.0);
    EXPECT_DOUBLE_EQ(approach.lat, 11.0);

    BoundaryPoint departure = event->departurePoint();
    EXPECT_DOUBLE_EQ(departure.sequence, 4.6);
    EXPECT_DOUBLE_EQ(departure.lon, -180.0);
    EXPECT_DOUBLE_EQ(departure.lat, 11.0);
}

TEST_F(CrossingDetectorTest, DegenerateCrossingIsReported) {
    domain::CrossingDetector detector;

    try {
        detector.examine(point(2, 10.0, -180.0), point(3, 11.0, 180.0), 3);
        FAIL() << "expected DegenerateCrossing";
    } catch (const CircleError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DegenerateCrossing);
    }
}

TEST_F(CrossingDetectorTest, ShortInputHasNoCrossings) {
    domain::CrossingDetector detector;

    EXPECT_TRUE(detector.detect({}).empty());
    EXPECT_TRUE(detector.detect({point(0, 1.0, 179.0)}).empty());
}
