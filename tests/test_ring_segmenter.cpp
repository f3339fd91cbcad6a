#include <gtest/gtest.h>
#include "../core/domain/RingSegmenter.hpp"
#include "../core/domain/CrossingDetector.hpp"
#include "../core/domain/BoundarySampler.hpp"
#include "../core/CircleError.hpp"
#include "../core/Geo.hpp"
#include <variant>

using namespace geocircle;

class RingSegmenterTest : public ::testing::Test {
protected:
    void segmentCircle(double lat, double lon, double radius) {
        points_ = domain::BoundarySampler::sample(lat, lon, radius, Geo::DEFAULT_EARTH_RADIUS_METERS, 120);
        crossings_ = detector_.detect(points_);
        geometry_ = segmenter_.segment(points_, crossings_);
    }

    const std::array<Batch, 4>& batches() const {
        return std::get<MultiBatch>(geometry_).batches;
    }

    domain::CrossingDetector detector_;
    domain::RingSegmenter segmenter_;
    std::vector<BoundaryPoint> points_;
    std::vector<CrossingEvent> crossings_;
    RingGeometry geometry_;
};

TEST_F(RingSegmenterTest, NoCrossingsGivesSingleBatch) {
    segmentCircle(51.5072, -0.1276, 900000.0);

    ASSERT_TRUE(std::holds_alternative<SingleBatch>(geometry_));
    EXPECT_EQ(batchCount(geometry_), 1u);

    const auto& batch = std::get<SingleBatch>(geometry_).batch;
    ASSERT_EQ(batch.points.size(), 121u);
    EXPECT_DOUBLE_EQ(batch.points.front().lat, batch.points.back().lat);
    EXPECT_DOUBLE_EQ(batch.points.front().lon, batch.points.back().lon);
}

TEST_F(RingSegmenterTest, TwoCrossingsGiveFourBatches) {
    segmentCircle(67.017, -178.242, 450000.0);

    ASSERT_TRUE(std::holds_alternative<MultiBatch>(geometry_));
    EXPECT_EQ(batchCount(geometry_), 4u);

    EXPECT_EQ(batches()[0].points.size(), 65u);
    EXPECT_EQ(batches()[1].points.size(), 28u);
    EXPECT_EQ(batches()[2].points.size(), 28u);
    EXPECT_EQ(batches()[3].points.size(), 4u);
}

TEST_F(RingSegmenterTest, BatchesMeetAtTheSeam) {
    segmentCircle(67.017, -178.242, 450000.0);

    const auto& first = batches()[0].points;
    EXPECT_DOUBLE_EQ(first.front().sequence, 0.0);
    EXPECT_DOUBLE_EQ(first.back().sequence, 63.4);
    EXPECT_DOUBLE_EQ(first.back().lon, -180.0);
    EXPECT_NEAR(first.back().lat, 63.039082286593846, 1e-9);

    const auto& second = batches()[1].points;
    EXPECT_DOUBLE_EQ(second.front().sequence, 63.6);
    EXPECT_DOUBLE_EQ(second.front().lon, 180.0);
    EXPECT_DOUBLE_EQ(second.front().lat, first.back().lat);
    EXPECT_DOUBLE_EQ(second.back().sequence, 90.0);

    const auto& third = batches()[2].points;
    EXPECT_DOUBLE_EQ(third.front().sequence, 91.0);
    EXPECT_DOUBLE_EQ(third.back().sequence, 117.4);
    EXPECT_DOUBLE_EQ(third.back().lon, 180.0);

    const auto& fourth = batches()[3].points;
    EXPECT_DOUBLE_EQ(fourth.front().sequence, 117.6);
    EXPECT_DOUBLE_EQ(fourth.front().lon, -180.0);
    EXPECT_DOUBLE_EQ(fourth.front().lat, third.back().lat);
    EXPECT_DOUBLE_EQ(fourth.back().sequence, 120.0);
}

TEST_F(RingSegmenterTest, ConcatenationReproducesAugmentedRing) {
    segmentCircle(67.017, -178.242, 450000.0);

    auto all = flatten(geometry_);
    ASSERT_EQ(all.size(), points_.size() + 4);

    for (std::size_t i = 1; i < all.size(); ++i) {
        EXPECT_LT(all[i - 1].sequence, all[i].sequence) << "position " << i;
    }

    // Every original point survives unchanged
    std::size_t matched = 0;
    for (const auto& point : all) {
        double whole = static_cast<double>(static_cast<std::size_t>(point.sequence));
        if (point.sequence == whole) {
            const auto& original = points_[static_cast<std::size_t>(whole)];
            EXPECT_DOUBLE_EQ(point.lat, original.lat);
            EXPECT_DOUBLE_EQ(point.lon, original.lon);
            ++matched;
        }
    }
    EXPECT_EQ(matched, points_.size());
}

TEST_F(RingSegmenterTest, NoBatchWrapsAcrossTheSeam) {
    segmentCircle(67.017, -178.242, 450000.0);
    for (const auto& batch : batches()) {
        EXPECT_TRUE(domain::RingSegmenter::isNonWrapping(batch));
    }

    segmentCircle(-18.1, 178.27, 200000.0);
    for (const auto& batch : batches()) {
        EXPECT_TRUE(domain::RingSegmenter::isNonWrapping(batch));
    }
}

TEST_F(RingSegmenterTest, FijiBatchSizes) {
    segmentCircle(-18.1, 178.27, 200000.0);

    ASSERT_EQ(batchCount(geometry_), 4u);
    EXPECT_EQ(batches()[0].points.size(), 24u);
    EXPECT_EQ(batches()[1].points.size(), 9u);
    EXPECT_EQ(batches()[2].points.size(), 9u);
    EXPECT_EQ(batches()[3].points.size(), 83u);

    // Eastbound first crossing: the ring approaches from the eastern hemisphere
    EXPECT_DOUBLE_EQ(batches()[0].points.back().lon, 180.0);
    EXPECT_DOUBLE_EQ(batches()[1].points.front().lon, -180.0);
}

TEST_F(RingSegmenterTest, CrossingOrderDoesNotMatter) {
    points_ = domain::BoundarySampler::sample(67.017, -178.242, 450000.0, Geo::DEFAULT_EARTH_RADIUS_METERS, 120);
    auto crossings = detector_.detect(points_);
    ASSERT_EQ(crossings.size(), 2u);

    std::vector<CrossingEvent> reversed = {crossings[1], crossings[0]};
    auto inOrder = flatten(segmenter_.segment(points_, crossings));
    auto outOfOrder = flatten(segmenter_.segment(points_, reversed));

    ASSERT_EQ(inOrder.size(), outOfOrder.size());
    for (std::size_t i = 0; i < inOrder.size(); ++i) {
        EXPECT_DOUBLE_EQ(inOrder[i].sequence, outOfOrder[i].sequence);
    }
}

TEST_F(RingSegmenterTest, UnsupportedCrossingCount) {
    points_ = domain::BoundarySampler::sample(67.017, -178.242, 450000.0, Geo::DEFAULT_EARTH_RADIUS_METERS, 120);
    auto crossings = detector_.detect(points_);
    ASSERT_EQ(crossings.size(), 2u);

    std::vector<CrossingEvent> one = {crossings[0]};
    std::vector<CrossingEvent> three = {crossings[0], crossings[1], crossings[1]};

    for (const auto& subset : {one, three}) {
        try {
            segmenter_.segment(points_, subset);
            FAIL() << "expected UnsupportedCrossingCount for " << subset.size() << " crossings";
        } catch (const CircleError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::UnsupportedCrossingCount);
        }
    }
}

TEST_F(RingSegmenterTest, WrappingSingleBatchIsRejected) {
    points_ = domain::BoundarySampler::sample(67.017, -178.242, 450000.0, Geo::DEFAULT_EARTH_RADIUS_METERS, 120);

    try {
        segmenter_.segment(points_, {});
        FAIL() << "expected WrappingBatch";
    } catch (const CircleError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::WrappingBatch);
    }
}

TEST_F(RingSegmenterTest, IsNonWrappingOnHandBuiltBatches) {
    Batch calm;
    calm.points = {{0, 1.0, 170.0}, {1, 2.0, 179.9}, {2, 3.0, 180.0}};
    EXPECT_TRUE(domain::RingSegmenter::isNonWrapping(calm));

    Batch wrapping;
    wrapping.points = {{0, 1.0, 179.0}, {1, 2.0, -179.0}};
    EXPECT_FALSE(domain::RingSegmenter::isNonWrapping(wrapping));

    EXPECT_TRUE(domain::RingSegmenter::isNonWrapping(Batch{}));
}
