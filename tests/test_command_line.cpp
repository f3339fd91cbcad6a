#include <gtest/gtest.h>
#include "../platform/desktop/CommandLine.hpp"
#include "../platform/desktop/StdoutReservation.hpp"
#include "../core/domain/CirclePipeline.hpp"
#include "../core/adapters/GeoJsonAssembler.hpp"
#include <iostream>
#include <sstream>
#include <vector>

using namespace geocircle;

namespace {

CliOptions parseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "geocircle");
    return CommandLine::parse(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(CommandLineTest, NoFlagsLeaveConfigUntouched) {
    GeoCircleConfig config;
    config.circle.pointCount = 240;
    config.outputPath = "out.geojson";

    CommandLine::apply(parseArgs({}), config);

    EXPECT_EQ(config.circle.pointCount, 240);
    EXPECT_EQ(config.outputPath, "out.geojson");
    EXPECT_EQ(config.circle.crossingFormula, CrossingFormula::Interpolated);
    EXPECT_FALSE(config.mqtt.enabled);
}

TEST(CommandLineTest, FlagsOverrideConfig) {
    auto options = parseArgs({"--config", "alt.toml", "--output", "-", "--point-count", "36",
                              "--formula", "reference", "--ignore-antimeridian", "--publish"});
    EXPECT_TRUE(options.configGiven);
    EXPECT_EQ(options.configFile, "alt.toml");

    GeoCircleConfig config;
    CommandLine::apply(options, config);

    EXPECT_EQ(config.outputPath, "-");
    EXPECT_EQ(config.circle.pointCount, 36);
    EXPECT_EQ(config.circle.crossingFormula, CrossingFormula::Reference);
    EXPECT_EQ(config.circle.antimeridian, AntimeridianMode::Ignore);
    EXPECT_TRUE(config.mqtt.enabled);
}

TEST(CommandLineTest, ZeroPointCountReachesThePipeline) {
    GeoCircleConfig config;
    CommandLine::apply(parseArgs({"--point-count", "0"}), config);
    ASSERT_EQ(config.circle.pointCount, 0);

    Location chukotka;
    chukotka.id = "5";
    chukotka.latitude = 67.017;
    chukotka.longitude = -178.242;
    chukotka.radius = 450000.0;

    domain::CirclePipeline pipeline(config.circle);
    auto result = pipeline.run({chukotka});
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ErrorKind::InvalidPointCount);
}

TEST(CommandLineTest, BadArgumentsAreRejected) {
    EXPECT_THROW(parseArgs({"--formula", "refrence"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--point-count", "12x"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--point-count"}), std::invalid_argument);
    EXPECT_THROW(parseArgs({"--verbose"}), std::invalid_argument);
    EXPECT_TRUE(parseArgs({"--help"}).help);
}

class StdoutReservationTest : public ::testing::Test {
protected:
    void SetUp() override { original_ = std::cout.rdbuf(captured_.rdbuf()); }
    void TearDown() override { std::cout.rdbuf(original_); }

    std::ostringstream captured_;
    std::streambuf* original_ = nullptr;
};

TEST_F(StdoutReservationTest, StdoutCarriesOnlyTheDocument) {
    Location chukotka;
    chukotka.id = "5";
    chukotka.latitude = 67.017;
    chukotka.longitude = -178.242;
    chukotka.radius = 450000.0;

    {
        StdoutReservation reservation;
        std::cout << "Computing 1 circles" << std::endl;

        domain::CirclePipeline pipeline;
        auto result = pipeline.run({chukotka});

        adapters::GeoJsonAssembler assembler;
        reservation.data() << assembler.toFeatureCollection(result).dump(2) << std::endl;
    }

    EXPECT_EQ(std::cout.rdbuf(), captured_.rdbuf());

    auto document = nlohmann::json::parse(captured_.str());
    EXPECT_EQ(document["type"], "FeatureCollection");
    ASSERT_EQ(document["features"].size(), 1u);
    EXPECT_EQ(document["features"][0]["id"], "5");
}
