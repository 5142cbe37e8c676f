#include "network/gap_detector.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>

namespace lanecheck::network {
namespace {

using test_utils::Coordinates;
using test_utils::id;
using test_utils::makeLane;

constexpr double kSnapTolerance = 1e-7;
constexpr double kStrictRadius = 1e-5;

ValidationConfig makeConfig(bool use_spatial_index, double strict_radius = kStrictRadius) {
    ValidationConfig config;
    config.snap_tolerance = kSnapTolerance;
    config.strict_radius = strict_radius;
    config.use_spatial_index = use_spatial_index;
    return config;
}

// Deterministic network of short lines with endpoints jittered around a grid
LaneGroup makeJitteredNetwork(const std::string& lane_type, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> jitter(-3e-5, 3e-5);

    LaneGroup group;
    const double spacing = 1e-4;
    for (int row = 0; row < 6; ++row) {
        for (int col = 0; col < 6; ++col) {
            const double x = col * spacing;
            const double y = row * spacing;
            const int way = (row * 6 + col) % 7;
            group.push_back(makeLane(group.size(),
                                     {{x + jitter(rng), y + jitter(rng)},
                                      {x + spacing / 2, y + jitter(rng)},
                                      {x + spacing + jitter(rng), y + jitter(rng)}},
                                     lane_type, id(way)));
        }
    }
    return group;
}

// Runs each test with both the linear scan and the R-tree lookups
class GapDetectorTest : public ::testing::TestWithParam<bool> {
protected:
    GapDetector detector_{makeConfig(GetParam())};
};

TEST_P(GapDetectorTest, CoincidentEndpointsAreNotReported)
{
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "centerline", id("a")),
        makeLane(1, {{1e-4, 0.0}, {2e-4, 0.0}}, "centerline", id("b")),
    };

    EXPECT_TRUE(detector_.detectGaps(group, GapKind::CENTERLINE_GAP).empty());
}

TEST_P(GapDetectorTest, DistantEndpointsAreNetworkBoundaries)
{
    const double gap = 2 * kStrictRadius;
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "centerline", id("a")),
        makeLane(1, {{1e-4 + gap, 0.0}, {2e-4 + gap, 0.0}}, "centerline", id("b")),
    };

    EXPECT_TRUE(detector_.detectGaps(group, GapKind::CENTERLINE_GAP).empty());
}

TEST_P(GapDetectorTest, NearbyUnsnappedEndpointsAreBothReported)
{
    const double gap = 0.5 * kStrictRadius;
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "centerline", id("a"), std::nullopt, id(10)),
        makeLane(1, {{1e-4 + gap, 0.0}, {2e-4, 0.0}}, "centerline", id("b"), std::nullopt, id(11)),
    };

    const auto issues = detector_.detectGaps(group, GapKind::CENTERLINE_GAP);
    ASSERT_EQ(issues.size(), 2u);

    EXPECT_EQ(issues[0].way_id, id("a"));
    EXPECT_EQ(issues[0].road_id, id(10));
    EXPECT_DOUBLE_EQ(bg::get<0>(issues[0].coordinate), 1e-4);
    EXPECT_DOUBLE_EQ(bg::get<1>(issues[0].coordinate), 0.0);
    EXPECT_EQ(issues[0].kind, GapKind::CENTERLINE_GAP);
    EXPECT_EQ(issues[0].type, "CENTERLINE_GAP (centerline)");
    EXPECT_EQ(issues[0].color, "magenta");

    EXPECT_EQ(issues[1].way_id, id("b"));
    EXPECT_DOUBLE_EQ(bg::get<0>(issues[1].coordinate), 1e-4 + gap);
}

TEST_P(GapDetectorTest, RoadAndCycleBordersDoNotContinueEachOther)
{
    const double gap = 0.5 * kStrictRadius;
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "road", id("a")),
        makeLane(1, {{1e-4 + gap, 0.0}, {2e-4, 0.0}}, "cycle", id("b")),
    };

    EXPECT_TRUE(detector_.detectGaps(group, GapKind::BORDER_GAP).empty());
}

TEST_P(GapDetectorTest, CycleFamilyBordersContinueEachOther)
{
    const double gap = 0.5 * kStrictRadius;
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "road_cycle", id("a")),
        makeLane(1, {{1e-4 + gap, 0.0}, {2e-4, 0.0}}, "cycle", id("b")),
    };

    const auto issues = detector_.detectGaps(group, GapKind::BORDER_GAP);
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].type, "BORDER_GAP (road_cycle)");
    EXPECT_EQ(issues[0].color, "red");
    EXPECT_EQ(issues[1].type, "BORDER_GAP (cycle)");
}

TEST_P(GapDetectorTest, SinglePointGeometryIsMalformed)
{
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "centerline", id("a")),
        makeLane(7, {{1e-4, 0.0}}, "centerline", id("b")),
    };

    try {
        detector_.detectGaps(group, GapKind::CENTERLINE_GAP);
        FAIL() << "Expected MalformedGeometryError";
    } catch (const MalformedGeometryError& e) {
        EXPECT_EQ(e.getFeatureIndex(), 7u);
        EXPECT_EQ(e.getPointCount(), 1u);
    }
}

TEST_P(GapDetectorTest, ClosedRingDoesNotSnapToItself)
{
    const Coordinates ring = {{0.0, 0.0}, {1e-4, 0.0}, {1e-4, 1e-4}, {0.0, 1e-4}, {0.0, 0.0}};

    // Alone, the ring has no compatible line of another way nearby
    LaneGroup alone = {makeLane(0, ring, "centerline", id("r"))};
    EXPECT_TRUE(detector_.detectGaps(alone, GapKind::CENTERLINE_GAP).empty());

    // A line of another way bending close to the ring's start exposes both endpoints
    LaneGroup with_neighbor = {
        makeLane(0, ring, "centerline", id("r")),
        makeLane(1, {{-5e-5, -5e-5}, {-3e-6, 0.0}, {-5e-5, 5e-5}}, "centerline", id("c")),
    };
    const auto issues = detector_.detectGaps(with_neighbor, GapKind::CENTERLINE_GAP);
    ASSERT_EQ(issues.size(), 2u);
    for (const auto& issue : issues) {
        EXPECT_EQ(issue.way_id, id("r"));
        EXPECT_DOUBLE_EQ(bg::get<0>(issue.coordinate), 0.0);
        EXPECT_DOUBLE_EQ(bg::get<1>(issue.coordinate), 0.0);
    }
}

TEST_P(GapDetectorTest, DuplicateFeaturesSnapToEachOther)
{
    const Coordinates line = {{0.0, 0.0}, {1e-4, 0.0}};
    const auto neighbor = makeLane(2, {{-5e-5, 3e-6}, {-3e-6, 3e-6}, {-3e-6, 5e-5}}, "centerline", id("c"));

    LaneGroup single = {makeLane(0, line, "centerline", id("a")), neighbor};
    EXPECT_EQ(detector_.detectGaps(single, GapKind::CENTERLINE_GAP).size(), 1u);

    LaneGroup duplicated = {
        makeLane(0, line, "centerline", id("a")),
        makeLane(1, line, "centerline", id("a")),
        neighbor,
    };
    EXPECT_TRUE(detector_.detectGaps(duplicated, GapKind::CENTERLINE_GAP).empty());
}

TEST_P(GapDetectorTest, SameWayCannotCloseItsOwnGap)
{
    const double gap = 0.5 * kStrictRadius;
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "centerline", id("a")),
        makeLane(1, {{1e-4 + gap, 0.0}, {2e-4, 0.0}}, "centerline", id("a")),
    };

    EXPECT_TRUE(detector_.detectGaps(group, GapKind::CENTERLINE_GAP).empty());
}

TEST_P(GapDetectorTest, MissingWayIdsCountAsTheSameWay)
{
    const double gap = 0.5 * kStrictRadius;
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "centerline", std::nullopt),
        makeLane(1, {{1e-4 + gap, 0.0}, {2e-4, 0.0}}, "centerline", std::nullopt),
        makeLane(2, {{1e-4 + gap, 1e-3}, {2e-4, 1e-3}}, "centerline", id("b")),
    };

    EXPECT_TRUE(detector_.detectGaps(group, GapKind::CENTERLINE_GAP).empty());
}

TEST_P(GapDetectorTest, EndpointNearTheMiddleOfAnotherLineIsAGap)
{
    // Undershooting T-junction
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {0.0, -1e-4}}, "centerline", id("stem")),
        makeLane(1, {{-1e-4, 5e-6}, {1e-4, 5e-6}}, "centerline", id("bar")),
    };

    const auto issues = detector_.detectGaps(group, GapKind::CENTERLINE_GAP);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].way_id, id("stem"));
    EXPECT_DOUBLE_EQ(bg::get<1>(issues[0].coordinate), 0.0);
}

TEST_P(GapDetectorTest, SnappingIsSymmetric)
{
    const double offset = 0.5 * kSnapTolerance;
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "centerline", id("x")),
        makeLane(1, {{1e-4 + offset, 0.0}, {2e-4, 0.0}}, "centerline", id("y")),
    };

    EXPECT_TRUE(detector_.isEndpointSnapped(group, 0, EndpointSide::LAST));
    EXPECT_TRUE(detector_.isEndpointSnapped(group, 1, EndpointSide::FIRST));
    EXPECT_FALSE(detector_.isEndpointSnapped(group, 0, EndpointSide::FIRST));
    EXPECT_TRUE(detector_.detectGaps(group, GapKind::CENTERLINE_GAP).empty());
}

TEST_P(GapDetectorTest, SnapToleranceIsStrict)
{
    LaneGroup group = {
        makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "centerline", id("x")),
        makeLane(1, {{1e-4 + 2 * kSnapTolerance, 0.0}, {2e-4, 0.0}}, "centerline", id("y")),
    };

    EXPECT_FALSE(detector_.isEndpointSnapped(group, 0, EndpointSide::LAST));
    EXPECT_TRUE(detector_.hasUnresolvedAdjacency(group, 0, EndpointSide::LAST));
}

TEST_P(GapDetectorTest, EmptyGroupHasNoIssues)
{
    EXPECT_TRUE(detector_.detectGaps(LaneGroup(), GapKind::BORDER_GAP).empty());
}

TEST_P(GapDetectorTest, ResultsAreDeterministic)
{
    const LaneGroup group = makeJitteredNetwork("centerline", 42);

    const auto first = detector_.detectGaps(group, GapKind::CENTERLINE_GAP);
    const auto second = detector_.detectGaps(group, GapKind::CENTERLINE_GAP);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].way_id, second[i].way_id);
        EXPECT_TRUE(bg::equals(first[i].coordinate, second[i].coordinate));
    }
}

TEST_P(GapDetectorTest, LargerStrictRadiusNeverReportsFewerIssues)
{
    const LaneGroup group = makeJitteredNetwork("road", 7);

    size_t previous = 0;
    for (double radius : {1e-6, 5e-6, 1e-5, 2e-5, 4e-5, 8e-5}) {
        GapDetector detector(makeConfig(GetParam(), radius));
        const size_t count = detector.detectGaps(group, GapKind::BORDER_GAP).size();
        EXPECT_GE(count, previous) << "strict_radius " << radius;
        previous = count;
    }
    EXPECT_GT(previous, 0u);
}

TEST_P(GapDetectorTest, OutOfRangeFeatureIndexThrows)
{
    LaneGroup group = {makeLane(0, {{0.0, 0.0}, {1e-4, 0.0}}, "centerline", id("a"))};

    EXPECT_THROW(detector_.isEndpointSnapped(group, 1, EndpointSide::FIRST), std::out_of_range);
    EXPECT_THROW(detector_.hasUnresolvedAdjacency(group, 3, EndpointSide::LAST), std::out_of_range);
}

INSTANTIATE_TEST_SUITE_P(ScanStrategies, GapDetectorTest, ::testing::Values(false, true),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? "SpatialIndex" : "LinearScan";
                         });

TEST(GapDetector, SpatialIndexMatchesLinearScan)
{
    for (unsigned seed : {1u, 2u, 3u, 4u}) {
        for (const char* lane_type : {"centerline", "road", "cycle"}) {
            const LaneGroup group = makeJitteredNetwork(lane_type, seed);

            const auto linear = GapDetector(makeConfig(false)).detectGaps(group, GapKind::BORDER_GAP);
            const auto indexed = GapDetector(makeConfig(true)).detectGaps(group, GapKind::BORDER_GAP);

            ASSERT_EQ(linear.size(), indexed.size()) << "seed " << seed << " type " << lane_type;
            for (size_t i = 0; i < linear.size(); ++i) {
                EXPECT_EQ(linear[i].way_id, indexed[i].way_id);
                EXPECT_TRUE(bg::equals(linear[i].coordinate, indexed[i].coordinate));
            }
        }
    }
}

TEST(GapDetector, InvalidThresholdsAreRejected)
{
    ValidationConfig config;

    config.snap_tolerance = 1e-5;
    config.strict_radius = 1e-5;
    EXPECT_THROW(GapDetector{config}, ConfigurationError);

    config.snap_tolerance = 1e-4;
    EXPECT_THROW(GapDetector{config}, ConfigurationError);

    config.snap_tolerance = -1e-7;
    EXPECT_THROW(GapDetector{config}, ConfigurationError);

    config.snap_tolerance = 1e-7;
    config.strict_radius = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(GapDetector{config}, ConfigurationError);

    config.strict_radius = std::numeric_limits<double>::infinity();
    EXPECT_THROW(GapDetector{config}, ConfigurationError);

    EXPECT_NO_THROW(GapDetector{ValidationConfig()});
}

TEST(LaneClassCompatibility, FollowsTheCompatibilityTable)
{
    const LaneClass all[] = {LaneClass::CENTERLINE, LaneClass::ROAD, LaneClass::CYCLE,
                             LaneClass::ROAD_CYCLE, LaneClass::OTHER};

    auto expected = [](LaneClass a, LaneClass b) {
        auto cycle = [](LaneClass c) { return c == LaneClass::CYCLE || c == LaneClass::ROAD_CYCLE; };
        if (a == LaneClass::CENTERLINE && b == LaneClass::CENTERLINE) return true;
        if (a == LaneClass::ROAD && b == LaneClass::ROAD) return true;
        return cycle(a) && cycle(b);
    };

    for (LaneClass a : all) {
        for (LaneClass b : all) {
            EXPECT_EQ(areLaneClassesCompatible(a, b), expected(a, b))
                << laneClassToString(a) << " x " << laneClassToString(b);
            EXPECT_EQ(areLaneClassesCompatible(a, b), areLaneClassesCompatible(b, a));
        }
    }
}

TEST(LaneClassCompatibility, ParsesNormalizedLaneTypes)
{
    EXPECT_EQ(LaneFeature::parseLaneClass("centerline"), LaneClass::CENTERLINE);
    EXPECT_EQ(LaneFeature::parseLaneClass("road"), LaneClass::ROAD);
    EXPECT_EQ(LaneFeature::parseLaneClass("cycle"), LaneClass::CYCLE);
    EXPECT_EQ(LaneFeature::parseLaneClass("road_cycle"), LaneClass::ROAD_CYCLE);
    EXPECT_EQ(LaneFeature::parseLaneClass("cycle_track"), LaneClass::CYCLE);
    EXPECT_EQ(LaneFeature::parseLaneClass("road_edge"), LaneClass::OTHER);
    EXPECT_EQ(LaneFeature::parseLaneClass("none"), LaneClass::OTHER);
}

} // namespace
} // namespace lanecheck::network
