#ifndef LANECHECK_GAP_DETECTOR_HPP
#define LANECHECK_GAP_DETECTOR_HPP

#include <vector>
#include <optional>
#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>
#include "network/common.hpp"

namespace lanecheck {
namespace network {

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

// R-tree types for endpoint and segment lookups within one group
using EndpointRTree = bgi::rtree<EndpointRTreeValue, bgi::quadratic<16>>;
using LaneSegmentRTree = bgi::rtree<LaneSegmentRTreeValue, bgi::quadratic<16>>;

/**
 * Finds unsnapped endpoints that lie close to a compatible feature of the same group
 *
 * For every endpoint of every feature in a group:
 *  1. the endpoint is snapped if another feature of the group (by position, not value)
 *     has its first or last point closer than snap_tolerance; snapped endpoints are fine.
 *  2. otherwise, if a feature with a different way id and a compatible lane class passes
 *     closer than strict_radius (distance to its whole polyline), the endpoint is a gap.
 *     With no such feature the endpoint is a genuine network boundary.
 *
 * The scan only reads the group. Spatial indices, when enabled, are built per call and
 * give the same outcome as the quadratic scan.
 */
class GapDetector {
public:
    /**
     * @param config Validation thresholds
     * @throws ConfigurationError if the thresholds are invalid
     */
    explicit GapDetector(const ValidationConfig& config);
    ~GapDetector() = default;

    /**
     * Detect gaps in one group
     * @param group Features of a single group, in input order
     * @param kind Gap kind reported for this group
     * @return Issues in discovery order (feature order, first endpoint before last)
     * @throws MalformedGeometryError if a feature has fewer than 2 points
     */
    std::vector<Issue> detectGaps(const LaneGroup& group, GapKind kind) const;

    /**
     * Snapping test for one endpoint using a linear scan of the group
     * @param group Group containing the feature
     * @param feature_index Position of the feature in the group
     * @param side Which endpoint to test
     * @return true if another feature has an endpoint closer than snap_tolerance
     */
    bool isEndpointSnapped(const LaneGroup& group, size_t feature_index, EndpointSide side) const;

    /**
     * Continuity test for one endpoint using a linear scan of the group
     * @param group Group containing the feature
     * @param feature_index Position of the feature in the group
     * @param side Which endpoint to test
     * @return true if a compatible feature of another way passes closer than strict_radius
     */
    bool hasUnresolvedAdjacency(const LaneGroup& group, size_t feature_index, EndpointSide side) const;

    /**
     * Reject groups containing features with fewer than 2 points
     * @throws MalformedGeometryError for the first offending feature
     */
    static void validateGroup(const LaneGroup& group);

private:
    ValidationConfig config_;

    // Per-call indices over one group
    struct GroupSpatialIndex {
        EndpointRTree endpoints;
        LaneSegmentRTree segments;
    };

    GroupSpatialIndex buildSpatialIndex(const LaneGroup& group) const;

    bool isEndpointSnapped(const GroupSpatialIndex& index, const LaneGroup& group,
                           size_t feature_index, EndpointSide side) const;

    bool hasUnresolvedAdjacency(const GroupSpatialIndex& index, const LaneGroup& group,
                                size_t feature_index, EndpointSide side) const;

    // Whether `candidate` may serve as continuity evidence for `feature`
    static bool isContinuityCandidate(const LaneFeature& feature, const LaneFeature& candidate);

    // Square search window centered on a point
    static Box searchBox(const Point& center, double radius);
};

} // namespace network
} // namespace lanecheck

#endif // LANECHECK_GAP_DETECTOR_HPP
