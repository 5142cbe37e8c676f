#include "network/gap_detector.hpp"
#include <iostream>
#include <stdexcept>

namespace lanecheck {
namespace network {

namespace {
constexpr EndpointSide kEndpointSides[] = {EndpointSide::FIRST, EndpointSide::LAST};
}

GapDetector::GapDetector(const ValidationConfig& config)
    : config_(config) {
    config_.validate();
}

void GapDetector::validateGroup(const LaneGroup& group) {
    for (const auto& feature : group) {
        if (feature.geometry.size() < 2) {
            throw MalformedGeometryError(feature.index, feature.geometry.size());
        }
    }
}

std::vector<Issue> GapDetector::detectGaps(const LaneGroup& group, GapKind kind) const {
    validateGroup(group);

    std::vector<Issue> issues;
    if (group.empty()) {
        return issues;
    }

    std::optional<GroupSpatialIndex> index;
    if (config_.use_spatial_index) {
        index.emplace(buildSpatialIndex(group));
    }

    for (size_t i = 0; i < group.size(); ++i) {
        const LaneFeature& feature = group[i];

        for (EndpointSide side : kEndpointSides) {
            // 1. Physical snapping check
            bool snapped = index ? isEndpointSnapped(*index, group, i, side)
                                 : isEndpointSnapped(group, i, side);
            if (snapped) {
                continue;
            }

            // 2. Continuity check
            bool expected_connection = index ? hasUnresolvedAdjacency(*index, group, i, side)
                                             : hasUnresolvedAdjacency(group, i, side);
            if (expected_connection) {
                issues.emplace_back(feature.way_id, feature.road_id,
                                    getEndpoint(feature.geometry, side), kind, feature.lane_type);
            }
        }
    }

    std::cout << "Detected " << issues.size() << " " << gapKindToString(kind)
              << " issues among " << group.size() << " features" << std::endl;

    return issues;
}

bool GapDetector::isEndpointSnapped(const LaneGroup& group, size_t feature_index, EndpointSide side) const {
    if (feature_index >= group.size()) {
        throw std::out_of_range("Lane feature index out of range");
    }

    const Point& node = getEndpoint(group[feature_index].geometry, side);

    for (size_t j = 0; j < group.size(); ++j) {
        if (j == feature_index) {
            continue;
        }
        const LineString& other = group[j].geometry;
        if (bg::distance(node, other.front()) < config_.snap_tolerance ||
            bg::distance(node, other.back()) < config_.snap_tolerance) {
            return true;
        }
    }

    return false;
}

bool GapDetector::hasUnresolvedAdjacency(const LaneGroup& group, size_t feature_index, EndpointSide side) const {
    if (feature_index >= group.size()) {
        throw std::out_of_range("Lane feature index out of range");
    }

    const LaneFeature& feature = group[feature_index];
    const Point& node = getEndpoint(feature.geometry, side);

    for (const auto& candidate : group) {
        if (!isContinuityCandidate(feature, candidate)) {
            continue;
        }
        if (bg::distance(node, candidate.geometry) < config_.strict_radius) {
            return true;
        }
    }

    return false;
}

bool GapDetector::isContinuityCandidate(const LaneFeature& feature, const LaneFeature& candidate) {
    // Features of the same way cannot close that way's own gap; two missing ids count as the same way
    if (candidate.way_id == feature.way_id) {
        return false;
    }
    return areLaneClassesCompatible(feature.lane_class, candidate.lane_class);
}

GapDetector::GroupSpatialIndex GapDetector::buildSpatialIndex(const LaneGroup& group) const {
    std::vector<EndpointRTreeValue> endpoint_values;
    std::vector<LaneSegmentRTreeValue> segment_values;
    endpoint_values.reserve(group.size() * 2);
    segment_values.reserve(group.size() * 4); // Estimate segments per lane

    for (size_t i = 0; i < group.size(); ++i) {
        const LineString& linestring = group[i].geometry;

        endpoint_values.emplace_back(linestring.front(), i);
        endpoint_values.emplace_back(linestring.back(), i);

        for (size_t j = 0; j + 1 < linestring.size(); ++j) {
            segment_values.emplace_back(Segment(linestring[j], linestring[j + 1]), i);
        }
    }

    GroupSpatialIndex index;
    index.endpoints = EndpointRTree(endpoint_values.begin(), endpoint_values.end());
    index.segments = LaneSegmentRTree(segment_values.begin(), segment_values.end());

    std::cout << "Built spatial index for " << endpoint_values.size() << " endpoints and "
              << segment_values.size() << " lane segments" << std::endl;

    return index;
}

bool GapDetector::isEndpointSnapped(const GroupSpatialIndex& index, const LaneGroup& group,
                                    size_t feature_index, EndpointSide side) const {
    const Point& node = getEndpoint(group[feature_index].geometry, side);
    const double tolerance = config_.snap_tolerance;

    auto query = index.endpoints.qbegin(
        bgi::intersects(searchBox(node, tolerance)) &&
        bgi::satisfies([&](const EndpointRTreeValue& value) {
            return value.feature_index != feature_index &&
                   bg::distance(node, value.location) < tolerance;
        }));

    return query != index.endpoints.qend();
}

bool GapDetector::hasUnresolvedAdjacency(const GroupSpatialIndex& index, const LaneGroup& group,
                                         size_t feature_index, EndpointSide side) const {
    const LaneFeature& feature = group[feature_index];
    const Point& node = getEndpoint(feature.geometry, side);
    const double radius = config_.strict_radius;

    // A line is within the radius iff one of its segments is
    auto query = index.segments.qbegin(
        bgi::intersects(searchBox(node, radius)) &&
        bgi::satisfies([&](const LaneSegmentRTreeValue& value) {
            return isContinuityCandidate(feature, group[value.feature_index]) &&
                   bg::distance(node, value.segment) < radius;
        }));

    return query != index.segments.qend();
}

Box GapDetector::searchBox(const Point& center, double radius) {
    const double x = bg::get<0>(center);
    const double y = bg::get<1>(center);
    return Box(Point(x - radius, y - radius), Point(x + radius, y + radius));
}

} // namespace network
} // namespace lanecheck
