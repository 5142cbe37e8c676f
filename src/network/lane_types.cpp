#include "network/common.hpp"
#include <cmath>
#include <sstream>

namespace lanecheck {
namespace network {

LaneClass LaneFeature::parseLaneClass(const std::string& normalized_lane_type) {
    if (normalized_lane_type == "centerline") {
        return LaneClass::CENTERLINE;
    }
    if (normalized_lane_type == "road") {
        return LaneClass::ROAD;
    }
    if (normalized_lane_type == "road_cycle") {
        return LaneClass::ROAD_CYCLE;
    }
    if (normalized_lane_type.find("cycle") != std::string::npos) {
        return LaneClass::CYCLE;
    }
    return LaneClass::OTHER;
}

Issue::Issue(const std::optional<FeatureId>& way, const std::optional<FeatureId>& road,
             const Point& coord, GapKind gap_kind, const std::string& normalized_lane_type)
    : way_id(way), road_id(road), coordinate(coord), kind(gap_kind), lane_type(normalized_lane_type),
      type(gapKindToString(gap_kind) + " (" + normalized_lane_type + ")"),
      color(gapKindColor(gap_kind)) {}

void ValidationConfig::validate() const {
    if (!std::isfinite(snap_tolerance) || snap_tolerance <= 0.0) {
        throw ConfigurationError("snap_tolerance must be a positive finite number");
    }
    if (!std::isfinite(strict_radius) || strict_radius <= 0.0) {
        throw ConfigurationError("strict_radius must be a positive finite number");
    }
    if (snap_tolerance >= strict_radius) {
        std::ostringstream message;
        message << "snap_tolerance (" << snap_tolerance << ") must be smaller than strict_radius ("
                << strict_radius << ")";
        throw ConfigurationError(message.str());
    }
}

std::string laneClassToString(LaneClass lane_class) {
    switch (lane_class) {
        case LaneClass::CENTERLINE:
            return "centerline";
        case LaneClass::ROAD:
            return "road";
        case LaneClass::CYCLE:
            return "cycle";
        case LaneClass::ROAD_CYCLE:
            return "road_cycle";
        case LaneClass::OTHER:
            return "other";
    }
    return "other";
}

std::string gapKindToString(GapKind kind) {
    switch (kind) {
        case GapKind::CENTERLINE_GAP:
            return "CENTERLINE_GAP";
        case GapKind::BORDER_GAP:
            return "BORDER_GAP";
    }
    return "UNKNOWN_GAP";
}

std::string gapKindColor(GapKind kind) {
    switch (kind) {
        case GapKind::CENTERLINE_GAP:
            return "magenta";
        case GapKind::BORDER_GAP:
            return "red";
    }
    return "black";
}

bool areLaneClassesCompatible(LaneClass a, LaneClass b) {
    auto isCycleFamily = [](LaneClass lane_class) {
        return lane_class == LaneClass::CYCLE || lane_class == LaneClass::ROAD_CYCLE;
    };

    switch (a) {
        case LaneClass::CENTERLINE:
            return b == LaneClass::CENTERLINE;
        case LaneClass::ROAD:
            return b == LaneClass::ROAD;
        case LaneClass::CYCLE:
        case LaneClass::ROAD_CYCLE:
            return isCycleFamily(b);
        case LaneClass::OTHER:
            return false;
    }
    return false;
}

const Point& getEndpoint(const LineString& geometry, EndpointSide side) {
    return side == EndpointSide::FIRST ? geometry.front() : geometry.back();
}

} // namespace network
} // namespace lanecheck
