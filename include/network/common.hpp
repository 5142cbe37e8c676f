#ifndef LANECHECK_COMMON_HPP
#define LANECHECK_COMMON_HPP

#include <cstddef>
#include <vector>
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/segment.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace lanecheck {
namespace network {

// Boost Geometry namespace aliases
namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

// 2D Geometry types
using Point = bg::model::point<double, 2, bg::cs::cartesian>;
using LineString = bg::model::linestring<Point>;
using Segment = bg::model::segment<Point>;
using Box = bg::model::box<Point>;

// Opaque identifier passed through from the input property bag (string, number, ...)
using FeatureId = nlohmann::json;

/**
 * Error raised when a validated feature has fewer than two coordinates
 */
class MalformedGeometryError : public std::runtime_error {
public:
    MalformedGeometryError(size_t feature_index, size_t point_count)
        : std::runtime_error("Malformed geometry: feature " + std::to_string(feature_index) +
                             " has " + std::to_string(point_count) + " coordinate(s), at least 2 required"),
          feature_index_(feature_index), point_count_(point_count) {}

    size_t getFeatureIndex() const { return feature_index_; }
    size_t getPointCount() const { return point_count_; }

private:
    size_t feature_index_;
    size_t point_count_;
};

/**
 * Error raised when validation thresholds are unusable
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

// Recognized lane classes after normalization
enum class LaneClass {
    CENTERLINE,     // "centerline"
    ROAD,           // "road"
    CYCLE,          // any other type containing "cycle"
    ROAD_CYCLE,     // "road_cycle"
    OTHER           // anything else, including a missing lane type
};

// Which end of a polyline an endpoint refers to
enum class EndpointSide {
    FIRST,
    LAST
};

// Gap categories, one per validated group
enum class GapKind {
    CENTERLINE_GAP,
    BORDER_GAP
};

// Raw GeoJSON feature
struct GeospatialFeature {
    size_t id;                    // Position of the feature in the source collection
    nlohmann::json geometry;
    nlohmann::json properties;

    GeospatialFeature(size_t feature_id, const nlohmann::json& geom, const nlohmann::json& props)
        : id(feature_id), geometry(geom), properties(props) {}
};

// Raw GeoJSON feature collection
struct GeospatialDataset {
    std::string crs;
    std::vector<GeospatialFeature> features;

    GeospatialDataset() = default;
    GeospatialDataset(const std::string& crs_string, const std::vector<GeospatialFeature>& feature_list)
        : crs(crs_string), features(feature_list) {}
};

// Lane feature with properties normalized at ingestion
struct LaneFeature {
    size_t index;                           // Position in the loaded collection
    LineString geometry;
    std::optional<FeatureId> way_id;
    std::optional<FeatureId> road_id;
    std::string lane_type;                  // Lower-cased lane type, "none" when missing
    LaneClass lane_class;
    std::optional<std::string> area_type;   // Lower-cased area type, nullopt when missing

    LaneFeature(size_t feature_index, const LineString& geom,
                const std::optional<FeatureId>& way, const std::optional<FeatureId>& road,
                const std::string& normalized_lane_type,
                const std::optional<std::string>& normalized_area_type)
        : index(feature_index), geometry(geom), way_id(way), road_id(road),
          lane_type(normalized_lane_type), lane_class(parseLaneClass(normalized_lane_type)),
          area_type(normalized_area_type) {}

    static LaneClass parseLaneClass(const std::string& normalized_lane_type);
};

// Group of features validated together, in input order
using LaneGroup = std::vector<LaneFeature>;

// Detected gap at a feature endpoint
struct Issue {
    std::optional<FeatureId> way_id;
    std::optional<FeatureId> road_id;
    Point coordinate;
    GapKind kind;
    std::string lane_type;
    std::string type;      // Display label, e.g. "CENTERLINE_GAP (centerline)"
    std::string color;     // Display hint for renderers

    Issue(const std::optional<FeatureId>& way, const std::optional<FeatureId>& road,
          const Point& coord, GapKind gap_kind, const std::string& normalized_lane_type);
};

// Validation thresholds
struct ValidationConfig {
    double snap_tolerance;      // Endpoints closer than this are coincident
    double strict_radius;       // Unsnapped endpoints closer than this to a compatible line are gaps
    bool use_spatial_index;     // Use R-trees instead of the quadratic scan

    ValidationConfig()
        : snap_tolerance(1e-7), strict_radius(1e-5), use_spatial_index(true) {}

    /**
     * Check that both thresholds are positive, finite and ordered
     * @throws ConfigurationError if they are not
     */
    void validate() const;
};

// R-tree value types
struct EndpointRTreeValue {
    Point location;
    size_t feature_index;   // Position in the group

    EndpointRTreeValue(const Point& pt, size_t feat_idx)
        : location(pt), feature_index(feat_idx) {}
};

struct LaneSegmentRTreeValue {
    Segment segment;
    size_t feature_index;   // Position in the group

    LaneSegmentRTreeValue(const Segment& seg, size_t feat_idx)
        : segment(seg), feature_index(feat_idx) {}
};

// Lane class and gap kind utilities
std::string laneClassToString(LaneClass lane_class);
std::string gapKindToString(GapKind kind);
std::string gapKindColor(GapKind kind);

/**
 * Check whether two lane classes may be continuity evidence for each other
 * Centerline x centerline, cycle family x cycle family and road x road are compatible
 */
bool areLaneClassesCompatible(LaneClass a, LaneClass b);

// Endpoint access; geometry must hold at least one point
const Point& getEndpoint(const LineString& geometry, EndpointSide side);

// Geometry Conversion Utilities for GeoJSON
nlohmann::json pointToGeoJSON(const Point& point);
Point geoJSONPointToBoost(const nlohmann::json& geometry);
LineString geoJSONLineStringToBoost(const nlohmann::json& geometry);

// GeoJSON Field Value Utilities

/**
 * Normalize a property to a lower-case token
 * Strings are lower-cased, numbers and booleans stringified
 * @return nullopt when the field is missing or JSON null
 */
std::optional<std::string> getFieldValueAsNormalizedString(const nlohmann::json& properties,
                                                          const std::string& field_name);

/**
 * Read an identifier property for pass-through
 * @return nullopt when the field is missing or JSON null
 */
std::optional<FeatureId> getFieldValueAsId(const nlohmann::json& properties,
                                          const std::string& field_name);

} // namespace network
} // namespace lanecheck

// Boost Geometry R-tree specializations
namespace boost { namespace geometry { namespace index {

template<>
struct indexable<lanecheck::network::EndpointRTreeValue> {
    using result_type = lanecheck::network::Point;
    result_type const& operator()(lanecheck::network::EndpointRTreeValue const& v) const {
        return v.location;
    }
};

template<>
struct indexable<lanecheck::network::LaneSegmentRTreeValue> {
    using result_type = lanecheck::network::Segment;
    result_type const& operator()(lanecheck::network::LaneSegmentRTreeValue const& v) const {
        return v.segment;
    }
};

}}} // namespace boost::geometry::index

#endif // LANECHECK_COMMON_HPP
