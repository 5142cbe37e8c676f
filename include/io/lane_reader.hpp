#ifndef LANECHECK_LANE_READER_HPP
#define LANECHECK_LANE_READER_HPP

#include <string>
#include <vector>
#include "network/common.hpp"
#include "io/geojson_reader.hpp"

namespace lanecheck {
namespace io {

// Lane reader configuration
struct LaneReaderConfig {
    std::string file_path;          // Input file path (GeoJSON)
    std::string lane_type_field;    // Field name for lane type
    std::string area_type_field;    // Field name for enclosing area type
    std::string way_id_field;       // Field name for way ID
    std::string road_id_field;      // Field name for road ID

    LaneReaderConfig()
        : lane_type_field("lane_type"), area_type_field("area_type"),
          way_id_field("way_id"), road_id_field("road_id") {}
};

class LaneReader {
public:
    explicit LaneReader(const LaneReaderConfig& config);
    ~LaneReader();

    // Disable copy constructor and assignment
    LaneReader(const LaneReader&) = delete;
    LaneReader& operator=(const LaneReader&) = delete;

    /**
     * Read lane features from the configured file
     * @return true if successful, false otherwise
     */
    bool read();

    /**
     * Read lane features from a GeoJSON string
     * @param geojson_string FeatureCollection as text
     * @return true if successful, false otherwise
     */
    bool readFromString(const std::string& geojson_string);

    /**
     * Get the number of lane features
     * @return Number of features
     */
    size_t getFeatureCount() const { return lanes_.size(); }

    /**
     * Get a lane feature by index
     * @param index Feature index
     * @return Lane feature
     */
    const network::LaneFeature& getLaneFeature(size_t index) const;

    const std::vector<network::LaneFeature>& getLaneFeatures() const { return lanes_; }

    /**
     * Get the coordinate system CRS string
     * @return Coordinate system CRS string (e.g., "EPSG:4326")
     */
    std::string getCoordinateSystemCRS() const { return coordinate_system_crs_; }

    void clearLanes();

private:
    LaneReaderConfig config_;
    std::vector<network::LaneFeature> lanes_;

    // Coordinate system information
    std::string coordinate_system_crs_;

    /**
     * Convert raw features into lane features, normalizing their properties
     * @param dataset GeoJSON dataset to process
     * @return true once the dataset is converted, including when it holds no lanes
     */
    bool readFeatures(const network::GeospatialDataset& dataset);
};

} // namespace io
} // namespace lanecheck

#endif // LANECHECK_LANE_READER_HPP
