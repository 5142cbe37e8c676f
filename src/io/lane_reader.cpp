#include "io/lane_reader.hpp"
#include "io/geojson_reader.hpp"
#include "network/common.hpp"
#include <stdexcept>
#include <iostream>

namespace lanecheck {
namespace io {

LaneReader::LaneReader(const LaneReaderConfig& config)
    : config_(config) {
}

LaneReader::~LaneReader() = default;

bool LaneReader::read() {
    lanes_.clear();

    try {
        network::GeospatialDataset dataset = GeoJSONReader::readFromFile(config_.file_path);
        return readFeatures(dataset);

    } catch (const std::exception& e) {
        std::cerr << "Failed to read lane file: " << config_.file_path << std::endl;
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

bool LaneReader::readFromString(const std::string& geojson_string) {
    lanes_.clear();

    try {
        network::GeospatialDataset dataset = GeoJSONReader::readFromString(geojson_string);
        return readFeatures(dataset);

    } catch (const std::exception& e) {
        std::cerr << "Failed to read lane data: " << e.what() << std::endl;
        return false;
    }
}

bool LaneReader::readFeatures(const network::GeospatialDataset& dataset) {
    lanes_.clear();

    coordinate_system_crs_ = dataset.crs;

    std::cout << "Lane dataset coordinate system: "
              << (coordinate_system_crs_.empty() ? "Unknown" : coordinate_system_crs_) << std::endl;
    std::cout << "Lane feature count: " << dataset.features.size() << std::endl;

    for (const auto& feature : dataset.features) {
        network::LineString linestring;
        try {
            linestring = network::geoJSONLineStringToBoost(feature.geometry);
        } catch (const std::exception& e) {
            std::cerr << "Warning: Skipping feature " << feature.id << ": " << e.what() << std::endl;
            continue;
        }

        auto lane_type = network::getFieldValueAsNormalizedString(feature.properties, config_.lane_type_field);
        auto area_type = network::getFieldValueAsNormalizedString(feature.properties, config_.area_type_field);

        // A missing lane type matches none of the recognized families
        lanes_.emplace_back(lanes_.size(), linestring,
                            network::getFieldValueAsId(feature.properties, config_.way_id_field),
                            network::getFieldValueAsId(feature.properties, config_.road_id_field),
                            lane_type.value_or("none"),
                            area_type);
    }

    if (lanes_.empty()) {
        std::cerr << "Warning: No valid lane features found in dataset" << std::endl;
    }

    std::cout << "Successfully read " << lanes_.size() << " lane features" << std::endl;

    return true;
}

const network::LaneFeature& LaneReader::getLaneFeature(size_t index) const {
    if (index >= lanes_.size()) {
        throw std::out_of_range("Lane feature index out of range");
    }
    return lanes_[index];
}

void LaneReader::clearLanes() {
    lanes_.clear();
    std::cout << "Cleared lane data" << std::endl;
}

} // namespace io
} // namespace lanecheck
