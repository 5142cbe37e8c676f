#include "io/geojson_reader.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <optional>

namespace lanecheck {
namespace io {

std::string GeoJSONReader::last_error_ = "";

network::GeospatialDataset GeoJSONReader::readFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        setError("Failed to open file: " + filepath);
        throw std::runtime_error(last_error_);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    try {
        return readFromString(buffer.str());
    } catch (const std::exception& e) {
        setError("Error reading file " + filepath + ": " + e.what());
        throw std::runtime_error(last_error_);
    }
}

network::GeospatialDataset GeoJSONReader::readFromString(const std::string& geojson_string) {
    nlohmann::json geojson;
    try {
        geojson = nlohmann::json::parse(geojson_string);
    } catch (const nlohmann::json::parse_error& e) {
        setError("JSON parse error: " + std::string(e.what()));
        throw std::runtime_error(last_error_);
    }

    // Validate that this is a FeatureCollection
    if (!geojson.is_object() || !geojson.contains("type") || geojson["type"] != "FeatureCollection") {
        setError("Invalid GeoJSON: Expected FeatureCollection type");
        throw std::runtime_error(last_error_);
    }

    // Thresholds are expressed in the data's own units, so geographic CRS are accepted as-is
    std::string crs = parseCRS(geojson);

    std::vector<network::GeospatialFeature> features;
    if (geojson.contains("features") && geojson["features"].is_array()) {
        size_t featureIndex = 0;
        for (const auto& feature_json : geojson["features"]) {
            try {
                auto feature = parseFeature(feature_json, featureIndex);
                if (feature.has_value()) {
                    features.push_back(feature.value());
                }
                featureIndex++;
            } catch (const std::exception& e) {
                setError("Error parsing feature " + std::to_string(featureIndex) + ": " + e.what());
                throw std::runtime_error(last_error_);
            }
        }
    }

    // An empty collection is a valid map with nothing to check
    if (features.empty()) {
        std::cerr << "Warning: No features with geometry found in GeoJSON" << std::endl;
    }

    return network::GeospatialDataset(crs, features);
}

std::string GeoJSONReader::parseCRS(const nlohmann::json& geojson) {
    if (geojson.contains("crs") && geojson["crs"].is_object()) {
        const auto& crs_obj = geojson["crs"];

        // Handle standard GeoJSON CRS format: {"type": "name", "properties": {"name": "EPSG:4326"}}
        if (crs_obj.contains("type") && crs_obj["type"] == "name" &&
            crs_obj.contains("properties") && crs_obj["properties"].is_object() &&
            crs_obj["properties"].contains("name") && crs_obj["properties"]["name"].is_string()) {
            return crs_obj["properties"]["name"].get<std::string>();
        }

        // Handle legacy CRS format: {"type": "EPSG", "properties": {"code": 4326}}
        if (crs_obj.contains("type") && crs_obj["type"] == "EPSG" &&
            crs_obj.contains("properties") && crs_obj["properties"].is_object() &&
            crs_obj["properties"].contains("code") && crs_obj["properties"]["code"].is_number_integer()) {
            int code = crs_obj["properties"]["code"].get<int>();
            return "EPSG:" + std::to_string(code);
        }
    }

    // No CRS found, return empty string
    return "";
}

std::optional<network::GeospatialFeature> GeoJSONReader::parseFeature(const nlohmann::json& feature_json, size_t id) {
    // Validate feature structure
    if (!feature_json.is_object() || !feature_json.contains("type") || feature_json["type"] != "Feature") {
        throw std::runtime_error("Invalid feature: Expected Feature type");
    }

    // Check if geometry is present - if not, return nullopt
    if (!feature_json.contains("geometry") || feature_json["geometry"].is_null()) {
        return std::nullopt;
    }

    nlohmann::json geometry = feature_json["geometry"];

    // Extract properties - if not present or null, use empty object
    nlohmann::json properties = nlohmann::json::object();
    if (feature_json.contains("properties") && feature_json["properties"].is_object()) {
        properties = feature_json["properties"];
    }

    return network::GeospatialFeature(id, geometry, properties);
}

} // namespace io
} // namespace lanecheck
