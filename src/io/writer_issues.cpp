#include "io/writer_issues.hpp"
#include <fstream>
#include <iostream>
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

namespace lanecheck {
namespace io {

bool IssueWriter::writeIssues(const IssueWriterConfig& config, const std::vector<network::Issue>& issues) {
    clearError();

    if (config.output_file_path.empty()) {
        last_error_ = "Output file path is empty";
        return false;
    }

    // Create the output directory if needed
    fs::path output_path(config.output_file_path);
    if (output_path.has_parent_path()) {
        boost::system::error_code ec;
        fs::create_directories(output_path.parent_path(), ec);
        if (ec) {
            last_error_ = "Failed to create output directory " + output_path.parent_path().string() +
                          ": " + ec.message();
            return false;
        }
    }

    nlohmann::json geojson = issuesToGeoJSON(config, issues);

    std::ofstream file(config.output_file_path);
    if (!file.is_open()) {
        last_error_ = "Failed to open file for writing: " + config.output_file_path;
        return false;
    }

    file << geojson.dump(2);
    if (!file) {
        last_error_ = "Failed to write file: " + config.output_file_path;
        return false;
    }

    std::cout << "Wrote " << issues.size() << " issues to " << config.output_file_path << std::endl;
    return true;
}

nlohmann::json IssueWriter::issuesToGeoJSON(const IssueWriterConfig& config,
                                            const std::vector<network::Issue>& issues) const {
    nlohmann::json geojson;
    geojson["type"] = "FeatureCollection";

    // Standard GeoJSON CRS format: {"type": "name", "properties": {"name": "EPSG:4326"}}
    if (!config.crs.empty()) {
        geojson["crs"]["type"] = "name";
        geojson["crs"]["properties"]["name"] = config.crs;
    }

    nlohmann::json features = nlohmann::json::array();
    for (size_t i = 0; i < issues.size(); ++i) {
        features.push_back(issueToGeoJSONFeature(issues[i], i));
    }
    geojson["features"] = features;

    return geojson;
}

nlohmann::json IssueWriter::issueToGeoJSONFeature(const network::Issue& issue, size_t feature_id) const {
    nlohmann::json properties = nlohmann::json::object();

    // Identifiers keep their input JSON type; absent ones are written as null
    properties["id"] = feature_id;
    properties["way_id"] = issue.way_id ? *issue.way_id : nlohmann::json(nullptr);
    properties["road_id"] = issue.road_id ? *issue.road_id : nlohmann::json(nullptr);
    properties["type"] = issue.type;
    properties["kind"] = network::gapKindToString(issue.kind);
    properties["lane_type"] = issue.lane_type;
    properties["color"] = issue.color;

    nlohmann::json feature;
    feature["type"] = "Feature";
    feature["geometry"] = network::pointToGeoJSON(issue.coordinate);
    feature["properties"] = properties;
    return feature;
}

} // namespace io
} // namespace lanecheck
