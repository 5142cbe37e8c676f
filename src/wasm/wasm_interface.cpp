#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Define EMSCRIPTEN_KEEPALIVE if not already defined
#ifndef EMSCRIPTEN_KEEPALIVE
#define EMSCRIPTEN_KEEPALIVE
#endif

#include "wasm/wasm_interface.hpp"
#include "io/lane_reader.hpp"
#include "io/writer_issues.hpp"
#include "network/lane_integrity_checker.hpp"

using namespace lanecheck;

namespace wasm_interface {

// Helper function to parse LaneReaderConfig from JSON
io::LaneReaderConfig parseLaneReaderConfig(const nlohmann::json& config_json) {
    io::LaneReaderConfig config;

    if (config_json.contains("file_path")) {
        config.file_path = config_json["file_path"].get<std::string>();
    }
    if (config_json.contains("lane_type_field")) {
        config.lane_type_field = config_json["lane_type_field"].get<std::string>();
    }
    if (config_json.contains("area_type_field")) {
        config.area_type_field = config_json["area_type_field"].get<std::string>();
    }
    if (config_json.contains("way_id_field")) {
        config.way_id_field = config_json["way_id_field"].get<std::string>();
    }
    if (config_json.contains("road_id_field")) {
        config.road_id_field = config_json["road_id_field"].get<std::string>();
    }

    return config;
}

// Helper function to parse ValidationConfig from JSON
network::ValidationConfig parseValidationConfig(const nlohmann::json& config_json) {
    network::ValidationConfig config;

    if (config_json.contains("snap_tolerance")) {
        config.snap_tolerance = config_json["snap_tolerance"].get<double>();
    }
    if (config_json.contains("strict_radius")) {
        config.strict_radius = config_json["strict_radius"].get<double>();
    }
    if (config_json.contains("use_spatial_index")) {
        config.use_spatial_index = config_json["use_spatial_index"].get<bool>();
    }

    return config;
}

// Helper function to parse IssueWriterConfig from JSON
io::IssueWriterConfig parseIssueWriterConfig(const nlohmann::json& config_json) {
    io::IssueWriterConfig config;

    if (config_json.contains("output_file_path")) {
        config.output_file_path = config_json["output_file_path"].get<std::string>();
    }
    if (config_json.contains("crs")) {
        config.crs = config_json["crs"].get<std::string>();
    }

    return config;
}

// Lane Integrity Tool
EMSCRIPTEN_KEEPALIVE
std::string processLaneIntegrityTool(
    const std::string& writer_config_json,
    const std::string& lane_config_json,
    const std::string& validation_config_json) {

    try {
        // Parse configurations
        nlohmann::json writer_config = nlohmann::json::parse(writer_config_json);
        nlohmann::json lane_config = nlohmann::json::parse(lane_config_json);
        nlohmann::json validation_config = nlohmann::json::parse(validation_config_json);

        io::LaneReaderConfig lane_cfg = parseLaneReaderConfig(lane_config);
        network::ValidationConfig validation_cfg = parseValidationConfig(validation_config);

        // Thresholds are checked here, before the file is read
        network::LaneIntegrityChecker checker(validation_cfg);

        if (!checker.processLaneIntegrity(lane_cfg)) {
            return "Error: Failed to read lane features from " + lane_cfg.file_path;
        }

        const auto& issues = checker.getIssues();
        for (const auto& [type, count] : checker.getIssueCollector().countByType()) {
            std::cout << "  " << type << ": " << count << std::endl;
        }

        // Get CRS from the checker and add to writer config
        writer_config["crs"] = checker.getCoordinateSystemCRS();
        io::IssueWriterConfig writer_cfg = parseIssueWriterConfig(writer_config);

        io::IssueWriter writer;
        if (!writer.writeIssues(writer_cfg, issues)) {
            return "Error: Failed to write lane integrity issues: " + writer.getLastError();
        }

        return "Success: Lane integrity check completed with " + std::to_string(issues.size()) + " issues";

    } catch (const std::exception& e) {
        return "Error: " + std::string(e.what());
    }
}

} // namespace wasm_interface
