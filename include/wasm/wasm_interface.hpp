#ifndef LANECHECK_WASM_INTERFACE_HPP
#define LANECHECK_WASM_INTERFACE_HPP

#include <string>

namespace wasm_interface {

/**
 * Lane Integrity Tool
 * Loads a lane map, detects centerline and border gaps and writes them as GeoJSON points
 * @param writer_config_json JSON string for writer configuration (output_file_path)
 * @param lane_config_json JSON string for lane reader configuration (file_path, *_field names)
 * @param validation_config_json JSON string for validation configuration (snap_tolerance, strict_radius, use_spatial_index)
 * @return Result message (success or error)
 */
std::string processLaneIntegrityTool(
    const std::string& writer_config_json,
    const std::string& lane_config_json,
    const std::string& validation_config_json
);

} // namespace wasm_interface

#endif // LANECHECK_WASM_INTERFACE_HPP
