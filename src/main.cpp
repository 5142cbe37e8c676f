#include <iostream>
#include <string>
#include <unordered_map>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "wasm/wasm_interface.hpp"

using namespace wasm_interface;


void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --lane-file-path <path> --output-file <path> [options]\n"
              << "\nRequired arguments:\n"
              << "  --lane-file-path <path>      Path to the lane map file (GeoJSON)\n"
              << "  --output-file <path>         Output GeoJSON file for detected issues\n"
              << "\nOptional arguments:\n"
              << "  --snap-tolerance <value>     Distance below which two endpoints are coincident (default: 1e-7)\n"
              << "  --strict-radius <value>      Distance within which an unsnapped endpoint is a gap (default: 1e-5)\n"
              << "  --lane-type-field <name>     Field name for lane type (default: lane_type)\n"
              << "  --area-type-field <name>     Field name for area type (default: area_type)\n"
              << "  --way-id-field <name>        Field name for way ID (default: way_id)\n"
              << "  --road-id-field <name>       Field name for road ID (default: road_id)\n"
              << "  --no-spatial-index           Use the linear scan instead of R-tree lookups\n"
              << "\nExamples:\n"
              << "  " << programName << " --lane-file-path lanes.geojson --output-file issues.geojson\n"
              << "  " << programName << " --lane-file-path lanes.geojson --output-file issues.geojson --snap-tolerance 1e-8 --strict-radius 2e-5\n"
              << "\nUse --help for detailed parameter explanations and examples.\n"
              << "Use --version to display version information.\n";
}

void printDetailedHelp(const char* programName) {
    std::cout << "LaneCheck - Lane Network Integrity Checker\n"
              << "==========================================\n\n"
              << "LaneCheck finds line endpoints of a lane map that should connect to another line\n"
              << "of the same class but do not.\n\n"
              << "CHECKS:\n\n"
              << "1. CENTERLINE GAPS (magenta)\n"
              << "   Features with lane_type 'centerline' are checked against each other.\n\n"
              << "2. BORDER GAPS (red)\n"
              << "   Features with lane_type 'road', 'cycle' or 'road_cycle' and no area_type are\n"
              << "   checked against each other. Road borders only continue road borders, cycle\n"
              << "   borders only continue cycle borders.\n\n"
              << "   An endpoint is fine when another feature of its group starts or ends within\n"
              << "   --snap-tolerance. Otherwise it is reported when a compatible line of another\n"
              << "   way passes within --strict-radius; if none does, it is a network boundary.\n\n"
              << "INPUT DATASET RECOMMENDATIONS:\n\n"
              << "  - GeoJSON FeatureCollection of LineString features\n"
              << "  - Thresholds are in the units of the data (degrees for EPSG:4326;\n"
              << "    the default strict radius of 1e-5 degrees is about 1 meter)\n"
              << "  - Lines need at least two coordinates\n\n"
              << "Example:\n"
              << "  " << programName << " --lane-file-path lanes.geojson --output-file issues.geojson\n\n"
              << "OTHER OPTIONS:\n"
              << "  --help, -h     Show this detailed help message\n"
              << "  --version, -v  Show version information\n";
}

std::unordered_map<std::string, std::string> parseArgs(int argc, char* argv[]) {
    std::unordered_map<std::string, std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h") {
            args["help"] = "true";
        } else if (arg == "-v") {
            args["version"] = "true";
        } else if (arg.substr(0, 2) == "--") {
            std::string key = arg.substr(2);

            // Values may be negative numbers or exponents, so only "--" starts a new option
            if (i + 1 < argc && std::string(argv[i + 1]).substr(0, 2) != "--") {
                args[key] = argv[i + 1];
                i++; // Skip the value in next iteration
            } else {
                // This is a flag argument - set it to "true"
                args[key] = "true";
            }
        }
    }

    return args;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto args = parseArgs(argc, argv);

        if (args.count("help") > 0) {
            printDetailedHelp(argv[0]);
            return 0;
        }

        if (args.count("version") > 0) {
            std::cout << "LaneCheck v1.0.0\n";
            std::cout << "Lane Network Integrity Checker\n";
            return 0;
        }

        if (args.count("lane-file-path") == 0) {
            std::cerr << "Error: --lane-file-path is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        if (args.count("output-file") == 0) {
            std::cerr << "Error: --output-file is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        // Convert arguments to JSON configurations
        nlohmann::json writer_config = nlohmann::json::object();
        writer_config["output_file_path"] = args.at("output-file");

        nlohmann::json lane_config = nlohmann::json::object();
        lane_config["file_path"] = args.at("lane-file-path");
        if (args.count("lane-type-field")) lane_config["lane_type_field"] = args.at("lane-type-field");
        if (args.count("area-type-field")) lane_config["area_type_field"] = args.at("area-type-field");
        if (args.count("way-id-field")) lane_config["way_id_field"] = args.at("way-id-field");
        if (args.count("road-id-field")) lane_config["road_id_field"] = args.at("road-id-field");

        nlohmann::json validation_config = nlohmann::json::object();
        if (args.count("snap-tolerance")) validation_config["snap_tolerance"] = std::stod(args.at("snap-tolerance"));
        if (args.count("strict-radius")) validation_config["strict_radius"] = std::stod(args.at("strict-radius"));
        if (args.count("no-spatial-index")) validation_config["use_spatial_index"] = false;

        std::string result = processLaneIntegrityTool(
            writer_config.dump(),
            lane_config.dump(),
            validation_config.dump()
        );

        std::cout << result << std::endl;

        // Check if result indicates an error
        if (result.substr(0, 5) == "Error") {
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
