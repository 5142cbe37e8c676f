#include "network/common.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace lanecheck {
namespace network {

// Geometry Conversion Utilities for GeoJSON
nlohmann::json pointToGeoJSON(const Point& point) {
    nlohmann::json geometry;
    geometry["type"] = "Point";
    geometry["coordinates"] = {bg::get<0>(point), bg::get<1>(point)};
    return geometry;
}

// GeoJSON to Boost Geometry Conversion Utilities
Point geoJSONPointToBoost(const nlohmann::json& geometry) {
    if (!geometry.is_object() || !geometry.contains("type") || !geometry.contains("coordinates")) {
        throw std::runtime_error("Geometry must have type and coordinates members");
    }

    if (geometry["type"] == "Point") {
        const auto& coords = geometry["coordinates"];
        if (coords.size() >= 2) {
            return Point(coords[0].get<double>(), coords[1].get<double>());
        } else {
            throw std::runtime_error("Point geometry has fewer than 2 coordinate values");
        }
    } else {
        throw std::runtime_error("Invalid geometry type for point conversion: " + geometry["type"].dump());
    }
}

LineString geoJSONLineStringToBoost(const nlohmann::json& geometry) {
    // Every position is kept, even for lines too short to validate; the detector rejects those
    auto readPositions = [](const nlohmann::json& coords) {
        LineString linestring;
        for (const auto& coord : coords) {
            if (!coord.is_array() || coord.size() < 2) {
                throw std::runtime_error("Position " + std::to_string(linestring.size()) +
                                         " has fewer than 2 coordinate values");
            }
            linestring.push_back(Point(coord[0].get<double>(), coord[1].get<double>()));
        }
        return linestring;
    };

    if (!geometry.is_object() || !geometry.contains("type") || !geometry.contains("coordinates")) {
        throw std::runtime_error("Geometry must have type and coordinates members");
    }

    if (geometry["type"] == "LineString") {
        return readPositions(geometry["coordinates"]);
    } else if (geometry["type"] == "MultiLineString") {
        const auto& coords = geometry["coordinates"];
        if (coords.size() > 1) {
            std::cerr << "Warning: MultiLineString geometry contains " << coords.size()
                      << " linestrings, using only the first linestring" << std::endl;
        }
        if (coords.size() > 0) {
            return readPositions(coords[0]);
        } else {
            return LineString();
        }
    } else if (geometry["type"] == "Point") {
        LineString linestring;
        linestring.push_back(geoJSONPointToBoost(geometry));
        return linestring;
    } else {
        throw std::runtime_error("Invalid geometry type for linestring conversion: " + geometry["type"].dump());
    }
}

// GeoJSON Field Value Utilities
std::optional<std::string> getFieldValueAsNormalizedString(const nlohmann::json& properties,
                                                          const std::string& field_name) {
    if (field_name.empty() || !properties.is_object() || !properties.contains(field_name)) {
        return std::nullopt;
    }

    const auto& value = properties[field_name];

    std::string token;
    if (value.is_null()) {
        return std::nullopt;
    } else if (value.is_string()) {
        token = value.get<std::string>();
    } else if (value.is_boolean()) {
        token = value.get<bool>() ? "true" : "false";
    } else {
        token = value.dump();
    }

    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return token;
}

std::optional<FeatureId> getFieldValueAsId(const nlohmann::json& properties,
                                          const std::string& field_name) {
    if (field_name.empty() || !properties.is_object() || !properties.contains(field_name)) {
        return std::nullopt;
    }

    const auto& value = properties[field_name];
    if (value.is_null()) {
        return std::nullopt;
    }

    return std::optional<FeatureId>(std::in_place, value);
}

} // namespace network
} // namespace lanecheck
