#include "network/lane_classifier.hpp"
#include <iostream>

namespace lanecheck {
namespace network {

bool LaneClassifier::isCenterline(const LaneFeature& feature) {
    return feature.lane_type == "centerline";
}

bool LaneClassifier::isUnenclosedBorder(const LaneFeature& feature) {
    // Exact type match; other cycle-like types are not borders
    const bool is_border_type = feature.lane_type == "road" ||
                                feature.lane_type == "cycle" ||
                                feature.lane_type == "road_cycle";
    return is_border_type && isUnenclosed(feature.area_type);
}

bool LaneClassifier::isUnenclosed(const std::optional<std::string>& area_type) {
    if (!area_type) {
        return true;
    }
    return *area_type == "null" || *area_type == "none" || area_type->empty();
}

ClassifiedGroups LaneClassifier::classify(const std::vector<LaneFeature>& features) {
    ClassifiedGroups groups;

    for (const auto& feature : features) {
        if (isCenterline(feature)) {
            groups.centerlines.push_back(feature);
        } else if (isUnenclosedBorder(feature)) {
            groups.borders.push_back(feature);
        }
    }

    std::cout << "Classified " << groups.centerlines.size() << " centerlines and "
              << groups.borders.size() << " unenclosed borders out of "
              << features.size() << " lane features" << std::endl;

    return groups;
}

} // namespace network
} // namespace lanecheck
