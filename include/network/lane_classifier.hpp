#ifndef LANECHECK_LANE_CLASSIFIER_HPP
#define LANECHECK_LANE_CLASSIFIER_HPP

#include <vector>
#include "network/common.hpp"

namespace lanecheck {
namespace network {

// Features partitioned into the two validated groups
struct ClassifiedGroups {
    LaneGroup centerlines;
    LaneGroup borders;
};

/**
 * Partitions lane features into centerlines and unenclosed borders
 */
class LaneClassifier {
public:
    /**
     * Check whether a feature belongs to the centerline group
     * @param feature Lane feature with normalized properties
     * @return true if the lane type is "centerline"
     */
    static bool isCenterline(const LaneFeature& feature);

    /**
     * Check whether a feature belongs to the border group
     * @param feature Lane feature with normalized properties
     * @return true if the lane type is road, cycle or road_cycle and the feature is unenclosed
     */
    static bool isUnenclosedBorder(const LaneFeature& feature);

    /**
     * Check whether a normalized area type means "no enclosing area"
     * @param area_type Lower-cased area type, nullopt when missing
     * @return true if missing or one of "null", "none", ""
     */
    static bool isUnenclosed(const std::optional<std::string>& area_type);

    /**
     * Split features into centerline and border groups, keeping input order
     * Features matching neither predicate are left out
     * @param features All loaded lane features
     * @return Classified groups
     */
    static ClassifiedGroups classify(const std::vector<LaneFeature>& features);

private:
    // Disable instantiation
    LaneClassifier() = delete;
};

} // namespace network
} // namespace lanecheck

#endif // LANECHECK_LANE_CLASSIFIER_HPP
