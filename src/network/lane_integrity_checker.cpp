#include "network/lane_integrity_checker.hpp"
#include <iostream>

namespace lanecheck {
namespace network {

LaneIntegrityChecker::LaneIntegrityChecker(const ValidationConfig& config)
    : detector_(config) {
}

const std::vector<Issue>& LaneIntegrityChecker::checkLaneIntegrity(const std::vector<LaneFeature>& features) {
    collector_.clear();

    ClassifiedGroups groups = LaneClassifier::classify(features);

    // Both passes finish before anything is stored so a failing group leaves no partial result
    std::vector<Issue> centerline_issues = detector_.detectGaps(groups.centerlines, GapKind::CENTERLINE_GAP);
    std::vector<Issue> border_issues = detector_.detectGaps(groups.borders, GapKind::BORDER_GAP);

    collector_.addIssues(centerline_issues);
    collector_.addIssues(border_issues);

    std::cout << "Number of issues detected: " << collector_.getIssueCount() << std::endl;

    return collector_.getIssues();
}

bool LaneIntegrityChecker::processLaneIntegrity(const io::LaneReaderConfig& reader_config) {
    collector_.clear();

    io::LaneReader reader(reader_config);
    if (!reader.read()) {
        std::cerr << "Error: Failed to read lane features from " << reader_config.file_path << std::endl;
        return false;
    }

    coordinate_system_crs_ = reader.getCoordinateSystemCRS();

    checkLaneIntegrity(reader.getLaneFeatures());
    return true;
}

} // namespace network
} // namespace lanecheck
