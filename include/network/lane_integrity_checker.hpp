#ifndef LANECHECK_LANE_INTEGRITY_CHECKER_HPP
#define LANECHECK_LANE_INTEGRITY_CHECKER_HPP

#include <string>
#include <vector>
#include "network/common.hpp"
#include "network/lane_classifier.hpp"
#include "network/gap_detector.hpp"
#include "network/issue_collector.hpp"
#include "io/lane_reader.hpp"

namespace lanecheck {
namespace network {

/**
 * Runs one validation pass: classification, centerline gaps, then border gaps
 */
class LaneIntegrityChecker {
public:
    /**
     * @param config Validation thresholds
     * @throws ConfigurationError before any scan if the thresholds are invalid
     */
    explicit LaneIntegrityChecker(const ValidationConfig& config);
    ~LaneIntegrityChecker() = default;

    // Disable copy constructor and assignment
    LaneIntegrityChecker(const LaneIntegrityChecker&) = delete;
    LaneIntegrityChecker& operator=(const LaneIntegrityChecker&) = delete;

    /**
     * Validate an in-memory feature collection
     * Previous results are discarded.
     * @param features All lane features of one snapshot
     * @return Issues, centerline pass first
     * @throws MalformedGeometryError if a validated feature has fewer than 2 points; no issues are kept
     */
    const std::vector<Issue>& checkLaneIntegrity(const std::vector<LaneFeature>& features);

    /**
     * Load a lane file and validate it
     * @param reader_config Lane reader configuration
     * @return true if the file was read and validated, false if reading failed
     * @throws MalformedGeometryError as checkLaneIntegrity
     */
    bool processLaneIntegrity(const io::LaneReaderConfig& reader_config);

    const std::vector<Issue>& getIssues() const { return collector_.getIssues(); }

    const IssueCollector& getIssueCollector() const { return collector_; }

    /**
     * Get the coordinate system of the last file processed
     * @return CRS string or empty string if unknown
     */
    std::string getCoordinateSystemCRS() const { return coordinate_system_crs_; }

private:
    GapDetector detector_;
    IssueCollector collector_;
    std::string coordinate_system_crs_;
};

} // namespace network
} // namespace lanecheck

#endif // LANECHECK_LANE_INTEGRITY_CHECKER_HPP
