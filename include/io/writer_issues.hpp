#ifndef LANECHECK_WRITER_ISSUES_HPP
#define LANECHECK_WRITER_ISSUES_HPP

#include <string>
#include <vector>
#include "network/common.hpp"
#include <nlohmann/json.hpp>

namespace lanecheck {
namespace io {

/**
 * Configuration for issue output writer
 */
struct IssueWriterConfig {
    std::string output_file_path;     // Output file path (GeoJSON)
    std::string crs;                  // Coordinate reference system of the input (e.g., "EPSG:4326")

    IssueWriterConfig() = default;
};

/**
 * Writes detected lane gaps as GeoJSON point features for renderers and reports
 */
class IssueWriter {
public:
    IssueWriter() = default;
    ~IssueWriter() = default;

    // Disable copy constructor and assignment
    IssueWriter(const IssueWriter&) = delete;
    IssueWriter& operator=(const IssueWriter&) = delete;

    /**
     * Write issues to the configured output file, creating parent directories
     * @param config Writer configuration
     * @param issues Issues in discovery order
     * @return true if successful, false otherwise
     */
    bool writeIssues(const IssueWriterConfig& config, const std::vector<network::Issue>& issues);

    /**
     * Build the FeatureCollection that writeIssues stores
     * @param config Writer configuration (only the CRS is used)
     * @param issues Issues in discovery order
     * @return GeoJSON FeatureCollection with one point feature per issue
     */
    nlohmann::json issuesToGeoJSON(const IssueWriterConfig& config,
                                   const std::vector<network::Issue>& issues) const;

    std::string getLastError() const { return last_error_; }

    void clearError() { last_error_.clear(); }

private:
    std::string last_error_;

    /**
     * Convert an issue to a GeoJSON feature
     * @param issue Detected issue
     * @param feature_id Feature ID
     * @return GeoJSON feature
     */
    nlohmann::json issueToGeoJSONFeature(const network::Issue& issue, size_t feature_id) const;
};

} // namespace io
} // namespace lanecheck

#endif // LANECHECK_WRITER_ISSUES_HPP
