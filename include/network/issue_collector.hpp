#ifndef LANECHECK_ISSUE_COLLECTOR_HPP
#define LANECHECK_ISSUE_COLLECTOR_HPP

#include <map>
#include <string>
#include <vector>
#include "network/common.hpp"

namespace lanecheck {
namespace network {

/**
 * Accumulates detected issues in discovery order
 */
class IssueCollector {
public:
    IssueCollector() = default;
    ~IssueCollector() = default;

    void addIssue(const Issue& issue) { issues_.push_back(issue); }

    /**
     * Append the issues of one group pass
     * @param issues Issues in the order the detector reported them
     */
    void addIssues(const std::vector<Issue>& issues);

    const std::vector<Issue>& getIssues() const { return issues_; }

    size_t getIssueCount() const { return issues_.size(); }

    /**
     * Count issues per display label
     * @return Map of label (e.g. "BORDER_GAP (road)") to count
     */
    std::map<std::string, size_t> countByType() const;

    void clear() { issues_.clear(); }

private:
    std::vector<Issue> issues_;
};

} // namespace network
} // namespace lanecheck

#endif // LANECHECK_ISSUE_COLLECTOR_HPP
