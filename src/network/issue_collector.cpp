#include "network/issue_collector.hpp"

namespace lanecheck {
namespace network {

void IssueCollector::addIssues(const std::vector<Issue>& issues) {
    issues_.insert(issues_.end(), issues.begin(), issues.end());
}

std::map<std::string, size_t> IssueCollector::countByType() const {
    std::map<std::string, size_t> counts;
    for (const auto& issue : issues_) {
        counts[issue.type]++;
    }
    return counts;
}

} // namespace network
} // namespace lanecheck
