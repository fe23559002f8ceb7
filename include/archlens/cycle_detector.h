#pragma once

#include <archlens/graph.h>
#include <archlens/models.h>

#include <string>
#include <vector>

namespace archlens {

// Strongly connected components of more than one node, each sorted by name,
// ordered by their first member. Uses an explicit stack instead of recursion.
std::vector<std::vector<std::string>>
StronglyConnectedComponents(const DependencyGraph &graph);

Severity ClassifyCycleSeverity(std::size_t strong_edges,
                               std::size_t total_occurrences);

class CycleDetector {
public:
  explicit CycleDetector(StrengthThresholds thresholds = {});

  std::vector<Cycle> FindCycles(const DependencyGraph &graph) const;

private:
  StrengthThresholds thresholds_;
};

} // namespace archlens
