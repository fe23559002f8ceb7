#pragma once

#include <archlens/graph.h>
#include <archlens/models.h>

#include <cstddef>
#include <map>
#include <string>

namespace archlens {

CouplingMetrics ComputeCoupling(const DependencyGraph &graph);

double Instability(std::size_t afferent, std::size_t efferent);

// 1 or 0 for a type; for a package the share of its contained types that
// are abstract, 0 when it contains none.
double Abstractness(const TypeNode &node);
double DistanceFromMainSequence(double abstractness, double instability);

// 0.7 * occurrences + 0.3 * distinct originating members.
double EdgeStrength(const Edge &edge);
StrengthClass ClassifyStrength(double strength,
                               const StrengthThresholds &thresholds);
StrengthClass ClassifyEdge(const Edge &edge,
                           const StrengthThresholds &thresholds);

GraphSummary SummarizeGraph(const DependencyGraph &graph);

// Superclass chain length per analyzed type. An external superclass counts
// as one level; the platform root never appears in the graph.
std::map<std::string, std::size_t>
InheritanceDepths(const DependencyGraph &graph);

} // namespace archlens
