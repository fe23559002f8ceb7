#include <archlens/coupling_metrics.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <vector>

namespace archlens {

double Instability(std::size_t afferent, std::size_t efferent) {
  const auto total = afferent + efferent;
  if (total == 0) {
    return 0.0;
  }
  const auto value =
      static_cast<double>(efferent) / static_cast<double>(total);
  return std::clamp(value, 0.0, 1.0);
}

double Abstractness(const TypeNode &node) {
  if (node.kind != NodeKind::kPackage) {
    return IsAbstractType(node) ? 1.0 : 0.0;
  }
  if (node.contained_types == 0) {
    return 0.0;
  }
  return static_cast<double>(node.abstract_types) /
         static_cast<double>(node.contained_types);
}

double DistanceFromMainSequence(double abstractness, double instability) {
  return std::abs(abstractness + instability - 1.0);
}

CouplingMetrics ComputeCoupling(const DependencyGraph &graph) {
  CouplingMetrics metrics;
  for (const auto &[name, node] : graph.Nodes()) {
    std::set<std::string> targets;
    for (const auto *edge : graph.OutgoingEdges(name)) {
      targets.insert(edge->target);
    }
    std::set<std::string> sources;
    for (const auto *edge : graph.IncomingEdges(name)) {
      sources.insert(edge->source);
    }

    CouplingRecord record;
    record.node = name;
    record.afferent = sources.size();
    record.efferent = targets.size();
    record.instability = Instability(record.afferent, record.efferent);
    record.abstractness = Abstractness(node);
    record.distance =
        DistanceFromMainSequence(record.abstractness, record.instability);
    metrics.emplace(name, std::move(record));
  }
  return metrics;
}

double EdgeStrength(const Edge &edge) {
  return 0.7 * static_cast<double>(edge.occurrence_count) +
         0.3 * static_cast<double>(edge.originating_members.size());
}

StrengthClass ClassifyStrength(double strength,
                               const StrengthThresholds &thresholds) {
  if (strength > thresholds.strong) {
    return StrengthClass::kStrong;
  }
  if (strength < thresholds.moderate) {
    return StrengthClass::kWeak;
  }
  return StrengthClass::kModerate;
}

StrengthClass ClassifyEdge(const Edge &edge,
                           const StrengthThresholds &thresholds) {
  return ClassifyStrength(EdgeStrength(edge), thresholds);
}

GraphSummary SummarizeGraph(const DependencyGraph &graph) {
  GraphSummary summary;
  summary.node_count = graph.Nodes().size();
  summary.edge_count = graph.Edges().size();
  for (const auto &[name, node] : graph.Nodes()) {
    if (node.partial) {
      ++summary.partial_node_count;
    }
  }
  for (const auto &edge : graph.Edges()) {
    if (edge.target_external) {
      ++summary.external_edge_count;
    }
    auto kind = EdgeKindName(edge.kind);
    if (edge.kind == EdgeKind::kUsage) {
      kind += ":" + UsageKindName(edge.usage);
    }
    ++summary.edges_by_kind[kind];
  }
  if (summary.node_count > 0) {
    const auto nodes = static_cast<double>(summary.node_count);
    const auto edges = static_cast<double>(summary.edge_count);
    summary.average_degree = edges / nodes;
    if (summary.node_count > 1) {
      summary.density = edges / (nodes * (nodes - 1.0));
    }
  }
  return summary;
}

std::map<std::string, std::size_t>
InheritanceDepths(const DependencyGraph &graph) {
  std::map<std::string, std::string> superclass;
  std::map<std::string, std::size_t> depths;
  for (const auto &[name, node] : graph.Nodes()) {
    for (const auto *edge : graph.OutgoingEdges(name)) {
      if (edge->kind == EdgeKind::kInheritance && !edge->is_interface) {
        superclass[name] = edge->target;
      }
    }
  }

  for (const auto &[name, node] : graph.Nodes()) {
    std::vector<std::string> chain;
    std::set<std::string> seen;
    std::string current = name;
    std::size_t base = 0;
    while (true) {
      if (const auto known = depths.find(current); known != depths.end()) {
        base = known->second + 1;
        break;
      }
      // A malformed input can declare an inheritance loop; stop there.
      if (!seen.insert(current).second) {
        break;
      }
      chain.push_back(current);
      const auto parent = superclass.find(current);
      if (parent == superclass.end()) {
        break;
      }
      if (!graph.HasNode(parent->second)) {
        base = 1;
        break;
      }
      current = parent->second;
    }
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
      if (depths.count(*it) == 0) {
        depths[*it] = base;
      }
      ++base;
    }
  }
  return depths;
}

} // namespace archlens
