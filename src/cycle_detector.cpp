#include <archlens/cycle_detector.h>

#include <archlens/coupling_metrics.h>

#include <algorithm>
#include <limits>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace archlens {
namespace {

constexpr std::size_t kUnvisited = std::numeric_limits<std::size_t>::max();

struct IndexedGraph {
  std::vector<std::string> names;
  std::vector<std::vector<std::size_t>> successors;
};

IndexedGraph IndexGraph(const DependencyGraph &graph) {
  IndexedGraph indexed;
  std::unordered_map<std::string, std::size_t> positions;
  indexed.names.reserve(graph.Nodes().size());
  for (const auto &[name, node] : graph.Nodes()) {
    positions.emplace(name, indexed.names.size());
    indexed.names.push_back(name);
  }
  indexed.successors.resize(indexed.names.size());
  for (std::size_t i = 0; i < indexed.names.size(); ++i) {
    for (const auto &target : graph.Successors(indexed.names[i])) {
      indexed.successors[i].push_back(positions.at(target));
    }
  }
  return indexed;
}

// Tarjan with an explicit call stack of (node, next successor) frames.
std::vector<std::vector<std::size_t>> Tarjan(const IndexedGraph &graph) {
  const auto count = graph.names.size();
  std::vector<std::size_t> index(count, kUnvisited);
  std::vector<std::size_t> lowlink(count, 0);
  std::vector<bool> on_stack(count, false);
  std::vector<std::size_t> stack;
  std::vector<std::pair<std::size_t, std::size_t>> frames;
  std::vector<std::vector<std::size_t>> components;
  std::size_t next_index = 0;

  for (std::size_t root = 0; root < count; ++root) {
    if (index[root] != kUnvisited) {
      continue;
    }
    index[root] = lowlink[root] = next_index++;
    stack.push_back(root);
    on_stack[root] = true;
    frames.emplace_back(root, 0);

    while (!frames.empty()) {
      const auto node = frames.back().first;
      auto &cursor = frames.back().second;
      if (cursor < graph.successors[node].size()) {
        const auto next = graph.successors[node][cursor++];
        if (index[next] == kUnvisited) {
          index[next] = lowlink[next] = next_index++;
          stack.push_back(next);
          on_stack[next] = true;
          frames.emplace_back(next, 0);
        } else if (on_stack[next]) {
          lowlink[node] = std::min(lowlink[node], index[next]);
        }
        continue;
      }

      frames.pop_back();
      if (lowlink[node] == index[node]) {
        std::vector<std::size_t> component;
        std::size_t member = kUnvisited;
        do {
          member = stack.back();
          stack.pop_back();
          on_stack[member] = false;
          component.push_back(member);
        } while (member != node);
        if (component.size() > 1) {
          std::sort(component.begin(), component.end());
          components.push_back(std::move(component));
        }
      }
      if (!frames.empty()) {
        const auto parent = frames.back().first;
        lowlink[parent] = std::min(lowlink[parent], lowlink[node]);
      }
    }
  }

  std::sort(components.begin(), components.end());
  return components;
}

// Shortest path from -> to inside the component, excluding from.
std::vector<std::size_t>
ShortestPath(const IndexedGraph &graph, std::size_t from, std::size_t to,
             const std::unordered_set<std::size_t> &component) {
  std::unordered_map<std::size_t, std::size_t> parent;
  std::queue<std::size_t> frontier;
  parent.emplace(from, from);
  frontier.push(from);
  while (!frontier.empty() && parent.count(to) == 0) {
    const auto current = frontier.front();
    frontier.pop();
    for (const auto next : graph.successors[current]) {
      if (component.count(next) != 0 && parent.emplace(next, current).second) {
        frontier.push(next);
      }
    }
  }

  std::vector<std::size_t> path;
  if (parent.count(to) == 0) {
    return path;
  }
  for (auto node = to; node != from; node = parent.at(node)) {
    path.push_back(node);
  }
  std::reverse(path.begin(), path.end());
  return path;
}

// Closed walk through every member, starting at the smallest one.
std::vector<std::size_t> ClosedWalk(const IndexedGraph &graph,
                                    const std::vector<std::size_t> &members) {
  const std::unordered_set<std::size_t> component(members.begin(),
                                                  members.end());
  const auto start = members.front();
  std::vector<std::size_t> walk{start};
  std::unordered_set<std::size_t> visited{start};
  auto current = start;
  for (const auto member : members) {
    if (visited.count(member) != 0) {
      continue;
    }
    for (const auto step : ShortestPath(graph, current, member, component)) {
      walk.push_back(step);
      visited.insert(step);
    }
    current = member;
  }
  auto back = ShortestPath(graph, current, start, component);
  if (!back.empty()) {
    back.pop_back();
  }
  walk.insert(walk.end(), back.begin(), back.end());
  return walk;
}

const Edge *StrongestEdge(const DependencyGraph &graph,
                          const std::string &source,
                          const std::string &target) {
  const Edge *strongest = nullptr;
  for (const auto *edge : graph.OutgoingEdges(source)) {
    if (edge->target != target) {
      continue;
    }
    if (strongest == nullptr || EdgeStrength(*edge) > EdgeStrength(*strongest)) {
      strongest = edge;
    }
  }
  return strongest;
}

std::vector<std::string> Suggestions(const Cycle &cycle,
                                     Granularity granularity) {
  std::vector<std::string> suggestions;
  const Edge *weakest = nullptr;
  for (const auto &edge : cycle.closing_edges) {
    if (weakest == nullptr || EdgeStrength(edge) < EdgeStrength(*weakest)) {
      weakest = &edge;
    }
  }
  if (weakest != nullptr) {
    suggestions.push_back("Cut the weakest link " + weakest->source + " -> " +
                          weakest->target + " (" +
                          EdgeKindName(weakest->kind) + ", " +
                          std::to_string(weakest->occurrence_count) +
                          " occurrences)");
  }
  if (granularity == Granularity::kPackage) {
    suggestions.push_back(
        "Extract common functionality to a shared package");
    suggestions.push_back(
        "Invert one dependency so both packages depend on an abstraction");
  } else {
    suggestions.push_back("Extract a common interface or abstract class");
    suggestions.push_back("Refactor to eliminate bidirectional references");
  }
  return suggestions;
}

} // namespace

std::vector<std::vector<std::string>>
StronglyConnectedComponents(const DependencyGraph &graph) {
  const auto indexed = IndexGraph(graph);
  std::vector<std::vector<std::string>> components;
  for (const auto &component : Tarjan(indexed)) {
    std::vector<std::string> names;
    names.reserve(component.size());
    for (const auto node : component) {
      names.push_back(indexed.names[node]);
    }
    components.push_back(std::move(names));
  }
  return components;
}

Severity ClassifyCycleSeverity(std::size_t strong_edges,
                               std::size_t total_occurrences) {
  if (strong_edges > 3 || total_occurrences > 100) {
    return Severity::kHigh;
  }
  if (strong_edges > 1 || total_occurrences > 50) {
    return Severity::kMedium;
  }
  return Severity::kLow;
}

CycleDetector::CycleDetector(StrengthThresholds thresholds)
    : thresholds_(thresholds) {}

std::vector<Cycle> CycleDetector::FindCycles(const DependencyGraph &graph) const {
  const auto indexed = IndexGraph(graph);
  std::vector<Cycle> cycles;
  for (const auto &component : Tarjan(indexed)) {
    Cycle cycle;
    for (const auto node : component) {
      cycle.members.push_back(indexed.names[node]);
    }
    for (const auto node : ClosedWalk(indexed, component)) {
      cycle.nodes.push_back(indexed.names[node]);
    }

    for (std::size_t i = 0; i < cycle.nodes.size(); ++i) {
      const auto &from = cycle.nodes[i];
      const auto &to = cycle.nodes[(i + 1) % cycle.nodes.size()];
      if (const auto *edge = StrongestEdge(graph, from, to)) {
        cycle.closing_edges.push_back(*edge);
      }
    }

    const std::unordered_set<std::string> members(cycle.members.begin(),
                                                  cycle.members.end());
    for (const auto &name : cycle.members) {
      for (const auto *edge : graph.OutgoingEdges(name)) {
        if (edge->target_external || members.count(edge->target) == 0) {
          continue;
        }
        cycle.total_occurrences += edge->occurrence_count;
        if (ClassifyEdge(*edge, thresholds_) == StrengthClass::kStrong) {
          ++cycle.strong_edges;
        }
      }
    }
    cycle.severity =
        ClassifyCycleSeverity(cycle.strong_edges, cycle.total_occurrences);
    cycle.suggestions = Suggestions(cycle, graph.granularity());
    cycles.push_back(std::move(cycle));
  }
  return cycles;
}

} // namespace archlens
