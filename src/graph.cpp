#include <archlens/graph.h>

#include <archlens/errors.h>
#include <archlens/symbol_table.h>

#include <algorithm>
#include <utility>

namespace archlens {

DependencyGraph::DependencyGraph(Granularity granularity)
    : granularity_(granularity) {}

DependencyGraph::EdgeKey DependencyGraph::KeyOf(const Edge &edge) {
  return EdgeKey{edge.source, edge.target,       edge.kind,
                 edge.usage,  edge.is_interface, edge.member};
}

void DependencyGraph::AddNode(TypeNode node) {
  if (node.name.empty()) {
    throw InvariantViolation("node without a name");
  }
  if (nodes_.count(node.name) != 0) {
    throw InvariantViolation("node '" + node.name + "' added twice");
  }
  auto name = node.name;
  nodes_.emplace(std::move(name), std::move(node));
}

void DependencyGraph::CheckEdge(const Edge &edge) const {
  if (!HasNode(edge.source)) {
    throw InvariantViolation("edge source is not a node: " +
                             DescribeEdge(edge));
  }
  if (edge.source == edge.target) {
    throw InvariantViolation("self edge: " + DescribeEdge(edge));
  }
  if (edge.target_external == HasNode(edge.target)) {
    throw InvariantViolation(
        edge.target_external
            ? "edge tagged external targets an analyzed node: " +
                  DescribeEdge(edge)
            : "edge target is not a node: " + DescribeEdge(edge));
  }
  if (edge.occurrence_count == 0) {
    throw InvariantViolation("edge without occurrences: " +
                             DescribeEdge(edge));
  }
}

void DependencyGraph::AddEdge(Edge edge) {
  CheckEdge(edge);
  if (edge.originating_members.empty() && !edge.member.empty()) {
    edge.originating_members.insert(edge.member);
  }

  const auto key = KeyOf(edge);
  const auto existing = edge_index_.find(key);
  if (existing != edge_index_.end()) {
    auto &folded = edges_[existing->second];
    folded.occurrence_count += edge.occurrence_count;
    folded.originating_members.insert(edge.originating_members.begin(),
                                      edge.originating_members.end());
    if (edge.multiplicity == Multiplicity::kMany) {
      folded.multiplicity = Multiplicity::kMany;
    }
    return;
  }

  const auto index = edges_.size();
  outgoing_[edge.source].push_back(index);
  incoming_[edge.target].push_back(index);
  edge_index_.emplace(key, index);
  edges_.push_back(std::move(edge));
}

bool DependencyGraph::HasNode(const std::string &name) const {
  return nodes_.count(name) != 0;
}

const TypeNode *DependencyGraph::FindNode(const std::string &name) const {
  const auto found = nodes_.find(name);
  return found == nodes_.end() ? nullptr : &found->second;
}

std::vector<const Edge *>
DependencyGraph::OutgoingEdges(const std::string &name) const {
  std::vector<const Edge *> result;
  const auto found = outgoing_.find(name);
  if (found == outgoing_.end()) {
    return result;
  }
  result.reserve(found->second.size());
  for (const auto index : found->second) {
    result.push_back(&edges_[index]);
  }
  return result;
}

std::vector<const Edge *>
DependencyGraph::IncomingEdges(const std::string &name) const {
  std::vector<const Edge *> result;
  const auto found = incoming_.find(name);
  if (found == incoming_.end()) {
    return result;
  }
  result.reserve(found->second.size());
  for (const auto index : found->second) {
    result.push_back(&edges_[index]);
  }
  return result;
}

std::vector<std::string>
DependencyGraph::Successors(const std::string &name) const {
  std::vector<std::string> successors;
  for (const auto *edge : OutgoingEdges(name)) {
    if (!edge->target_external) {
      successors.push_back(edge->target);
    }
  }
  std::sort(successors.begin(), successors.end());
  successors.erase(std::unique(successors.begin(), successors.end()),
                   successors.end());
  return successors;
}

std::map<std::string, std::vector<const TypeNode *>>
DependencyGraph::NodesByPackage() const {
  std::map<std::string, std::vector<const TypeNode *>> packages;
  for (const auto &[name, node] : nodes_) {
    packages[node.package].push_back(&node);
  }
  return packages;
}

void DependencyGraph::ValidateInvariants() const {
  for (const auto &edge : edges_) {
    CheckEdge(edge);
    if (edge.target_external && outgoing_.count(edge.target) != 0) {
      throw InvariantViolation("external target appears as a source: " +
                               DescribeEdge(edge));
    }
  }
}

DependencyGraph AssembleGraph(std::vector<TypeNode> nodes,
                              const std::vector<Edge> &edges) {
  DependencyGraph graph(Granularity::kType);
  for (auto &node : nodes) {
    graph.AddNode(std::move(node));
  }
  for (const auto &edge : edges) {
    graph.AddEdge(edge);
  }
  return graph;
}

DependencyGraph ProjectToPackages(const DependencyGraph &type_graph,
                                  const SymbolTable &symbols) {
  DependencyGraph packages(Granularity::kPackage);

  for (const auto &[package, members] : type_graph.NodesByPackage()) {
    TypeNode node;
    node.name = package;
    node.package = package;
    node.kind = NodeKind::kPackage;
    node.contained_types = members.size();
    for (const auto *member : members) {
      node.field_count += member->field_count;
      node.method_count += member->method_count;
      node.estimated_size += member->estimated_size;
      node.partial = node.partial || member->partial;
      if (IsAbstractType(*member)) {
        ++node.abstract_types;
      }
    }
    packages.AddNode(std::move(node));
  }

  for (const auto &edge : type_graph.Edges()) {
    const auto *source = type_graph.FindNode(edge.source);
    const auto *target = type_graph.FindNode(edge.target);
    const auto source_package = source->package;
    const auto target_package =
        target != nullptr ? target->package : PackageOf(edge.target);
    if (source_package == target_package ||
        symbols.IsPlatform(target_package)) {
      continue;
    }

    Edge projected;
    projected.source = source_package;
    projected.target = target_package;
    projected.kind = edge.kind;
    projected.usage = edge.usage;
    projected.is_interface = edge.is_interface;
    projected.multiplicity = edge.multiplicity;
    projected.occurrence_count = edge.occurrence_count;
    projected.target_external = !packages.HasNode(target_package);
    if (edge.originating_members.empty()) {
      projected.originating_members.insert(edge.source);
    }
    for (const auto &member : edge.originating_members) {
      projected.originating_members.insert(edge.source + "#" + member);
    }
    packages.AddEdge(std::move(projected));
  }
  return packages;
}

} // namespace archlens
