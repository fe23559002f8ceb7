#pragma once

#include <archlens/models.h>

#include <cstddef>
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace archlens {

class SymbolTable;

enum class Granularity { kType, kPackage };

// Nodes plus folded edges indexed by source and by target. Edges whose target
// is not a node must be tagged external; sources are always nodes.
class DependencyGraph {
public:
  explicit DependencyGraph(Granularity granularity = Granularity::kType);

  void AddNode(TypeNode node);
  // Folds into an existing edge with the same key by summing occurrences.
  void AddEdge(Edge edge);

  bool HasNode(const std::string &name) const;
  const TypeNode *FindNode(const std::string &name) const;
  const std::map<std::string, TypeNode> &Nodes() const { return nodes_; }
  const std::vector<Edge> &Edges() const { return edges_; }

  std::vector<const Edge *> OutgoingEdges(const std::string &name) const;
  std::vector<const Edge *> IncomingEdges(const std::string &name) const;
  // Distinct in-graph targets in name order, external targets excluded.
  std::vector<std::string> Successors(const std::string &name) const;

  std::map<std::string, std::vector<const TypeNode *>> NodesByPackage() const;

  void ValidateInvariants() const;

  Granularity granularity() const { return granularity_; }

private:
  using EdgeKey = std::tuple<std::string, std::string, EdgeKind, UsageKind,
                             bool, std::string>;

  static EdgeKey KeyOf(const Edge &edge);
  void CheckEdge(const Edge &edge) const;

  Granularity granularity_;
  std::map<std::string, TypeNode> nodes_;
  std::vector<Edge> edges_;
  std::map<EdgeKey, std::size_t> edge_index_;
  std::map<std::string, std::vector<std::size_t>> outgoing_;
  std::map<std::string, std::vector<std::size_t>> incoming_;
};

DependencyGraph AssembleGraph(std::vector<TypeNode> nodes,
                              const std::vector<Edge> &edges);

DependencyGraph ProjectToPackages(const DependencyGraph &type_graph,
                                  const SymbolTable &symbols);

} // namespace archlens
