#include <archlens/coupling_metrics.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/metadata_builders.h"

namespace archlens {
namespace {

Edge Extends(std::string source, std::string target, bool external = false) {
  Edge edge;
  edge.source = std::move(source);
  edge.target = std::move(target);
  edge.kind = EdgeKind::kInheritance;
  edge.target_external = external;
  return edge;
}

TEST(CouplingMetricsTest, CountsDistinctNeighbours) {
  auto graph = test::GraphOf({"a.Hub", "a.Left", "a.Right", "a.Leaf"},
                             {{"a.Left", "a.Hub"},
                              {"a.Right", "a.Hub"},
                              {"a.Hub", "a.Leaf"}});
  graph.AddEdge(test::UsageEdge("a.Left", "a.Hub", 4, "other"));

  const auto metrics = ComputeCoupling(graph);

  EXPECT_EQ(metrics.at("a.Hub").afferent, 2u);
  EXPECT_EQ(metrics.at("a.Hub").efferent, 1u);
  EXPECT_DOUBLE_EQ(metrics.at("a.Hub").instability, 1.0 / 3.0);
  EXPECT_DOUBLE_EQ(metrics.at("a.Left").instability, 1.0);
  EXPECT_DOUBLE_EQ(metrics.at("a.Leaf").instability, 0.0);
}

TEST(CouplingMetricsTest, IsolatedNodeHasZeroInstability) {
  const auto metrics = ComputeCoupling(test::GraphOf({"a.Alone"}, {}));

  ASSERT_EQ(metrics.size(), 1u);
  EXPECT_EQ(metrics.at("a.Alone").afferent, 0u);
  EXPECT_EQ(metrics.at("a.Alone").efferent, 0u);
  EXPECT_DOUBLE_EQ(metrics.at("a.Alone").instability, 0.0);
}

TEST(CouplingMetricsTest, ExternalTargetsCountAsEfferent) {
  auto graph = test::GraphOf({"a.Client"}, {});
  auto external = test::UsageEdge("a.Client", "vendor.Sdk");
  external.target_external = true;
  graph.AddEdge(external);

  const auto metrics = ComputeCoupling(graph);

  EXPECT_EQ(metrics.at("a.Client").efferent, 1u);
  EXPECT_DOUBLE_EQ(metrics.at("a.Client").instability, 1.0);
  EXPECT_EQ(metrics.count("vendor.Sdk"), 0u);
}

TEST(CouplingMetricsTest, InstabilityStaysWithinUnitInterval) {
  EXPECT_DOUBLE_EQ(Instability(0, 0), 0.0);
  EXPECT_DOUBLE_EQ(Instability(3, 0), 0.0);
  EXPECT_DOUBLE_EQ(Instability(0, 3), 1.0);
  EXPECT_DOUBLE_EQ(Instability(1, 3), 0.75);
}

TEST(CouplingMetricsTest, TypeAbstractnessAndDistance) {
  auto port = test::Node("a.Port");
  port.kind = NodeKind::kInterface;
  auto base = test::Node("a.Base");
  base.modifiers.is_abstract = true;
  const auto graph = AssembleGraph(
      {port, base, test::Node("a.Impl"), test::Node("a.Util")},
      {test::UsageEdge("a.Impl", "a.Port"), test::UsageEdge("a.Impl", "a.Base")});

  const auto metrics = ComputeCoupling(graph);

  EXPECT_DOUBLE_EQ(metrics.at("a.Port").abstractness, 1.0);
  EXPECT_DOUBLE_EQ(metrics.at("a.Port").distance, 0.0);
  EXPECT_DOUBLE_EQ(metrics.at("a.Base").abstractness, 1.0);
  EXPECT_DOUBLE_EQ(metrics.at("a.Impl").abstractness, 0.0);
  EXPECT_DOUBLE_EQ(metrics.at("a.Impl").distance, 0.0);
  // Concrete and unreferenced: the zone of pain.
  EXPECT_DOUBLE_EQ(metrics.at("a.Util").distance, 1.0);
}

TEST(CouplingMetricsTest, PackageAbstractnessIsShareOfAbstractTypes) {
  const auto package = [](const std::string &name, std::size_t types,
                          std::size_t abstract_types) {
    auto node = test::Node(name);
    node.kind = NodeKind::kPackage;
    node.package = name;
    node.contained_types = types;
    node.abstract_types = abstract_types;
    return node;
  };
  DependencyGraph graph(Granularity::kPackage);
  graph.AddNode(package("p.api", 2, 2));
  graph.AddNode(package("p.core", 4, 1));
  graph.AddNode(package("p.empty", 0, 0));
  graph.AddEdge(test::UsageEdge("p.core", "p.api"));

  const auto metrics = ComputeCoupling(graph);

  EXPECT_DOUBLE_EQ(metrics.at("p.api").abstractness, 1.0);
  EXPECT_DOUBLE_EQ(metrics.at("p.api").distance, 0.0);
  EXPECT_DOUBLE_EQ(metrics.at("p.core").abstractness, 0.25);
  EXPECT_DOUBLE_EQ(metrics.at("p.core").distance, 0.25);
  EXPECT_DOUBLE_EQ(metrics.at("p.empty").abstractness, 0.0);
  EXPECT_DOUBLE_EQ(metrics.at("p.empty").distance, 1.0);
}

TEST(CouplingMetricsTest, DistanceIsSymmetricAroundMainSequence) {
  EXPECT_DOUBLE_EQ(DistanceFromMainSequence(1.0, 1.0), 1.0);
  EXPECT_DOUBLE_EQ(DistanceFromMainSequence(0.5, 0.5), 0.0);
  EXPECT_DOUBLE_EQ(DistanceFromMainSequence(0.25, 0.5), 0.25);
}

TEST(CouplingMetricsTest, ClassifiesEdgeStrength) {
  auto edge = test::UsageEdge("a.A", "a.B", 10);
  edge.originating_members = {"x", "y"};
  EXPECT_DOUBLE_EQ(EdgeStrength(edge), 7.6);

  const StrengthThresholds thresholds;
  EXPECT_EQ(ClassifyEdge(edge, thresholds), StrengthClass::kWeak);
  EXPECT_EQ(ClassifyStrength(20.0, thresholds), StrengthClass::kModerate);
  EXPECT_EQ(ClassifyStrength(50.0, thresholds), StrengthClass::kModerate);
  EXPECT_EQ(ClassifyStrength(50.5, thresholds), StrengthClass::kStrong);

  edge.occurrence_count = 80;
  EXPECT_EQ(ClassifyEdge(edge, thresholds), StrengthClass::kStrong);
  EXPECT_EQ(ClassifyEdge(edge, StrengthThresholds{20.0, 100.0}),
            StrengthClass::kModerate);
}

TEST(CouplingMetricsTest, SummarizesGraph) {
  auto graph = test::GraphOf({"a.A", "a.B"}, {{"a.A", "a.B"}});
  graph.AddEdge(Extends("a.B", "a.A"));
  auto external = test::UsageEdge("a.A", "vendor.Sdk");
  external.target_external = true;
  graph.AddEdge(external);

  const auto summary = SummarizeGraph(graph);

  EXPECT_EQ(summary.node_count, 2u);
  EXPECT_EQ(summary.edge_count, 3u);
  EXPECT_EQ(summary.external_edge_count, 1u);
  EXPECT_EQ(summary.edges_by_kind.at("usage:call"), 2u);
  EXPECT_EQ(summary.edges_by_kind.at("inheritance"), 1u);
  EXPECT_DOUBLE_EQ(summary.average_degree, 1.5);
  EXPECT_DOUBLE_EQ(summary.density, 1.5);
}

TEST(CouplingMetricsTest, MeasuresInheritanceDepth) {
  std::vector<TypeNode> nodes = {test::Node("a.Base"), test::Node("a.Mid"),
                                 test::Node("a.Leaf"), test::Node("a.Plugin")};
  const auto graph = AssembleGraph(
      std::move(nodes),
      {Extends("a.Leaf", "a.Mid"), Extends("a.Mid", "a.Base"),
       Extends("a.Plugin", "vendor.Framework", true)});

  const auto depths = InheritanceDepths(graph);

  EXPECT_EQ(depths.at("a.Base"), 0u);
  EXPECT_EQ(depths.at("a.Mid"), 1u);
  EXPECT_EQ(depths.at("a.Leaf"), 2u);
  EXPECT_EQ(depths.at("a.Plugin"), 1u);
}

} // namespace
} // namespace archlens
