#include <archlens/relationship_extractor.h>

#include <algorithm>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/metadata_builders.h"

namespace archlens {
namespace {

using ::testing::AllOf;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

constexpr const char kAutowired[] =
    "org.springframework.beans.factory.annotation.Autowired";

class RelationshipExtractorTest : public ::testing::Test {
protected:
  ExtractionResult ExtractFrom(const TypeMetadata &type,
                               std::vector<TypeMetadata> others = {}) {
    others.push_back(type);
    const SymbolTable symbols(others, DefaultVocabulary());
    return extractor_.Extract(type, symbols);
  }

  static const Edge *FindEdge(const ExtractionResult &result,
                              const std::string &target, EdgeKind kind) {
    const auto found = std::find_if(
        result.edges.begin(), result.edges.end(), [&](const Edge &edge) {
          return edge.target == target && edge.kind == kind;
        });
    return found == result.edges.end() ? nullptr : &*found;
  }

  BytecodeRelationshipExtractor extractor_;
};

TypeMetadata ServiceWithRepository(std::vector<std::string> annotations) {
  auto service = test::Type("com.shop.OrderService");
  service.fields.push_back(test::Field("repository", "com.shop.OrderRepository",
                                       std::move(annotations)));
  service.methods.push_back(test::Method(
      "<init>", {test::Write("com.shop.OrderService", "repository")}));
  return service;
}

TEST_F(RelationshipExtractorTest, ConstructorAssignedFieldIsComposition) {
  const auto result = ExtractFrom(ServiceWithRepository({}),
                                  {test::Type("com.shop.OrderRepository")});

  const auto *edge =
      FindEdge(result, "com.shop.OrderRepository", EdgeKind::kComposition);
  ASSERT_NE(edge, nullptr);
  EXPECT_EQ(edge->member, "repository");
  EXPECT_EQ(edge->multiplicity, Multiplicity::kOne);
  EXPECT_FALSE(edge->target_external);
}

TEST_F(RelationshipExtractorTest, InjectedFieldIsAggregationEvenIfAssigned) {
  const auto result = ExtractFrom(ServiceWithRepository({kAutowired}),
                                  {test::Type("com.shop.OrderRepository")});

  EXPECT_NE(FindEdge(result, "com.shop.OrderRepository",
                     EdgeKind::kAggregation),
            nullptr);
  EXPECT_EQ(FindEdge(result, "com.shop.OrderRepository",
                     EdgeKind::kComposition),
            nullptr);
}

TEST_F(RelationshipExtractorTest, ClassifiesSetterAndUnassignedFields) {
  auto type = test::Type("com.shop.Cart");
  type.fields = {test::Field("pricing", "com.shop.Pricing"),
                 test::Field("audit", "com.shop.Audit")};
  auto setter =
      test::Method("setPricing", {test::Write("com.shop.Cart", "pricing")});
  setter.parameter_types = {"com.shop.Pricing"};
  setter.return_type = "void";
  type.methods = {setter};

  const auto result = ExtractFrom(type);

  EXPECT_NE(FindEdge(result, "com.shop.Pricing", EdgeKind::kAggregation),
            nullptr);
  EXPECT_NE(FindEdge(result, "com.shop.Audit", EdgeKind::kAssociation),
            nullptr);
}

TEST_F(RelationshipExtractorTest, SetPrefixedNonSettersLeaveFieldAssociated) {
  auto type = test::Type("com.shop.Car");
  type.fields = {test::Field("engine", "com.shop.Engine"),
                 test::Field("gearbox", "com.shop.Gearbox"),
                 test::Field("brakes", "com.shop.Brakes")};
  auto setup = test::Method("setup", {test::Write("com.shop.Car", "engine")});
  setup.parameter_types = {"com.shop.Engine"};
  auto settle = test::Method("settle", {test::Write("com.shop.Car", "engine")});
  auto no_argument =
      test::Method("setGearbox", {test::Write("com.shop.Car", "gearbox")});
  auto returns_value =
      test::Method("setBrakes", {test::Write("com.shop.Car", "brakes")});
  returns_value.parameter_types = {"com.shop.Brakes"};
  returns_value.return_type = "com.shop.Car";
  type.methods = {setup, settle, no_argument, returns_value};

  const auto result = ExtractFrom(type);

  for (const auto *target :
       {"com.shop.Engine", "com.shop.Gearbox", "com.shop.Brakes"}) {
    EXPECT_NE(FindEdge(result, target, EdgeKind::kAssociation), nullptr)
        << target;
    EXPECT_EQ(FindEdge(result, target, EdgeKind::kAggregation), nullptr)
        << target;
  }
}

TEST_F(RelationshipExtractorTest, ContainersAndArraysAreOneToMany) {
  auto type = test::Type("com.shop.Order");
  auto lines = test::Field("lines", "java.util.List");
  lines.element_type = "com.shop.OrderLine";
  type.fields = {lines, test::Field("tags", "com.shop.Tag[]"),
                 test::Field("raw", "java.util.Map"),
                 test::Field("id", "java.lang.String"),
                 test::Field("count", "int")};

  const auto result = ExtractFrom(
      type, {test::Type("com.shop.OrderLine"), test::Type("com.shop.Tag")});

  ASSERT_EQ(result.edges.size(), 2u);
  EXPECT_THAT(result.edges,
              UnorderedElementsAre(
                  AllOf(Field(&Edge::target, "com.shop.OrderLine"),
                        Field(&Edge::multiplicity, Multiplicity::kMany)),
                  AllOf(Field(&Edge::target, "com.shop.Tag"),
                        Field(&Edge::multiplicity, Multiplicity::kMany))));
}

TEST_F(RelationshipExtractorTest, InheritanceSkipsPlatformRoot) {
  auto type = test::Type("com.shop.Order");
  type.superclass = "java.lang.Object";
  type.interfaces = {"com.shop.Identifiable"};

  const auto result = ExtractFrom(
      type, {test::Type("com.shop.Identifiable", TypeKind::kInterface)});

  ASSERT_EQ(result.edges.size(), 1u);
  EXPECT_EQ(result.edges[0].kind, EdgeKind::kInheritance);
  EXPECT_TRUE(result.edges[0].is_interface);
  EXPECT_EQ(result.edges[0].target, "com.shop.Identifiable");
}

TEST_F(RelationshipExtractorTest, UsageEdgesCarryCallingMemberAndFold) {
  auto type = test::Type("com.shop.Checkout");
  type.methods = {test::Method("pay",
                               {test::Call("com.shop.Gateway", "charge"),
                                test::Call("com.shop.Gateway", "refund"),
                                test::New("com.shop.Receipt"),
                                test::Check("com.shop.Receipt[]"),
                                test::Call("com.shop.Checkout", "log")})};

  const auto result = ExtractFrom(
      type, {test::Type("com.shop.Gateway"), test::Type("com.shop.Receipt")});

  EXPECT_THAT(
      result.edges,
      UnorderedElementsAre(
          AllOf(Field(&Edge::target, "com.shop.Gateway"),
                Field(&Edge::usage, UsageKind::kCall),
                Field(&Edge::member, "pay"),
                Field(&Edge::occurrence_count, 2u)),
          AllOf(Field(&Edge::target, "com.shop.Receipt"),
                Field(&Edge::usage, UsageKind::kInstantiate)),
          AllOf(Field(&Edge::target, "com.shop.Receipt"),
                Field(&Edge::usage, UsageKind::kTypeCheck))));
  EXPECT_THAT(result.diagnostics, IsEmpty());
  EXPECT_FALSE(result.node.partial);
}

TEST_F(RelationshipExtractorTest, UnknownTargetsAreExternalWithOneDiagnostic) {
  auto type = test::Type("com.shop.Checkout");
  type.methods = {test::Method("pay", {test::Call("com.vendor.Sdk", "a"),
                                       test::Call("com.vendor.Sdk", "b"),
                                       test::Call("java.util.List", "add")}),
                  test::Method("undo", {test::Call("com.vendor.Sdk", "c")})};

  const auto result = ExtractFrom(type);

  ASSERT_EQ(result.edges.size(), 3u);
  for (const auto &edge : result.edges) {
    EXPECT_TRUE(edge.target_external) << DescribeEdge(edge);
  }
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics[0].kind, DiagnosticKind::kUnresolvedTarget);
  EXPECT_THAT(result.diagnostics[0].message,
              ::testing::HasSubstr("com.vendor.Sdk"));
}

TEST_F(RelationshipExtractorTest, MalformedInstructionKeepsEarlierEdges) {
  auto type = test::Type("com.shop.Checkout");
  type.methods = {
      test::Method("pay", {test::Call("com.shop.Gateway", "charge"),
                           Instruction{OpCategory::kNew, "", ""},
                           test::Call("com.shop.Ledger", "post")}),
      test::Method("audit", {test::Call("com.shop.Ledger", "read")})};
  type.methods[1].truncated = true;

  const auto result = ExtractFrom(type, {test::Type("com.shop.Gateway"),
                                         test::Type("com.shop.Ledger")});

  EXPECT_TRUE(result.node.partial);
  EXPECT_THAT(result.edges,
              UnorderedElementsAre(
                  AllOf(Field(&Edge::target, "com.shop.Gateway"),
                        Field(&Edge::member, "pay")),
                  AllOf(Field(&Edge::target, "com.shop.Ledger"),
                        Field(&Edge::member, "audit"))));
  ASSERT_EQ(result.diagnostics.size(), 2u);
  EXPECT_EQ(result.diagnostics[0].kind, DiagnosticKind::kPartialExtraction);
  EXPECT_EQ(result.diagnostics[0].subject, "com.shop.Checkout#pay");
  EXPECT_EQ(result.diagnostics[1].subject, "com.shop.Checkout#audit");
}

TEST_F(RelationshipExtractorTest, NodeRecordsShapeAndEstimatedSize) {
  auto type = test::Type("com.shop.Order");
  type.fields = {test::Field("id", "long"), test::Field("total", "double")};
  type.methods = {test::Method("total"), test::Method("add")};
  type.methods[1].parameter_types = {"com.shop.Item", "int"};

  const auto result = ExtractFrom(type);

  EXPECT_EQ(result.node.package, "com.shop");
  EXPECT_EQ(result.node.kind, NodeKind::kClass);
  EXPECT_EQ(result.node.method_count, 2u);
  EXPECT_EQ(result.node.field_count, 2u);
  EXPECT_EQ(result.node.estimated_size, EstimateSize(2, 2));
  EXPECT_EQ(result.node.estimated_size, 24u);
  ASSERT_EQ(result.node.methods.size(), 2u);
  EXPECT_EQ(result.node.methods[1].parameter_count, 2u);
}

TEST_F(RelationshipExtractorTest, ExtractionDoesNotMutateInput) {
  const auto type = ServiceWithRepository({kAutowired});
  const auto copy = type;

  ExtractFrom(type);

  EXPECT_EQ(type.fields.size(), copy.fields.size());
  EXPECT_EQ(type.methods[0].instructions.size(),
            copy.methods[0].instructions.size());
}

} // namespace
} // namespace archlens
