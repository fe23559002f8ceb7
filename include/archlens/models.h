#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace archlens {

enum class TypeKind { kClass, kInterface, kEnum, kAnnotation };

enum class Visibility { kPublic, kProtected, kPackage, kPrivate };

struct Modifiers {
  bool is_abstract = false;
  bool is_static = false;
  bool is_final = false;
  Visibility visibility = Visibility::kPackage;
};

enum class OpCategory { kInvoke, kNew, kTypeCheck, kFieldWrite, kOther };

struct Instruction {
  OpCategory op = OpCategory::kOther;
  std::string target_type;
  std::string member;
};

struct FieldMetadata {
  std::string name;
  std::string declared_type;
  // Element type of a recognized container, empty when unknown.
  std::string element_type;
  Modifiers modifiers;
  std::vector<std::string> annotations;
};

struct MethodMetadata {
  std::string name;
  std::string signature;
  std::vector<std::string> parameter_types;
  std::string return_type;
  Modifiers modifiers;
  std::vector<std::string> annotations;
  std::vector<Instruction> instructions;
  bool truncated = false;
};

struct TypeMetadata {
  std::string name;
  TypeKind kind = TypeKind::kClass;
  Modifiers modifiers;
  std::string superclass;
  std::vector<std::string> interfaces;
  std::vector<std::string> annotations;
  std::vector<FieldMetadata> fields;
  std::vector<MethodMetadata> methods;
};

enum class NodeKind { kClass, kInterface, kEnum, kAnnotation, kPackage };

struct MethodShape {
  std::string name;
  std::size_t parameter_count = 0;
};

struct TypeNode {
  std::string name;
  std::string package;
  NodeKind kind = NodeKind::kClass;
  Modifiers modifiers;
  bool partial = false;
  std::size_t field_count = 0;
  std::size_t method_count = 0;
  std::size_t estimated_size = 0;
  // Number of analyzed types grouped under a package node.
  std::size_t contained_types = 0;
  // Contained types that are interfaces or abstract classes.
  std::size_t abstract_types = 0;
  std::vector<MethodShape> methods;
};

enum class EdgeKind {
  kInheritance,
  kComposition,
  kAggregation,
  kAssociation,
  kUsage
};

enum class UsageKind { kNone, kCall, kInstantiate, kTypeCheck };

enum class Multiplicity { kOne, kMany };

struct Edge {
  std::string source;
  std::string target;
  EdgeKind kind = EdgeKind::kUsage;
  UsageKind usage = UsageKind::kNone;
  bool is_interface = false;
  Multiplicity multiplicity = Multiplicity::kOne;
  std::string member;
  std::size_t occurrence_count = 1;
  std::set<std::string> originating_members;
  bool target_external = false;
};

struct StrengthThresholds {
  double moderate = 20.0;
  double strong = 50.0;
};

enum class StrengthClass { kWeak, kModerate, kStrong };

struct CouplingRecord {
  std::string node;
  std::size_t afferent = 0;
  std::size_t efferent = 0;
  double instability = 0.0;
  double abstractness = 0.0;
  // Distance from the main sequence, |A + I - 1|.
  double distance = 0.0;
};

using CouplingMetrics = std::map<std::string, CouplingRecord>;

enum class Severity { kLow = 0, kMedium = 1, kHigh = 2 };

struct Cycle {
  // Closed walk: every consecutive pair and the last-to-first pair is an edge.
  std::vector<std::string> nodes;
  std::vector<std::string> members;
  Severity severity = Severity::kLow;
  std::vector<Edge> closing_edges;
  std::size_t total_occurrences = 0;
  std::size_t strong_edges = 0;
  std::vector<std::string> suggestions;
};

struct Violation {
  std::string rule_id;
  Severity severity = Severity::kLow;
  std::vector<std::string> nodes;
  std::vector<Edge> edges;
  std::string description;
  std::string remediation;
};

enum class DiagnosticKind {
  kPartialExtraction,
  kUnresolvedTarget,
  kConfigurationError,
  kRuleFailure,
  kDuplicateType
};

struct Diagnostic {
  DiagnosticKind kind = DiagnosticKind::kPartialExtraction;
  std::string subject;
  std::string message;
};

struct GraphSummary {
  std::size_t node_count = 0;
  std::size_t edge_count = 0;
  std::size_t external_edge_count = 0;
  std::size_t partial_node_count = 0;
  std::map<std::string, std::size_t> edges_by_kind;
  double average_degree = 0.0;
  double density = 0.0;
};

std::string EdgeKindName(EdgeKind kind);
std::string UsageKindName(UsageKind kind);
std::string SeverityName(Severity severity);
std::string DiagnosticKindName(DiagnosticKind kind);
// "A -> B [usage:call via run x3]"
std::string DescribeEdge(const Edge &edge);
// Interfaces and abstract classes.
bool IsAbstractType(const TypeNode &node);

} // namespace archlens
