#include <archlens/relationship_extractor.h>

#include <cctype>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace archlens {
namespace {

constexpr const char kConstructorName[] = "<init>";

bool IsConstructor(const MethodMetadata &method) {
  return method.name == kConstructorName;
}

// setX(value) with a void (or unrecorded) return type.
bool IsSetter(const MethodMetadata &method) {
  const auto &name = method.name;
  if (name.size() <= 3 || name.compare(0, 3, "set") != 0 ||
      !std::isupper(static_cast<unsigned char>(name[3]))) {
    return false;
  }
  return method.parameter_types.size() == 1 &&
         (method.return_type.empty() || method.return_type == "void");
}

bool WritesField(const MethodMetadata &method, const TypeMetadata &owner,
                 const std::string &field) {
  for (const auto &instruction : method.instructions) {
    if (instruction.op == OpCategory::kFieldWrite &&
        instruction.member == field &&
        (instruction.target_type.empty() ||
         instruction.target_type == owner.name)) {
      return true;
    }
  }
  return false;
}

NodeKind ToNodeKind(TypeKind kind) {
  switch (kind) {
  case TypeKind::kClass:
    return NodeKind::kClass;
  case TypeKind::kInterface:
    return NodeKind::kInterface;
  case TypeKind::kEnum:
    return NodeKind::kEnum;
  case TypeKind::kAnnotation:
    return NodeKind::kAnnotation;
  }
  return NodeKind::kClass;
}

UsageKind ToUsage(OpCategory op) {
  switch (op) {
  case OpCategory::kInvoke:
    return UsageKind::kCall;
  case OpCategory::kNew:
    return UsageKind::kInstantiate;
  case OpCategory::kTypeCheck:
    return UsageKind::kTypeCheck;
  case OpCategory::kFieldWrite:
  case OpCategory::kOther:
    break;
  }
  return UsageKind::kNone;
}

// Resolves targets and folds repeated relationships of one type.
class EdgeCollector {
public:
  EdgeCollector(const TypeMetadata &type, const SymbolTable &symbols,
                ExtractionResult &result)
      : type_(type), symbols_(symbols), result_(result) {}

  void Add(const std::string &raw_target, EdgeKind kind, UsageKind usage,
           bool is_interface, Multiplicity multiplicity,
           const std::string &member) {
    const auto target = StripArray(raw_target);
    if (target.empty() || target == type_.name ||
        symbols_.IsPrimitive(target) || symbols_.IsPlatformRoot(target)) {
      return;
    }

    const auto key = std::make_tuple(target, kind, usage, is_interface, member);
    const auto existing = index_.find(key);
    if (existing != index_.end()) {
      auto &edge = result_.edges[existing->second];
      ++edge.occurrence_count;
      if (multiplicity == Multiplicity::kMany) {
        edge.multiplicity = Multiplicity::kMany;
      }
      return;
    }

    Edge edge;
    edge.source = type_.name;
    edge.target = target;
    edge.kind = kind;
    edge.usage = usage;
    edge.is_interface = is_interface;
    edge.multiplicity = multiplicity;
    edge.member = member;
    if (!member.empty()) {
      edge.originating_members.insert(member);
    }
    edge.target_external = !symbols_.IsKnown(target);
    if (edge.target_external && !symbols_.IsPlatform(target) &&
        unresolved_.insert(target).second) {
      result_.diagnostics.push_back(
          Diagnostic{DiagnosticKind::kUnresolvedTarget, type_.name,
                     "reference to type outside the analyzed set: " +
                         target});
    }
    index_.emplace(key, result_.edges.size());
    result_.edges.push_back(std::move(edge));
  }

private:
  const TypeMetadata &type_;
  const SymbolTable &symbols_;
  ExtractionResult &result_;
  std::map<std::tuple<std::string, EdgeKind, UsageKind, bool, std::string>,
           std::size_t>
      index_;
  std::set<std::string> unresolved_;
};

void ExtractInheritance(const TypeMetadata &type, EdgeCollector &collector) {
  if (!type.superclass.empty()) {
    collector.Add(type.superclass, EdgeKind::kInheritance, UsageKind::kNone,
                  false, Multiplicity::kOne, "");
  }
  for (const auto &interface_name : type.interfaces) {
    collector.Add(interface_name, EdgeKind::kInheritance, UsageKind::kNone,
                  true, Multiplicity::kOne, "");
  }
}

void ExtractFields(const TypeMetadata &type, const SymbolTable &symbols,
                   EdgeCollector &collector) {
  for (const auto &field : type.fields) {
    std::string target;
    auto multiplicity = Multiplicity::kOne;
    if (IsArrayType(field.declared_type)) {
      target = StripArray(field.declared_type);
      multiplicity = Multiplicity::kMany;
    } else if (symbols.IsContainer(field.declared_type)) {
      // An untyped container relates the owner to nothing analyzable.
      if (field.element_type.empty()) {
        continue;
      }
      target = StripArray(field.element_type);
      multiplicity = Multiplicity::kMany;
    } else {
      target = field.declared_type;
    }
    if (target.empty() || symbols.IsPrimitive(target) ||
        symbols.IsValueType(target)) {
      continue;
    }
    collector.Add(target, ClassifyField(type, field, symbols),
                  UsageKind::kNone, false, multiplicity, field.name);
  }
}

void ExtractUsages(const TypeMetadata &type, EdgeCollector &collector,
                   ExtractionResult &result) {
  for (const auto &method : type.methods) {
    bool malformed = false;
    for (const auto &instruction : method.instructions) {
      const auto usage = ToUsage(instruction.op);
      if (usage == UsageKind::kNone) {
        continue;
      }
      if (instruction.target_type.empty()) {
        malformed = true;
        break;
      }
      collector.Add(instruction.target_type, EdgeKind::kUsage, usage, false,
                    Multiplicity::kOne, method.name);
    }

    if (malformed || method.truncated) {
      result.node.partial = true;
      result.diagnostics.push_back(Diagnostic{
          DiagnosticKind::kPartialExtraction, type.name + "#" + method.name,
          malformed ? "instruction without a target type, walk stopped"
                    : "method body truncated, walk stopped"});
    }
  }
}

} // namespace

std::size_t EstimateSize(std::size_t method_count, std::size_t field_count) {
  return method_count * 5 + field_count * 2 + 10;
}

TypeNode MakeTypeNode(const TypeMetadata &type) {
  TypeNode node;
  node.name = type.name;
  node.package = PackageOf(type.name);
  node.kind = ToNodeKind(type.kind);
  node.modifiers = type.modifiers;
  node.field_count = type.fields.size();
  node.method_count = type.methods.size();
  node.estimated_size = EstimateSize(node.method_count, node.field_count);
  node.methods.reserve(type.methods.size());
  for (const auto &method : type.methods) {
    node.methods.push_back(
        MethodShape{method.name, method.parameter_types.size()});
  }
  return node;
}

EdgeKind ClassifyField(const TypeMetadata &owner, const FieldMetadata &field,
                       const SymbolTable &symbols) {
  for (const auto &annotation : field.annotations) {
    if (symbols.IsInjectionMarker(annotation)) {
      return EdgeKind::kAggregation;
    }
  }

  bool constructor_assigned = false;
  for (const auto &method : owner.methods) {
    if (!WritesField(method, owner, field.name)) {
      continue;
    }
    if (IsConstructor(method)) {
      constructor_assigned = true;
    } else if (IsSetter(method)) {
      return EdgeKind::kAggregation;
    }
  }
  return constructor_assigned ? EdgeKind::kComposition
                              : EdgeKind::kAssociation;
}

ExtractionResult
BytecodeRelationshipExtractor::Extract(const TypeMetadata &type,
                                       const SymbolTable &symbols) const {
  ExtractionResult result;
  result.node = MakeTypeNode(type);

  EdgeCollector collector(type, symbols, result);
  ExtractInheritance(type, collector);
  ExtractFields(type, symbols, collector);
  ExtractUsages(type, collector, result);
  return result;
}

} // namespace archlens
