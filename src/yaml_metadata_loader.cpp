#include <archlens/yaml_metadata_loader.h>

#include <algorithm>
#include <initializer_list>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace archlens {
namespace {

void RejectUnknownKeys(const YAML::Node &node, const std::string &context,
                       std::initializer_list<const char *> supported) {
  for (const auto &entry : node) {
    const auto key = entry.first.as<std::string>();
    const auto found =
        std::find_if(supported.begin(), supported.end(),
                     [&](const char *candidate) { return key == candidate; });
    if (found == supported.end()) {
      std::string message = "Unknown key '" + key + "' in " + context +
                            ". Supported keys: ";
      for (auto it = supported.begin(); it != supported.end(); ++it) {
        message += *it;
        if (it + 1 != supported.end()) {
          message += ", ";
        }
      }
      throw std::invalid_argument(message);
    }
  }
}

std::string Scalar(const YAML::Node &node, const std::string &context) {
  if (!node.IsScalar()) {
    throw std::invalid_argument(context + " must be a string");
  }
  return node.as<std::string>();
}

std::string OptionalScalar(const YAML::Node &parent, const char *key,
                           const std::string &context) {
  const auto node = parent[key];
  if (!node || node.IsNull()) {
    return {};
  }
  return Scalar(node, context + "." + key);
}

std::vector<std::string> StringList(const YAML::Node &parent, const char *key,
                                    const std::string &context) {
  std::vector<std::string> values;
  const auto node = parent[key];
  if (!node || node.IsNull()) {
    return values;
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument(context + "." + key + " must be a list");
  }
  for (const auto &child : node) {
    values.push_back(Scalar(child, context + "." + key));
  }
  return values;
}

Modifiers ParseModifiers(const YAML::Node &parent, const std::string &context) {
  Modifiers modifiers;
  for (const auto &value : StringList(parent, "modifiers", context)) {
    if (value == "abstract") {
      modifiers.is_abstract = true;
    } else if (value == "static") {
      modifiers.is_static = true;
    } else if (value == "final") {
      modifiers.is_final = true;
    } else if (value == "public") {
      modifiers.visibility = Visibility::kPublic;
    } else if (value == "protected") {
      modifiers.visibility = Visibility::kProtected;
    } else if (value == "private") {
      modifiers.visibility = Visibility::kPrivate;
    } else if (value == "package") {
      modifiers.visibility = Visibility::kPackage;
    }
  }
  return modifiers;
}

Instruction ParseInstruction(const YAML::Node &node,
                             const std::string &context) {
  if (!node.IsMap()) {
    throw std::invalid_argument(context + " must be a mapping");
  }
  RejectUnknownKeys(node, context, {"op", "target", "member"});
  if (!node["op"]) {
    throw std::invalid_argument(context + " requires 'op'");
  }
  Instruction instruction;
  instruction.op = ParseOpCategory(Scalar(node["op"], context + ".op"));
  instruction.target_type = OptionalScalar(node, "target", context);
  instruction.member = OptionalScalar(node, "member", context);
  return instruction;
}

FieldMetadata ParseField(const YAML::Node &node, const std::string &context) {
  if (!node.IsMap() || !node["name"] || !node["type"]) {
    throw std::invalid_argument(context +
                                " must be a mapping with 'name' and 'type'");
  }
  RejectUnknownKeys(node, context,
                    {"name", "type", "element_type", "modifiers",
                     "annotations"});
  FieldMetadata field;
  field.name = Scalar(node["name"], context + ".name");
  field.declared_type = Scalar(node["type"], context + ".type");
  field.element_type = OptionalScalar(node, "element_type", context);
  field.modifiers = ParseModifiers(node, context);
  field.annotations = StringList(node, "annotations", context);
  return field;
}

MethodMetadata ParseMethod(const YAML::Node &node, const std::string &context) {
  if (!node.IsMap() || !node["name"]) {
    throw std::invalid_argument(context + " must be a mapping with 'name'");
  }
  RejectUnknownKeys(node, context,
                    {"name", "signature", "parameters", "returns", "modifiers",
                     "annotations", "instructions", "truncated"});
  MethodMetadata method;
  method.name = Scalar(node["name"], context + ".name");
  method.signature = OptionalScalar(node, "signature", context);
  method.parameter_types = StringList(node, "parameters", context);
  method.return_type = OptionalScalar(node, "returns", context);
  method.modifiers = ParseModifiers(node, context);
  method.annotations = StringList(node, "annotations", context);
  if (node["truncated"]) {
    method.truncated = node["truncated"].as<bool>();
  }
  if (const auto instructions = node["instructions"]; instructions) {
    if (!instructions.IsSequence()) {
      throw std::invalid_argument(context + ".instructions must be a list");
    }
    for (std::size_t i = 0; i < instructions.size(); ++i) {
      method.instructions.push_back(ParseInstruction(
          instructions[i],
          context + ".instructions[" + std::to_string(i) + "]"));
    }
  }
  return method;
}

TypeMetadata ParseType(const YAML::Node &node, const std::string &context) {
  if (!node.IsMap() || !node["name"]) {
    throw std::invalid_argument(context + " must be a mapping with 'name'");
  }
  RejectUnknownKeys(node, context,
                    {"name", "kind", "modifiers", "superclass", "interfaces",
                     "annotations", "fields", "methods"});
  TypeMetadata type;
  type.name = Scalar(node["name"], context + ".name");
  const auto owner = context + "(" + type.name + ")";
  if (node["kind"]) {
    type.kind = ParseTypeKind(Scalar(node["kind"], owner + ".kind"));
  }
  type.modifiers = ParseModifiers(node, owner);
  type.superclass = OptionalScalar(node, "superclass", owner);
  type.interfaces = StringList(node, "interfaces", owner);
  type.annotations = StringList(node, "annotations", owner);
  if (const auto fields = node["fields"]; fields && !fields.IsNull()) {
    if (!fields.IsSequence()) {
      throw std::invalid_argument(owner + ".fields must be a list");
    }
    for (std::size_t i = 0; i < fields.size(); ++i) {
      type.fields.push_back(
          ParseField(fields[i], owner + ".fields[" + std::to_string(i) + "]"));
    }
  }
  if (const auto methods = node["methods"]; methods && !methods.IsNull()) {
    if (!methods.IsSequence()) {
      throw std::invalid_argument(owner + ".methods must be a list");
    }
    for (std::size_t i = 0; i < methods.size(); ++i) {
      type.methods.push_back(ParseMethod(
          methods[i], owner + ".methods[" + std::to_string(i) + "]"));
    }
  }
  return type;
}

std::vector<TypeMetadata> ParseRoot(const YAML::Node &root) {
  if (!root.IsMap() || !root["types"]) {
    throw std::invalid_argument(
        "Metadata must be a mapping with a 'types' list");
  }
  const auto types = root["types"];
  std::vector<TypeMetadata> result;
  if (types.IsNull()) {
    return result;
  }
  if (!types.IsSequence()) {
    throw std::invalid_argument("Metadata key 'types' must be a list");
  }
  result.reserve(types.size());
  for (std::size_t i = 0; i < types.size(); ++i) {
    result.push_back(ParseType(types[i], "types[" + std::to_string(i) + "]"));
  }
  return result;
}

} // namespace

OpCategory ParseOpCategory(const std::string &value) {
  if (value == "invoke" || value == "call") {
    return OpCategory::kInvoke;
  }
  if (value == "new" || value == "instantiate") {
    return OpCategory::kNew;
  }
  if (value == "type_check" || value == "checkcast" || value == "instanceof") {
    return OpCategory::kTypeCheck;
  }
  if (value == "field_write" || value == "putfield") {
    return OpCategory::kFieldWrite;
  }
  if (value == "other") {
    return OpCategory::kOther;
  }
  throw std::invalid_argument("Unknown instruction op: " + value);
}

TypeKind ParseTypeKind(const std::string &value) {
  if (value == "class") {
    return TypeKind::kClass;
  }
  if (value == "interface") {
    return TypeKind::kInterface;
  }
  if (value == "enum") {
    return TypeKind::kEnum;
  }
  if (value == "annotation") {
    return TypeKind::kAnnotation;
  }
  throw std::invalid_argument("Unknown type kind: " + value);
}

std::vector<TypeMetadata> ParseMetadata(const std::string &yaml_text) {
  try {
    return ParseRoot(YAML::Load(yaml_text));
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument(std::string("Malformed metadata: ") +
                                error.what());
  }
}

std::vector<TypeMetadata>
YamlMetadataLoader::Load(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Metadata file not found: " + path.string());
  }
  try {
    return ParseRoot(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument("Malformed metadata " + path.string() + ": " +
                                error.what());
  }
}

} // namespace archlens
