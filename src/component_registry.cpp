#include <archlens/component_registry.h>

#include <archlens/relationship_extractor.h>
#include <archlens/rules.h>
#include <archlens/yaml_metadata_loader.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kDefaultExtractor[] = "bytecode";
constexpr const char kDefaultLoader[] = "yaml";

} // namespace

namespace archlens {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Interface, typename Factory, typename... Args>
std::unique_ptr<Interface>
ComponentRegistry::CreateComponent(const std::string &name,
                                   const ComponentSet<Factory> &set,
                                   const std::string &kind,
                                   const Args &...args) const {
  const auto target_name = name.empty() ? set.default_name : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(target_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + target_name +
                                "'. Registered: " + JoinNames(set));
  }
  auto instance = found->second(args...);
  if (!instance) {
    throw std::runtime_error("Factory for " + kind + " '" + target_name +
                             "' returned null");
  }
  return instance;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RegisterExtractor(const std::string &name,
                                          ExtractorFactory factory,
                                          bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, extractors_);
}

void ComponentRegistry::RegisterRule(const std::string &name,
                                     RuleFactory factory) {
  RegisterComponent(name, std::move(factory), false, rules_);
}

void ComponentRegistry::RegisterLoader(const std::string &name,
                                       LoaderFactory factory,
                                       bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, loaders_);
}

std::unique_ptr<RelationshipExtractor>
ComponentRegistry::CreateExtractor(const std::string &name) const {
  return CreateComponent<RelationshipExtractor>(name, extractors_,
                                                "extractor");
}

std::unique_ptr<Rule>
ComponentRegistry::CreateRule(const std::string &name,
                              const RuleConfig &config) const {
  if (name.empty()) {
    throw std::invalid_argument("Rule name cannot be empty");
  }
  return CreateComponent<Rule>(name, rules_, "rule", config);
}

std::unique_ptr<MetadataLoader>
ComponentRegistry::CreateLoader(const std::string &name) const {
  return CreateComponent<MetadataLoader>(name, loaders_, "loader");
}

bool ComponentRegistry::HasRule(const std::string &name) const {
  return rules_.factories.count(name) != 0;
}

std::vector<std::string> ComponentRegistry::ExtractorNames() const {
  return RegisteredNames(extractors_);
}

std::vector<std::string> ComponentRegistry::RuleNames() const {
  return RegisteredNames(rules_);
}

std::vector<std::string> ComponentRegistry::LoaderNames() const {
  return RegisteredNames(loaders_);
}

const std::string &ComponentRegistry::DefaultExtractorName() const {
  return extractors_.default_name;
}

const std::string &ComponentRegistry::DefaultLoaderName() const {
  return loaders_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterExtractor(
      kDefaultExtractor,
      []() { return std::make_unique<BytecodeRelationshipExtractor>(); }, true);
  registry.RegisterLoader(
      kDefaultLoader, []() { return std::make_unique<YamlMetadataLoader>(); },
      true);
  registry.RegisterRule(kLayerAccessRule, [](const RuleConfig &config) {
    return std::make_unique<LayerAccessRule>(config);
  });
  registry.RegisterRule(kGodObjectRule, [](const RuleConfig &config) {
    return std::make_unique<GodObjectRule>(config);
  });
  registry.RegisterRule(kGodPackageRule, [](const RuleConfig &config) {
    return std::make_unique<GodPackageRule>(config);
  });
  registry.RegisterRule(kUnstableDependencyRule, [](const RuleConfig &) {
    return std::make_unique<UnstableDependencyRule>();
  });
  registry.RegisterRule(kLongParameterListRule, [](const RuleConfig &config) {
    return std::make_unique<LongParameterListRule>(config);
  });
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace archlens
