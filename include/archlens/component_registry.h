#pragma once

#include <archlens/analysis_config.h>
#include <archlens/interfaces.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace archlens {

class ComponentRegistry {
public:
  using ExtractorFactory =
      std::function<std::unique_ptr<RelationshipExtractor>()>;
  using RuleFactory = std::function<std::unique_ptr<Rule>(const RuleConfig &)>;
  using LoaderFactory = std::function<std::unique_ptr<MetadataLoader>()>;

  void RegisterExtractor(const std::string &name, ExtractorFactory factory,
                         bool set_as_default = false);
  void RegisterRule(const std::string &name, RuleFactory factory);
  void RegisterLoader(const std::string &name, LoaderFactory factory,
                      bool set_as_default = false);

  std::unique_ptr<RelationshipExtractor>
  CreateExtractor(const std::string &name = "") const;
  std::unique_ptr<Rule> CreateRule(const std::string &name,
                                   const RuleConfig &config) const;
  std::unique_ptr<MetadataLoader>
  CreateLoader(const std::string &name = "") const;

  bool HasRule(const std::string &name) const;

  std::vector<std::string> ExtractorNames() const;
  std::vector<std::string> RuleNames() const;
  std::vector<std::string> LoaderNames() const;

  const std::string &DefaultExtractorName() const;
  const std::string &DefaultLoaderName() const;

  template <typename Factory>
  struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Interface, typename Factory, typename... Args>
  std::unique_ptr<Interface>
  CreateComponent(const std::string &name, const ComponentSet<Factory> &set,
                  const std::string &kind, const Args &...args) const;

  template <typename Factory>
  void RegisterComponent(const std::string &name, Factory factory,
                         bool set_as_default, ComponentSet<Factory> &set);

  ComponentSet<ExtractorFactory> extractors_;
  ComponentSet<RuleFactory> rules_;
  ComponentSet<LoaderFactory> loaders_;
};

ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace archlens
