#include <archlens/archlens_cli.h>

#include <archlens/analysis_config.h>
#include <archlens/analyzer_pipeline_builder.h>
#include <archlens/cli_exit_codes.h>
#include <archlens/component_registry.h>
#include <archlens/default_analyzer_pipeline.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace {

using archlens::AnalyzeOptions;

void PrintAnalyzeUsage() {
  std::cout
      << "Usage: archlens analyze --metadata <file> [options]\n"
      << "Options:\n"
      << "  --metadata <file>     Compiled-unit metadata exported as YAML\n"
      << "  --rules <file>        Rule configuration (layers, thresholds)\n"
      << "  --config <file>       Optional YAML file with these options\n"
      << "  --jobs <n>            Extraction workers (default: hardware "
         "threads)\n"
      << "  --fail-on <severity>  Exit with 2 on findings at or above\n"
      << "                        low, medium or high (default: high)\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --extractor <name>    Relationship extractor plug-in to use\n"
      << "  --loader <name>       Metadata loader plug-in to use\n"
      << "  --help                Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::size_t ParseJobs(const std::string &value) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    throw std::invalid_argument("--jobs expects a non-negative integer, got '" +
                                value + "'");
  }
  return static_cast<std::size_t>(std::stoul(trimmed));
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        archlens::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = archlens::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = archlens::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandlePluginSelection(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--extractor") {
    options.extractor = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--loader") {
    options.loader = RequireValue(arguments, index, argument);
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--metadata") {
    options.metadata = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--rules") {
    options.rules_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--jobs") {
    options.jobs = ParseJobs(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--fail-on") {
    options.fail_on =
        archlens::ParseSeverity(RequireValue(arguments, index, argument));
    return true;
  }
  return HandleLoggingOption(arguments, index, options) ||
         HandlePluginSelection(arguments, index, options);
}

void ValidateAnalyzeOptions(const AnalyzeOptions &options) {
  if (!options.metadata) {
    throw std::invalid_argument(
        "--metadata is required (or set in config file)");
  }
}

} // namespace

namespace archlens {

Severity ParseSeverity(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "low") {
    return Severity::kLow;
  }
  if (normalized == "medium") {
    return Severity::kMedium;
  }
  if (normalized == "high") {
    return Severity::kHigh;
  }
  throw std::invalid_argument("Unknown severity: " + value);
}

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

namespace {

using ConfigValue = std::variant<std::string, std::size_t>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "metadata", "rules", "log_level", "jobs", "extractor", "loader",
      "fail_on"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"metadata_file", "metadata"},
      {"rules_file", "rules"},
      {"rule_config", "rules"},
      {"workers", "jobs"}};
  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key +
                                "' must be a scalar value");
  }
  if (key == "jobs") {
    return ConfigValue{ParseJobs(node.as<std::string>())};
  }
  return ConfigValue{node.as<std::string>()};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }
  RawConfig config;
  const auto &supported = SupportedConfigKeys();
  for (const auto &entry : root) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    if (std::find(supported.begin(), supported.end(), key) ==
        supported.end()) {
      ThrowUnknownKey(entry.first.as<std::string>());
    }
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, AnalyzeOptions &options) {
  for (const auto &[key, value] : config) {
    if (key == "jobs") {
      options.jobs = std::get<std::size_t>(value);
      continue;
    }
    const auto &text = std::get<std::string>(value);
    if (key == "metadata") {
      options.metadata = text;
    } else if (key == "rules") {
      options.rules_file = text;
    } else if (key == "log_level") {
      options.log_level = ParseLogLevel(text);
    } else if (key == "extractor") {
      options.extractor = text;
    } else if (key == "loader") {
      options.loader = text;
    } else if (key == "fail_on") {
      options.fail_on = ParseSeverity(text);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

} // namespace

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  AnalyzeOptions options;
  options.config_file = path;
  ApplyConfig(ParseYamlConfig(path), options);
  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.metadata, cli_options.metadata);
  override_value(merged.rules_file, cli_options.rules_file);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.jobs, cli_options.jobs);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.extractor, cli_options.extractor);
  override_value(merged.loader, cli_options.loader);
  override_value(merged.fail_on, cli_options.fail_on);
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  AnalyzeOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateAnalyzeOptions(merged);
  return merged;
}

void RenderSummary(const AnalysisResult &result, std::ostream &stream) {
  stream << "archlens: " << result.summary.node_count << " types, "
         << result.summary.edge_count << " edges ("
         << result.summary.external_edge_count << " external), "
         << result.package_graph.Nodes().size() << " packages\n";

  for (const auto &violation : result.violations) {
    stream << "violation " << SeverityName(violation.severity) << " "
           << violation.rule_id << ": " << violation.description << "\n";
    if (!violation.remediation.empty()) {
      stream << "  remediation: " << violation.remediation << "\n";
    }
  }

  const auto render_cycles = [&stream](const std::vector<Cycle> &cycles,
                                       const char *granularity) {
    for (const auto &cycle : cycles) {
      stream << "cycle " << SeverityName(cycle.severity) << " " << granularity
             << ": ";
      for (const auto &node : cycle.nodes) {
        stream << node << " -> ";
      }
      stream << cycle.nodes.front() << "\n";
    }
  };
  render_cycles(result.type_cycles, "type");
  render_cycles(result.package_cycles, "package");

  for (const auto &diagnostic : result.diagnostics) {
    stream << "diagnostic " << DiagnosticKindName(diagnostic.kind) << " "
           << diagnostic.subject << ": " << diagnostic.message << "\n";
  }

  stream << "summary: " << result.violations.size() << " violations, "
         << result.type_cycles.size() + result.package_cycles.size()
         << " cycles, " << result.diagnostics.size() << " diagnostics\n";
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage();
    return kExitClean;
  }

  const auto options = ResolveAnalyzeOptions(cli_options);
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  auto logger = MakeLogger(logging, std::clog);

  const auto &registry = GlobalComponentRegistry();
  auto loader = registry.CreateLoader(options.loader.value_or(""));
  const auto types = loader->Load(*options.metadata);
  logger->Log(LogLevel::kInfo, "metadata.loaded",
              {{"path", options.metadata->string()},
               {"types", std::to_string(types.size())}});

  auto config = options.rules_file ? LoadAnalysisConfig(*options.rules_file)
                                   : AnalysisConfig{};
  config.jobs = options.jobs.value_or(0);

  AnalyzerPipelineBuilder builder(registry);
  builder.WithLogger(logger);
  if (options.extractor) {
    builder.WithExtractorName(*options.extractor);
  }
  auto pipeline = builder.Build();
  const auto result = pipeline.Run(types, config);

  RenderSummary(result, std::cout);
  return FindingsExitCode(result, options.fail_on.value_or(Severity::kHigh));
}

int RunListRules(const std::vector<std::string> &arguments) {
  if (!arguments.empty()) {
    throw std::invalid_argument("Unknown rules argument: " + arguments.front());
  }
  const auto &registry = GlobalComponentRegistry();
  std::cout << "rules:\n";
  for (const auto &name : registry.RuleNames()) {
    std::cout << "  " << name << "\n";
  }
  std::cout << "extractors:\n";
  for (const auto &name : registry.ExtractorNames()) {
    std::cout << "  " << name;
    if (name == registry.DefaultExtractorName()) {
      std::cout << " (default)";
    }
    std::cout << "\n";
  }
  std::cout << "loaders:\n";
  for (const auto &name : registry.LoaderNames()) {
    std::cout << "  " << name << "\n";
  }
  return kExitClean;
}

} // namespace archlens
