#pragma once

#include <archlens/interfaces.h>
#include <archlens/logging.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace archlens {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> metadata;
  std::optional<std::filesystem::path> rules_file;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::size_t> jobs;
  std::optional<LogLevel> log_level;
  std::optional<std::string> extractor;
  std::optional<std::string> loader;
  std::optional<Severity> fail_on;
  bool show_help = false;
};

Severity ParseSeverity(const std::string &value);

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

void RenderSummary(const AnalysisResult &result, std::ostream &stream);

int RunAnalyze(const std::vector<std::string> &arguments);
int RunListRules(const std::vector<std::string> &arguments);

} // namespace archlens
