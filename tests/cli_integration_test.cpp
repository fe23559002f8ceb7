#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_directory.h"

namespace archlens {
namespace {

using ::testing::HasSubstr;

constexpr const char kCyclicMetadata[] = R"(types:
  - name: app.ui.View
    methods:
      - name: render
        instructions:
          - {op: invoke, target: app.db.Repository, member: load}
  - name: app.db.Repository
    methods:
      - name: load
        instructions:
          - {op: invoke, target: app.ui.View, member: refresh}
)";

constexpr const char kLayerRules[] = R"(layers:
  UI: [app.ui.*]
  DB: [app.db.*]
allowed_layer_edges:
  - [UI, DB]
)";

std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

std::filesystem::path ExecutableUnderTest() { return ARCHLENS_CLI_PATH; }

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system(command.c_str()));
}

class CliIntegrationTest : public ::testing::Test {
protected:
  std::string Command(const std::string &arguments) const {
    return ExecutableUnderTest().string() + " " + arguments + " > " +
           (directory_.root() / "stdout.txt").string() + " 2> " +
           (directory_.root() / "stderr.txt").string();
  }

  std::string Stdout() const { return LoadFile(directory_.root() / "stdout.txt"); }
  std::string Stderr() const { return LoadFile(directory_.root() / "stderr.txt"); }

  test::TemporaryDirectory directory_;
};

TEST_F(CliIntegrationTest, ReportsLayerViolationWithFindingsExitCode) {
  ASSERT_TRUE(std::filesystem::exists(ExecutableUnderTest()))
      << "Expected CLI executable at " << ExecutableUnderTest();
  const auto metadata = directory_.AddFile("classes.yaml", kCyclicMetadata);
  const auto rules = directory_.AddFile("rules.yaml", kLayerRules);

  const auto exit_code = ExitCode(Command("analyze --metadata " +
                                          metadata.string() + " --rules " +
                                          rules.string() + " --jobs 2"));

  EXPECT_EQ(exit_code, 2);
  const auto output = Stdout();
  EXPECT_THAT(output, HasSubstr("archlens: 2 types, 2 edges"));
  EXPECT_THAT(output,
              HasSubstr("violation HIGH layer-access: Layer DB may not access "
                        "UI"));
  EXPECT_THAT(output, HasSubstr("cycle LOW type: app.db.Repository -> "
                                "app.ui.View -> app.db.Repository"));
}

TEST_F(CliIntegrationTest, FailOnThresholdControlsExitCode) {
  const auto metadata = directory_.AddFile("classes.yaml", kCyclicMetadata);

  EXPECT_EQ(ExitCode(Command("--metadata " + metadata.string())), 0);
  EXPECT_EQ(
      ExitCode(Command("analyze --metadata " + metadata.string() +
                       " --fail-on low")),
      2);
}

TEST_F(CliIntegrationTest, ReadsOptionsFromConfigFile) {
  const auto metadata = directory_.AddFile("classes.yaml", kCyclicMetadata);
  const auto config = directory_.AddFile(
      "archlens.yaml", "metadata: " + metadata.string() + "\nfail_on: low\n");

  EXPECT_EQ(ExitCode(Command("analyze --config " + config.string())), 2);
  EXPECT_THAT(Stdout(), HasSubstr("summary: 0 violations, 2 cycles"));
}

TEST_F(CliIntegrationTest, InvertedStrengthThresholdsStillAnalyze) {
  const auto metadata = directory_.AddFile("classes.yaml", kCyclicMetadata);
  const auto rules = directory_.AddFile(
      "rules.yaml", "moderate_edge_occurrence_threshold: 60\n");

  EXPECT_EQ(ExitCode(Command("analyze --metadata " + metadata.string() +
                             " --rules " + rules.string())),
            0);
  EXPECT_THAT(Stdout(), HasSubstr("diagnostic configuration_error strength: "));
  EXPECT_THAT(Stdout(), HasSubstr("archlens: 2 types, 2 edges"));
}

TEST_F(CliIntegrationTest, ReportsUsageErrorsWithExitCodeOne) {
  EXPECT_EQ(ExitCode(Command("analyze")), 1);
  EXPECT_THAT(Stderr(), HasSubstr("--metadata is required"));

  EXPECT_EQ(ExitCode(Command("analyze --metadata " +
                             (directory_.root() / "missing.yaml").string())),
            1);
  EXPECT_THAT(Stderr(), HasSubstr("Metadata file not found"));

  EXPECT_EQ(ExitCode(Command("frobnicate")), 1);
  EXPECT_THAT(Stderr(), HasSubstr("Unknown command: frobnicate"));
}

TEST_F(CliIntegrationTest, ListsRegisteredComponents) {
  EXPECT_EQ(ExitCode(Command("rules")), 0);
  const auto output = Stdout();
  EXPECT_THAT(output, HasSubstr("rules:\n  god-object\n"));
  EXPECT_THAT(output, HasSubstr("  layer-access\n"));
  EXPECT_THAT(output, HasSubstr("extractors:\n  bytecode (default)\n"));
  EXPECT_THAT(output, HasSubstr("loaders:\n  yaml\n"));
}

} // namespace
} // namespace archlens
