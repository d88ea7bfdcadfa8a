#pragma once

#include <pgrails/logging.h>
#include <pgrails/models.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pgrails {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::vector<std::string> formats;
  std::vector<std::string> rules;
  std::optional<std::string> reporter;
  std::optional<LogLevel> log_level;
  std::optional<std::size_t> boolean_preview_limit;
  std::optional<std::size_t> where_preview_limit;
  bool show_help = false;
};

// "indexes", "n-plus-one" or "config". Throws std::invalid_argument.
AnalysisSuite ParseSuite(const std::string &command);

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options,
                                   AnalysisSuite suite);

// Runs one command and returns its process exit status. Fatal problems are
// thrown to the caller.
int RunCommand(AnalysisSuite suite, const std::vector<std::string> &arguments);

} // namespace pgrails
