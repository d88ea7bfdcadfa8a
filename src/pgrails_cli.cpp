#include <pgrails/analyzer_pipeline_builder.h>
#include <pgrails/cli_exit_codes.h>
#include <pgrails/default_analyzer_pipeline.h>
#include <pgrails/errors.h>
#include <pgrails/pgrails_cli.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using pgrails::AnalyzeOptions;

void PrintCommandUsage(pgrails::AnalysisSuite suite) {
  std::cout
      << "Usage: pgrails-analyze " << pgrails::ToString(suite)
      << " [options]\n"
      << "Options:\n"
      << "  --root <path>         Directory inside the Rails application\n"
      << "                        (default: current directory)\n"
      << "  --format <list>       Comma-separated list of output formats\n"
      << "                        (supported: text,json)\n"
      << "  --out <path>          Directory for report files\n"
      << "  --config <file>       Optional YAML config file\n"
      << "  --rules <list>        Comma-separated rule names to run instead\n"
      << "                        of the command's defaults\n"
      << "  --reporter <name>     Reporter plug-in to render outputs\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
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

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      values.push_back(current);
      current.clear();
    } else {
      current.push_back(character);
    }
  }
  values.push_back(current);
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    if (value.empty()) {
      continue;
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(Trim(format));
    if (format.empty()) {
      continue;
    }
    if (format != "text" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
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
        pgrails::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = pgrails::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = pgrails::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandlePluginSelection(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--rules") {
    AppendValues(RequireValue(arguments, index, argument), options.rules);
    return true;
  }
  if (argument == "--reporter") {
    options.reporter = RequireValue(arguments, index, argument);
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
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, argument), options.formats);
    return true;
  }
  return HandleLoggingOption(arguments, index, options) ||
         HandlePluginSelection(arguments, index, options);
}

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"root",
                                                "formats",
                                                "out",
                                                "log_level",
                                                "rules",
                                                "reporter",
                                                "boolean_preview_limit",
                                                "where_preview_limit"};
  return keys;
}

// Keys are matched case-insensitively and `log-level` equals `log_level`.
std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
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

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or path value");
  }
  return node.as<std::string>();
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

std::size_t ExtractLimit(const YAML::Node &node, const std::string &key_name) {
  int value = -1;
  if (node.IsScalar() && node.Tag() != "!") {
    try {
      value = node.as<int>();
    } catch (const YAML::BadConversion &) {
      value = -1;
    }
  }
  if (value < 0) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a non-negative integer");
  }
  return static_cast<std::size_t>(value);
}

void ApplyConfigEntry(const std::string &key, const YAML::Node &node,
                      AnalyzeOptions &options) {
  if (key == "root") {
    options.root = ExtractStringScalar(node, key);
    return;
  }
  if (key == "out") {
    options.output_directory = ExtractStringScalar(node, key);
    return;
  }
  if (key == "formats") {
    options.formats = ExtractList(node, key, AppendFormats);
    return;
  }
  if (key == "rules") {
    options.rules = ExtractList(node, key, AppendValues);
    return;
  }
  if (key == "reporter") {
    options.reporter = ExtractStringScalar(node, key);
    return;
  }
  if (key == "log_level") {
    options.log_level = pgrails::ParseLogLevel(ExtractStringScalar(node, key));
    return;
  }
  if (key == "boolean_preview_limit") {
    options.boolean_preview_limit = ExtractLimit(node, key);
    return;
  }
  if (key == "where_preview_limit") {
    options.where_preview_limit = ExtractLimit(node, key);
    return;
  }
  ThrowUnknownKey(key);
}

YAML::Node LoadYamlConfig(const std::filesystem::path &path) {
  try {
    return YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw pgrails::ConfigParseError(path.string(), error.what());
  }
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const std::filesystem::path &directory,
                  pgrails::AnalysisSuite suite, const pgrails::Report &report) {
  std::filesystem::create_directories(directory);
  const auto stem = "pgrails_" + pgrails::ToString(suite);
  WriteFileIfContent(directory / (stem + ".txt"), report.text);
  WriteFileIfContent(directory / (stem + ".json"), report.json);
}

pgrails::LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options) {
  pgrails::LoggingConfig logging;
  logging.level = options.log_level.value_or(pgrails::LogLevel::kWarn);
  return logging;
}

pgrails::DefaultAnalyzerPipeline
BuildPipeline(const AnalyzeOptions &options, pgrails::AnalysisSuite suite,
              const std::shared_ptr<pgrails::Logger> &logger) {
  pgrails::AnalyzerPipelineBuilder builder;
  builder.WithLogger(logger).WithSuite(suite).WithRuleNames(options.rules);
  if (options.reporter) {
    builder.WithReporterName(*options.reporter);
  }
  return builder.Build();
}

} // namespace

namespace pgrails {

AnalysisSuite ParseSuite(const std::string &command) {
  if (command == "indexes") {
    return AnalysisSuite::kIndexes;
  }
  if (command == "n-plus-one") {
    return AnalysisSuite::kNPlusOne;
  }
  if (command == "config") {
    return AnalysisSuite::kConfig;
  }
  throw std::invalid_argument("Unknown command: " + command);
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

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  const auto root = LoadYamlConfig(path);
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  AnalyzeOptions options;
  options.config_file = path;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    ApplyConfigEntry(key, entry.second, options);
  }
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

  override_value(merged.root, cli_options.root);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.reporter, cli_options.reporter);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.boolean_preview_limit,
                 cli_options.boolean_preview_limit);
  override_value(merged.where_preview_limit, cli_options.where_preview_limit);

  if (!cli_options.formats.empty()) {
    merged.formats = cli_options.formats;
  }
  if (!cli_options.rules.empty()) {
    merged.rules = cli_options.rules;
  }
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

  auto merged = MergeOptions(config_options, cli_options);
  if (!merged.root) {
    merged.root = std::filesystem::current_path();
  }
  return merged;
}

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options,
                                   AnalysisSuite suite) {
  AnalysisConfig config;
  config.root_path =
      options.root.value_or(std::filesystem::current_path()).string();
  config.suite = suite;
  config.formats = options.formats.empty() ? std::vector<std::string>{"text"}
                                           : options.formats;
  if (options.boolean_preview_limit) {
    config.limits.boolean_preview = *options.boolean_preview_limit;
  }
  if (options.where_preview_limit) {
    config.limits.where_column_preview = *options.where_preview_limit;
  }
  return config;
}

int RunCommand(AnalysisSuite suite, const std::vector<std::string> &arguments) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintCommandUsage(suite);
    return 0;
  }

  const auto options = ResolveAnalyzeOptions(cli_options);
  auto logger = MakeLogger(BuildLoggingConfig(options), std::clog);
  auto pipeline = BuildPipeline(options, suite, logger);
  const auto config = BuildAnalysisConfig(options, suite);

  const auto result = pipeline.Run(config);
  std::cout << result.report.text;
  if (!options.output_directory && result.report.text.empty()) {
    std::cout << result.report.json << "\n";
  }
  for (const auto &error : result.summary.scan_errors) {
    std::cerr << "Warning: could not read " << error.file << ": "
              << error.message << "\n";
  }
  if (options.output_directory) {
    WriteReports(*options.output_directory, suite, result.report);
  }
  return ExitCodeFor(suite, result.findings);
}

} // namespace pgrails
