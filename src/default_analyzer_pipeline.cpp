#include <pgrails/default_analyzer_pipeline.h>

#include <pgrails/database_config.h>
#include <pgrails/finding_aggregator.h>
#include <pgrails/rails_project_acquirer.h>
#include <pgrails/schema_parser.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

namespace pgrails {
namespace {

void Append(std::vector<Finding> &target, std::vector<Finding> source) {
  target.insert(target.end(), std::make_move_iterator(source.begin()),
                std::make_move_iterator(source.end()));
}

} // namespace

DefaultAnalyzerPipeline::DefaultAnalyzerPipeline(PipelineComponents components)
    : source_acquirer_(std::move(components.source_acquirer)),
      schema_analyzers_(std::move(components.schema_analyzers)),
      source_analyzers_(std::move(components.source_analyzers)),
      config_analyzers_(std::move(components.config_analyzers)),
      reporter_(std::move(components.reporter)),
      logger_(EnsureLogger(std::move(components.logger))) {}

std::vector<std::string>
DefaultAnalyzerPipeline::ScopedFiles(const ProjectSources &sources) const {
  std::vector<std::string> scoped;
  std::copy_if(sources.files.begin(), sources.files.end(),
               std::back_inserter(scoped), [this](const std::string &file) {
                 return std::any_of(source_analyzers_.begin(),
                                    source_analyzers_.end(),
                                    [&file](const auto &analyzer) {
                                      return analyzer->Scope().Matches(file);
                                    });
               });
  return scoped;
}

PipelineResult DefaultAnalyzerPipeline::Run(const AnalysisConfig &config) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"root", config.root_path},
                {"suite", ToString(config.suite)},
                {"formats", std::to_string(config.formats.size())}});

  const auto pipeline_start = std::chrono::steady_clock::now();
  const auto sources = source_acquirer_->Acquire(config);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "acquire"},
                {"file_count", std::to_string(sources.files.size())}});

  RunSummary summary;
  summary.project_root = sources.project_root;
  std::vector<Finding> findings;

  if (!schema_analyzers_.empty()) {
    const auto schema = LoadSchemaModel(sources.schema_path, logger_);
    summary.table_count = schema.size();
    for (const auto &analyzer : schema_analyzers_) {
      Append(findings, analyzer->Analyze(schema));
    }
    logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
                 {{"stage", "schema"},
                  {"tables", std::to_string(schema.size())},
                  {"findings", std::to_string(findings.size())}});
  }

  if (!source_analyzers_.empty()) {
    auto read = ReadSourceFiles(sources.project_root, ScopedFiles(sources),
                                logger_);
    for (const auto &file : read.files) {
      for (const auto &analyzer : source_analyzers_) {
        if (analyzer->Scope().Matches(file.relative_path)) {
          Append(findings, analyzer->Analyze(file));
        }
      }
    }
    summary.files_scanned = read.files.size();
    summary.scan_errors = std::move(read.errors);
    logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
                 {{"stage", "source"},
                  {"files", std::to_string(summary.files_scanned)},
                  {"errors", std::to_string(summary.scan_errors.size())},
                  {"findings", std::to_string(findings.size())}});
  }

  if (!config_analyzers_.empty()) {
    const auto database_config =
        LoadDatabaseConfig(sources.database_config_path);
    for (const auto &analyzer : config_analyzers_) {
      Append(findings, analyzer->Analyze(database_config));
    }
    logger_->Log(
        LogLevel::kDebug, "pipeline.stage.complete",
        {{"stage", "config"},
         {"environments",
          std::to_string(database_config.environments.size())},
         {"findings", std::to_string(findings.size())}});
  }

  auto aggregated = AggregateFindings(std::move(findings));
  auto report = reporter_->Render(aggregated, summary, config);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"findings", std::to_string(aggregated.total)},
                {"warnings", std::to_string(aggregated.warning_count)}});

  return PipelineResult{std::move(report), std::move(aggregated),
                        std::move(summary)};
}

} // namespace pgrails
