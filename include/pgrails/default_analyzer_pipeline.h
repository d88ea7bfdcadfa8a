#pragma once

#include <pgrails/analyzer_pipeline_builder.h>

#include <memory>
#include <vector>

namespace pgrails {

// Loads only the inputs its analyzers need: the schema for schema rules,
// database.yml for config rules, and the files some source rule scopes.
class DefaultAnalyzerPipeline : public AnalyzerPipeline {
public:
  explicit DefaultAnalyzerPipeline(PipelineComponents components);

  PipelineResult Run(const AnalysisConfig &config) override;

private:
  std::vector<std::string> ScopedFiles(const ProjectSources &sources) const;

  std::unique_ptr<SourceAcquirer> source_acquirer_;
  std::vector<std::unique_ptr<SchemaAnalyzer>> schema_analyzers_;
  std::vector<std::unique_ptr<SourceAnalyzer>> source_analyzers_;
  std::vector<std::unique_ptr<ConfigAnalyzer>> config_analyzers_;
  std::unique_ptr<Reporter> reporter_;
  std::shared_ptr<Logger> logger_;
};

} // namespace pgrails
