#pragma once

#include <pgrails/component_registry.h>
#include <pgrails/interfaces.h>
#include <pgrails/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace pgrails {

class DefaultAnalyzerPipeline;

struct PipelineComponents {
  std::unique_ptr<SourceAcquirer> source_acquirer;
  std::vector<std::unique_ptr<SchemaAnalyzer>> schema_analyzers;
  std::vector<std::unique_ptr<SourceAnalyzer>> source_analyzers;
  std::vector<std::unique_ptr<ConfigAnalyzer>> config_analyzers;
  std::unique_ptr<Reporter> reporter;
  std::shared_ptr<Logger> logger;
};

// Analyzers added directly are used as given. When none are added, Build()
// creates the rules named by WithRuleNames(), or the suite's default rules.
class AnalyzerPipelineBuilder {
public:
  explicit AnalyzerPipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  AnalyzerPipelineBuilder &
  WithSourceAcquirer(std::unique_ptr<SourceAcquirer> source_acquirer);
  AnalyzerPipelineBuilder &
  WithSchemaAnalyzer(std::unique_ptr<SchemaAnalyzer> analyzer);
  AnalyzerPipelineBuilder &
  WithSourceAnalyzer(std::unique_ptr<SourceAnalyzer> analyzer);
  AnalyzerPipelineBuilder &
  WithConfigAnalyzer(std::unique_ptr<ConfigAnalyzer> analyzer);
  AnalyzerPipelineBuilder &WithReporter(std::unique_ptr<Reporter> reporter);
  AnalyzerPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  AnalyzerPipelineBuilder &WithSuite(AnalysisSuite suite);
  AnalyzerPipelineBuilder &WithRuleNames(std::vector<std::string> names);
  AnalyzerPipelineBuilder &WithReporterName(std::string name);

  DefaultAnalyzerPipeline Build();

private:
  bool HasAnalyzers() const;
  void CreateRules(const std::vector<std::string> &names);

  const ComponentRegistry *registry_;
  struct ComponentSelections {
    AnalysisSuite suite = AnalysisSuite::kIndexes;
    std::vector<std::string> rules;
    std::string reporter;
  } selections_;
  PipelineComponents components_;
};

} // namespace pgrails
