#include <pgrails/analyzer_pipeline_builder.h>

#include <pgrails/default_analyzer_pipeline.h>
#include <pgrails/rails_project_acquirer.h>

#include <utility>

namespace pgrails {

AnalyzerPipelineBuilder::AnalyzerPipelineBuilder(
    const ComponentRegistry &registry)
    : registry_(&registry) {
  selections_.reporter = registry_->DefaultReporterName();
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithSourceAcquirer(
    std::unique_ptr<SourceAcquirer> source_acquirer) {
  components_.source_acquirer = std::move(source_acquirer);
  return *this;
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithSchemaAnalyzer(
    std::unique_ptr<SchemaAnalyzer> analyzer) {
  components_.schema_analyzers.push_back(std::move(analyzer));
  return *this;
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithSourceAnalyzer(
    std::unique_ptr<SourceAnalyzer> analyzer) {
  components_.source_analyzers.push_back(std::move(analyzer));
  return *this;
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithConfigAnalyzer(
    std::unique_ptr<ConfigAnalyzer> analyzer) {
  components_.config_analyzers.push_back(std::move(analyzer));
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithReporter(std::unique_ptr<Reporter> reporter) {
  components_.reporter = std::move(reporter);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithSuite(AnalysisSuite suite) {
  selections_.suite = suite;
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithRuleNames(std::vector<std::string> names) {
  selections_.rules = std::move(names);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithReporterName(std::string name) {
  selections_.reporter = std::move(name);
  return *this;
}

bool AnalyzerPipelineBuilder::HasAnalyzers() const {
  return !components_.schema_analyzers.empty() ||
         !components_.source_analyzers.empty() ||
         !components_.config_analyzers.empty();
}

void AnalyzerPipelineBuilder::CreateRules(
    const std::vector<std::string> &names) {
  for (const auto &name : names) {
    switch (registry_->KindOf(name)) {
    case RuleKind::kSchema:
      components_.schema_analyzers.push_back(
          registry_->CreateSchemaRule(name, components_.logger));
      break;
    case RuleKind::kSource:
      components_.source_analyzers.push_back(
          registry_->CreateSourceRule(name, components_.logger));
      break;
    case RuleKind::kConfig:
      components_.config_analyzers.push_back(
          registry_->CreateConfigRule(name, components_.logger));
      break;
    }
  }
}

DefaultAnalyzerPipeline AnalyzerPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.source_acquirer =
      components_.source_acquirer
          ? std::move(components_.source_acquirer)
          : std::make_unique<RailsProjectAcquirer>(components_.logger);

  if (!HasAnalyzers()) {
    CreateRules(selections_.rules.empty()
                    ? registry_->SuiteRules(selections_.suite)
                    : selections_.rules);
  }

  components_.reporter = components_.reporter
                             ? std::move(components_.reporter)
                             : registry_->CreateReporter(selections_.reporter);
  return DefaultAnalyzerPipeline(std::move(components_));
}

} // namespace pgrails
