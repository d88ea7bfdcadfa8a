#pragma once

#include <pgrails/database_config.h>
#include <pgrails/models.h>

#include <string>
#include <vector>

namespace pgrails {

// Files a source rule reads: under one of `directories` (relative to the
// project root, any depth) and ending in one of `extensions`.
struct SourceScope {
  std::vector<std::string> directories;
  std::vector<std::string> extensions;

  bool Matches(const std::string &relative_path) const;
};

class SourceAcquirer {
public:
  virtual ~SourceAcquirer() = default;
  virtual ProjectSources Acquire(const AnalysisConfig &config) = 0;
};

class SchemaAnalyzer {
public:
  virtual ~SchemaAnalyzer() = default;
  virtual std::vector<Finding> Analyze(const SchemaModel &schema) = 0;
};

class SourceAnalyzer {
public:
  virtual ~SourceAnalyzer() = default;
  virtual const SourceScope &Scope() const = 0;
  virtual std::vector<Finding> Analyze(const SourceFile &file) = 0;
};

class ConfigAnalyzer {
public:
  virtual ~ConfigAnalyzer() = default;
  virtual std::vector<Finding> Analyze(const DatabaseConfig &config) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const AggregatedFindings &findings,
                        const RunSummary &summary,
                        const AnalysisConfig &config) = 0;
};

class AnalyzerPipeline {
public:
  virtual ~AnalyzerPipeline() = default;
  virtual PipelineResult Run(const AnalysisConfig &config) = 0;
};

} // namespace pgrails
