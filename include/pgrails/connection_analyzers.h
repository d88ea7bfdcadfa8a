#pragma once

#include <pgrails/interfaces.h>

namespace pgrails {

// Visits every environment of AnalyzedEnvironments() present in the
// configuration, in that order.
class EnvironmentConfigAnalyzer : public ConfigAnalyzer {
public:
  std::vector<Finding> Analyze(const DatabaseConfig &config) override;

protected:
  virtual void AnalyzeEnvironment(const EnvironmentConfig &environment,
                                  std::vector<Finding> &findings) = 0;
};

class ConnectionPoolAnalyzer : public EnvironmentConfigAnalyzer {
public:
  static constexpr int kMinimumPoolSize = 5;
  static constexpr int kMaximumPoolSize = 20;

protected:
  void AnalyzeEnvironment(const EnvironmentConfig &environment,
                          std::vector<Finding> &findings) override;
};

// statement_timeout, connect_timeout and checkout_timeout.
class TimeoutAnalyzer : public EnvironmentConfigAnalyzer {
protected:
  void AnalyzeEnvironment(const EnvironmentConfig &environment,
                          std::vector<Finding> &findings) override;
};

class PreparedStatementsAnalyzer : public EnvironmentConfigAnalyzer {
protected:
  void AnalyzeEnvironment(const EnvironmentConfig &environment,
                          std::vector<Finding> &findings) override;
};

class ReapingFrequencyAnalyzer : public EnvironmentConfigAnalyzer {
protected:
  void AnalyzeEnvironment(const EnvironmentConfig &environment,
                          std::vector<Finding> &findings) override;
};

class SslConfigurationAnalyzer : public EnvironmentConfigAnalyzer {
protected:
  void AnalyzeEnvironment(const EnvironmentConfig &environment,
                          std::vector<Finding> &findings) override;
};

// Always recommends pg_stat_statements, once, for environment "all".
class PerformanceExtensionAnalyzer : public ConfigAnalyzer {
public:
  std::vector<Finding> Analyze(const DatabaseConfig &config) override;
};

} // namespace pgrails
