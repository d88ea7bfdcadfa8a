#include <pgrails/connection_analyzers.h>

#include <string>
#include <utility>

namespace pgrails {

namespace {

constexpr const char kProduction[] = "production";

bool HasKey(const YAML::Node &settings, const std::string &key) {
  return settings.IsMap() && settings[key].IsDefined();
}

// Absent and explicit null are treated alike.
bool IsUnset(const YAML::Node &settings, const std::string &key) {
  return !HasKey(settings, key) || settings[key].IsNull();
}

bool ReadPlainInt(const YAML::Node &node, int &value) {
  if (!node.IsScalar() || node.Tag() == "!") {
    return false;
  }
  return YAML::convert<int>::decode(node, value);
}

bool IsExplicitFalse(const YAML::Node &node) {
  bool value = true;
  return node.IsScalar() && node.Tag() != "!" &&
         YAML::convert<bool>::decode(node, value) && !value;
}

// Unquoted false-like scalars (no, off, 0) disable SSL as much as `disable`.
bool IsSslDisabled(const YAML::Node &node) {
  int number = 0;
  if (IsExplicitFalse(node) || (ReadPlainInt(node, number) && number == 0)) {
    return true;
  }
  if (!node.IsScalar()) {
    return false;
  }
  const auto &value = node.Scalar();
  return value.empty() || value == "disable";
}

void AddFinding(std::vector<Finding> &findings, FindingType type,
                Severity severity, const std::string &environment,
                const std::string &setting, std::string message,
                std::string recommendation) {
  Finding finding;
  finding.type = type;
  finding.severity = severity;
  finding.message = std::move(message);
  finding.suggestion = std::move(recommendation);
  finding.location = ConfigLocation{environment, setting};
  findings.push_back(std::move(finding));
}

} // namespace

std::vector<Finding>
EnvironmentConfigAnalyzer::Analyze(const DatabaseConfig &config) {
  std::vector<Finding> findings;
  for (const auto &name : AnalyzedEnvironments()) {
    const auto *environment = config.Find(name);
    if (environment == nullptr || !environment->settings.IsMap()) {
      continue;
    }
    AnalyzeEnvironment(*environment, findings);
  }
  return findings;
}

void ConnectionPoolAnalyzer::AnalyzeEnvironment(
    const EnvironmentConfig &environment, std::vector<Finding> &findings) {
  const auto &settings = environment.settings;
  if (IsUnset(settings, "pool")) {
    AddFinding(findings, FindingType::kConnectionPoolSize, Severity::kWarning,
               environment.name, "pool",
               "Connection pool size not explicitly set (defaults to 5)",
               "Set pool size based on your application threads/workers. For "
               "Puma with 5 threads: pool: 5");
    return;
  }

  int pool_size = 0;
  if (!ReadPlainInt(settings["pool"], pool_size)) {
    return;
  }
  if (pool_size < kMinimumPoolSize) {
    AddFinding(findings, FindingType::kConnectionPoolSize, Severity::kWarning,
               environment.name, "pool",
               "Connection pool size (" + std::to_string(pool_size) +
                   ") is quite small",
               "Consider increasing pool size to match your web server "
               "threads/workers");
  } else if (pool_size > kMaximumPoolSize) {
    AddFinding(findings, FindingType::kConnectionPoolSize, Severity::kInfo,
               environment.name, "pool",
               "Connection pool size (" + std::to_string(pool_size) +
                   ") is quite large",
               "Verify this matches your actual concurrency needs. Too many "
               "connections can strain PostgreSQL");
  }
}

void TimeoutAnalyzer::AnalyzeEnvironment(const EnvironmentConfig &environment,
                                         std::vector<Finding> &findings) {
  const auto &settings = environment.settings;
  const auto variables = settings["variables"];
  if (!variables.IsDefined() || !variables.IsMap() ||
      !variables["statement_timeout"].IsDefined()) {
    AddFinding(findings, FindingType::kStatementTimeout, Severity::kWarning,
               environment.name, "statement_timeout",
               "statement_timeout not configured",
               "Add to database.yml:\n"
               "  variables:\n"
               "    statement_timeout: 30000  # 30 seconds in milliseconds");
  }

  if (!HasKey(settings, "connect_timeout")) {
    AddFinding(findings, FindingType::kConnectTimeout, Severity::kInfo,
               environment.name, "connect_timeout",
               "connect_timeout not configured",
               "Add connect_timeout: 5 to prevent hanging on database "
               "connection issues");
  }

  if (!HasKey(settings, "checkout_timeout")) {
    AddFinding(findings, FindingType::kCheckoutTimeout, Severity::kInfo,
               environment.name, "checkout_timeout",
               "checkout_timeout not configured (defaults to 5 seconds)",
               "Explicitly set checkout_timeout: 5 for clarity");
  }
}

void PreparedStatementsAnalyzer::AnalyzeEnvironment(
    const EnvironmentConfig &environment, std::vector<Finding> &findings) {
  const auto &settings = environment.settings;
  if (!IsUnset(settings, "prepared_statements")) {
    if (IsExplicitFalse(settings["prepared_statements"])) {
      AddFinding(findings, FindingType::kPreparedStatements, Severity::kInfo,
                 environment.name, "prepared_statements",
                 "Prepared statements are disabled",
                 "Prepared statements improve performance. Only disable if "
                 "using PgBouncer in transaction mode");
    }
    return;
  }
  if (environment.name == kProduction) {
    AddFinding(findings, FindingType::kPreparedStatements, Severity::kInfo,
               environment.name, "prepared_statements",
               "Prepared statements setting not explicit",
               "Add prepared_statements: true for better query performance "
               "(enabled by default)");
  }
}

void ReapingFrequencyAnalyzer::AnalyzeEnvironment(
    const EnvironmentConfig &environment, std::vector<Finding> &findings) {
  if (environment.name != kProduction ||
      HasKey(environment.settings, "reaping_frequency")) {
    return;
  }
  AddFinding(findings, FindingType::kReapingFrequency, Severity::kInfo,
             environment.name, "reaping_frequency",
             "reaping_frequency not configured",
             "Consider adding reaping_frequency: 60 to clean up stale "
             "connections (seconds)");
}

void SslConfigurationAnalyzer::AnalyzeEnvironment(
    const EnvironmentConfig &environment, std::vector<Finding> &findings) {
  if (environment.name != kProduction) {
    return;
  }
  const auto &settings = environment.settings;
  if (!IsUnset(settings, "sslmode") && !IsSslDisabled(settings["sslmode"])) {
    return;
  }
  AddFinding(findings, FindingType::kSslConfiguration, Severity::kWarning,
             environment.name, "sslmode",
             "SSL/TLS not enforced for production database connections",
             "Add sslmode: require or sslmode: verify-full for secure "
             "connections");
}

std::vector<Finding>
PerformanceExtensionAnalyzer::Analyze(const DatabaseConfig &) {
  std::vector<Finding> findings;
  AddFinding(findings, FindingType::kPerformanceExtension, Severity::kInfo,
             "all", "extensions",
             "Consider enabling pg_stat_statements extension",
             "Enable in PostgreSQL config:\n"
             "  shared_preload_libraries = 'pg_stat_statements'\n"
             "Then run: CREATE EXTENSION IF NOT EXISTS pg_stat_statements;");
  return findings;
}

} // namespace pgrails
