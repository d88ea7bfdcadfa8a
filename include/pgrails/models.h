#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pgrails {

enum class AnalysisSuite { kIndexes, kNPlusOne, kConfig };

enum class Severity { kWarning, kInfo };

enum class FindingType {
  kMissingForeignKeyIndex,
  kBooleanIndexOpportunity,
  kWhereClauseColumn,
  kPotentialNPlusOne,
  kViewAssociationAccess,
  kConnectionPoolSize,
  kStatementTimeout,
  kConnectTimeout,
  kCheckoutTimeout,
  kPreparedStatements,
  kReapingFrequency,
  kSslConfiguration,
  kPerformanceExtension
};

std::string ToString(AnalysisSuite suite);
std::string ToString(Severity severity);
std::string ToString(FindingType type);

// Declaration order of the enumeration; the aggregator groups in this order.
const std::vector<FindingType> &AllFindingTypes();

// Display caps; full counts are never truncated.
struct AggregationLimits {
  std::size_t boolean_preview = 5;
  std::size_t where_column_preview = 10;
};

struct AnalysisConfig {
  std::string root_path;
  AnalysisSuite suite = AnalysisSuite::kIndexes;
  std::vector<std::string> formats;
  AggregationLimits limits;
};

struct ProjectSources {
  std::string project_root;
  std::string schema_path;
  std::string database_config_path;
  // Paths relative to project_root, generic separators, sorted.
  std::vector<std::string> files;
};

struct SourceFile {
  std::string path;
  std::string relative_path;
  std::string content;
};

struct ScanError {
  std::string file;
  std::string message;
};

struct Table {
  std::string name;
  std::vector<std::string> columns;
  std::vector<std::string> foreign_keys;
  std::vector<std::string> indexes;

  bool HasIndexOn(const std::string &column) const;
};

// Tables keep the position of their first declaration. A later block with
// the same name replaces the earlier contents.
class SchemaModel {
public:
  void Put(Table table);
  Table *Find(const std::string &name);
  const Table *Find(const std::string &name) const;

  const std::vector<Table> &tables() const { return tables_; }
  std::size_t size() const { return tables_.size(); }
  bool empty() const { return tables_.empty(); }

private:
  std::vector<Table> tables_;
  std::unordered_map<std::string, std::size_t> positions_;
};

struct SchemaLocation {
  std::string table;
  std::string column;

  bool operator==(const SchemaLocation &) const = default;
};

struct SourceLocation {
  std::string file;
  int line = 0;
  // Database column the finding is about, when the rule knows one.
  std::string column;

  bool operator==(const SourceLocation &) const = default;
};

struct ConfigLocation {
  std::string environment;
  std::string setting;

  bool operator==(const ConfigLocation &) const = default;
};

using Location = std::variant<SchemaLocation, SourceLocation, ConfigLocation>;

struct Finding {
  FindingType type = FindingType::kMissingForeignKeyIndex;
  Severity severity = Severity::kInfo;
  std::string message;
  std::optional<std::string> suggestion;
  Location location;

  // Empty when the rule that produced the finding does not deduplicate.
  std::string DedupKey() const;
  std::string LocationLabel() const;

  bool operator==(const Finding &) const = default;
};

struct FindingGroup {
  FindingType type = FindingType::kMissingForeignKeyIndex;
  std::vector<Finding> warnings;
  std::vector<Finding> infos;

  std::size_t Count() const { return warnings.size() + infos.size(); }
  std::vector<Finding> All() const;
};

struct AggregatedFindings {
  std::vector<FindingGroup> groups;
  std::size_t total = 0;
  std::size_t warning_count = 0;
  std::size_t info_count = 0;
  std::size_t duplicates_dropped = 0;

  const FindingGroup *Find(FindingType type) const;
  bool HasWarnings() const { return warning_count > 0; }
};

struct Report {
  std::string text;
  std::string json;
};

struct RunSummary {
  std::string project_root;
  std::size_t table_count = 0;
  std::size_t files_scanned = 0;
  std::vector<ScanError> scan_errors;
};

struct PipelineResult {
  Report report;
  AggregatedFindings findings;
  RunSummary summary;
};

} // namespace pgrails
