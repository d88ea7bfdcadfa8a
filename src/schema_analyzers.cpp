#include <pgrails/schema_analyzers.h>

#include <algorithm>
#include <array>
#include <string>
#include <utility>

namespace pgrails {

namespace {

constexpr std::array<const char *, 2> kBooleanPrefixes = {"is_", "has_"};
constexpr std::array<const char *, 4> kBooleanNames = {"active", "enabled",
                                                       "published", "deleted"};

Finding MakeSchemaFinding(FindingType type, Severity severity,
                          const Table &table, const std::string &column,
                          std::string message, std::string suggestion) {
  Finding finding;
  finding.type = type;
  finding.severity = severity;
  finding.message = std::move(message);
  finding.suggestion = std::move(suggestion);
  finding.location = SchemaLocation{table.name, column};
  return finding;
}

} // namespace

std::vector<Finding>
MissingForeignKeyIndexAnalyzer::Analyze(const SchemaModel &schema) {
  std::vector<Finding> findings;
  for (const auto &table : schema.tables()) {
    for (const auto &column : table.foreign_keys) {
      if (table.HasIndexOn(column)) {
        continue;
      }
      findings.push_back(MakeSchemaFinding(
          FindingType::kMissingForeignKeyIndex, Severity::kWarning, table,
          column,
          "Foreign key " + column + " on " + table.name +
              " should have an index",
          "add_index :" + table.name + ", :" + column));
    }
  }
  return findings;
}

bool BooleanColumnAnalyzer::LooksBoolean(const std::string &column) {
  const auto has_prefix =
      std::any_of(kBooleanPrefixes.begin(), kBooleanPrefixes.end(),
                  [&](const char *prefix) { return column.rfind(prefix, 0) == 0; });
  return has_prefix ||
         std::find(kBooleanNames.begin(), kBooleanNames.end(), column) !=
             kBooleanNames.end();
}

std::vector<Finding> BooleanColumnAnalyzer::Analyze(const SchemaModel &schema) {
  std::vector<Finding> findings;
  for (const auto &table : schema.tables()) {
    for (const auto &column : table.columns) {
      if (!LooksBoolean(column) || table.HasIndexOn(column)) {
        continue;
      }
      findings.push_back(MakeSchemaFinding(
          FindingType::kBooleanIndexOpportunity, Severity::kInfo, table,
          column,
          "Boolean column " + column + " on " + table.name +
              " might benefit from a partial index",
          "add_index :" + table.name + ", :" + column + ", where: \"" +
              column + " = true\""));
    }
  }
  return findings;
}

} // namespace pgrails
