#include <pgrails/models.h>

#include <algorithm>
#include <filesystem>
#include <utility>

namespace pgrails {

std::string ToString(AnalysisSuite suite) {
  switch (suite) {
  case AnalysisSuite::kIndexes:
    return "indexes";
  case AnalysisSuite::kNPlusOne:
    return "n-plus-one";
  case AnalysisSuite::kConfig:
    return "config";
  }
  return "unknown";
}

std::string ToString(Severity severity) {
  switch (severity) {
  case Severity::kWarning:
    return "warning";
  case Severity::kInfo:
    return "info";
  }
  return "unknown";
}

std::string ToString(FindingType type) {
  switch (type) {
  case FindingType::kMissingForeignKeyIndex:
    return "missing_foreign_key_index";
  case FindingType::kBooleanIndexOpportunity:
    return "boolean_index_opportunity";
  case FindingType::kWhereClauseColumn:
    return "where_clause_column";
  case FindingType::kPotentialNPlusOne:
    return "potential_n_plus_one";
  case FindingType::kViewAssociationAccess:
    return "view_association_access";
  case FindingType::kConnectionPoolSize:
    return "connection_pool_size";
  case FindingType::kStatementTimeout:
    return "statement_timeout";
  case FindingType::kConnectTimeout:
    return "connect_timeout";
  case FindingType::kCheckoutTimeout:
    return "checkout_timeout";
  case FindingType::kPreparedStatements:
    return "prepared_statements";
  case FindingType::kReapingFrequency:
    return "reaping_frequency";
  case FindingType::kSslConfiguration:
    return "ssl_configuration";
  case FindingType::kPerformanceExtension:
    return "performance_extension";
  }
  return "unknown";
}

const std::vector<FindingType> &AllFindingTypes() {
  static const std::vector<FindingType> types = {
      FindingType::kMissingForeignKeyIndex,
      FindingType::kBooleanIndexOpportunity,
      FindingType::kWhereClauseColumn,
      FindingType::kPotentialNPlusOne,
      FindingType::kViewAssociationAccess,
      FindingType::kConnectionPoolSize,
      FindingType::kStatementTimeout,
      FindingType::kConnectTimeout,
      FindingType::kCheckoutTimeout,
      FindingType::kPreparedStatements,
      FindingType::kReapingFrequency,
      FindingType::kSslConfiguration,
      FindingType::kPerformanceExtension};
  return types;
}

bool Table::HasIndexOn(const std::string &column) const {
  return std::find(indexes.begin(), indexes.end(), column) != indexes.end();
}

void SchemaModel::Put(Table table) {
  const auto existing = positions_.find(table.name);
  if (existing != positions_.end()) {
    tables_[existing->second] = std::move(table);
    return;
  }
  positions_.emplace(table.name, tables_.size());
  tables_.push_back(std::move(table));
}

Table *SchemaModel::Find(const std::string &name) {
  const auto found = positions_.find(name);
  return found == positions_.end() ? nullptr : &tables_[found->second];
}

const Table *SchemaModel::Find(const std::string &name) const {
  const auto found = positions_.find(name);
  return found == positions_.end() ? nullptr : &tables_[found->second];
}

std::string Finding::DedupKey() const {
  if (type != FindingType::kWhereClauseColumn) {
    return {};
  }
  const auto *source = std::get_if<SourceLocation>(&location);
  if (source == nullptr) {
    return {};
  }
  return std::filesystem::path(source->file).stem().string() + ":" +
         source->column;
}

std::string Finding::LocationLabel() const {
  if (const auto *schema = std::get_if<SchemaLocation>(&location)) {
    return "Table: " + schema->table + ", Column: " + schema->column;
  }
  if (const auto *source = std::get_if<SourceLocation>(&location)) {
    if (source->line > 0) {
      return source->file + ":" + std::to_string(source->line);
    }
    return source->file;
  }
  const auto &config = std::get<ConfigLocation>(location);
  return "[" + config.environment + "] " + config.setting;
}

std::vector<Finding> FindingGroup::All() const {
  std::vector<Finding> all = warnings;
  all.insert(all.end(), infos.begin(), infos.end());
  return all;
}

const FindingGroup *AggregatedFindings::Find(FindingType type) const {
  const auto found =
      std::find_if(groups.begin(), groups.end(),
                   [&](const FindingGroup &group) { return group.type == type; });
  return found == groups.end() ? nullptr : &*found;
}

} // namespace pgrails
