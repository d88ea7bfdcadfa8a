#include <pgrails/finding_aggregator.h>

#include <limits>
#include <map>
#include <set>
#include <unordered_set>
#include <utility>
#include <variant>

namespace pgrails {

AggregatedFindings AggregateFindings(std::vector<Finding> findings) {
  AggregatedFindings aggregated;
  std::unordered_set<std::string> seen_keys;
  std::map<FindingType, FindingGroup> by_type;

  for (auto &finding : findings) {
    const auto key = finding.DedupKey();
    if (!key.empty() && !seen_keys.insert(key).second) {
      ++aggregated.duplicates_dropped;
      continue;
    }

    auto &group = by_type[finding.type];
    group.type = finding.type;
    if (finding.severity == Severity::kWarning) {
      ++aggregated.warning_count;
      group.warnings.push_back(std::move(finding));
    } else {
      ++aggregated.info_count;
      group.infos.push_back(std::move(finding));
    }
    ++aggregated.total;
  }

  for (const auto type : AllFindingTypes()) {
    const auto found = by_type.find(type);
    if (found != by_type.end()) {
      aggregated.groups.push_back(std::move(found->second));
    }
  }
  return aggregated;
}

std::size_t PreviewLimit(FindingType type, const AggregationLimits &limits) {
  if (type == FindingType::kBooleanIndexOpportunity) {
    return limits.boolean_preview;
  }
  if (type == FindingType::kWhereClauseColumn) {
    return limits.where_column_preview;
  }
  return std::numeric_limits<std::size_t>::max();
}

FindingPreview PreviewGroup(const FindingGroup &group,
                            const AggregationLimits &limits) {
  const auto limit = PreviewLimit(group.type, limits);
  FindingPreview preview;
  for (auto &finding : group.All()) {
    if (preview.shown.size() >= limit) {
      ++preview.overflow;
      continue;
    }
    preview.shown.push_back(std::move(finding));
  }
  return preview;
}

ColumnPreview PreviewWhereColumns(const FindingGroup &group,
                                  const AggregationLimits &limits) {
  std::set<std::string> unique_columns;
  for (const auto &finding : group.All()) {
    if (const auto *source = std::get_if<SourceLocation>(&finding.location)) {
      unique_columns.insert(source->column);
    }
  }

  ColumnPreview preview;
  preview.unique_count = unique_columns.size();
  for (const auto &column : unique_columns) {
    if (preview.columns.size() >= limits.where_column_preview) {
      ++preview.overflow;
      continue;
    }
    preview.columns.push_back(column);
  }
  return preview;
}

} // namespace pgrails
