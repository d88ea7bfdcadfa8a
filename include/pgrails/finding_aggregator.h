#pragma once

#include <pgrails/models.h>

#include <cstddef>
#include <string>
#include <vector>

namespace pgrails {

// Drops findings whose non-empty DedupKey() was already seen, then groups
// by type (AllFindingTypes() order) and by severity. Input order is kept
// inside each group.
AggregatedFindings AggregateFindings(std::vector<Finding> findings);

struct FindingPreview {
  std::vector<Finding> shown;
  std::size_t overflow = 0;
};

struct ColumnPreview {
  std::vector<std::string> columns;
  std::size_t unique_count = 0;
  std::size_t overflow = 0;
};

// Display limit for a group: boolean opportunities are capped, the other
// itemized groups are listed in full.
std::size_t PreviewLimit(FindingType type, const AggregationLimits &limits);

FindingPreview PreviewGroup(const FindingGroup &group,
                            const AggregationLimits &limits);

// Unique WHERE-clause column names, sorted, capped at
// limits.where_column_preview.
ColumnPreview PreviewWhereColumns(const FindingGroup &group,
                                  const AggregationLimits &limits);

} // namespace pgrails
