#pragma once

#include <pgrails/interfaces.h>

namespace pgrails {

// `_id` columns with no index whose first column is that column.
class MissingForeignKeyIndexAnalyzer : public SchemaAnalyzer {
public:
  std::vector<Finding> Analyze(const SchemaModel &schema) override;
};

// Boolean-looking, unindexed columns; suggests a partial index on `true`.
class BooleanColumnAnalyzer : public SchemaAnalyzer {
public:
  std::vector<Finding> Analyze(const SchemaModel &schema) override;

  static bool LooksBoolean(const std::string &column);
};

} // namespace pgrails
