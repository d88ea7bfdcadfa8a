#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pgrails {

// Pattern extraction over raw Ruby and schema.rb text. Every function is a
// pure function of its input; text that does not match is ignored.

struct TableBlock {
  std::string name;
  std::string body;
};

struct ColumnDeclaration {
  std::string type;
  std::string name;
};

struct IndexDeclaration {
  std::string table;
  std::string first_column;
};

struct WhereFilter {
  std::string column;
  int line = 0;
};

std::vector<std::string> SplitLines(const std::string &content);

// `create_table "name" ... do |t| <body> end` spans.
std::vector<TableBlock> ExtractTableBlocks(const std::string &content);
// `t.<type> "<name>"` lines of a table body.
std::vector<ColumnDeclaration> ExtractColumns(const std::string &body);
// Declared columns whose name ends in `_id`.
std::vector<std::string> ExtractForeignKeyColumns(const std::string &body);
// `add_index "table", ["col", ...]` statements; only the first column.
std::vector<IndexDeclaration>
ExtractIndexDeclarations(const std::string &content);
// `t.index ["col", ...]` lines of a table body; only the first column.
std::vector<std::string> ExtractInlineIndexColumns(const std::string &body);

// `.where(column: ...)` and `.where("column = ...")` call sites.
std::vector<WhereFilter> ExtractWhereFilters(const std::string &content);

bool IsQueryFetch(const std::string &line);
bool HasEagerLoading(const std::string &text);
// Instance variable assigned on the line, without the leading `@`.
std::optional<std::string> ExtractInstanceAssignment(const std::string &line);
// `@variable.a.b` on the line.
bool HasChainedMemberAccess(const std::string &line,
                            const std::string &variable);
// `object.association.method` on the line.
bool HasAssociationChain(const std::string &line);

} // namespace pgrails
