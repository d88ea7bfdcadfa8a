#include <pgrails/errors.h>
#include <pgrails/schema_parser.h>
#include <pgrails/text_extractor.h>

#include <fstream>
#include <iterator>
#include <utility>

namespace pgrails {

namespace {

Table BuildTable(const TableBlock &block) {
  Table table;
  table.name = block.name;
  for (auto &column : ExtractColumns(block.body)) {
    table.columns.push_back(std::move(column.name));
  }
  table.foreign_keys = ExtractForeignKeyColumns(block.body);
  table.indexes = ExtractInlineIndexColumns(block.body);
  return table;
}

} // namespace

SchemaModel BuildSchemaModel(const std::string &content) {
  SchemaModel model;
  for (const auto &block : ExtractTableBlocks(content)) {
    model.Put(BuildTable(block));
  }

  for (const auto &index : ExtractIndexDeclarations(content)) {
    auto *table = model.Find(index.table);
    if (table == nullptr) {
      continue;
    }
    table->indexes.push_back(index.first_column);
  }
  return model;
}

SchemaModel LoadSchemaModel(const std::filesystem::path &path,
                            std::shared_ptr<Logger> logger) {
  logger = EnsureLogger(std::move(logger));
  if (!std::filesystem::exists(path)) {
    throw SchemaFileMissing(path.string());
  }

  std::ifstream stream(path);
  if (!stream) {
    throw MalformedSchemaError(path.string());
  }
  const std::string content((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
  if (stream.bad()) {
    throw MalformedSchemaError(path.string());
  }

  auto model = BuildSchemaModel(content);
  logger->Log(LogLevel::kInfo, "schema.parsed",
              {{"path", path.string()},
               {"tables", std::to_string(model.size())}});
  return model;
}

} // namespace pgrails
