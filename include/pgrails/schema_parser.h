#pragma once

#include <pgrails/logging.h>
#include <pgrails/models.h>

#include <filesystem>
#include <memory>
#include <string>

namespace pgrails {

// Builds the table model from schema.rb text. Unrecognized text is skipped;
// this never throws for content reasons.
SchemaModel BuildSchemaModel(const std::string &content);

// Throws SchemaFileMissing when `path` does not exist and
// MalformedSchemaError when it cannot be read.
SchemaModel LoadSchemaModel(const std::filesystem::path &path,
                            std::shared_ptr<Logger> logger = nullptr);

} // namespace pgrails
