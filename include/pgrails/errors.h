#pragma once

#include <stdexcept>
#include <string>

namespace pgrails {

class PgRailsError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ProjectRootNotFound : public PgRailsError {
public:
  explicit ProjectRootNotFound(const std::string &start)
      : PgRailsError("Not in a Rails application directory (searched upward "
                     "from " +
                     start + ")") {}
};

class SchemaFileMissing : public PgRailsError {
public:
  explicit SchemaFileMissing(const std::string &path)
      : PgRailsError("Could not find " + path) {}
};

class MalformedSchemaError : public PgRailsError {
public:
  explicit MalformedSchemaError(const std::string &path)
      : PgRailsError("Could not read schema file " + path) {}
};

class ConfigFileMissing : public PgRailsError {
public:
  explicit ConfigFileMissing(const std::string &path)
      : PgRailsError("Could not find " + path) {}
};

class ConfigParseError : public PgRailsError {
public:
  ConfigParseError(const std::string &path, const std::string &cause)
      : PgRailsError("Error parsing " + path + ": " + cause) {}
};

} // namespace pgrails
