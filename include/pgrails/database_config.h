#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace pgrails {

struct EnvironmentConfig {
  std::string name;
  YAML::Node settings;
};

// Top-level mapping entries of database.yml, in file order. Entries whose
// value is not a mapping are not kept.
struct DatabaseConfig {
  std::vector<EnvironmentConfig> environments;

  const EnvironmentConfig *Find(const std::string &name) const;
};

// Environments the connection rules inspect, in report order.
const std::vector<std::string> &AnalyzedEnvironments();

std::string StripErbTags(std::string content);

DatabaseConfig ParseDatabaseConfig(const std::string &content,
                                   const std::string &source_name);
DatabaseConfig LoadDatabaseConfig(const std::filesystem::path &path);

} // namespace pgrails
