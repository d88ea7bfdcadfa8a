#include <pgrails/database_config.h>
#include <pgrails/errors.h>

#include <fstream>
#include <iterator>

namespace pgrails {

namespace {

void ReplaceAll(std::string &content, const std::string &token) {
  for (auto position = content.find(token); position != std::string::npos;
       position = content.find(token, position)) {
    content.erase(position, token.size());
  }
}

void MergeInto(YAML::Node &target, const YAML::Node &source) {
  if (!source.IsMap()) {
    return;
  }
  for (const auto &entry : source) {
    const auto key = entry.first.as<std::string>();
    const YAML::Node &existing = target;
    if (!existing[key]) {
      target[key] = entry.second;
    }
  }
}

// Resolves `<<: *anchor` merge keys, which yaml-cpp leaves as plain
// entries. Keys already present take precedence over merged ones.
YAML::Node ResolveMergeKeys(const YAML::Node &mapping) {
  YAML::Node resolved(YAML::NodeType::Map);
  YAML::Node merge_sources;
  for (const auto &entry : mapping) {
    const auto key = entry.first.as<std::string>();
    if (key == "<<") {
      merge_sources = entry.second;
      continue;
    }
    resolved[key] =
        entry.second.IsMap() ? ResolveMergeKeys(entry.second) : entry.second;
  }
  if (merge_sources.IsSequence()) {
    for (const auto &source : merge_sources) {
      MergeInto(resolved, ResolveMergeKeys(source));
    }
  } else if (merge_sources.IsMap()) {
    MergeInto(resolved, ResolveMergeKeys(merge_sources));
  }
  return resolved;
}

} // namespace

const EnvironmentConfig *DatabaseConfig::Find(const std::string &name) const {
  for (const auto &environment : environments) {
    if (environment.name == name) {
      return &environment;
    }
  }
  return nullptr;
}

const std::vector<std::string> &AnalyzedEnvironments() {
  static const std::vector<std::string> environments = {
      "development", "test", "production"};
  return environments;
}

std::string StripErbTags(std::string content) {
  ReplaceAll(content, "<%=");
  ReplaceAll(content, "%>");
  return content;
}

DatabaseConfig ParseDatabaseConfig(const std::string &content,
                                   const std::string &source_name) {
  YAML::Node root;
  try {
    root = YAML::Load(StripErbTags(content));
  } catch (const YAML::Exception &error) {
    throw ConfigParseError(source_name, error.what());
  }
  if (!root.IsMap()) {
    throw ConfigParseError(source_name,
                           "expected a mapping of environments at the root");
  }

  DatabaseConfig config;
  try {
    for (const auto &entry : root) {
      if (!entry.second.IsMap()) {
        continue;
      }
      config.environments.push_back(
          {entry.first.as<std::string>(), ResolveMergeKeys(entry.second)});
    }
  } catch (const YAML::Exception &error) {
    throw ConfigParseError(source_name, error.what());
  }
  return config;
}

DatabaseConfig LoadDatabaseConfig(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigFileMissing(path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw ConfigParseError(path.string(), "file could not be opened");
  }
  const std::string content((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
  return ParseDatabaseConfig(content, path.string());
}

} // namespace pgrails
