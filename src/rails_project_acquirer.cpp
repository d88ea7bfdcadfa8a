#include <pgrails/errors.h>
#include <pgrails/rails_project_acquirer.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <system_error>
#include <utility>

namespace pgrails {

namespace {

const std::filesystem::path kApplicationMarker =
    std::filesystem::path("config") / "application.rb";

bool IsSourceExtension(const std::filesystem::path &path) {
  static const std::set<std::string> kExtensions = {".rb", ".erb", ".haml"};
  return kExtensions.count(path.extension().string()) > 0;
}

std::vector<std::string> CollectSourceFiles(const std::filesystem::path &root,
                                            Logger &logger) {
  std::vector<std::string> files;
  const auto app_directory = root / "app";
  std::error_code error;
  if (!std::filesystem::is_directory(app_directory, error)) {
    logger.Log(LogLevel::kWarn, "acquire.no_app_directory",
               {{"path", app_directory.string()}});
    return files;
  }

  std::filesystem::recursive_directory_iterator it(
      app_directory,
      std::filesystem::directory_options::skip_permission_denied, error);
  for (std::filesystem::recursive_directory_iterator end;
       !error && it != end; it.increment(error)) {
    const auto &entry = *it;
    std::error_code status_error;
    if (!entry.is_regular_file(status_error) ||
        !IsSourceExtension(entry.path())) {
      continue;
    }
    files.push_back(
        std::filesystem::relative(entry.path(), root).generic_string());
  }
  if (error) {
    logger.Log(LogLevel::kWarn, "acquire.walk_failed",
               {{"path", app_directory.string()}, {"error", error.message()}});
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace

bool SourceScope::Matches(const std::string &relative_path) const {
  const std::filesystem::path path(relative_path);
  const auto extension = path.extension().string();
  if (std::find(extensions.begin(), extensions.end(), extension) ==
      extensions.end()) {
    return false;
  }
  const auto generic = path.generic_string();
  return std::any_of(directories.begin(), directories.end(),
                     [&](const std::string &directory) {
                       return generic.rfind(directory + "/", 0) == 0;
                     });
}

std::filesystem::path FindProjectRoot(const std::filesystem::path &start) {
  auto current = std::filesystem::weakly_canonical(
      start.empty() ? std::filesystem::current_path() : start);
  while (true) {
    if (std::filesystem::exists(current / kApplicationMarker)) {
      return current;
    }
    if (current == current.parent_path()) {
      break;
    }
    current = current.parent_path();
  }
  throw ProjectRootNotFound(start.empty() ? std::string(".") : start.string());
}

SourceReadResult ReadSourceFiles(const std::filesystem::path &root,
                                 const std::vector<std::string> &relative_paths,
                                 const std::shared_ptr<Logger> &logger) {
  const auto sink = EnsureLogger(logger);
  SourceReadResult result;
  for (const auto &relative : relative_paths) {
    const auto path = root / relative;
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
      result.errors.push_back({path.string(), "file could not be opened"});
      sink->Log(LogLevel::kWarn, "scan.read_failed",
                {{"file", path.string()}});
      continue;
    }
    std::string content((std::istreambuf_iterator<char>(stream)),
                        std::istreambuf_iterator<char>());
    if (stream.bad()) {
      result.errors.push_back({path.string(), "read error"});
      sink->Log(LogLevel::kWarn, "scan.read_failed",
                {{"file", path.string()}});
      continue;
    }
    result.files.push_back({path.string(), relative, std::move(content)});
  }
  return result;
}

RailsProjectAcquirer::RailsProjectAcquirer(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

ProjectSources RailsProjectAcquirer::Acquire(const AnalysisConfig &config) {
  const auto root = FindProjectRoot(config.root_path);

  ProjectSources sources;
  sources.project_root = root.string();
  sources.schema_path = (root / "db" / "schema.rb").string();
  sources.database_config_path = (root / "config" / "database.yml").string();
  sources.files = CollectSourceFiles(root, *logger_);

  logger_->Log(LogLevel::kInfo, "acquire.complete",
               {{"root", sources.project_root},
                {"files", std::to_string(sources.files.size())}});
  return sources;
}

} // namespace pgrails
