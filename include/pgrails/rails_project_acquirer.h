#pragma once

#include <pgrails/interfaces.h>
#include <pgrails/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace pgrails {

// Walks upward from `start` to the first directory holding
// config/application.rb. Throws ProjectRootNotFound.
std::filesystem::path FindProjectRoot(const std::filesystem::path &start);

struct SourceReadResult {
  std::vector<SourceFile> files;
  std::vector<ScanError> errors;
};

// Reads each file; failures are collected and the remaining files are still
// read.
SourceReadResult ReadSourceFiles(const std::filesystem::path &root,
                                 const std::vector<std::string> &relative_paths,
                                 const std::shared_ptr<Logger> &logger);

class RailsProjectAcquirer : public SourceAcquirer {
public:
  explicit RailsProjectAcquirer(std::shared_ptr<Logger> logger = nullptr);
  ProjectSources Acquire(const AnalysisConfig &config) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace pgrails
