#include <pgrails/source_analyzers.h>
#include <pgrails/text_extractor.h>

#include <algorithm>
#include <set>
#include <string>
#include <utility>

namespace pgrails {

namespace {

std::string DisplayPath(const SourceFile &file) {
  return file.relative_path.empty() ? file.path : file.relative_path;
}

Finding MakeSourceFinding(FindingType type, Severity severity,
                          const SourceFile &file, int line,
                          std::string message, std::string column = {}) {
  Finding finding;
  finding.type = type;
  finding.severity = severity;
  finding.message = std::move(message);
  finding.location = SourceLocation{DisplayPath(file), line, std::move(column)};
  return finding;
}

std::string JoinLines(const std::vector<std::string> &lines, std::size_t begin,
                      std::size_t end) {
  std::string joined;
  for (auto i = begin; i < end; ++i) {
    if (i > begin) {
      joined.push_back('\n');
    }
    joined.append(lines[i]);
  }
  return joined;
}

} // namespace

WhereClauseAnalyzer::WhereClauseAnalyzer()
    : scope_{{"app/models", "app/controllers"}, {".rb"}} {}

std::vector<Finding> WhereClauseAnalyzer::Analyze(const SourceFile &file) {
  std::vector<Finding> findings;
  std::set<std::string> seen_columns;
  for (const auto &filter : ExtractWhereFilters(file.content)) {
    if (!seen_columns.insert(filter.column).second) {
      continue;
    }
    findings.push_back(MakeSourceFinding(
        FindingType::kWhereClauseColumn, Severity::kInfo, file, filter.line,
        "Column \"" + filter.column +
            "\" used in WHERE clause - consider indexing if queries are slow",
        filter.column));
  }
  return findings;
}

ControllerNPlusOneAnalyzer::ControllerNPlusOneAnalyzer(
    std::shared_ptr<Logger> logger)
    : scope_{{"app/controllers"}, {".rb"}},
      logger_(EnsureLogger(std::move(logger))) {}

std::vector<Finding>
ControllerNPlusOneAnalyzer::Analyze(const SourceFile &file) {
  std::vector<Finding> findings;
  const auto lines = SplitLines(file.content);

  for (std::size_t index = 0; index < lines.size(); ++index) {
    const auto &line = lines[index];
    if (!IsQueryFetch(line)) {
      continue;
    }

    const auto context_begin =
        index >= kEagerLoadLookbehind ? index - kEagerLoadLookbehind : 0;
    const auto context_end =
        std::min(lines.size(), index + kEagerLoadLookahead + 1);
    if (HasEagerLoading(JoinLines(lines, context_begin, context_end))) {
      continue;
    }

    const auto variable = ExtractInstanceAssignment(line);
    if (!variable) {
      continue;
    }

    const auto line_number = static_cast<int>(index + 1);
    const auto access_end = std::min(lines.size(), index + 1 + kAccessLookahead);
    for (auto next = index + 1; next < access_end; ++next) {
      if (!HasChainedMemberAccess(lines[next], *variable)) {
        continue;
      }
      logger_->Log(LogLevel::kDebug, "n_plus_one.candidate",
                   {{"file", DisplayPath(file)},
                    {"line", std::to_string(line_number)},
                    {"variable", *variable},
                    {"access_line", std::to_string(next + 1)}});
      findings.push_back(MakeSourceFinding(
          FindingType::kPotentialNPlusOne, Severity::kWarning, file,
          line_number,
          "Potential N+1 query: Query at line " + std::to_string(line_number) +
              " may need eager loading"));
      break;
    }
  }
  return findings;
}

ViewAssociationAnalyzer::ViewAssociationAnalyzer()
    : scope_{{"app/views"}, {".erb", ".haml"}} {}

std::vector<Finding> ViewAssociationAnalyzer::Analyze(const SourceFile &file) {
  std::vector<Finding> findings;
  const auto lines = SplitLines(file.content);
  for (std::size_t index = 0; index < lines.size(); ++index) {
    if (!HasAssociationChain(lines[index])) {
      continue;
    }
    findings.push_back(MakeSourceFinding(
        FindingType::kViewAssociationAccess, Severity::kInfo, file,
        static_cast<int>(index + 1),
        "Association access in view - verify eager loading in controller"));
  }
  return findings;
}

} // namespace pgrails
