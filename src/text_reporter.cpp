#include <pgrails/finding_aggregator.h>
#include <pgrails/text_reporter.h>

#include <algorithm>
#include <sstream>
#include <variant>

namespace pgrails {
namespace {

const std::string kRule(80, '=');
const std::string kDivider(80, '-');

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "text";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string SubjectFor(AnalysisSuite suite) {
  switch (suite) {
  case AnalysisSuite::kIndexes:
    return "database schema";
  case AnalysisSuite::kNPlusOne:
    return "Rails application";
  case AnalysisSuite::kConfig:
    return "database configuration";
  }
  return "project";
}

std::string FindingsNounFor(AnalysisSuite suite) {
  switch (suite) {
  case AnalysisSuite::kIndexes:
    return "indexing opportunities";
  case AnalysisSuite::kNPlusOne:
    return "potential issues";
  case AnalysisSuite::kConfig:
    return "configuration recommendations";
  }
  return "findings";
}

std::string CleanMessageFor(AnalysisSuite suite) {
  switch (suite) {
  case AnalysisSuite::kIndexes:
    return "No obvious indexing issues detected!";
  case AnalysisSuite::kNPlusOne:
    return "No obvious N+1 query issues detected!";
  case AnalysisSuite::kConfig:
    return "Database configuration looks good!";
  }
  return "No findings.";
}

std::string TitleFor(FindingType type) {
  switch (type) {
  case FindingType::kMissingForeignKeyIndex:
    return "MISSING FOREIGN KEY INDEXES";
  case FindingType::kBooleanIndexOpportunity:
    return "BOOLEAN COLUMN INDEXING OPPORTUNITIES";
  case FindingType::kWhereClauseColumn:
    return "COLUMNS USED IN WHERE CLAUSES";
  case FindingType::kPotentialNPlusOne:
    return "POTENTIAL N+1 QUERIES";
  case FindingType::kViewAssociationAccess:
    return "ASSOCIATION ACCESS IN VIEWS";
  case FindingType::kConnectionPoolSize:
    return "CONNECTION POOL SIZE";
  case FindingType::kStatementTimeout:
    return "STATEMENT TIMEOUT";
  case FindingType::kConnectTimeout:
    return "CONNECT TIMEOUT";
  case FindingType::kCheckoutTimeout:
    return "CHECKOUT TIMEOUT";
  case FindingType::kPreparedStatements:
    return "PREPARED STATEMENTS";
  case FindingType::kReapingFrequency:
    return "REAPING FREQUENCY";
  case FindingType::kSslConfiguration:
    return "SSL CONFIGURATION";
  case FindingType::kPerformanceExtension:
    return "PERFORMANCE EXTENSIONS";
  }
  return "FINDINGS";
}

std::string SuggestionLabelFor(const Finding &finding) {
  if (std::holds_alternative<SchemaLocation>(finding.location)) {
    return "Migration";
  }
  return "Recommendation";
}

std::string Indent(const std::string &text) {
  std::string indented;
  for (const auto character : text) {
    indented.push_back(character);
    if (character == '\n') {
      indented.append("    ");
    }
  }
  return indented;
}

void RenderFinding(const Finding &finding, std::ostringstream &output) {
  output << "  [" << ToString(finding.severity) << "] "
         << finding.LocationLabel() << "\n";
  output << "  -> " << finding.message << "\n";
  if (finding.suggestion) {
    output << "  " << SuggestionLabelFor(finding) << ": "
           << Indent(*finding.suggestion) << "\n";
  }
  output << "\n";
}

void RenderWhereColumns(const FindingGroup &group,
                        const AggregationLimits &limits,
                        std::ostringstream &output) {
  const auto preview = PreviewWhereColumns(group, limits);
  output << "\n" << TitleFor(group.type) << " (" << preview.unique_count
         << " columns):\n";
  output << kDivider << "\n";
  output << "  Consider adding indexes to these columns if queries are slow:\n";
  for (const auto &column : preview.columns) {
    output << "  - " << column << "\n";
  }
  if (preview.overflow > 0) {
    output << "  - ... and " << preview.overflow << " more\n";
  }
  output << "\n";
}

void RenderGroup(const FindingGroup &group, const AggregationLimits &limits,
                 std::ostringstream &output) {
  if (group.type == FindingType::kWhereClauseColumn) {
    RenderWhereColumns(group, limits, output);
    return;
  }

  const auto preview = PreviewGroup(group, limits);
  output << "\n" << TitleFor(group.type) << " (" << group.Count()
         << (group.Count() == 1 ? " item" : " items") << "):\n";
  output << kDivider << "\n";
  for (const auto &finding : preview.shown) {
    RenderFinding(finding, output);
  }
  if (preview.overflow > 0) {
    output << "  ... and " << preview.overflow << " more\n";
  }
}

std::string RenderText(const AggregatedFindings &findings,
                       const RunSummary &summary,
                       const AnalysisConfig &config) {
  std::ostringstream output;
  output << "Analyzing " << SubjectFor(config.suite)
         << " at: " << summary.project_root << "\n";
  output << kRule << "\n";
  if (config.suite == AnalysisSuite::kIndexes) {
    output << "Found " << summary.table_count << " tables\n";
  }
  if (summary.files_scanned > 0 || !summary.scan_errors.empty()) {
    output << "Scanned " << summary.files_scanned << " source files\n";
  }

  output << "\nFound " << findings.total << " " << FindingsNounFor(config.suite)
         << " (" << findings.warning_count << " warnings, "
         << findings.info_count << " info):\n";

  for (const auto &group : findings.groups) {
    RenderGroup(group, config.limits, output);
  }

  if (!summary.scan_errors.empty()) {
    output << "\nSKIPPED FILES (" << summary.scan_errors.size() << "):\n";
    output << kDivider << "\n";
    for (const auto &error : summary.scan_errors) {
      output << "  " << error.file << ": " << error.message << "\n";
    }
  }

  if (findings.total == 0) {
    output << CleanMessageFor(config.suite) << "\n";
  } else if (config.suite == AnalysisSuite::kConfig) {
    output << "\n" << kRule << "\n";
    output << "For more information, see the High Performance PostgreSQL for "
              "Rails book\n";
    output << "   Chapters: 2 (Administration Basics), 5 (Optimizing Active "
              "Record)\n";
  }
  return output.str();
}

std::string LocationJson(const Location &location) {
  std::ostringstream json;
  if (const auto *schema = std::get_if<SchemaLocation>(&location)) {
    json << "{\"kind\": \"schema\", \"table\": \""
         << EscapeJsonString(schema->table) << "\", \"column\": \""
         << EscapeJsonString(schema->column) << "\"}";
  } else if (const auto *source = std::get_if<SourceLocation>(&location)) {
    json << "{\"kind\": \"source\", \"file\": \""
         << EscapeJsonString(source->file) << "\", \"line\": " << source->line;
    if (!source->column.empty()) {
      json << ", \"column\": \"" << EscapeJsonString(source->column) << "\"";
    }
    json << "}";
  } else {
    const auto &config = std::get<ConfigLocation>(location);
    json << "{\"kind\": \"config\", \"environment\": \""
         << EscapeJsonString(config.environment) << "\", \"setting\": \""
         << EscapeJsonString(config.setting) << "\"}";
  }
  return json.str();
}

std::string FindingJson(const Finding &finding) {
  std::ostringstream json;
  json << "{\"type\": \"" << ToString(finding.type) << "\",";
  json << "\"severity\": \"" << ToString(finding.severity) << "\",";
  json << "\"message\": \"" << EscapeJsonString(finding.message) << "\",";
  json << "\"suggestion\": ";
  if (finding.suggestion) {
    json << "\"" << EscapeJsonString(*finding.suggestion) << "\",";
  } else {
    json << "null,";
  }
  json << "\"location\": " << LocationJson(finding.location) << "}";
  return json.str();
}

std::string RenderJson(const AggregatedFindings &findings,
                       const RunSummary &summary,
                       const AnalysisConfig &config) {
  std::ostringstream json;
  json << "{";
  json << "\"suite\": \"" << ToString(config.suite) << "\",";
  json << "\"project_root\": \"" << EscapeJsonString(summary.project_root)
       << "\",";
  json << "\"summary\": {\"total\": " << findings.total
       << ", \"warnings\": " << findings.warning_count
       << ", \"info\": " << findings.info_count
       << ", \"duplicates_dropped\": " << findings.duplicates_dropped
       << ", \"tables\": " << summary.table_count
       << ", \"files_scanned\": " << summary.files_scanned << "},";

  json << "\"groups\": [";
  for (std::size_t i = 0; i < findings.groups.size(); ++i) {
    const auto &group = findings.groups[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"type\": \"" << ToString(group.type) << "\", \"count\": "
         << group.Count() << ", \"findings\": [";
    const auto all = group.All();
    for (std::size_t j = 0; j < all.size(); ++j) {
      if (j > 0) {
        json << ",";
      }
      json << FindingJson(all[j]);
    }
    json << "]}";
  }
  json << "],";

  json << "\"scan_errors\": [";
  for (std::size_t i = 0; i < summary.scan_errors.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    json << "{\"file\": \"" << EscapeJsonString(summary.scan_errors[i].file)
         << "\", \"message\": \""
         << EscapeJsonString(summary.scan_errors[i].message) << "\"}";
  }
  json << "]}";
  return json.str();
}

} // namespace

std::string EscapeJsonString(const std::string &value) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '"':
      escaped.append("\\\"");
      break;
    case '\\':
      escaped.append("\\\\");
      break;
    case '\b':
      escaped.append("\\b");
      break;
    case '\f':
      escaped.append("\\f");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    case '\r':
      escaped.append("\\r");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    default:
      if (static_cast<unsigned char>(character) < 0x20) {
        const auto code = static_cast<unsigned char>(character);
        escaped.append("\\u00");
        escaped.push_back(kHexDigits[code >> 4]);
        escaped.push_back(kHexDigits[code & 0x0f]);
      } else {
        escaped.push_back(character);
      }
      break;
    }
  }
  return escaped;
}

Report TextReporter::Render(const AggregatedFindings &findings,
                            const RunSummary &summary,
                            const AnalysisConfig &config) {
  Report report;
  if (ShouldRenderFormat(config.formats, "text")) {
    report.text = RenderText(findings, summary, config);
  }
  if (ShouldRenderFormat(config.formats, "json")) {
    report.json = RenderJson(findings, summary, config);
  }
  return report;
}

} // namespace pgrails
