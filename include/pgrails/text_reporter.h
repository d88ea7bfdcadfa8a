#pragma once

#include <pgrails/interfaces.h>

namespace pgrails {

// Console report ("text") and a machine-readable document ("json"). The
// text report truncates long groups; the JSON document lists every finding.
class TextReporter : public Reporter {
public:
  Report Render(const AggregatedFindings &findings, const RunSummary &summary,
                const AnalysisConfig &config) override;
};

std::string EscapeJsonString(const std::string &value);

} // namespace pgrails
