#include <pgrails/cli_exit_codes.h>

namespace pgrails {

int ExitCodeFor(AnalysisSuite suite, const AggregatedFindings &findings) {
  switch (suite) {
  case AnalysisSuite::kIndexes:
  case AnalysisSuite::kConfig:
    return 0;
  case AnalysisSuite::kNPlusOne:
    return findings.HasWarnings() ? 1 : 0;
  }
  return 1;
}

} // namespace pgrails
