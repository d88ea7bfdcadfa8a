#pragma once

#include <pgrails/models.h>

namespace pgrails {

// n-plus-one fails the run when any warning was found; indexes and config
// only report.
int ExitCodeFor(AnalysisSuite suite, const AggregatedFindings &findings);

} // namespace pgrails
