#pragma once

#include "core/cleanertypes.h"

#include <QString>

namespace QuickCleaner {
namespace Report {

// Console lines of the headless shell. Task names are user text and are
// never treated as format patterns.
QString progressLine(const ProgressEvent& event);
QString taskLine(const TaskResult& result);
QString summaryLine(const RunSummary& summary);

} // namespace Report
} // namespace QuickCleaner
