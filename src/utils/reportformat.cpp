#include "reportformat.h"
#include "systeminfo.h"

namespace QuickCleaner {
namespace Report {

QString progressLine(const ProgressEvent& event)
{
    return QString("[%1/%2] %3 - %4 freed so far")
        .arg(QString::number(event.taskIndex + 1),
             QString::number(event.taskCount),
             event.taskName,
             SystemInfo::formatBytes(event.bytesFreedSoFar));
}

QString taskLine(const TaskResult& result)
{
    // "~" marks a best-effort size
    return QString("  %1: %2%3, %4 deleted, %5 failed")
        .arg(result.task,
             result.estimated ? QStringLiteral("~") : QString(),
             SystemInfo::formatBytes(result.bytesFreed),
             QString::number(result.itemsDeleted),
             QString::number(result.itemsFailed));
}

QString summaryLine(const RunSummary& summary)
{
    return QString("%1: %2 freed in %3")
        .arg(summary.cancelled ? QStringLiteral("Cancelled") : QStringLiteral("Done"),
             SystemInfo::formatBytes(summary.totalBytesFreed),
             SystemInfo::formatDuration(summary.startedAt.msecsTo(summary.finishedAt)));
}

} // namespace Report
} // namespace QuickCleaner
