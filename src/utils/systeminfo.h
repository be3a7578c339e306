#pragma once

#include <QString>

namespace QuickCleaner {
namespace SystemInfo {

// Format helpers
QString formatBytes(quint64 bytes);
QString formatDuration(qint64 milliseconds);

// System queries
bool isAdministrator();

} // namespace SystemInfo
} // namespace QuickCleaner
