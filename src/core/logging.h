#pragma once

#include <QLoggingCategory>

namespace QuickCleaner {

// Filter with QT_LOGGING_RULES="quickcleaner.engine.debug=true"
Q_DECLARE_LOGGING_CATEGORY(lcEngine)

} // namespace QuickCleaner
