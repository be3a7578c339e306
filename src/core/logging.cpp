#include "logging.h"

namespace QuickCleaner {

Q_LOGGING_CATEGORY(lcEngine, "quickcleaner.engine", QtInfoMsg)

} // namespace QuickCleaner
