#include "cleanertypes.h"

#include <array>
#include <utility>

namespace QuickCleaner {

namespace {

const std::array<std::pair<CleanCategory, const char*>, 11> kCategoryIds = {{
    { CleanCategory::RecycleBin,   "recycle-bin" },
    { CleanCategory::UserTemp,     "user-temp" },
    { CleanCategory::SystemTemp,   "system-temp" },
    { CleanCategory::RecentItems,  "recent-items" },
    { CleanCategory::Thumbnails,   "thumbnails" },
    { CleanCategory::ChromeCache,  "chrome-cache" },
    { CleanCategory::EdgeCache,    "edge-cache" },
    { CleanCategory::BraveCache,   "brave-cache" },
    { CleanCategory::VivaldiCache, "vivaldi-cache" },
    { CleanCategory::OperaCache,   "opera-cache" },
    { CleanCategory::FirefoxCache, "firefox-cache" },
}};

} // namespace

QString categoryId(CleanCategory category)
{
    for (const auto& [cat, id] : kCategoryIds) {
        if (cat == category) {
            return QString::fromLatin1(id);
        }
    }
    return {};
}

bool parseCategory(const QString& id, CleanCategory& category)
{
    const QString key = id.trimmed().toLower();
    for (const auto& [cat, name] : kCategoryIds) {
        if (key == QLatin1String(name)) {
            category = cat;
            return true;
        }
    }
    return false;
}

bool isBrowserCategory(CleanCategory category)
{
    switch (category) {
    case CleanCategory::ChromeCache:
    case CleanCategory::EdgeCache:
    case CleanCategory::BraveCache:
    case CleanCategory::VivaldiCache:
    case CleanCategory::OperaCache:
    case CleanCategory::FirefoxCache:
        return true;
    default:
        return false;
    }
}

} // namespace QuickCleaner
