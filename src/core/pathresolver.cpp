#include "pathresolver.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>

namespace QuickCleaner {

namespace {

const QStringList& chromiumCacheDirs()
{
    static const QStringList dirs = {
        "Cache",
        "Code Cache",
        "GPUCache",
        "ShaderCache",
        "DawnCache",
        "Media Cache",
        "Service Worker/CacheStorage"
    };
    return dirs;
}

QString joinPath(const QString& base, const QString& relative)
{
    if (relative.isEmpty()) return QDir::cleanPath(base);
    return QDir::cleanPath(base + QLatin1Char('/') + relative);
}

bool isExistingDir(const QString& path)
{
    QFileInfo fi(path);
    return fi.exists() && fi.isDir() && !fi.isSymLink();
}

} // namespace

PathResolver::PathResolver(QProcessEnvironment environment)
    : m_environment(std::move(environment))
{
}

const std::vector<LocationRule>& PathResolver::locationTable()
{
    static const std::vector<LocationRule> table = {
        // === Windows ===
        { CleanCategory::UserTemp,    {"TEMP", "TMP"}, "",
          ProfileLayout::Direct, {}, {}, {} },
        { CleanCategory::SystemTemp,  {"WINDIR", "SystemRoot"}, "Temp",
          ProfileLayout::Direct, {}, {}, {} },
        { CleanCategory::RecentItems, {"APPDATA"}, "Microsoft/Windows/Recent",
          ProfileLayout::Direct, {}, {}, {} },
        { CleanCategory::Thumbnails,  {"LOCALAPPDATA"}, "Microsoft/Windows/Explorer",
          ProfileLayout::Direct, {}, {"thumbcache*.db", "iconcache*.db"}, {} },

        // === Browsers ===
        { CleanCategory::ChromeCache,  {"LOCALAPPDATA"}, "Google/Chrome/User Data",
          ProfileLayout::ChromiumUserData, chromiumCacheDirs(), {}, "Google Chrome" },
        { CleanCategory::EdgeCache,    {"LOCALAPPDATA"}, "Microsoft/Edge/User Data",
          ProfileLayout::ChromiumUserData, chromiumCacheDirs(), {}, "Microsoft Edge" },
        { CleanCategory::BraveCache,   {"LOCALAPPDATA"}, "BraveSoftware/Brave-Browser/User Data",
          ProfileLayout::ChromiumUserData, chromiumCacheDirs(), {}, "Brave" },
        { CleanCategory::VivaldiCache, {"LOCALAPPDATA"}, "Vivaldi/User Data",
          ProfileLayout::ChromiumUserData, chromiumCacheDirs(), {}, "Vivaldi" },
        { CleanCategory::OperaCache,   {"LOCALAPPDATA"}, "Opera Software/Opera Stable",
          ProfileLayout::Direct, chromiumCacheDirs(), {}, "Opera" },
        { CleanCategory::FirefoxCache, {"LOCALAPPDATA"}, "Mozilla/Firefox/Profiles",
          ProfileLayout::FirefoxProfiles, {"cache2", "startupCache"}, {}, "Firefox" },
        { CleanCategory::FirefoxCache, {"APPDATA"}, "Mozilla/Firefox/Profiles",
          ProfileLayout::FirefoxProfiles, {"cache2", "startupCache"}, {}, "Firefox" },
    };
    return table;
}

QString PathResolver::anchor(const LocationRule& rule) const
{
    for (const QString& variable : rule.variables) {
        const QString value = m_environment.value(variable).trimmed();
        if (!value.isEmpty()) {
            return QDir::fromNativeSeparators(value);
        }
    }

    const QString variable = rule.variables.isEmpty() ? QString() : rule.variables.first();
    throw ResolutionError(variable,
        QStringLiteral("Environment variable %1 is not set")
            .arg(QLatin1Char('%') + variable + QLatin1Char('%')));
}

QStringList PathResolver::locations(const LocationRule& rule, const QString& anchorPath) const
{
    const QString base = joinPath(anchorPath, rule.relativePath);
    if (!isExistingDir(base)) {
        return {};
    }

    // Profile directories the sub paths are probed under
    QStringList profiles;
    switch (rule.layout) {
    case ProfileLayout::Direct:
        profiles << base;
        break;

    case ProfileLayout::ChromiumUserData: {
        profiles << base;
        QDir dir(base);
        for (const QString& entry : dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden,
                                                  QDir::Name)) {
            profiles << dir.absoluteFilePath(entry);
        }
        break;
    }

    case ProfileLayout::FirefoxProfiles: {
        QDir dir(base);
        for (const QString& entry : dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden,
                                                  QDir::Name)) {
            profiles << dir.absoluteFilePath(entry);
        }
        break;
    }
    }

    QStringList result;
    for (const QString& profile : profiles) {
        if (rule.subPaths.isEmpty()) {
            result << profile;
            continue;
        }
        for (const QString& sub : rule.subPaths) {
            const QString candidate = joinPath(profile, sub);
            if (isExistingDir(candidate)) {
                result << candidate;
            }
        }
    }
    return result;
}

QList<CleanupRoot> PathResolver::resolve(CleanCategory category) const
{
    // Recycle Bin is emptied through the shell, it has no roots
    if (category == CleanCategory::RecycleBin) {
        return {};
    }

    QList<CleanupRoot> roots;
    QString failedVariable;
    QString failure;

    for (const LocationRule& rule : locationTable()) {
        if (rule.category != category) continue;

        QString anchorPath;
        try {
            anchorPath = anchor(rule);
        }
        catch (const ResolutionError& e) {
            // Keep going, a category can have several anchors
            failedVariable = e.variable();
            failure = QString::fromStdString(e.what());
            continue;
        }

        for (const QString& path : locations(rule, anchorPath)) {
            roots.append({ path, rule.nameFilters });
        }
    }

    if (!failure.isEmpty()) {
        throw ResolutionError(failedVariable, failure, roots);
    }
    return roots;
}

std::vector<BrowserPresence> PathResolver::browserPresence() const
{
    std::vector<BrowserPresence> result;

    for (const LocationRule& rule : locationTable()) {
        if (rule.browser.isEmpty()) continue;

        bool present = false;
        try {
            const QString base = joinPath(anchor(rule), rule.relativePath);
            present = isExistingDir(base) && !QDir(base).isEmpty();
        }
        catch (const ResolutionError&) {
            present = false;
        }

        auto it = std::find_if(result.begin(), result.end(),
            [&rule](const BrowserPresence& b) { return b.category == rule.category; });
        if (it == result.end()) {
            result.push_back({ rule.browser, rule.category, present });
        } else {
            it->installed = it->installed || present;
        }
    }

    return result;
}

} // namespace QuickCleaner
