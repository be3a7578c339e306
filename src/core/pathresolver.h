#pragma once

#include "cleanertypes.h"

#include <QProcessEnvironment>
#include <vector>

namespace QuickCleaner {

/**
 * @brief How a location is expanded into cleanup roots
 */
enum class ProfileLayout {
    Direct,             // The location itself
    ChromiumUserData,   // "User Data" folder and each profile inside it
    FirefoxProfiles     // Every directory inside a Profiles folder
};

/**
 * @brief One row of the location table
 *
 * New browsers or categories are added as rows, not as code.
 */
struct LocationRule {
    CleanCategory category;
    QStringList variables;      // Anchoring environment variables, first non-empty wins
    QString relativePath;       // Relative to the anchor, '/' separated
    ProfileLayout layout{ProfileLayout::Direct};
    QStringList subPaths;       // Probed under each profile, empty = location itself
    QStringList nameFilters;    // File name filters applied when cleaning
    QString browser;            // Display name for browser rows
};

/**
 * @brief Installed-browser probe result
 */
struct BrowserPresence {
    QString name;
    CleanCategory category;
    bool installed{false};
};

/**
 * @brief Resolves cleanup categories to concrete directories
 *
 * Pure function of the environment it was given; the only file-system
 * access is probing which candidate directories exist.
 */
class PathResolver
{
public:
    explicit PathResolver(QProcessEnvironment environment = QProcessEnvironment::systemEnvironment());

    /// Existing roots of a category. Empty when the category does not apply.
    /// Throws ResolutionError when an anchoring variable is unavailable.
    QList<CleanupRoot> resolve(CleanCategory category) const;

    /// Which browsers of the table have data on this system
    std::vector<BrowserPresence> browserPresence() const;

    /// The built-in location table
    static const std::vector<LocationRule>& locationTable();

    const QProcessEnvironment& environment() const { return m_environment; }

private:
    QString anchor(const LocationRule& rule) const;
    QStringList locations(const LocationRule& rule, const QString& anchorPath) const;

    QProcessEnvironment m_environment;
};

} // namespace QuickCleaner
