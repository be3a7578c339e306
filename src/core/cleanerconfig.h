#pragma once

#include "cleanertypes.h"

#include <QList>

class QSettings;

namespace QuickCleaner {

/**
 * @brief Ordered list of task descriptors
 *
 * Validation of category ids is left to CleaningEngine so that a
 * hand-edited settings file fails at engine construction.
 */
class CleanerConfig
{
public:
    CleanerConfig() = default;
    explicit CleanerConfig(QList<TaskDescriptor> tasks);

    /// Default task table: every user-scope task on, system temp off
    static CleanerConfig defaults();

    /// Load from settings, falls back to defaults() when nothing is stored
    static CleanerConfig load(QSettings& settings);

    /// Save the task list to settings (replaces any stored list)
    void save(QSettings& settings) const;

    const QList<TaskDescriptor>& tasks() const { return m_tasks; }
    QList<TaskDescriptor>& tasks() { return m_tasks; }

    /// Enable/disable every task of a category, returns false if none matched
    bool setEnabled(const QString& category, bool enabled);

    /// Number of enabled tasks
    int enabledCount() const;

private:
    QList<TaskDescriptor> m_tasks;
};

} // namespace QuickCleaner
