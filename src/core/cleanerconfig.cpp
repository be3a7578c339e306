#include "cleanerconfig.h"

#include <QSettings>

namespace QuickCleaner {

namespace {

const char* const kGroup = "Tasks";
const char* const kArray = "task";

} // namespace

CleanerConfig::CleanerConfig(QList<TaskDescriptor> tasks)
    : m_tasks(std::move(tasks))
{
}

CleanerConfig CleanerConfig::defaults()
{
    QList<TaskDescriptor> tasks = {
        // === Windows ===
        { "Recycle Bin",          "recycle-bin",   true, false, true },
        { "User Temp",            "user-temp",     true, true,  true },
        { "Recent Items",         "recent-items",  true, true,  true },
        { "Windows Thumbnails",   "thumbnails",    true, false, true },

        // === Browsers ===
        { "Google Chrome Cache",  "chrome-cache",  true, true,  true },
        { "Microsoft Edge Cache", "edge-cache",    true, true,  true },
        { "Brave Cache",          "brave-cache",   true, true,  true },
        { "Vivaldi Cache",        "vivaldi-cache", true, true,  true },
        { "Opera Cache",          "opera-cache",   true, true,  true },
        { "Firefox Cache",        "firefox-cache", true, true,  true },

        // Off by default, needs admin rights
        { "System Temp",          "system-temp",   false, true, true },
    };

    return CleanerConfig(std::move(tasks));
}

CleanerConfig CleanerConfig::load(QSettings& settings)
{
    settings.beginGroup(kGroup);
    const int size = settings.beginReadArray(kArray);

    QList<TaskDescriptor> tasks;
    for (int i = 0; i < size; ++i) {
        settings.setArrayIndex(i);

        TaskDescriptor task;
        task.name = settings.value("name").toString();
        task.category = settings.value("category").toString();
        task.enabled = settings.value("enabled", true).toBool();
        task.recursive = settings.value("recursive", true).toBool();
        task.deleteContentsOnly = settings.value("deleteContentsOnly", true).toBool();
        tasks.append(task);
    }

    settings.endArray();
    settings.endGroup();

    if (tasks.isEmpty()) {
        return defaults();
    }
    return CleanerConfig(std::move(tasks));
}

void CleanerConfig::save(QSettings& settings) const
{
    settings.beginGroup(kGroup);
    settings.remove("");

    settings.beginWriteArray(kArray, static_cast<int>(m_tasks.size()));
    for (int i = 0; i < m_tasks.size(); ++i) {
        settings.setArrayIndex(i);

        const TaskDescriptor& task = m_tasks.at(i);
        settings.setValue("name", task.name);
        settings.setValue("category", task.category);
        settings.setValue("enabled", task.enabled);
        settings.setValue("recursive", task.recursive);
        settings.setValue("deleteContentsOnly", task.deleteContentsOnly);
    }
    settings.endArray();

    settings.endGroup();
}

bool CleanerConfig::setEnabled(const QString& category, bool enabled)
{
    bool found = false;
    for (auto& task : m_tasks) {
        if (task.category == category) {
            task.enabled = enabled;
            found = true;
        }
    }
    return found;
}

int CleanerConfig::enabledCount() const
{
    int count = 0;
    for (const auto& task : m_tasks) {
        if (task.enabled) count++;
    }
    return count;
}

} // namespace QuickCleaner
