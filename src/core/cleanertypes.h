#pragma once

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <vector>
#include <utility>
#include <stdexcept>
#include <functional>

namespace QuickCleaner {

/**
 * @brief Category of cleanable items
 *
 * Drives which PathResolver lookup a task uses.
 */
enum class CleanCategory {
    RecycleBin,         // Recycle Bin contents
    UserTemp,           // %TEMP% folder
    SystemTemp,         // %WINDIR%\Temp (needs elevation)
    RecentItems,        // Recent documents list
    Thumbnails,         // Explorer thumbnail and icon caches

    // Browsers
    ChromeCache,
    EdgeCache,
    BraveCache,
    VivaldiCache,
    OperaCache,
    FirefoxCache
};

/// Configuration id of a category ("user-temp", "chrome-cache", ...)
QString categoryId(CleanCategory category);

/// Parse a configuration id, returns false for unknown ids
bool parseCategory(const QString& id, CleanCategory& category);

/// True for the browser cache categories
bool isBrowserCategory(CleanCategory category);

/**
 * @brief A task as declared in configuration
 */
struct TaskDescriptor {
    QString name;               // Display name
    QString category;           // Category id, validated by the engine
    bool enabled{true};
    bool recursive{true};
    bool deleteContentsOnly{true};  // Keep the root directory itself
};

/**
 * @brief Deletion policy of a task
 */
struct TaskPolicy {
    bool recursive{true};
    bool deleteContentsOnly{true};
    bool emptyRecycleBin{false};
};

/**
 * @brief A validated cleanup task, immutable once the engine is built
 */
struct CleanupTask {
    QString name;
    CleanCategory category;
    TaskPolicy policy;
    bool enabled{true};
};

/**
 * @brief A directory whose contents a task targets
 */
struct CleanupRoot {
    QString path;
    QStringList nameFilters;    // Empty = every file
};

/**
 * @brief Entry that could not be deleted or resolved
 */
struct CleanError {
    QString path;
    QString reason;
};

/**
 * @brief Result of one task execution
 */
struct TaskResult {
    QString task;
    quint64 bytesFreed{0};
    quint32 itemsDeleted{0};    // Files
    quint32 itemsFailed{0};     // Files and directories, one per error
    QList<CleanError> errors;
    bool estimated{false};      // bytesFreed is a best-effort figure (Recycle Bin)
};

/**
 * @brief Overall result of a run
 */
struct RunSummary {
    quint64 totalBytesFreed{0};
    std::vector<TaskResult> results;
    QDateTime startedAt;
    QDateTime finishedAt;
    bool cancelled{false};
};

/**
 * @brief Progress notification delivered while a run executes
 */
struct ProgressEvent {
    enum class Kind {
        TaskFinished,   // One per executed task
        RunFinished     // Always last, mirrors the summary
    };

    Kind kind{Kind::TaskFinished};
    QString taskName;
    int taskIndex{0};           // 0-based; RunFinished carries the number of tasks started
    int taskCount{0};           // Enabled tasks in this run
    quint64 bytesFreedSoFar{0};

    /// Fraction of the run completed, 0.0 - 1.0
    double fraction() const {
        if (taskCount <= 0) return 1.0;
        if (kind == Kind::RunFinished) return 1.0;
        return static_cast<double>(taskIndex + 1) / taskCount;
    }
};

using ProgressCallback = std::function<void(const ProgressEvent& event)>;

/**
 * @brief Engine life cycle
 */
enum class EngineState {
    Idle,
    Running,
    Completed
};

// === Errors ===

/// Malformed task descriptor, raised before any run can start
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// run() invoked while another run is in flight
class EngineBusyError : public std::runtime_error {
public:
    EngineBusyError() : std::runtime_error("A cleaning run is already in progress") {}
};

/// The environment anchoring a category's location is unavailable
class ResolutionError : public std::runtime_error {
public:
    ResolutionError(const QString& variable, const QString& message,
                    QList<CleanupRoot> resolvedRoots = {})
        : std::runtime_error(message.toStdString())
        , m_variable(variable)
        , m_resolvedRoots(std::move(resolvedRoots))
    {}

    const QString& variable() const { return m_variable; }

    /// Roots of the category that did resolve before the failure
    const QList<CleanupRoot>& resolvedRoots() const { return m_resolvedRoots; }

private:
    QString m_variable;
    QList<CleanupRoot> m_resolvedRoots;
};

} // namespace QuickCleaner

// Register for queued connections
Q_DECLARE_METATYPE(QuickCleaner::ProgressEvent)
Q_DECLARE_METATYPE(QuickCleaner::RunSummary)
Q_DECLARE_METATYPE(QuickCleaner::TaskResult)
