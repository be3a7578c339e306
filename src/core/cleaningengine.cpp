#include "cleaningengine.h"
#include "logging.h"

#include <limits>

namespace QuickCleaner {

// Register metatypes for queued connections
static bool registerMetaTypes()
{
    qRegisterMetaType<ProgressEvent>("QuickCleaner::ProgressEvent");
    qRegisterMetaType<RunSummary>("QuickCleaner::RunSummary");
    qRegisterMetaType<TaskResult>("QuickCleaner::TaskResult");
    return true;
}
static bool s_metaTypesRegistered = registerMetaTypes();

namespace {

quint32 clampCount(quint64 value)
{
    return static_cast<quint32>(qMin<quint64>(value, std::numeric_limits<quint32>::max()));
}

/**
 * Releases the in-flight flag however run() is left.
 */
class RunGuard
{
public:
    RunGuard(std::atomic<bool>& running, std::atomic<EngineState>& state)
        : m_running(running), m_state(state)
    {
        m_state.store(EngineState::Running);
    }

    ~RunGuard()
    {
        m_state.store(EngineState::Completed);
        m_running.store(false);
    }

    RunGuard(const RunGuard&) = delete;
    RunGuard& operator=(const RunGuard&) = delete;

private:
    std::atomic<bool>& m_running;
    std::atomic<EngineState>& m_state;
};

} // namespace

CleaningEngine::CleaningEngine(const CleanerConfig& config, QObject* parent)
    : CleaningEngine(config, PathResolver(), std::make_unique<Deleter>(),
                     createSystemRecycleBin(), parent)
{
}

CleaningEngine::CleaningEngine(const CleanerConfig& config,
                               PathResolver resolver,
                               std::unique_ptr<Deleter> deleter,
                               std::unique_ptr<RecycleBin> recycleBin,
                               QObject* parent)
    : QObject(parent)
    , m_tasks(buildTasks(config))
    , m_resolver(std::move(resolver))
    , m_deleter(std::move(deleter))
    , m_recycleBin(std::move(recycleBin))
{
    if (!m_deleter) {
        m_deleter = std::make_unique<Deleter>();
    }
    if (!m_recycleBin) {
        m_recycleBin = createSystemRecycleBin();
    }
}

CleaningEngine::~CleaningEngine()
{
    cancel();
}

std::vector<CleanupTask> CleaningEngine::buildTasks(const CleanerConfig& config)
{
    std::vector<CleanupTask> tasks;
    tasks.reserve(config.tasks().size());

    for (const TaskDescriptor& descriptor : config.tasks()) {
        if (descriptor.name.trimmed().isEmpty()) {
            throw ConfigurationError("Task descriptor without a name");
        }

        CleanCategory category;
        if (!parseCategory(descriptor.category, category)) {
            throw ConfigurationError(
                QStringLiteral("Unknown cleanup category '%1' for task '%2'")
                    .arg(descriptor.category, descriptor.name)
                    .toStdString());
        }

        CleanupTask task;
        task.name = descriptor.name;
        task.category = category;
        task.enabled = descriptor.enabled;
        task.policy.recursive = descriptor.recursive;
        task.policy.deleteContentsOnly = descriptor.deleteContentsOnly;
        task.policy.emptyRecycleBin = (category == CleanCategory::RecycleBin);
        tasks.push_back(task);
    }

    return tasks;
}

int CleaningEngine::enabledTaskCount() const
{
    int count = 0;
    for (const auto& task : m_tasks) {
        if (task.enabled) count++;
    }
    return count;
}

void CleaningEngine::cancel()
{
    m_stopRequested = true;
}

// === Run ===

RunSummary CleaningEngine::run(const ProgressCallback& onProgress)
{
    acquireRun();
    return runAcquired(onProgress);
}

void CleaningEngine::acquireRun()
{
    bool expected = false;
    if (!m_isRunning.compare_exchange_strong(expected, true)) {
        throw EngineBusyError();
    }
    m_stopRequested = false;
    m_state = EngineState::Running;
}

RunSummary CleaningEngine::runAcquired(const ProgressCallback& onProgress)
{
    RunGuard guard(m_isRunning, m_state);

    std::vector<const CleanupTask*> enabled;
    for (const auto& task : m_tasks) {
        if (task.enabled) {
            enabled.push_back(&task);
        }
    }

    RunSummary summary;
    summary.startedAt = QDateTime::currentDateTime();

    const int total = static_cast<int>(enabled.size());
    qCDebug(lcEngine) << "Cleaning run started," << total << "tasks";

    bool stopped = false;
    for (int index = 0; index < total; ++index) {
        if (m_stopRequested) {
            stopped = true;
            break;
        }

        const CleanupTask& task = *enabled[index];
        emit taskStarted(task.name, index, total);
        qCDebug(lcEngine) << "Cleaning" << task.name << "...";

        TaskResult result = executeTask(task);
        summary.totalBytesFreed += result.bytesFreed;

        // Stop landed while the task ran, it may be incomplete
        if (m_stopRequested) {
            stopped = true;
        }

        qCDebug(lcEngine) << task.name << "freed" << result.bytesFreed << "bytes,"
                          << result.itemsDeleted << "deleted," << result.itemsFailed << "failed";

        emit taskFinished(result);
        summary.results.push_back(std::move(result));

        ProgressEvent event;
        event.kind = ProgressEvent::Kind::TaskFinished;
        event.taskName = task.name;
        event.taskIndex = index;
        event.taskCount = total;
        event.bytesFreedSoFar = summary.totalBytesFreed;
        publish(event, onProgress);
    }

    summary.cancelled = stopped;
    summary.finishedAt = QDateTime::currentDateTime();

    ProgressEvent finished;
    finished.kind = ProgressEvent::Kind::RunFinished;
    finished.taskIndex = static_cast<int>(summary.results.size());
    finished.taskCount = total;
    finished.bytesFreedSoFar = summary.totalBytesFreed;
    publish(finished, onProgress);

    qCInfo(lcEngine).nospace() << "Cleaning run " << (summary.cancelled ? "cancelled" : "complete")
                               << ": " << summary.totalBytesFreed << " bytes freed in "
                               << summary.results.size() << " tasks";

    emit runFinished(summary);
    return summary;
}

void CleaningEngine::publish(const ProgressEvent& event, const ProgressCallback& onProgress)
{
    emit progress(event);

    if (!onProgress) return;

    try {
        onProgress(event);
    }
    catch (const std::exception& e) {
        qCWarning(lcEngine) << "Progress callback failed:" << e.what();
    }
}

// === Tasks ===

TaskResult CleaningEngine::executeTask(const CleanupTask& task)
{
    try {
        if (task.policy.emptyRecycleBin) {
            return emptyRecycleBin(task);
        }
        return cleanRoots(task);
    }
    catch (const std::exception& e) {
        qCWarning(lcEngine) << "Task" << task.name << "aborted:" << e.what();

        TaskResult result;
        result.task = task.name;
        result.itemsFailed = 1;
        result.errors.append({ task.name, QString::fromLocal8Bit(e.what()) });
        return result;
    }
}

TaskResult CleaningEngine::cleanRoots(const CleanupTask& task)
{
    TaskResult result;
    result.task = task.name;

    QList<CleanupRoot> roots;
    try {
        roots = m_resolver.resolve(task.category);
    }
    catch (const ResolutionError& e) {
        // Fatal to this root only, keep whatever did resolve
        qCWarning(lcEngine) << "Cannot resolve" << task.name << "-" << e.what();
        roots = e.resolvedRoots();
        result.itemsFailed++;
        result.errors.append({ QLatin1Char('%') + e.variable() + QLatin1Char('%'),
                               QString::fromLocal8Bit(e.what()) });
    }

    DeleteResult deleted;
    for (const CleanupRoot& root : roots) {
        if (m_stopRequested) break;

        DeleteOptions options;
        options.recursive = task.policy.recursive;
        options.nameFilters = root.nameFilters;

        deleted += m_deleter->deleteContents(root.path, options, &m_stopRequested);

        if (!task.policy.deleteContentsOnly && !m_stopRequested) {
            QString reason;
            if (!m_deleter->removeRoot(root.path, &reason)) {
                qCWarning(lcEngine) << "Cannot remove" << root.path << "-" << reason;
                deleted.failed++;
                deleted.errors.append({ root.path, reason });
            }
        }
    }

    result.bytesFreed = deleted.bytesFreed;
    result.itemsDeleted = deleted.deleted;
    result.itemsFailed += deleted.failed;
    result.errors << deleted.errors;
    return result;
}

TaskResult CleaningEngine::emptyRecycleBin(const CleanupTask& task)
{
    TaskResult result;
    result.task = task.name;

    // Sizes must be read before the bin is emptied
    const std::optional<RecycleBinInfo> info = m_recycleBin->query();
    result.estimated = !info.has_value();

    QString reason;
    if (!m_recycleBin->empty(&reason)) {
        if (reason.isEmpty()) {
            reason = QStringLiteral("The Recycle Bin could not be emptied");
        }
        qCWarning(lcEngine) << "Failed to empty the Recycle Bin:" << reason;
        result.itemsFailed = 1;
        result.errors.append({ task.name, reason });
        return result;
    }

    if (info) {
        result.bytesFreed = info->sizeBytes;
        result.itemsDeleted = clampCount(info->itemCount);
    }
    return result;
}

} // namespace QuickCleaner
