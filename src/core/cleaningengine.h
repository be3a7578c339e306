#pragma once

#include "cleanertypes.h"
#include "cleanerconfig.h"
#include "pathresolver.h"
#include "deleter.h"
#include "recyclebin.h"

#include <QObject>
#include <memory>
#include <atomic>
#include <vector>

namespace QuickCleaner {

/**
 * @brief Runs the configured cleanup tasks one after another
 *
 * Life cycle: construct, run() zero or more times, destroy. A run always
 * completes with a summary; per-entry and per-task failures are reported
 * inside it. Only construction (ConfigurationError) and a concurrent
 * run() (EngineBusyError) throw.
 *
 * run() blocks the calling thread, use CleaningWorker to run it in the
 * background. Signals are emitted from the thread executing run().
 */
class CleaningEngine : public QObject
{
    Q_OBJECT

public:
    /// Engine on the system environment, file system and Recycle Bin
    explicit CleaningEngine(const CleanerConfig& config, QObject* parent = nullptr);

    CleaningEngine(const CleanerConfig& config,
                   PathResolver resolver,
                   std::unique_ptr<Deleter> deleter,
                   std::unique_ptr<RecycleBin> recycleBin,
                   QObject* parent = nullptr);

    ~CleaningEngine() override;

    /// Execute every enabled task in declaration order.
    /// onProgress is called on the running thread, once per task and a
    /// final time with the summary totals.
    RunSummary run(const ProgressCallback& onProgress = nullptr);

    /// Cooperative stop, checked between tasks and between entries
    void cancel();

    bool isRunning() const { return m_isRunning.load(); }
    EngineState state() const { return m_state.load(); }

    /// Every configured task, enabled or not
    const std::vector<CleanupTask>& tasks() const { return m_tasks; }

    int enabledTaskCount() const;

    const PathResolver& resolver() const { return m_resolver; }

signals:
    /// A task is about to be executed
    void taskStarted(const QString& name, int index, int count);

    /// A task has been executed, result included
    void taskFinished(const QuickCleaner::TaskResult& result);

    /// Same events as the run() callback
    void progress(const QuickCleaner::ProgressEvent& event);

    /// Run complete (also after cancellation)
    void runFinished(const QuickCleaner::RunSummary& summary);

private:
    friend class CleaningWorker;

    /// Take the in-flight flag and clear any earlier stop request.
    /// Throws EngineBusyError if a run is already in flight.
    void acquireRun();

    /// Body of run(), the caller holds the in-flight flag
    RunSummary runAcquired(const ProgressCallback& onProgress);

    static std::vector<CleanupTask> buildTasks(const CleanerConfig& config);

    TaskResult executeTask(const CleanupTask& task);
    TaskResult cleanRoots(const CleanupTask& task);
    TaskResult emptyRecycleBin(const CleanupTask& task);
    void publish(const ProgressEvent& event, const ProgressCallback& onProgress);

    // Tasks, immutable after construction
    std::vector<CleanupTask> m_tasks;

    // Collaborators
    PathResolver m_resolver;
    std::unique_ptr<Deleter> m_deleter;
    std::unique_ptr<RecycleBin> m_recycleBin;

    // State
    std::atomic<bool> m_isRunning{false};
    std::atomic<bool> m_stopRequested{false};
    std::atomic<EngineState> m_state{EngineState::Idle};
};

} // namespace QuickCleaner
