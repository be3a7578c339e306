#pragma once

#include "cleaningengine.h"

#include <QObject>
#include <QThread>
#include <memory>
#include <atomic>

namespace QuickCleaner {

/**
 * @brief Runs a CleaningEngine in a background thread
 *
 * The engine stays owned by the caller. Signals are emitted from the
 * worker thread; receivers living in the UI thread get them through
 * queued connections, so the run never waits on the UI.
 */
class CleaningWorker : public QObject
{
    Q_OBJECT

public:
    explicit CleaningWorker(CleaningEngine* engine, QObject* parent = nullptr);
    ~CleaningWorker() override;

    /// Start a run in the background. Throws EngineBusyError if a run is
    /// already in flight on this worker or on the engine.
    void start();

    /// Request a cooperative stop of the current run
    void cancel();

    /// Block until the current run ends, false on timeout
    bool wait(int timeoutMs = -1);

    /// Check if a run is in flight
    bool isRunning() const { return m_active.load(); }

signals:
    /// One event per task, then the run totals (connect with Qt::QueuedConnection)
    void progress(const QuickCleaner::ProgressEvent& event);

    /// Emitted after the last progress event
    void finished(const QuickCleaner::RunSummary& summary);

    /// The run ended without a summary
    void errorOccurred(const QString& error);

private:
    void doWork();

    CleaningEngine* m_engine;
    std::unique_ptr<QThread> m_thread;
    std::atomic<bool> m_active{false};
};

} // namespace QuickCleaner
