#include "cleaningworker.h"
#include "logging.h"

#include <QDeadlineTimer>

namespace QuickCleaner {

CleaningWorker::CleaningWorker(CleaningEngine* engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
{
}

CleaningWorker::~CleaningWorker()
{
    cancel();
    wait();
}

void CleaningWorker::start()
{
    if (!m_engine) {
        throw std::logic_error("CleaningWorker has no engine");
    }

    bool expected = false;
    if (!m_active.compare_exchange_strong(expected, true)) {
        throw EngineBusyError();
    }

    // Take the engine now so a cancel() issued right after start() is kept
    try {
        m_engine->acquireRun();
    }
    catch (const EngineBusyError&) {
        m_active = false;
        throw;
    }

    // Previous thread has finished its run, reclaim it
    if (m_thread) {
        m_thread->wait();
        m_thread.reset();
    }

    m_thread.reset(QThread::create([this]() { doWork(); }));
    m_thread->setObjectName(QStringLiteral("QuickCleanerWorker"));
    m_thread->start(QThread::LowPriority);
}

void CleaningWorker::cancel()
{
    if (m_engine && m_active.load()) {
        m_engine->cancel();
    }
}

bool CleaningWorker::wait(int timeoutMs)
{
    if (!m_thread) return true;

    QDeadlineTimer deadline = timeoutMs < 0
        ? QDeadlineTimer(QDeadlineTimer::Forever)
        : QDeadlineTimer(timeoutMs);
    return m_thread->wait(deadline);
}

void CleaningWorker::doWork()
{
    try {
        RunSummary summary = m_engine->runAcquired([this](const ProgressEvent& event) {
            emit progress(event);
        });
        m_active = false;
        emit finished(summary);
    }
    catch (const std::exception& e) {
        qCWarning(lcEngine) << "Cleaning worker failed:" << e.what();
        m_active = false;
        emit errorOccurred(QString::fromLocal8Bit(e.what()));
    }
}

} // namespace QuickCleaner
