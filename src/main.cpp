/**
 * QuickCleaner - one-click disk space cleaner
 * Headless entry point: runs every enabled task and prints the summary
 */

#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>

#include "core/cleaningengine.h"
#include "core/cleaningworker.h"
#include "utils/reportformat.h"
#include "utils/systeminfo.h"

using namespace QuickCleaner;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("QuickCleaner");
    app.setApplicationVersion("2.0.0");
    app.setOrganizationName("QuickCleaner");

    qSetMessagePattern("[%{time yyyy-MM-dd hh:mm:ss.zzz}] [%{type}] %{category}: %{message}");

    QTextStream out(stdout);

    QSettings settings;
    CleanerConfig config = CleanerConfig::load(settings);

    for (const auto& task : config.tasks()) {
        if (task.enabled && task.category == "system-temp" && !SystemInfo::isAdministrator()) {
            qWarning() << "System Temp is enabled but the process is not elevated,"
                       << "most of its files will fail to delete";
        }
    }

    try {
        CleaningEngine engine(config);
        CleaningWorker worker(&engine);

        QObject::connect(&worker, &CleaningWorker::progress, &app,
            [&out](const ProgressEvent& event) {
                if (event.kind != ProgressEvent::Kind::TaskFinished) return;
                out << Report::progressLine(event) << Qt::endl;
            });

        QObject::connect(&worker, &CleaningWorker::finished, &app,
            [&out, &app](const RunSummary& summary) {
                for (const TaskResult& result : summary.results) {
                    out << Report::taskLine(result) << Qt::endl;
                }
                out << Report::summaryLine(summary) << Qt::endl;
                app.quit();
            });

        QObject::connect(&worker, &CleaningWorker::errorOccurred, &app,
            [&app](const QString& error) {
                qCritical() << error;
                app.exit(1);
            });

        // Events are queued until the loop runs
        worker.start();
        return app.exec();
    }
    catch (const std::exception& e) {
        qCritical() << "QuickCleaner failed to start:" << e.what();
        return 1;
    }
}
