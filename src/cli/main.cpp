#include "appsettings.h"
#include "batchscheduler.h"
#include "completionaction.h"
#include "logsink.h"
#include "optimizationsession.h"
#include "processtaskworker.h"
#include "taskfactory.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTimer>

namespace
{
int runBatch(QCoreApplication& app, const QStringList& files, TaskType type, CompletionPolicy policy, LogSink& log)
{
    ProcessWorkerFactory factory;
    BatchScheduler scheduler(&factory);
    SystemPowerController power;
    CompletionActionDispatcher dispatcher(&power);

    QObject::connect(&scheduler, &BatchScheduler::logMessage, &log, &LogSink::logMessage);
    QObject::connect(&power, &SystemPowerController::logMessage, &log, &LogSink::logMessage);
    QObject::connect(&dispatcher, &CompletionActionDispatcher::logMessage, &log, &LogSink::logMessage);
    QObject::connect(&dispatcher, &CompletionActionDispatcher::countdownTick, &log,
                     [&log](int remaining)
                     {
                         if (remaining > 0 && (remaining % 10 == 0 || remaining <= 5))
                             log.logMessage(QString("%1 s left, press Ctrl+C to stay on.").arg(remaining),
                                            LogCategory::SYSTEM);
                     });

    QObject::connect(&scheduler, &BatchScheduler::taskProgress, &log,
                     [&log](const QString&, int percent, const QString& message)
                     {
                         log.logMessage(QString("%1% %2").arg(percent).arg(message), LogCategory::WORKER);
                     });

    int failures = 0;
    QObject::connect(&scheduler, &BatchScheduler::taskFailed, &app,
                     [&failures](const QString&, const QString&) { ++failures; });
    QObject::connect(&scheduler, &BatchScheduler::batchFinished, &dispatcher,
                     [&dispatcher, policy]() { dispatcher.dispatch(policy); });
    QObject::connect(&dispatcher, &CompletionActionDispatcher::finished, &app, &QCoreApplication::quit,
                     Qt::QueuedConnection);
    QObject::connect(&scheduler, &BatchScheduler::batchCanceled, &app, &QCoreApplication::quit,
                     Qt::QueuedConnection);

    for (const QString& path : files)
    {
        Task task;
        const CoreError error = TaskFactory::create(path, type, task);
        if (error != CoreError::None)
        {
            log.logMessage(QString("%1: %2").arg(path, coreErrorMessage(error)), LogCategory::APP);
            continue;
        }
        if (scheduler.addTask(task) != CoreError::None)
            log.logMessage("Already in the list: " + path, LogCategory::APP);
    }

    if (scheduler.tasks().isEmpty())
    {
        log.logMessage("Nothing to process.", LogCategory::APP);
        return 1;
    }

    // Start once the event loop runs so a quit() from the completion action is not lost
    QTimer::singleShot(0, &scheduler, [&scheduler]() { scheduler.startBatch(); });
    const int code = QCoreApplication::exec();
    return code != 0 ? code : (failures > 0 ? 2 : 0);
}

int runQueue(QCoreApplication& app, const QStringList& files, LogSink& log)
{
    ProcessWorkerFactory factory;
    OptimizationSession session(&factory);

    QObject::connect(&session, &OptimizationSession::logMessage, &log, &LogSink::logMessage);
    QObject::connect(&session, &OptimizationSession::progress, &log,
                     [&log](int percent, const QString& message)
                     {
                         log.logMessage(QString("%1% %2").arg(percent).arg(message), LogCategory::WORKER);
                     });

    int failures = 0;
    QObject::connect(&session, &OptimizationSession::failed, &app,
                     [&failures](const QString&, const QString&) { ++failures; });
    QObject::connect(&session, &OptimizationSession::queueDrained, &app, &QCoreApplication::quit,
                     Qt::QueuedConnection);

    QTimer::singleShot(0, &session, [&session, files]() { session.enqueueFiles(files); });
    const int code = QCoreApplication::exec();
    return code != 0 ? code : (failures > 0 ? 2 : 0);
}
} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("subtitlebatch");
    QCoreApplication::setApplicationVersion("1.0");

    qRegisterMetaType<Task>();
    qRegisterMetaType<TaskStatus>();
    qRegisterMetaType<LogCategory>();
    qRegisterMetaType<CompletionPolicy>();
    qRegisterMetaType<CoreError>();

    AppSettings::instance().load();
    AppSettings& settings = AppSettings::instance();

    QCommandLineParser parser;
    parser.setApplicationDescription("Batch transcription and optimization of subtitles.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption typeOption("type", "Task type: subtitle, transcribe or optimize.", "type",
                                  taskTypeToString(settings.defaultTaskType()));
    QCommandLineOption whenDoneOption("when-done", "After the batch: nothing, exit, suspend or shutdown.", "action",
                                      completionPolicyToString(settings.completionPolicy()));
    QCommandLineOption queueOption("queue", "Optimize subtitle files one after another and save each result.");
    parser.addOption(typeOption);
    parser.addOption(whenDoneOption);
    parser.addOption(queueOption);
    parser.addPositionalArgument("files", "Media or subtitle files to process.", "files...");
    parser.process(app);

    LogSink log("subtitlebatch.log");

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty())
    {
        log.logMessage("No input files.", LogCategory::APP);
        parser.showHelp(1);
    }

    if (parser.isSet(queueOption))
        return runQueue(app, files, log);

    const TaskType type = taskTypeFromString(parser.value(typeOption), settings.defaultTaskType());
    const CompletionPolicy policy = completionPolicyFromString(parser.value(whenDoneOption), CompletionPolicy::DoNothing);
    return runBatch(app, files, type, policy, log);
}
