#ifndef PROCESSTASKWORKER_H
#define PROCESSTASKWORKER_H

#include "taskworker.h"

#include <QList>
#include <QProcess>
#include <QScopedPointer>
#include <QTemporaryFile>

class ProcessManager;
class SubtitleCodec;

/**
 * @brief Runs a task as a chain of external commands (transcribe, optimize).
 *
 * Command templates come from AppSettings. Output of the last stage is loaded
 * back and published through fullUpdate() before finished().
 */
class ProcessTaskWorker : public TaskWorker
{
    Q_OBJECT
public:
    explicit ProcessTaskWorker(QObject* parent = nullptr);
    ~ProcessTaskWorker() override;

    void start(const Task& task, const CancellationToken& token) override;
    void requestStop() override;

    static QStringList prepareCommandArguments(const QString& commandTemplate, const QMap<QString, QString>& values);
    // Placeholders filled from the task's parameter snapshot (%MODEL%, %LANGUAGE%, %NEED_TRANSLATE%, ...)
    static QMap<QString, QString> parameterValues(const TaskParameters& parameters);
    static int parseProgressPercent(const QString& output);

private slots:
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessOutput(const QString& output);
    void onProcessStdErr(const QString& output);
    void onProcessError(const QString& message);

private:
    enum class Stage
    {
        Transcribing,
        Optimizing
    };

    void runNextStage();
    void finishTask();
    QMap<QString, QString> placeholderValues(Stage stage);
    QString stageName(Stage stage) const;
    void fail(const QString& message);

    Task m_task;
    CancellationToken m_token;
    ProcessManager* m_processManager;
    SubtitleCodec* m_codec;
    QList<Stage> m_stages;
    int m_currentStage = -1;
    QString m_lastStdErrLine;
    QScopedPointer<QTemporaryFile> m_promptFile;
    bool m_done = false;
};

class ProcessWorkerFactory : public WorkerFactory
{
public:
    TaskWorker* createWorker(const Task& task, QObject* parent) override;
};

#endif // PROCESSTASKWORKER_H
