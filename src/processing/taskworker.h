#ifndef TASKWORKER_H
#define TASKWORKER_H

#include "appsettings.h"
#include "cancellationtoken.h"
#include "subtitledocument.h"
#include "task.h"

#include <QMap>
#include <QObject>

/**
 * @brief Executes the actual work of one task (transcription and/or optimization).
 *
 * A worker reports exactly one of finished() or error() per start(). Signals
 * may be emitted from another thread; receivers on the control thread get them
 * queued.
 */
class TaskWorker : public QObject
{
    Q_OBJECT
public:
    explicit TaskWorker(QObject* parent = nullptr) : QObject(parent)
    {
    }

    virtual void start(const Task& task, const CancellationToken& token) = 0;

    /**
     * @brief Ask the worker to stop. Best effort: partial output is the worker's business.
     */
    virtual void requestStop() = 0;

signals:
    void progress(int percent, const QString& message);
    void stageChanged(TaskStatus status);
    void finished();
    void error(const QString& message);
    void partialUpdate(const QMap<int, QString>& updates);
    void fullUpdate(const SubtitleEntries& entries);
    void logMessage(const QString& message, LogCategory category);
};

class WorkerFactory
{
public:
    virtual ~WorkerFactory() = default;
    virtual TaskWorker* createWorker(const Task& task, QObject* parent) = 0;
};

#endif // TASKWORKER_H
