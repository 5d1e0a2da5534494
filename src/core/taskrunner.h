#ifndef TASKRUNNER_H
#define TASKRUNNER_H

#include "appsettings.h"
#include "cancellationtoken.h"
#include "subtitledocument.h"
#include "task.h"

#include <QMap>
#include <QObject>
#include <QPointer>
#include <QSharedPointer>

class TaskWorker;
class WorkerFactory;

/**
 * @brief Drives one task through its status machine.
 *
 * Pending -> Transcribing/Optimizing/Generating -> Completed/Failed, plus
 * cancel back to Pending. Owns the worker and its cancellation token while
 * the task runs. Lives on the control thread.
 */
class TaskRunner : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(TaskRunner)

public:
    explicit TaskRunner(WorkerFactory* factory, QObject* parent = nullptr);
    ~TaskRunner() override;

    /**
     * @brief Start the task's worker.
     * @return false if the task is already Completed (warning, nothing happens)
     *         or this runner is busy with another task
     */
    bool start(const QSharedPointer<Task>& task);

    // Stop the worker and put the task back to Pending. Safe to call repeatedly.
    void cancel();

    bool isActive() const;
    QSharedPointer<Task> task() const;

signals:
    void started(const QString& taskId);
    void statusChanged(const QString& taskId, TaskStatus status);
    void progress(const QString& taskId, int percent, const QString& message);
    void succeeded(const QString& taskId);
    void failed(const QString& taskId, const QString& message);
    void canceled(const QString& taskId);
    void partialUpdate(const QMap<int, QString>& updates);
    void fullUpdate(const SubtitleEntries& entries);
    void logMessage(const QString& message, LogCategory category);

private:
    void onSuccess();
    void onError(const QString& message);
    void onStageChanged(TaskStatus status);
    void releaseWorker();

    WorkerFactory* m_factory;
    QSharedPointer<Task> m_task;
    QPointer<TaskWorker> m_worker;
    CancellationToken m_token;
};

#endif // TASKRUNNER_H
