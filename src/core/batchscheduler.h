#ifndef BATCHSCHEDULER_H
#define BATCHSCHEDULER_H

#include "appsettings.h"
#include "coreerror.h"
#include "task.h"

#include <QList>
#include <QObject>
#include <QSharedPointer>

class TaskRunner;
class WorkerFactory;

using TaskList = QList<QSharedPointer<Task>>;

/**
 * @brief Runs a list of tasks one at a time.
 *
 * Whenever the running task reaches Completed or Failed the list is scanned
 * again from the top and the first task that is neither Completed nor Failed
 * is started. When the scan finds nothing, batchFinished() fires once.
 *
 * All state is owned by the control thread. Worker results are delivered as
 * queued signals, and advancing to the next task is itself queued, so no
 * continuation runs inside another task's callback.
 */
class BatchScheduler : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(BatchScheduler)

public:
    enum class State
    {
        Idle,
        Active
    };
    Q_ENUM(State)

    explicit BatchScheduler(WorkerFactory* factory, QObject* parent = nullptr);
    ~BatchScheduler() override;

    CoreError addTask(const Task& task);
    CoreError removeTask(const QString& taskId);
    CoreError clearAll();

    CoreError startBatch();
    void cancelBatch();

    /**
     * @brief Run a single task outside of a batch ("reprocess").
     *
     * A Completed task is not restarted: a warning is logged and None returned.
     * Reset it with resetTask() first to reprocess it.
     */
    CoreError startTask(const QString& taskId);
    void cancelTask(const QString& taskId);
    CoreError resetTask(const QString& taskId);

    State state() const;
    bool isActive() const;
    bool isBusy() const;
    const TaskList& tasks() const;
    QSharedPointer<Task> task(const QString& taskId) const;
    QString runningTaskId() const;

    // Index of the first task that is neither Completed nor Failed, -1 if none.
    static int findNextRunnable(const TaskList& tasks);

signals:
    void taskAdded(const QString& taskId);
    void taskRemoved(const QString& taskId);
    void tasksCleared();
    void taskStarted(const QString& taskId);
    void taskStatusChanged(const QString& taskId, TaskStatus status);
    void taskProgress(const QString& taskId, int percent, const QString& message);
    void taskFinished(const QString& taskId);
    void taskFailed(const QString& taskId, const QString& message);
    void taskCanceled(const QString& taskId);
    void batchStarted();
    void batchFinished();
    void batchCanceled();
    void rejected(CoreError error, const QString& message);
    void logMessage(const QString& message, LogCategory category);

private slots:
    void onTaskSucceeded(const QString& taskId);
    void onTaskFailed(const QString& taskId, const QString& message);

private:
    void scheduleAdvance();
    void advance();
    void finishBatch();
    CoreError reject(CoreError error, const QString& detail = QString());
    int indexOf(const QString& taskId) const;
    QString displayName(const QString& taskId) const;

    TaskList m_tasks;
    TaskRunner* m_runner;
    State m_state = State::Idle;
    quint64 m_batchGeneration = 0;
};

#endif // BATCHSCHEDULER_H
