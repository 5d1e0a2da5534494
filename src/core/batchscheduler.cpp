#include "batchscheduler.h"

#include "taskrunner.h"

#include <QTimer>

BatchScheduler::BatchScheduler(WorkerFactory* factory, QObject* parent)
    : QObject(parent), m_runner(new TaskRunner(factory, this))
{
    connect(m_runner, &TaskRunner::started, this, &BatchScheduler::taskStarted);
    connect(m_runner, &TaskRunner::statusChanged, this, &BatchScheduler::taskStatusChanged);
    connect(m_runner, &TaskRunner::progress, this, &BatchScheduler::taskProgress);
    connect(m_runner, &TaskRunner::canceled, this, &BatchScheduler::taskCanceled);
    connect(m_runner, &TaskRunner::succeeded, this, &BatchScheduler::onTaskSucceeded);
    connect(m_runner, &TaskRunner::failed, this, &BatchScheduler::onTaskFailed);
    connect(m_runner, &TaskRunner::logMessage, this, &BatchScheduler::logMessage);
}

BatchScheduler::~BatchScheduler()
{
    m_state = State::Idle;
}

CoreError BatchScheduler::addTask(const Task& task)
{
    if (indexOf(task.id) >= 0)
    {
        return reject(CoreError::DuplicateTask, task.filePath);
    }

    auto added = QSharedPointer<Task>::create(task);
    added->status = TaskStatus::Pending;
    m_tasks.append(added);
    emit logMessage("Task added: " + added->source.fileName, LogCategory::APP);
    emit taskAdded(added->id);
    return CoreError::None;
}

CoreError BatchScheduler::removeTask(const QString& taskId)
{
    if (isBusy())
    {
        return reject(CoreError::BusyBatch, "A task that is being processed cannot be removed.");
    }

    const int index = indexOf(taskId);
    if (index < 0)
    {
        return reject(CoreError::TaskNotFound, taskId);
    }

    const QSharedPointer<Task> removed = m_tasks.takeAt(index);
    emit logMessage("Task removed: " + removed->source.fileName, LogCategory::APP);
    emit taskRemoved(taskId);
    return CoreError::None;
}

CoreError BatchScheduler::clearAll()
{
    if (isBusy())
    {
        return reject(CoreError::BusyBatch, "Tasks cannot be cleared while processing.");
    }

    m_tasks.clear();
    emit logMessage("All tasks cleared.", LogCategory::APP);
    emit tasksCleared();
    return CoreError::None;
}

CoreError BatchScheduler::startBatch()
{
    if (m_tasks.isEmpty())
    {
        return reject(CoreError::EmptyBatch);
    }
    if (isBusy())
    {
        return reject(CoreError::BusyBatch);
    }

    m_state = State::Active;
    ++m_batchGeneration;
    emit logMessage(QString("Batch started (%1 tasks).").arg(m_tasks.size()), LogCategory::SCHEDULER);
    emit batchStarted();

    // Nothing left to do finishes the batch right away.
    advance();
    return CoreError::None;
}

void BatchScheduler::cancelBatch()
{
    const bool wasActive = m_state == State::Active;
    m_state = State::Idle;
    ++m_batchGeneration;

    // Only the dispatched task is running; never-started tasks stay Pending.
    m_runner->cancel();

    if (wasActive)
    {
        emit logMessage("Batch canceled.", LogCategory::SCHEDULER);
        emit batchCanceled();
    }
}

CoreError BatchScheduler::startTask(const QString& taskId)
{
    const int index = indexOf(taskId);
    if (index < 0)
    {
        return reject(CoreError::TaskNotFound, taskId);
    }
    if (isBusy())
    {
        return reject(CoreError::BusyBatch);
    }

    m_runner->start(m_tasks.at(index));
    return CoreError::None;
}

void BatchScheduler::cancelTask(const QString& taskId)
{
    if (m_runner->task().isNull() || m_runner->task()->id != taskId)
        return;

    // Restarting the scan would pick the same task up again, so the batch stops with it.
    if (m_state == State::Active)
    {
        cancelBatch();
        return;
    }
    m_runner->cancel();
}

CoreError BatchScheduler::resetTask(const QString& taskId)
{
    const int index = indexOf(taskId);
    if (index < 0)
    {
        return reject(CoreError::TaskNotFound, taskId);
    }
    if (m_tasks.at(index)->isRunning())
    {
        return reject(CoreError::BusyBatch, "A task that is being processed cannot be reset.");
    }

    m_tasks.at(index)->status = TaskStatus::Pending;
    emit taskStatusChanged(taskId, TaskStatus::Pending);
    return CoreError::None;
}

BatchScheduler::State BatchScheduler::state() const
{
    return m_state;
}

bool BatchScheduler::isActive() const
{
    return m_state == State::Active;
}

bool BatchScheduler::isBusy() const
{
    return m_state == State::Active || m_runner->isActive();
}

const TaskList& BatchScheduler::tasks() const
{
    return m_tasks;
}

QSharedPointer<Task> BatchScheduler::task(const QString& taskId) const
{
    const int index = indexOf(taskId);
    return index >= 0 ? m_tasks.at(index) : QSharedPointer<Task>();
}

QString BatchScheduler::runningTaskId() const
{
    const QSharedPointer<Task> running = m_runner->task();
    return running ? running->id : QString();
}

int BatchScheduler::findNextRunnable(const TaskList& tasks)
{
    for (int i = 0; i < tasks.size(); ++i)
    {
        if (!tasks.at(i)->isTerminal())
            return i;
    }
    return -1;
}

void BatchScheduler::onTaskSucceeded(const QString& taskId)
{
    emit logMessage("Task completed: " + displayName(taskId), LogCategory::SCHEDULER);
    emit taskFinished(taskId);
    scheduleAdvance();
}

void BatchScheduler::onTaskFailed(const QString& taskId, const QString& message)
{
    emit logMessage("Task failed: " + displayName(taskId) + ": " + message, LogCategory::SCHEDULER);
    emit taskFailed(taskId, message);
    scheduleAdvance();
}

void BatchScheduler::scheduleAdvance()
{
    if (m_state != State::Active)
        return;

    const quint64 generation = m_batchGeneration;
    QTimer::singleShot(0, this,
                       [this, generation]()
                       {
                           if (generation == m_batchGeneration)
                               advance();
                       });
}

void BatchScheduler::advance()
{
    if (m_state != State::Active || m_runner->isActive())
        return;

    const int next = findNextRunnable(m_tasks);
    if (next < 0)
    {
        finishBatch();
        return;
    }

    const QSharedPointer<Task> task = m_tasks.at(next);
    emit logMessage("Starting task: " + task->source.fileName, LogCategory::SCHEDULER);
    if (!m_runner->start(task))
    {
        emit logMessage("Task could not be started, batch stopped: " + task->source.fileName,
                        LogCategory::SCHEDULER);
        m_state = State::Idle;
        emit batchCanceled();
    }
}

void BatchScheduler::finishBatch()
{
    m_state = State::Idle;
    emit logMessage("All tasks processed.", LogCategory::SCHEDULER);
    emit batchFinished();
}

CoreError BatchScheduler::reject(CoreError error, const QString& detail)
{
    QString message = coreErrorMessage(error);
    if (!detail.isEmpty())
        message += " (" + detail + ")";
    emit logMessage(message, LogCategory::APP);
    emit rejected(error, message);
    return error;
}

int BatchScheduler::indexOf(const QString& taskId) const
{
    for (int i = 0; i < m_tasks.size(); ++i)
    {
        if (m_tasks.at(i)->id == taskId)
            return i;
    }
    return -1;
}

QString BatchScheduler::displayName(const QString& taskId) const
{
    const QSharedPointer<Task> t = task(taskId);
    return t ? t->source.fileName : taskId;
}
