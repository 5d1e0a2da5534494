#include "taskrunner.h"

#include "taskworker.h"

TaskRunner::TaskRunner(WorkerFactory* factory, QObject* parent) : QObject(parent), m_factory(factory)
{
}

TaskRunner::~TaskRunner()
{
    m_token.cancel();
    releaseWorker();
}

bool TaskRunner::start(const QSharedPointer<Task>& task)
{
    if (!task)
        return false;

    if (isActive())
    {
        emit logMessage(QString("Cannot start '%1': '%2' is still running.")
                            .arg(task->source.fileName, m_task->source.fileName),
                        LogCategory::SCHEDULER);
        return false;
    }

    if (task->status == TaskStatus::Completed)
    {
        emit logMessage("Warning: task '" + task->source.fileName + "' is already completed.",
                        LogCategory::SCHEDULER);
        return false;
    }

    m_task = task;
    m_token = CancellationToken();
    m_task->status = initialRunningStatus(m_task->type);
    emit statusChanged(m_task->id, m_task->status);
    emit started(m_task->id);

    TaskWorker* worker = m_factory ? m_factory->createWorker(*m_task, this) : nullptr;
    if (!worker)
    {
        onError("No worker available for task type '" + taskTypeToString(m_task->type) + "'.");
        return true;
    }
    m_worker = worker;

    connect(worker, &TaskWorker::progress, this,
            [this, worker](int percent, const QString& message)
            {
                if (worker == m_worker)
                    emit progress(m_task->id, percent, message);
            });
    connect(worker, &TaskWorker::stageChanged, this,
            [this, worker](TaskStatus status)
            {
                if (worker == m_worker)
                    onStageChanged(status);
            });
    connect(worker, &TaskWorker::finished, this,
            [this, worker]()
            {
                if (worker == m_worker)
                    onSuccess();
            });
    connect(worker, &TaskWorker::error, this,
            [this, worker](const QString& message)
            {
                if (worker == m_worker)
                    onError(message);
            });
    connect(worker, &TaskWorker::partialUpdate, this, &TaskRunner::partialUpdate);
    connect(worker, &TaskWorker::fullUpdate, this, &TaskRunner::fullUpdate);
    connect(worker, &TaskWorker::logMessage, this, &TaskRunner::logMessage);

    worker->start(*m_task, m_token);
    return true;
}

void TaskRunner::cancel()
{
    if (!m_task)
        return;

    m_token.cancel();
    releaseWorker();

    const QSharedPointer<Task> task = m_task;
    m_task.reset();
    task->status = TaskStatus::Pending;
    emit logMessage("Task '" + task->source.fileName + "' canceled.", LogCategory::SCHEDULER);
    emit statusChanged(task->id, task->status);
    emit canceled(task->id);
}

bool TaskRunner::isActive() const
{
    return m_task && m_task->isRunning();
}

QSharedPointer<Task> TaskRunner::task() const
{
    return m_task;
}

void TaskRunner::onSuccess()
{
    releaseWorker();
    const QSharedPointer<Task> task = m_task;
    m_task.reset();
    task->status = TaskStatus::Completed;
    emit statusChanged(task->id, task->status);
    emit succeeded(task->id);
}

void TaskRunner::onError(const QString& message)
{
    releaseWorker();
    const QSharedPointer<Task> task = m_task;
    m_task.reset();
    task->status = TaskStatus::Failed;
    emit statusChanged(task->id, task->status);
    emit failed(task->id, message);
}

void TaskRunner::onStageChanged(TaskStatus status)
{
    // Workers may only move between the in-progress states
    if (status != TaskStatus::Transcribing && status != TaskStatus::Optimizing && status != TaskStatus::Generating)
        return;
    m_task->status = status;
    emit statusChanged(m_task->id, status);
}

void TaskRunner::releaseWorker()
{
    if (!m_worker)
        return;
    TaskWorker* worker = m_worker;
    m_worker = nullptr;
    disconnect(worker, nullptr, this, nullptr);
    worker->requestStop();
    worker->deleteLater();
}
