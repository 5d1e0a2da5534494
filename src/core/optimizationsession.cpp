#include "optimizationsession.h"

#include "subtitlecodec.h"
#include "subtitledocument.h"
#include "taskfactory.h"
#include "taskrunner.h"

#include <QFile>

OptimizationSession::OptimizationSession(WorkerFactory* factory, QObject* parent)
    : QObject(parent), m_document(new SubtitleDocument(this)), m_codec(new SubtitleCodec(this)),
      m_runner(new TaskRunner(factory, this))
{
    connect(m_codec, &SubtitleCodec::logMessage, this, &OptimizationSession::logMessage);
    connect(m_runner, &TaskRunner::logMessage, this, &OptimizationSession::logMessage);
    connect(m_runner, &TaskRunner::progress, this,
            [this](const QString&, int percent, const QString& message) { emit progress(percent, message); });
    connect(m_runner, &TaskRunner::partialUpdate, m_document, &SubtitleDocument::updateEntries);
    connect(m_runner, &TaskRunner::fullUpdate, m_document,
            [this](const SubtitleEntries& entries) { m_document->replaceAll(entries); });
    connect(m_runner, &TaskRunner::succeeded, this, &OptimizationSession::onSucceeded);
    connect(m_runner, &TaskRunner::failed, this, &OptimizationSession::onFailed);
}

OptimizationSession::~OptimizationSession()
{
    m_draining = false;
}

SubtitleDocument* OptimizationSession::document() const
{
    return m_document;
}

QSharedPointer<Task> OptimizationSession::task() const
{
    return m_task;
}

const FileIntakeQueue& OptimizationSession::queue() const
{
    return m_queue;
}

bool OptimizationSession::isRunning() const
{
    return m_runner->isActive();
}

CoreError OptimizationSession::loadFile(const QString& path)
{
    if (isRunning())
        return reject(CoreError::BusyBatch);

    Task task;
    const CoreError error = TaskFactory::create(path, TaskType::OptimizationOnly, task);
    if (error != CoreError::None)
        return reject(error, path);

    if (!m_codec->loadInto(path, m_document))
        return reject(CoreError::IoError, m_codec->lastError());

    m_task = QSharedPointer<Task>::create(task);
    emit logMessage("Loaded " + task.source.fileName, LogCategory::APP);
    emit fileLoaded(path);
    return CoreError::None;
}

void OptimizationSession::enqueueFiles(const QStringList& paths)
{
    if (paths.isEmpty())
        return;

    m_queue.enqueue(paths);
    emit logMessage(QString("%1 file(s) queued, %2 waiting.").arg(paths.size()).arg(m_queue.size()), LogCategory::APP);

    m_draining = true;
    if (!isRunning())
        processNextFile();
}

CoreError OptimizationSession::process()
{
    if (!m_task)
        return reject(CoreError::TaskNotFound, "Load a subtitle file first.");
    if (isRunning())
        return reject(CoreError::BusyBatch);

    // Options may have changed since the file was loaded
    const QString prompt = m_task->parameters.customPrompt;
    m_task->parameters = AppSettings::instance().taskParameters();
    if (m_task->parameters.customPrompt.isEmpty())
        m_task->parameters.customPrompt = prompt;
    TaskFactory::deriveOutputPaths(*m_task);

    // An optimized file may be optimized again
    m_task->status = TaskStatus::Pending;

    m_runner->start(m_task);
    return CoreError::None;
}

void OptimizationSession::cancel()
{
    if (!isRunning())
        return;
    m_draining = false;
    m_runner->cancel();
    emit logMessage("Subtitle optimization canceled.", LogCategory::APP);
    emit canceled();
}

CoreError OptimizationSession::saveAs(const QString& path, OutputSubtitleFormat format, SubtitleLayout layout)
{
    if (!m_task)
        return reject(CoreError::TaskNotFound, "Load a subtitle file first.");

    QString style;
    const QString stylePath = AppSettings::instance().subtitleStylePath();
    if (format == OutputSubtitleFormat::Ass && !stylePath.isEmpty())
    {
        QFile styleFile(stylePath);
        if (styleFile.open(QIODevice::ReadOnly))
            style = QString::fromUtf8(styleFile.readAll());
        else
            emit logMessage("Warning: subtitle style not found, using the default: " + stylePath, LogCategory::APP);
    }

    if (!m_codec->save(m_document->entryList(), path, format, layout, style))
        return reject(CoreError::IoError, m_codec->lastError());
    return CoreError::None;
}

void OptimizationSession::onSucceeded(const QString& taskId)
{
    emit logMessage("Optimization finished: " + m_task->source.fileName, LogCategory::APP);

    const TaskParameters& parameters = m_task->parameters;
    if (saveAs(m_task->resultSubtitlePath, parameters.outputFormat, parameters.layout) == CoreError::None)
        emit logMessage("Saved " + m_task->resultSubtitlePath, LogCategory::APP);

    emit finished(taskId);
    processNextFile();
}

void OptimizationSession::onFailed(const QString& taskId, const QString& message)
{
    emit logMessage("Optimization failed: " + message, LogCategory::APP);
    emit failed(taskId, message);
    processNextFile();
}

void OptimizationSession::processNextFile()
{
    if (!m_draining)
        return;

    QString path;
    while (m_queue.dequeueNext(path))
    {
        if (loadFile(path) == CoreError::None && process() == CoreError::None)
            return;
        emit logMessage("Skipping " + path, LogCategory::APP);
    }

    m_draining = false;
    emit queueDrained();
}

CoreError OptimizationSession::reject(CoreError error, const QString& detail)
{
    QString message = coreErrorMessage(error);
    if (!detail.isEmpty())
        message += " (" + detail + ")";
    emit logMessage(message, LogCategory::APP);
    emit rejected(error, message);
    return error;
}
