#ifndef OPTIMIZATIONSESSION_H
#define OPTIMIZATIONSESSION_H

#include "appsettings.h"
#include "coreerror.h"
#include "filequeue.h"
#include "task.h"

#include <QObject>
#include <QSharedPointer>

class SubtitleCodec;
class SubtitleDocument;
class TaskRunner;
class WorkerFactory;

/**
 * @brief Edit-and-optimize loop for subtitle files.
 *
 * Holds the document being edited and feeds queued files through the
 * optimizer one at a time: load, optimize, then pull the next file whether
 * the previous one succeeded or failed. Cancel stops the current file and
 * leaves the rest of the queue waiting.
 */
class OptimizationSession : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(OptimizationSession)

public:
    explicit OptimizationSession(WorkerFactory* factory, QObject* parent = nullptr);
    ~OptimizationSession() override;

    SubtitleDocument* document() const;
    QSharedPointer<Task> task() const;
    const FileIntakeQueue& queue() const;
    bool isRunning() const;

    CoreError loadFile(const QString& path);
    void enqueueFiles(const QStringList& paths);
    CoreError process();
    void cancel();

    CoreError saveAs(const QString& path, OutputSubtitleFormat format, SubtitleLayout layout);

signals:
    void fileLoaded(const QString& path);
    void progress(int percent, const QString& message);
    void finished(const QString& taskId);
    void failed(const QString& taskId, const QString& message);
    void canceled();
    void queueDrained();
    void rejected(CoreError error, const QString& message);
    void logMessage(const QString& message, LogCategory category);

private slots:
    void onSucceeded(const QString& taskId);
    void onFailed(const QString& taskId, const QString& message);

private:
    void processNextFile();
    CoreError reject(CoreError error, const QString& detail = QString());

    SubtitleDocument* m_document;
    SubtitleCodec* m_codec;
    TaskRunner* m_runner;
    FileIntakeQueue m_queue;
    QSharedPointer<Task> m_task;
    bool m_draining = false;
};

#endif // OPTIMIZATIONSESSION_H
