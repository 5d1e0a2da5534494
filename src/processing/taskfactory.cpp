#include "taskfactory.h"

#include "appsettings.h"
#include "subtitlecodec.h"

#include <QDir>
#include <QFileInfo>

QStringList TaskFactory::supportedVideoSuffixes()
{
    return {"mp4", "mkv", "avi", "mov", "webm", "flv", "wmv", "m4v", "ts"};
}

QStringList TaskFactory::supportedAudioSuffixes()
{
    return {"mp3", "wav", "flac", "m4a", "aac", "ogg", "opus", "wma"};
}

bool TaskFactory::acceptsFile(const QString& path, TaskType type)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    switch (type)
    {
    case TaskType::SubtitlePipeline:
        return supportedVideoSuffixes().contains(suffix);
    case TaskType::TranscriptionOnly:
        return supportedVideoSuffixes().contains(suffix) || supportedAudioSuffixes().contains(suffix);
    case TaskType::OptimizationOnly:
        return SubtitleCodec::isSupportedSubtitleFile(path);
    }
    return false;
}

QString TaskFactory::canonicalId(const QString& path)
{
    const QFileInfo info(path);
    const QString canonical = info.canonicalFilePath();
    return canonical.isEmpty() ? QDir::cleanPath(info.absoluteFilePath()) : canonical;
}

CoreError TaskFactory::create(const QString& path, TaskType type, Task& task)
{
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile())
        return CoreError::IoError;
    if (!acceptsFile(path, type))
        return CoreError::UnsupportedFormat;

    const AppSettings& settings = AppSettings::instance();

    task = Task();
    task.id = canonicalId(path);
    task.type = type;
    task.status = TaskStatus::Pending;
    task.parameters = settings.taskParameters();
    task.filePath = info.absoluteFilePath();
    task.source.fileName = info.fileName();
    task.source.suffix = info.suffix().toLower();
    task.source.sizeBytes = info.size();
    deriveOutputPaths(task);
    return CoreError::None;
}

void TaskFactory::deriveOutputPaths(Task& task)
{
    const QFileInfo info(task.filePath);
    const QDir dir = info.absoluteDir();
    const QString baseName = info.completeBaseName();
    const QString resultSuffix = outputFormatToString(task.parameters.outputFormat);

    if (task.type == TaskType::OptimizationOnly)
    {
        task.originalSubtitlePath = task.filePath;
        task.resultSubtitlePath = dir.filePath(baseName + ".optimized." + resultSuffix);
    }
    else
    {
        task.originalSubtitlePath = dir.filePath(baseName + ".original.srt");
        task.resultSubtitlePath = dir.filePath(baseName + "." + resultSuffix);
    }
}
