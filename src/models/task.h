#ifndef TASK_H
#define TASK_H

#include <QMetaType>
#include <QString>

enum class TaskType
{
    SubtitlePipeline,
    TranscriptionOnly,
    OptimizationOnly
};

enum class TaskStatus
{
    Pending,
    Transcribing,
    Optimizing,
    Generating,
    Completed,
    Failed
};

enum class OutputSubtitleFormat
{
    Srt,
    Ass,
    Json
};

enum class SubtitleLayout
{
    TranslationOnTop,
    OriginalOnTop,
    OriginalOnly,
    TranslationOnly
};

/**
 * @brief Parameters passed through to the executing collaborator.
 *
 * The scheduler never looks inside; they are snapshotted from AppSettings when
 * the task is created.
 */
struct TaskParameters
{
    QString targetLanguage;
    QString transcribeModel;
    QString customPrompt;
    bool needOptimize = false;
    bool needTranslate = false;
    bool needSplit = false;
    int batchSize = 10;
    int threadNum = 4;
    int maxWordCountCjk = 18;
    int maxWordCountEnglish = 12;
    OutputSubtitleFormat outputFormat = OutputSubtitleFormat::Srt;
    SubtitleLayout layout = SubtitleLayout::TranslationOnTop;
};

struct SourceInfo
{
    QString fileName;
    QString suffix;
    qint64 sizeBytes = 0;
};

struct Task
{
    QString id; // Canonical absolute path of the source file
    TaskType type = TaskType::SubtitlePipeline;
    TaskStatus status = TaskStatus::Pending;
    TaskParameters parameters;
    SourceInfo source;

    QString filePath;
    QString originalSubtitlePath; // Transcription output / optimization input
    QString resultSubtitlePath;   // Optimized output

    bool isRunning() const;
    bool isTerminal() const;
};

QString taskTypeToString(TaskType type);
TaskType taskTypeFromString(const QString& name, TaskType fallback);
QString taskStatusToString(TaskStatus status);
QString outputFormatToString(OutputSubtitleFormat format);
OutputSubtitleFormat outputFormatFromString(const QString& name, OutputSubtitleFormat fallback);
QString subtitleLayoutToString(SubtitleLayout layout);
SubtitleLayout subtitleLayoutFromString(const QString& name, SubtitleLayout fallback);

/**
 * @brief First in-progress status for a freshly started task of the given type.
 */
TaskStatus initialRunningStatus(TaskType type);

Q_DECLARE_METATYPE(Task)
Q_DECLARE_METATYPE(TaskStatus)
Q_DECLARE_METATYPE(TaskType)

#endif // TASK_H
