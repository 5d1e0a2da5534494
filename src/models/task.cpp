#include "task.h"

bool Task::isRunning() const
{
    return status == TaskStatus::Transcribing || status == TaskStatus::Optimizing ||
           status == TaskStatus::Generating;
}

bool Task::isTerminal() const
{
    return status == TaskStatus::Completed || status == TaskStatus::Failed;
}

QString taskTypeToString(TaskType type)
{
    switch (type)
    {
    case TaskType::SubtitlePipeline:
        return "subtitle";
    case TaskType::TranscriptionOnly:
        return "transcribe";
    case TaskType::OptimizationOnly:
        return "optimize";
    }
    return "unknown";
}

TaskType taskTypeFromString(const QString& name, TaskType fallback)
{
    for (TaskType type : {TaskType::SubtitlePipeline, TaskType::TranscriptionOnly, TaskType::OptimizationOnly})
    {
        if (name.compare(taskTypeToString(type), Qt::CaseInsensitive) == 0)
            return type;
    }
    return fallback;
}

QString taskStatusToString(TaskStatus status)
{
    switch (status)
    {
    case TaskStatus::Pending:
        return "Pending";
    case TaskStatus::Transcribing:
        return "Transcribing";
    case TaskStatus::Optimizing:
        return "Optimizing";
    case TaskStatus::Generating:
        return "Generating";
    case TaskStatus::Completed:
        return "Completed";
    case TaskStatus::Failed:
        return "Failed";
    }
    return "Unknown";
}

QString outputFormatToString(OutputSubtitleFormat format)
{
    switch (format)
    {
    case OutputSubtitleFormat::Srt:
        return "srt";
    case OutputSubtitleFormat::Ass:
        return "ass";
    case OutputSubtitleFormat::Json:
        return "json";
    }
    return "srt";
}

OutputSubtitleFormat outputFormatFromString(const QString& name, OutputSubtitleFormat fallback)
{
    const QString lower = name.trimmed().toLower();
    if (lower == "srt")
        return OutputSubtitleFormat::Srt;
    if (lower == "ass")
        return OutputSubtitleFormat::Ass;
    if (lower == "json")
        return OutputSubtitleFormat::Json;
    return fallback;
}

QString subtitleLayoutToString(SubtitleLayout layout)
{
    switch (layout)
    {
    case SubtitleLayout::TranslationOnTop:
        return "TranslationOnTop";
    case SubtitleLayout::OriginalOnTop:
        return "OriginalOnTop";
    case SubtitleLayout::OriginalOnly:
        return "OriginalOnly";
    case SubtitleLayout::TranslationOnly:
        return "TranslationOnly";
    }
    return "TranslationOnTop";
}

SubtitleLayout subtitleLayoutFromString(const QString& name, SubtitleLayout fallback)
{
    for (SubtitleLayout layout : {SubtitleLayout::TranslationOnTop, SubtitleLayout::OriginalOnTop,
                                  SubtitleLayout::OriginalOnly, SubtitleLayout::TranslationOnly})
    {
        if (name.compare(subtitleLayoutToString(layout), Qt::CaseInsensitive) == 0)
            return layout;
    }
    return fallback;
}

TaskStatus initialRunningStatus(TaskType type)
{
    switch (type)
    {
    case TaskType::SubtitlePipeline:
    case TaskType::TranscriptionOnly:
        return TaskStatus::Transcribing;
    case TaskType::OptimizationOnly:
        return TaskStatus::Optimizing;
    }
    return TaskStatus::Transcribing;
}
