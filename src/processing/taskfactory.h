#ifndef TASKFACTORY_H
#define TASKFACTORY_H

#include "coreerror.h"
#include "task.h"

#include <QStringList>

/**
 * @brief Builds tasks for source files.
 *
 * The task id is the canonical absolute path, so two spellings of the same
 * file are recognized as duplicates by the scheduler. Parameters are a
 * snapshot of AppSettings at creation time.
 */
class TaskFactory
{
public:
    static CoreError create(const QString& path, TaskType type, Task& task);
    // Fills originalSubtitlePath and resultSubtitlePath from filePath, type and the output format
    static void deriveOutputPaths(Task& task);

    static bool acceptsFile(const QString& path, TaskType type);
    static QString canonicalId(const QString& path);

    static QStringList supportedVideoSuffixes();
    static QStringList supportedAudioSuffixes();
};

#endif // TASKFACTORY_H
