#ifndef COREERROR_H
#define COREERROR_H

#include <QMetaType>
#include <QString>

/**
 * @brief Closed set of failures the orchestration core reports.
 *
 * Synchronous operations return one of these; None means the call succeeded.
 */
enum class CoreError
{
    None,
    EmptyBatch,
    BusyBatch,
    DuplicateTask,
    MalformedTimestamp,
    EntryNotFound,
    TaskNotFound,
    UnsupportedFormat,
    IoError
};

QString coreErrorMessage(CoreError error);

Q_DECLARE_METATYPE(CoreError)

#endif // COREERROR_H
