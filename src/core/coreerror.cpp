#include "coreerror.h"

QString coreErrorMessage(CoreError error)
{
    switch (error)
    {
    case CoreError::None:
        return "OK";
    case CoreError::EmptyBatch:
        return "There are no tasks to process.";
    case CoreError::BusyBatch:
        return "A batch is being processed. Wait for it to finish or cancel it first.";
    case CoreError::DuplicateTask:
        return "This file is already in the task list.";
    case CoreError::MalformedTimestamp:
        return "Invalid timestamp. Expected hh:mm:ss.zzz with end after start.";
    case CoreError::EntryNotFound:
        return "No subtitle entry with this key.";
    case CoreError::TaskNotFound:
        return "No such task.";
    case CoreError::UnsupportedFormat:
        return "Unsupported file format for this task type.";
    case CoreError::IoError:
        return "File could not be read or written.";
    }
    return "Unknown error.";
}
