#include "logsink.h"

#include <QDateTime>
#include <QTextStream>

QString logCategoryToString(LogCategory category)
{
    switch (category)
    {
    case LogCategory::APP:
        return "APP";
    case LogCategory::SCHEDULER:
        return "SCHEDULER";
    case LogCategory::WORKER:
        return "WORKER";
    case LogCategory::SYSTEM:
        return "SYSTEM";
    case LogCategory::DEBUG:
        return "DEBUG";
    }
    return "UNKNOWN";
}

LogSink::LogSink(const QString& logFilePath, QObject* parent) : QObject(parent)
{
    // Overwritten each launch
    m_logFile.setFileName(logFilePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
    {
        qWarning("Failed to open %s for writing", qPrintable(logFilePath));
    }
}

LogSink::~LogSink()
{
    if (m_logFile.isOpen())
    {
        m_logFile.close();
    }
}

QString LogSink::formatLine(const QString& message, LogCategory category)
{
    return QString("[%1] %2 - %3")
        .arg(logCategoryToString(category))
        .arg(QDateTime::currentDateTime().toString("hh:mm:ss"))
        .arg(message.trimmed());
}

void LogSink::logMessage(const QString& message, LogCategory category)
{
    const QString timedMessage = formatLine(message, category);

    if (m_logFile.isOpen())
    {
        m_logFile.write(timedMessage.toUtf8());
        m_logFile.write("\n");
        m_logFile.flush();
    }

    const auto& enabledCategories = AppSettings::instance().enabledLogCategories();
    if (!enabledCategories.contains(category))
    {
        return;
    }

    QTextStream out(stdout);
    out << timedMessage << Qt::endl;
}
