#ifndef LOGSINK_H
#define LOGSINK_H

#include "appsettings.h"

#include <QFile>
#include <QObject>
#include <QString>

QString logCategoryToString(LogCategory category);

/**
 * @brief Collects logMessage() signals from every component.
 *
 * Every line goes to the log file; only categories enabled in AppSettings
 * are echoed to the console.
 */
class LogSink : public QObject
{
    Q_OBJECT
public:
    explicit LogSink(const QString& logFilePath, QObject* parent = nullptr);
    ~LogSink() override;

    static QString formatLine(const QString& message, LogCategory category);

public slots:
    void logMessage(const QString& message, LogCategory category);

private:
    QFile m_logFile;
};

#endif // LOGSINK_H
