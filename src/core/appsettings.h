#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include "task.h"

#include <QObject>
#include <QSet>
#include <QSettings>
#include <QString>

enum class LogCategory
{
    APP,
    SCHEDULER,
    WORKER,
    SYSTEM,
    DEBUG
};

enum class CompletionPolicy
{
    DoNothing,
    ExitProcess,
    SuspendHost,
    ShutdownHost
};

QString completionPolicyToString(CompletionPolicy policy);
CompletionPolicy completionPolicyFromString(const QString& name, CompletionPolicy fallback);

class AppSettings : public QObject
{
    Q_OBJECT
private:
    explicit AppSettings(QObject* parent = nullptr);
    AppSettings(const AppSettings&) = delete;
    AppSettings& operator=(const AppSettings&) = delete;

public:
    static AppSettings& instance();
    void load();
    void save();
    void resetToDefaults();

    QSet<LogCategory> enabledLogCategories() const;
    void setEnabledLogCategories(const QSet<LogCategory>& categories);
    CompletionPolicy completionPolicy() const;
    void setCompletionPolicy(CompletionPolicy policy);
    TaskType defaultTaskType() const;
    void setDefaultTaskType(TaskType type);

    QString transcribeCommand() const;
    void setTranscribeCommand(const QString& command);
    QString optimizeCommand() const;
    void setOptimizeCommand(const QString& command);
    QString transcribeModel() const;
    void setTranscribeModel(const QString& model);

    bool needOptimize() const;
    void setNeedOptimize(bool enabled);
    bool needTranslate() const;
    void setNeedTranslate(bool enabled);
    bool needSplit() const;
    void setNeedSplit(bool enabled);
    QString targetLanguage() const;
    void setTargetLanguage(const QString& language);
    int batchSize() const;
    void setBatchSize(int size);
    int threadNum() const;
    void setThreadNum(int count);
    int maxWordCountCjk() const;
    void setMaxWordCountCjk(int count);
    int maxWordCountEnglish() const;
    void setMaxWordCountEnglish(int count);
    QString customPrompt() const;
    void setCustomPrompt(const QString& prompt);

    OutputSubtitleFormat outputFormat() const;
    void setOutputFormat(OutputSubtitleFormat format);
    SubtitleLayout subtitleLayout() const;
    void setSubtitleLayout(SubtitleLayout layout);
    QString subtitleStylePath() const;
    void setSubtitleStylePath(const QString& path);

    /**
     * @brief Snapshot of the options handed to a newly created task.
     */
    TaskParameters taskParameters() const;

    static QString findExecutablePath(const QString& exeName);

private:
    void loadDefaults();

    QSet<LogCategory> m_enabledLogCategories;
    CompletionPolicy m_completionPolicy;
    TaskType m_defaultTaskType;
    QString m_transcribeCommand;
    QString m_optimizeCommand;
    QString m_transcribeModel;
    bool m_needOptimize;
    bool m_needTranslate;
    bool m_needSplit;
    QString m_targetLanguage;
    int m_batchSize;
    int m_threadNum;
    int m_maxWordCountCjk;
    int m_maxWordCountEnglish;
    QString m_customPrompt;
    OutputSubtitleFormat m_outputFormat;
    SubtitleLayout m_subtitleLayout;
    QString m_subtitleStylePath;
};

Q_DECLARE_METATYPE(LogCategory)
Q_DECLARE_METATYPE(CompletionPolicy)

#endif // APPSETTINGS_H
