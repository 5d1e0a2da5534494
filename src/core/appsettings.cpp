#include "appsettings.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QVariantList>

namespace
{
const char* const kOrganization = "SubtitleBatch";
const char* const kApplication = "SubtitleBatch";

// %INPUT% - source file, %OUTPUT% - subtitle file to produce, %OUTPUT_BASE% - %OUTPUT% without extension,
// %MODEL% - transcription model, %LANGUAGE% - target language, %PROMPT_FILE% - file with the custom prompt,
// %NEED_OPTIMIZE% / %NEED_TRANSLATE% / %NEED_SPLIT% - "true" or "false", %BATCH_SIZE%, %THREAD_NUM%,
// %MAX_WORDS_CJK%, %MAX_WORDS_EN% - numbers from the optimize settings
const char* const kDefaultTranscribeCommand =
    "whisper-cli -m \"%MODEL%\" -osrt -of \"%OUTPUT_BASE%\" -f \"%INPUT%\"";
const char* const kDefaultOptimizeCommand =
    "subtitle-optimizer --input \"%INPUT%\" --output \"%OUTPUT%\" --language \"%LANGUAGE%\" "
    "--prompt-file \"%PROMPT_FILE%\" --optimize %NEED_OPTIMIZE% --translate %NEED_TRANSLATE% --split %NEED_SPLIT% "
    "--batch-size %BATCH_SIZE% --threads %THREAD_NUM% --max-words-cjk %MAX_WORDS_CJK% --max-words-en %MAX_WORDS_EN%";
} // namespace

QString completionPolicyToString(CompletionPolicy policy)
{
    switch (policy)
    {
    case CompletionPolicy::DoNothing:
        return "nothing";
    case CompletionPolicy::ExitProcess:
        return "exit";
    case CompletionPolicy::SuspendHost:
        return "suspend";
    case CompletionPolicy::ShutdownHost:
        return "shutdown";
    }
    return "nothing";
}

CompletionPolicy completionPolicyFromString(const QString& name, CompletionPolicy fallback)
{
    for (CompletionPolicy policy : {CompletionPolicy::DoNothing, CompletionPolicy::ExitProcess,
                                    CompletionPolicy::SuspendHost, CompletionPolicy::ShutdownHost})
    {
        if (name.compare(completionPolicyToString(policy), Qt::CaseInsensitive) == 0)
            return policy;
    }
    return fallback;
}

/**
 * @brief Locate a tool: tools/ next to the binary, the binary's directory, then PATH.
 *
 * Falls back to the bare name so the caller can report a missing tool itself.
 */
QString AppSettings::findExecutablePath(const QString& exeName)
{
    const QString kAppDir = QCoreApplication::applicationDirPath();
    QString candidate = QDir(kAppDir).filePath("tools/" + exeName);
    if (QFileInfo::exists(candidate))
    {
        return QDir::toNativeSeparators(candidate);
    }

    candidate = QDir(kAppDir).filePath(exeName);
    if (QFileInfo::exists(candidate))
    {
        return QDir::toNativeSeparators(candidate);
    }

    QString path = QStandardPaths::findExecutable(exeName);
    if (!path.isEmpty())
    {
        return QDir::toNativeSeparators(path);
    }

    return exeName;
}

AppSettings& AppSettings::instance()
{
    static AppSettings self;
    return self;
}

AppSettings::AppSettings(QObject* parent) : QObject(parent)
{
    resetToDefaults();
}

void AppSettings::load()
{
    QSettings settings(kOrganization, kApplication);

    m_completionPolicy = completionPolicyFromString(settings.value("general/completionPolicy").toString(),
                                                    CompletionPolicy::DoNothing);
    m_defaultTaskType = static_cast<TaskType>(
        settings.value("general/defaultTaskType", static_cast<int>(TaskType::SubtitlePipeline)).toInt());

    m_transcribeCommand = settings.value("tools/transcribeCommand").toString();
    m_optimizeCommand = settings.value("tools/optimizeCommand").toString();
    m_transcribeModel = settings.value("transcribe/model", "ggml-base.bin").toString();

    m_needOptimize = settings.value("optimize/needOptimize", true).toBool();
    m_needTranslate = settings.value("optimize/needTranslate", false).toBool();
    m_needSplit = settings.value("optimize/needSplit", true).toBool();
    m_targetLanguage = settings.value("optimize/targetLanguage", "English").toString();
    m_batchSize = settings.value("optimize/batchSize", 10).toInt();
    m_threadNum = settings.value("optimize/threadNum", 4).toInt();
    m_maxWordCountCjk = settings.value("optimize/maxWordCountCjk", 18).toInt();
    m_maxWordCountEnglish = settings.value("optimize/maxWordCountEnglish", 12).toInt();
    m_customPrompt = settings.value("optimize/customPrompt", "").toString();

    m_outputFormat =
        outputFormatFromString(settings.value("subtitle/outputFormat").toString(), OutputSubtitleFormat::Srt);
    m_subtitleLayout =
        subtitleLayoutFromString(settings.value("subtitle/layout").toString(), SubtitleLayout::TranslationOnTop);
    m_subtitleStylePath = settings.value("subtitle/stylePath", "").toString();

    if (m_transcribeCommand.isEmpty() || m_optimizeCommand.isEmpty())
    {
        loadDefaults();
        save();
    }

    m_enabledLogCategories.clear();
    QVariantList enabledCategoriesInts = settings.value("logging/enabledCategories").toList();
    if (enabledCategoriesInts.isEmpty())
    {
        m_enabledLogCategories.insert(LogCategory::APP);
        m_enabledLogCategories.insert(LogCategory::SCHEDULER);
    }
    else
    {
        for (const QVariant& val : enabledCategoriesInts)
        {
            m_enabledLogCategories.insert(static_cast<LogCategory>(val.toInt()));
        }
    }
}

void AppSettings::save()
{
    QSettings settings(kOrganization, kApplication);
    settings.setValue("general/completionPolicy", completionPolicyToString(m_completionPolicy));
    settings.setValue("general/defaultTaskType", static_cast<int>(m_defaultTaskType));
    settings.setValue("tools/transcribeCommand", m_transcribeCommand);
    settings.setValue("tools/optimizeCommand", m_optimizeCommand);
    settings.setValue("transcribe/model", m_transcribeModel);
    settings.setValue("optimize/needOptimize", m_needOptimize);
    settings.setValue("optimize/needTranslate", m_needTranslate);
    settings.setValue("optimize/needSplit", m_needSplit);
    settings.setValue("optimize/targetLanguage", m_targetLanguage);
    settings.setValue("optimize/batchSize", m_batchSize);
    settings.setValue("optimize/threadNum", m_threadNum);
    settings.setValue("optimize/maxWordCountCjk", m_maxWordCountCjk);
    settings.setValue("optimize/maxWordCountEnglish", m_maxWordCountEnglish);
    settings.setValue("optimize/customPrompt", m_customPrompt);
    settings.setValue("subtitle/outputFormat", outputFormatToString(m_outputFormat));
    settings.setValue("subtitle/layout", subtitleLayoutToString(m_subtitleLayout));
    settings.setValue("subtitle/stylePath", m_subtitleStylePath);

    QVariantList enabledCategoriesInts;
    for (const auto& category : m_enabledLogCategories)
    {
        enabledCategoriesInts.append(static_cast<int>(category));
    }
    settings.setValue("logging/enabledCategories", enabledCategoriesInts);
}

void AppSettings::resetToDefaults()
{
    m_transcribeCommand.clear();
    m_optimizeCommand.clear();
    m_enabledLogCategories.clear();
    m_completionPolicy = CompletionPolicy::DoNothing;
    m_defaultTaskType = TaskType::SubtitlePipeline;
    m_transcribeModel = "ggml-base.bin";
    m_needOptimize = true;
    m_needTranslate = false;
    m_needSplit = true;
    m_targetLanguage = "English";
    m_batchSize = 10;
    m_threadNum = 4;
    m_maxWordCountCjk = 18;
    m_maxWordCountEnglish = 12;
    m_customPrompt.clear();
    m_outputFormat = OutputSubtitleFormat::Srt;
    m_subtitleLayout = SubtitleLayout::TranslationOnTop;
    m_subtitleStylePath.clear();
    loadDefaults();
}

void AppSettings::loadDefaults()
{
    if (m_transcribeCommand.isEmpty())
    {
        m_transcribeCommand = kDefaultTranscribeCommand;
    }
    if (m_optimizeCommand.isEmpty())
    {
        m_optimizeCommand = kDefaultOptimizeCommand;
    }
    if (m_enabledLogCategories.isEmpty())
    {
        m_enabledLogCategories = {LogCategory::APP, LogCategory::SCHEDULER};
    }
}

TaskParameters AppSettings::taskParameters() const
{
    TaskParameters p;
    p.targetLanguage = m_targetLanguage;
    p.transcribeModel = m_transcribeModel;
    p.customPrompt = m_customPrompt;
    p.needOptimize = m_needOptimize;
    p.needTranslate = m_needTranslate;
    p.needSplit = m_needSplit;
    p.batchSize = m_batchSize;
    p.threadNum = m_threadNum;
    p.maxWordCountCjk = m_maxWordCountCjk;
    p.maxWordCountEnglish = m_maxWordCountEnglish;
    p.outputFormat = m_outputFormat;
    p.layout = m_subtitleLayout;
    return p;
}

// Getters and setters
QSet<LogCategory> AppSettings::enabledLogCategories() const { return m_enabledLogCategories; }
void AppSettings::setEnabledLogCategories(const QSet<LogCategory>& categories) { m_enabledLogCategories = categories; }
CompletionPolicy AppSettings::completionPolicy() const { return m_completionPolicy; }
void AppSettings::setCompletionPolicy(CompletionPolicy policy) { m_completionPolicy = policy; }
TaskType AppSettings::defaultTaskType() const { return m_defaultTaskType; }
void AppSettings::setDefaultTaskType(TaskType type) { m_defaultTaskType = type; }
QString AppSettings::transcribeCommand() const { return m_transcribeCommand; }
void AppSettings::setTranscribeCommand(const QString& command) { m_transcribeCommand = command; }
QString AppSettings::optimizeCommand() const { return m_optimizeCommand; }
void AppSettings::setOptimizeCommand(const QString& command) { m_optimizeCommand = command; }
QString AppSettings::transcribeModel() const { return m_transcribeModel; }
void AppSettings::setTranscribeModel(const QString& model) { m_transcribeModel = model; }
bool AppSettings::needOptimize() const { return m_needOptimize; }
void AppSettings::setNeedOptimize(bool enabled) { m_needOptimize = enabled; }
bool AppSettings::needTranslate() const { return m_needTranslate; }
void AppSettings::setNeedTranslate(bool enabled) { m_needTranslate = enabled; }
bool AppSettings::needSplit() const { return m_needSplit; }
void AppSettings::setNeedSplit(bool enabled) { m_needSplit = enabled; }
QString AppSettings::targetLanguage() const { return m_targetLanguage; }
void AppSettings::setTargetLanguage(const QString& language) { m_targetLanguage = language; }
int AppSettings::batchSize() const { return m_batchSize; }
void AppSettings::setBatchSize(int size) { m_batchSize = size; }
int AppSettings::threadNum() const { return m_threadNum; }
void AppSettings::setThreadNum(int count) { m_threadNum = count; }
int AppSettings::maxWordCountCjk() const { return m_maxWordCountCjk; }
void AppSettings::setMaxWordCountCjk(int count) { m_maxWordCountCjk = count; }
int AppSettings::maxWordCountEnglish() const { return m_maxWordCountEnglish; }
void AppSettings::setMaxWordCountEnglish(int count) { m_maxWordCountEnglish = count; }
QString AppSettings::customPrompt() const { return m_customPrompt; }
void AppSettings::setCustomPrompt(const QString& prompt) { m_customPrompt = prompt; }
OutputSubtitleFormat AppSettings::outputFormat() const { return m_outputFormat; }
void AppSettings::setOutputFormat(OutputSubtitleFormat format) { m_outputFormat = format; }
SubtitleLayout AppSettings::subtitleLayout() const { return m_subtitleLayout; }
void AppSettings::setSubtitleLayout(SubtitleLayout layout) { m_subtitleLayout = layout; }
QString AppSettings::subtitleStylePath() const { return m_subtitleStylePath; }
void AppSettings::setSubtitleStylePath(const QString& path) { m_subtitleStylePath = path; }
