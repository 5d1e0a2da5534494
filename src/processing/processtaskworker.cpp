#include "processtaskworker.h"

#include "processmanager.h"
#include "subtitlecodec.h"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

ProcessTaskWorker::ProcessTaskWorker(QObject* parent)
    : TaskWorker(parent), m_processManager(new ProcessManager(this)), m_codec(new SubtitleCodec(this))
{
    connect(m_processManager, &ProcessManager::processOutput, this, &ProcessTaskWorker::onProcessOutput);
    connect(m_processManager, &ProcessManager::processStdErr, this, &ProcessTaskWorker::onProcessStdErr);
    connect(m_processManager, &ProcessManager::processFinished, this, &ProcessTaskWorker::onProcessFinished);
    connect(m_processManager, &ProcessManager::processError, this, &ProcessTaskWorker::onProcessError);
    connect(m_codec, &SubtitleCodec::logMessage, this, &ProcessTaskWorker::logMessage);
}

ProcessTaskWorker::~ProcessTaskWorker()
{
    m_done = true;
    m_processManager->killProcess();
}

void ProcessTaskWorker::start(const Task& task, const CancellationToken& token)
{
    m_task = task;
    m_token = token;
    m_done = false;
    m_currentStage = -1;
    m_stages.clear();

    switch (m_task.type)
    {
    case TaskType::SubtitlePipeline:
        m_stages << Stage::Transcribing;
        if (m_task.parameters.needOptimize || m_task.parameters.needTranslate)
            m_stages << Stage::Optimizing;
        break;
    case TaskType::TranscriptionOnly:
        m_stages << Stage::Transcribing;
        break;
    case TaskType::OptimizationOnly:
        m_stages << Stage::Optimizing;
        break;
    }

    runNextStage();
}

void ProcessTaskWorker::requestStop()
{
    if (m_done)
        return;
    m_done = true;
    m_token.cancel();
    emit logMessage("Stopping " + m_task.source.fileName, LogCategory::WORKER);
    m_processManager->killProcess();
}

QStringList ProcessTaskWorker::prepareCommandArguments(const QString& commandTemplate,
                                                       const QMap<QString, QString>& values)
{
    QString processedTemplate = commandTemplate;
    for (auto it = values.constBegin(); it != values.constEnd(); ++it)
    {
        processedTemplate.replace(it.key(), it.value());
    }

    // QProcess handles the quoting rules
    return QProcess::splitCommand(processedTemplate);
}

QMap<QString, QString> ProcessTaskWorker::parameterValues(const TaskParameters& parameters)
{
    const auto flag = [](bool enabled) { return enabled ? QString("true") : QString("false"); };

    QMap<QString, QString> values;
    values.insert("%MODEL%", parameters.transcribeModel);
    values.insert("%LANGUAGE%", parameters.targetLanguage);
    values.insert("%NEED_OPTIMIZE%", flag(parameters.needOptimize));
    values.insert("%NEED_TRANSLATE%", flag(parameters.needTranslate));
    values.insert("%NEED_SPLIT%", flag(parameters.needSplit));
    values.insert("%BATCH_SIZE%", QString::number(parameters.batchSize));
    values.insert("%THREAD_NUM%", QString::number(parameters.threadNum));
    values.insert("%MAX_WORDS_CJK%", QString::number(parameters.maxWordCountCjk));
    values.insert("%MAX_WORDS_EN%", QString::number(parameters.maxWordCountEnglish));
    return values;
}

int ProcessTaskWorker::parseProgressPercent(const QString& output)
{
    static const QRegularExpression percentRegex(R"((\d{1,3})(?:\.\d+)?\s*%)");
    int percent = -1;
    QRegularExpressionMatchIterator it = percentRegex.globalMatch(output);
    while (it.hasNext())
    {
        const int value = it.next().captured(1).toInt();
        if (value <= 100)
            percent = value;
    }
    return percent;
}

void ProcessTaskWorker::runNextStage()
{
    if (m_done)
        return;

    ++m_currentStage;
    if (m_currentStage >= m_stages.size())
    {
        finishTask();
        return;
    }

    const Stage stage = m_stages.at(m_currentStage);
    if (m_currentStage > 0)
        emit stageChanged(stage == Stage::Transcribing ? TaskStatus::Transcribing : TaskStatus::Optimizing);

    const AppSettings& settings = AppSettings::instance();
    const QString commandTemplate =
        stage == Stage::Transcribing ? settings.transcribeCommand() : settings.optimizeCommand();

    QStringList args = prepareCommandArguments(commandTemplate, placeholderValues(stage));
    if (args.isEmpty())
    {
        fail("Command template for " + stageName(stage) + " is empty.");
        return;
    }

    QString program = args.takeFirst();
    if (!QFileInfo(program).isAbsolute())
        program = AppSettings::findExecutablePath(program);

    m_lastStdErrLine.clear();
    emit progress(m_currentStage * 100 / m_stages.size(), stageName(stage));
    emit logMessage(stageName(stage) + ": " + program + " " + args.join(" "), LogCategory::WORKER);
    m_processManager->setWorkingDirectory(QFileInfo(m_task.filePath).absolutePath());
    m_processManager->startProcess(program, args);
}

void ProcessTaskWorker::finishTask()
{
    // The last produced file is what the user gets
    const QString outputPath =
        m_stages.contains(Stage::Optimizing) ? m_task.resultSubtitlePath : m_task.originalSubtitlePath;

    if (m_task.type == TaskType::SubtitlePipeline)
    {
        emit stageChanged(TaskStatus::Generating);
        emit progress(100, "Generating");
    }

    QList<SubtitleEntry> entries;
    if (!m_codec->load(outputPath, entries))
    {
        fail("No usable subtitle output: " + m_codec->lastError());
        return;
    }

    SubtitleEntries keyed;
    int key = 1;
    for (const SubtitleEntry& entry : entries)
        keyed.insert(key++, entry);

    m_done = true;
    emit fullUpdate(keyed);
    emit progress(100, "Completed");
    emit finished();
}

QMap<QString, QString> ProcessTaskWorker::placeholderValues(Stage stage)
{
    QMap<QString, QString> values = parameterValues(m_task.parameters);
    const QString input = stage == Stage::Transcribing ? m_task.filePath : m_task.originalSubtitlePath;
    const QString output = stage == Stage::Transcribing ? m_task.originalSubtitlePath : m_task.resultSubtitlePath;
    const QFileInfo outputInfo(output);

    values.insert("%INPUT%", input);
    values.insert("%OUTPUT%", output);
    values.insert("%OUTPUT_BASE%", outputInfo.dir().filePath(outputInfo.completeBaseName()));

    if (stage == Stage::Optimizing)
    {
        m_promptFile.reset(new QTemporaryFile());
        if (m_promptFile->open())
        {
            m_promptFile->write(m_task.parameters.customPrompt.toUtf8());
            m_promptFile->flush();
            values.insert("%PROMPT_FILE%", m_promptFile->fileName());
        }
        else
        {
            emit logMessage("Warning: could not create the prompt file, running without a prompt.", LogCategory::WORKER);
            values.insert("%PROMPT_FILE%", QString());
        }
    }
    return values;
}

QString ProcessTaskWorker::stageName(Stage stage) const
{
    return stage == Stage::Transcribing ? QString("Transcribing") : QString("Optimizing");
}

void ProcessTaskWorker::fail(const QString& message)
{
    if (m_done)
        return;
    m_done = true;
    emit error(message);
}

void ProcessTaskWorker::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (m_done || m_token.isCancelled() || m_processManager->wasKilled())
        return;

    if (exitStatus != QProcess::NormalExit || exitCode != 0)
    {
        QString message = QString("%1 failed with exit code %2.").arg(stageName(m_stages.at(m_currentStage))).arg(exitCode);
        if (!m_lastStdErrLine.isEmpty())
            message += " " + m_lastStdErrLine;
        fail(message);
        return;
    }

    runNextStage();
}

void ProcessTaskWorker::onProcessOutput(const QString& output)
{
    emit logMessage(output, LogCategory::WORKER);

    const int percent = parseProgressPercent(output);
    if (percent < 0 || m_currentStage < 0 || m_stages.isEmpty())
        return;
    // Each stage owns an equal share of the bar
    const int overall = (m_currentStage * 100 + percent) / m_stages.size();
    emit progress(overall, stageName(m_stages.at(m_currentStage)));
}

void ProcessTaskWorker::onProcessStdErr(const QString& output)
{
    const QStringList lines = output.split('\n', Qt::SkipEmptyParts);
    if (!lines.isEmpty())
        m_lastStdErrLine = lines.last().trimmed();
    onProcessOutput(output);
}

void ProcessTaskWorker::onProcessError(const QString& message)
{
    fail(message);
}

TaskWorker* ProcessWorkerFactory::createWorker(const Task& task, QObject* parent)
{
    Q_UNUSED(task);
    return new ProcessTaskWorker(parent);
}
