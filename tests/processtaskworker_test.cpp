/**
 * @file processtaskworker_test.cpp
 * @brief Unit tests for ProcessTaskWorker command handling.
 *
 * The end-to-end cases run POSIX tools (cp, false) in place of the real
 * transcriber and optimizer.
 */

#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "appsettings.h"
#include "processtaskworker.h"
#include "taskfactory.h"

class ProcessTaskWorkerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanup();

    void testPrepareCommandArguments_quotedPlaceholders();
    void testPrepareCommandArguments_taskParameters();
    void testPrepareCommandArguments_emptyTemplate();
    void testParseProgressPercent();

    void testRun_optimizationProducesEntries();
    void testRun_nonZeroExitFails();
    void testRun_missingProgramFails();

private:
    Task makeOptimizationTask();

    QTemporaryDir m_dir;
};

void ProcessTaskWorkerTest::initTestCase()
{
    QVERIFY(m_dir.isValid());
    qRegisterMetaType<LogCategory>();
    qRegisterMetaType<TaskStatus>();
}

void ProcessTaskWorkerTest::cleanup()
{
    AppSettings::instance().resetToDefaults();
}

Task ProcessTaskWorkerTest::makeOptimizationTask()
{
    const QString path = m_dir.filePath("input lines.srt");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly))
    {
        file.write("1\n00:00:00,000 --> 00:00:01,000\nfirst\nerste\n\n"
                   "2\n00:00:01,000 --> 00:00:02,000\nsecond\n");
    }

    Task task;
    TaskFactory::create(path, TaskType::OptimizationOnly, task);
    return task;
}

void ProcessTaskWorkerTest::testPrepareCommandArguments_quotedPlaceholders()
{
    QMap<QString, QString> values;
    values.insert("%INPUT%", "/media/My Show/ep 1.mkv");
    values.insert("%OUTPUT_BASE%", "/media/My Show/ep 1.original");
    values.insert("%MODEL%", "ggml-base.bin");

    const QStringList args = ProcessTaskWorker::prepareCommandArguments(
        "whisper-cli -m \"%MODEL%\" -osrt -of \"%OUTPUT_BASE%\" -f \"%INPUT%\"", values);

    QCOMPARE(args, QStringList({"whisper-cli", "-m", "ggml-base.bin", "-osrt", "-of", "/media/My Show/ep 1.original",
                                "-f", "/media/My Show/ep 1.mkv"}));
}

void ProcessTaskWorkerTest::testPrepareCommandArguments_taskParameters()
{
    TaskParameters parameters;
    parameters.targetLanguage = "Simplified Chinese";
    parameters.needOptimize = false;
    parameters.needTranslate = true;
    parameters.needSplit = true;
    parameters.batchSize = 25;
    parameters.threadNum = 8;
    parameters.maxWordCountCjk = 20;
    parameters.maxWordCountEnglish = 14;

    QMap<QString, QString> values = ProcessTaskWorker::parameterValues(parameters);
    values.insert("%INPUT%", "in.srt");
    values.insert("%OUTPUT%", "out.srt");
    values.insert("%PROMPT_FILE%", "/tmp/prompt.txt");

    AppSettings::instance().resetToDefaults();
    const QStringList args =
        ProcessTaskWorker::prepareCommandArguments(AppSettings::instance().optimizeCommand(), values);

    const auto valueOf = [&args](const QString& option)
    {
        const int index = args.indexOf(option);
        return index >= 0 && index + 1 < args.size() ? args.at(index + 1) : QString();
    };
    QCOMPARE(valueOf("--language"), QString("Simplified Chinese"));
    QCOMPARE(valueOf("--translate"), QString("true"));
    QCOMPARE(valueOf("--optimize"), QString("false"));
    QCOMPARE(valueOf("--split"), QString("true"));
    QCOMPARE(valueOf("--batch-size"), QString("25"));
    QCOMPARE(valueOf("--threads"), QString("8"));
    QCOMPARE(valueOf("--max-words-cjk"), QString("20"));
    QCOMPARE(valueOf("--max-words-en"), QString("14"));
    QCOMPARE(valueOf("--prompt-file"), QString("/tmp/prompt.txt"));
    for (const QString& arg : args)
        QVERIFY2(!arg.contains('%'), qPrintable("Unreplaced placeholder: " + arg));
}

void ProcessTaskWorkerTest::testPrepareCommandArguments_emptyTemplate()
{
    QVERIFY(ProcessTaskWorker::prepareCommandArguments("   ", {}).isEmpty());
}

void ProcessTaskWorkerTest::testParseProgressPercent()
{
    QCOMPARE(ProcessTaskWorker::parseProgressPercent("whisper_full: progress =  45%"), 45);
    QCOMPARE(ProcessTaskWorker::parseProgressPercent("batch 3/10 30.5% done, 40 %"), 40);
    QCOMPARE(ProcessTaskWorker::parseProgressPercent("no numbers here"), -1);
    QCOMPARE(ProcessTaskWorker::parseProgressPercent("450% overshoot"), -1);
}

void ProcessTaskWorkerTest::testRun_optimizationProducesEntries()
{
#ifndef Q_OS_UNIX
    QSKIP("This test requires POSIX cp");
#endif
    AppSettings::instance().setOptimizeCommand("cp \"%INPUT%\" \"%OUTPUT%\"");
    const Task task = makeOptimizationTask();

    ProcessTaskWorker worker;
    QSignalSpy finished(&worker, &TaskWorker::finished);
    QSignalSpy failed(&worker, &TaskWorker::error);
    QSignalSpy fullUpdate(&worker, &TaskWorker::fullUpdate);

    worker.start(task, CancellationToken());

    QVERIFY(finished.wait(5000));
    QCOMPARE(failed.count(), 0);
    QCOMPARE(fullUpdate.count(), 1);
    const SubtitleEntries entries = fullUpdate.first().at(0).value<SubtitleEntries>();
    QCOMPARE(entries.size(), 2);
    QCOMPARE(entries.value(1).translatedText, QString("erste"));
    QVERIFY(QFileInfo::exists(task.resultSubtitlePath));
}

void ProcessTaskWorkerTest::testRun_nonZeroExitFails()
{
#ifndef Q_OS_UNIX
    QSKIP("This test requires POSIX false");
#endif
    AppSettings::instance().setOptimizeCommand("false \"%INPUT%\"");

    ProcessTaskWorker worker;
    QSignalSpy finished(&worker, &TaskWorker::finished);
    QSignalSpy failed(&worker, &TaskWorker::error);

    worker.start(makeOptimizationTask(), CancellationToken());

    QVERIFY(failed.wait(5000));
    QVERIFY(failed.first().at(0).toString().startsWith("Optimizing failed with exit code 1"));
    QCOMPARE(finished.count(), 0);
}

void ProcessTaskWorkerTest::testRun_missingProgramFails()
{
    AppSettings::instance().setOptimizeCommand("/nonexistent/optimizer-tool \"%INPUT%\"");

    ProcessTaskWorker worker;
    QSignalSpy failed(&worker, &TaskWorker::error);

    worker.start(makeOptimizationTask(), CancellationToken());

    QVERIFY(failed.count() == 1 || failed.wait(5000));
    QCOMPARE(failed.count(), 1);
}

QTEST_GUILESS_MAIN(ProcessTaskWorkerTest)
#include "processtaskworker_test.moc"
