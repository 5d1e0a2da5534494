/**
 * @file taskfactory_test.cpp
 * @brief Unit tests for TaskFactory: file acceptance, identity and derived paths.
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "appsettings.h"
#include "taskfactory.h"

class TaskFactoryTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void testCreate_pipelineFromVideo();
    void testCreate_optimizationFromSubtitle();
    void testCreate_missingFile();
    void testCreate_unsupportedFormat();
    void testCreate_snapshotsSettings();
    void testCanonicalId_sameFileSameId();
    void testAcceptsFile_perType();

private:
    QString touch(const QString& name);

    QTemporaryDir m_dir;
};

void TaskFactoryTest::initTestCase()
{
    QVERIFY(m_dir.isValid());
    AppSettings::instance().resetToDefaults();
}

QString TaskFactoryTest::touch(const QString& name)
{
    const QString path = m_dir.filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly))
        file.write("data");
    return path;
}

void TaskFactoryTest::testCreate_pipelineFromVideo()
{
    const QString path = touch("Episode 01.mkv");
    Task task;

    QCOMPARE(TaskFactory::create(path, TaskType::SubtitlePipeline, task), CoreError::None);
    QCOMPARE(task.type, TaskType::SubtitlePipeline);
    QCOMPARE(task.status, TaskStatus::Pending);
    QCOMPARE(task.source.fileName, QString("Episode 01.mkv"));
    QCOMPARE(task.source.suffix, QString("mkv"));
    QCOMPARE(task.source.sizeBytes, qint64(4));
    QCOMPARE(QFileInfo(task.originalSubtitlePath).fileName(), QString("Episode 01.original.srt"));
    QCOMPARE(QFileInfo(task.resultSubtitlePath).fileName(), QString("Episode 01.srt"));
    QCOMPARE(QFileInfo(task.resultSubtitlePath).absolutePath(), QFileInfo(path).absolutePath());
}

void TaskFactoryTest::testCreate_optimizationFromSubtitle()
{
    const QString path = touch("lecture.srt");
    Task task;

    QCOMPARE(TaskFactory::create(path, TaskType::OptimizationOnly, task), CoreError::None);
    QCOMPARE(task.originalSubtitlePath, QFileInfo(path).absoluteFilePath());
    QCOMPARE(QFileInfo(task.resultSubtitlePath).fileName(), QString("lecture.optimized.srt"));
    QCOMPARE(initialRunningStatus(task.type), TaskStatus::Optimizing);
}

void TaskFactoryTest::testCreate_missingFile()
{
    Task task;
    QCOMPARE(TaskFactory::create(m_dir.filePath("absent.mp4"), TaskType::SubtitlePipeline, task),
             CoreError::IoError);
    QCOMPARE(TaskFactory::create(m_dir.path(), TaskType::SubtitlePipeline, task), CoreError::IoError);
}

void TaskFactoryTest::testCreate_unsupportedFormat()
{
    Task task;
    QCOMPARE(TaskFactory::create(touch("notes.txt"), TaskType::SubtitlePipeline, task),
             CoreError::UnsupportedFormat);
    QCOMPARE(TaskFactory::create(touch("clip.mp4"), TaskType::OptimizationOnly, task),
             CoreError::UnsupportedFormat);
    QCOMPARE(TaskFactory::create(touch("song.mp3"), TaskType::SubtitlePipeline, task),
             CoreError::UnsupportedFormat);
}

void TaskFactoryTest::testCreate_snapshotsSettings()
{
    AppSettings& settings = AppSettings::instance();
    settings.setTargetLanguage("German");
    settings.setOutputFormat(OutputSubtitleFormat::Ass);

    Task task;
    QCOMPARE(TaskFactory::create(touch("talk.mp4"), TaskType::SubtitlePipeline, task), CoreError::None);

    settings.setTargetLanguage("French");
    QCOMPARE(task.parameters.targetLanguage, QString("German"));
    QCOMPARE(task.parameters.outputFormat, OutputSubtitleFormat::Ass);
    QCOMPARE(QFileInfo(task.resultSubtitlePath).fileName(), QString("talk.ass"));

    settings.resetToDefaults();
}

void TaskFactoryTest::testCanonicalId_sameFileSameId()
{
    const QString path = touch("same.mp4");
    const QString roundabout = m_dir.path() + "/./sub/../same.mp4";
    QDir(m_dir.path()).mkpath("sub");

    QCOMPARE(TaskFactory::canonicalId(roundabout), TaskFactory::canonicalId(path));

    Task first;
    Task second;
    QCOMPARE(TaskFactory::create(path, TaskType::TranscriptionOnly, first), CoreError::None);
    QCOMPARE(TaskFactory::create(roundabout, TaskType::TranscriptionOnly, second), CoreError::None);
    QCOMPARE(first.id, second.id);
}

void TaskFactoryTest::testAcceptsFile_perType()
{
    QVERIFY(TaskFactory::acceptsFile("a.MP4", TaskType::SubtitlePipeline));
    QVERIFY(TaskFactory::acceptsFile("a.wav", TaskType::TranscriptionOnly));
    QVERIFY(TaskFactory::acceptsFile("a.mkv", TaskType::TranscriptionOnly));
    QVERIFY(!TaskFactory::acceptsFile("a.wav", TaskType::SubtitlePipeline));
    QVERIFY(TaskFactory::acceptsFile("a.ass", TaskType::OptimizationOnly));
    QVERIFY(!TaskFactory::acceptsFile("a.docx", TaskType::OptimizationOnly));
}

QTEST_GUILESS_MAIN(TaskFactoryTest)
#include "taskfactory_test.moc"
