/**
 * @file batchscheduler_test.cpp
 * @brief Unit tests for BatchScheduler and TaskRunner with scripted workers.
 *
 * Workers answer through the event loop (QTimer::singleShot), like real ones.
 */

#include <QtTest/QtTest>
#include <QSignalSpy>

#include "batchscheduler.h"
#include "taskworker.h"

namespace
{
enum class Outcome
{
    Succeed,
    Fail,
    Hang
};
} // namespace

class ScriptedWorker : public TaskWorker
{
    Q_OBJECT
public:
    ScriptedWorker(Outcome outcome, bool* stopRequested, QObject* parent)
        : TaskWorker(parent), m_outcome(outcome), m_stopRequested(stopRequested)
    {
    }

    void start(const Task& task, const CancellationToken& token) override
    {
        m_token = token;
        if (task.type == TaskType::SubtitlePipeline)
        {
            QTimer::singleShot(0, this, [this]() { emit stageChanged(TaskStatus::Optimizing); });
        }
        switch (m_outcome)
        {
        case Outcome::Succeed:
            QTimer::singleShot(5, this, [this]() { emit finished(); });
            break;
        case Outcome::Fail:
            QTimer::singleShot(5, this, [this]() { emit error("scripted failure"); });
            break;
        case Outcome::Hang:
            break;
        }
    }

    void requestStop() override
    {
        if (m_stopRequested)
            *m_stopRequested = true;
    }

private:
    Outcome m_outcome;
    bool* m_stopRequested;
    CancellationToken m_token;
};

class ScriptedWorkerFactory : public WorkerFactory
{
public:
    TaskWorker* createWorker(const Task& task, QObject* parent) override
    {
        started.append(task.id);
        return new ScriptedWorker(outcomes.value(task.id, Outcome::Succeed), &stopRequested, parent);
    }

    QMap<QString, Outcome> outcomes;
    QStringList started;
    bool stopRequested = false;
};

class BatchSchedulerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testBatch_failureDoesNotStopBatch();
    void testBatch_emptyIsRejected();
    void testBatch_busyRejectsStructuralChanges();
    void testBatch_nothingLeftFinishesImmediately();
    void testBatch_cancelLeavesTasksPending();
    void testBatch_taskAddedWhileActiveIsPickedUp();
    void testBatch_failedTasksAreNotRetried();
    void testBatch_canceledTaskRunsFirstOnRestart();
    void testCancelBatch_whenIdleIsSilent();

    void testAddTask_duplicateRejected();
    void testRemoveTask_unknownId();
    void testStartTask_completedIsWarningOnly();
    void testStartTask_resetAllowsReprocess();
    void testCancelTask_outsideBatch();
    void testStageChanges_reported();

    void testFindNextRunnable();

private:
    static Task makeTask(const QString& id, TaskType type = TaskType::SubtitlePipeline);

    ScriptedWorkerFactory* m_factory = nullptr;
    BatchScheduler* m_scheduler = nullptr;
};

Task BatchSchedulerTest::makeTask(const QString& id, TaskType type)
{
    Task task;
    task.id = id;
    task.type = type;
    task.filePath = id;
    task.source.fileName = id;
    return task;
}

void BatchSchedulerTest::initTestCase()
{
    qRegisterMetaType<CoreError>();
    qRegisterMetaType<TaskStatus>();
    qRegisterMetaType<LogCategory>();
}

void BatchSchedulerTest::init()
{
    m_factory = new ScriptedWorkerFactory;
    m_scheduler = new BatchScheduler(m_factory);
}

void BatchSchedulerTest::cleanup()
{
    delete m_scheduler;
    m_scheduler = nullptr;
    delete m_factory;
    m_factory = nullptr;
}

void BatchSchedulerTest::testBatch_failureDoesNotStopBatch()
{
    m_factory->outcomes.insert("b", Outcome::Fail);
    QCOMPARE(m_scheduler->addTask(makeTask("a")), CoreError::None);
    QCOMPARE(m_scheduler->addTask(makeTask("b")), CoreError::None);
    QCOMPARE(m_scheduler->addTask(makeTask("c")), CoreError::None);

    QSignalSpy finished(m_scheduler, &BatchScheduler::batchFinished);
    QSignalSpy failed(m_scheduler, &BatchScheduler::taskFailed);
    QSignalSpy succeeded(m_scheduler, &BatchScheduler::taskFinished);

    QCOMPARE(m_scheduler->startBatch(), CoreError::None);
    QVERIFY(m_scheduler->isActive());
    QVERIFY(finished.wait(2000));

    QCOMPARE(finished.count(), 1);
    QCOMPARE(m_factory->started, QStringList({"a", "b", "c"}));
    QCOMPARE(m_scheduler->task("a")->status, TaskStatus::Completed);
    QCOMPARE(m_scheduler->task("b")->status, TaskStatus::Failed);
    QCOMPARE(m_scheduler->task("c")->status, TaskStatus::Completed);
    QCOMPARE(failed.count(), 1);
    QCOMPARE(failed.first().at(0).toString(), QString("b"));
    QCOMPARE(failed.first().at(1).toString(), QString("scripted failure"));
    QCOMPARE(succeeded.count(), 2);
    QCOMPARE(m_scheduler->state(), BatchScheduler::State::Idle);

    // No second completion event once idle
    QTest::qWait(20);
    QCOMPARE(finished.count(), 1);
}

void BatchSchedulerTest::testBatch_emptyIsRejected()
{
    QSignalSpy rejected(m_scheduler, &BatchScheduler::rejected);
    QSignalSpy started(m_scheduler, &BatchScheduler::batchStarted);

    QCOMPARE(m_scheduler->startBatch(), CoreError::EmptyBatch);
    QCOMPARE(rejected.count(), 1);
    QCOMPARE(rejected.first().at(0).value<CoreError>(), CoreError::EmptyBatch);
    QCOMPARE(started.count(), 0);
    QVERIFY(!m_scheduler->isActive());
}

void BatchSchedulerTest::testBatch_busyRejectsStructuralChanges()
{
    m_factory->outcomes.insert("a", Outcome::Hang);
    m_scheduler->addTask(makeTask("a"));
    m_scheduler->addTask(makeTask("b"));

    QCOMPARE(m_scheduler->startBatch(), CoreError::None);
    QCOMPARE(m_scheduler->runningTaskId(), QString("a"));

    QCOMPARE(m_scheduler->startBatch(), CoreError::BusyBatch);
    QCOMPARE(m_scheduler->removeTask("b"), CoreError::BusyBatch);
    QCOMPARE(m_scheduler->clearAll(), CoreError::BusyBatch);
    QCOMPARE(m_scheduler->startTask("b"), CoreError::BusyBatch);
    QCOMPARE(m_scheduler->tasks().size(), 2);

    m_scheduler->cancelBatch();
    QCOMPARE(m_scheduler->removeTask("b"), CoreError::None);
    QCOMPARE(m_scheduler->clearAll(), CoreError::None);
    QVERIFY(m_scheduler->tasks().isEmpty());
}

void BatchSchedulerTest::testBatch_nothingLeftFinishesImmediately()
{
    m_scheduler->addTask(makeTask("a"));
    m_scheduler->addTask(makeTask("b"));
    m_scheduler->task("a")->status = TaskStatus::Completed;
    m_scheduler->task("b")->status = TaskStatus::Failed;

    QSignalSpy finished(m_scheduler, &BatchScheduler::batchFinished);

    QCOMPARE(m_scheduler->startBatch(), CoreError::None);

    QCOMPARE(finished.count(), 1);
    QVERIFY(m_factory->started.isEmpty());
    QVERIFY(!m_scheduler->isActive());
}

void BatchSchedulerTest::testBatch_cancelLeavesTasksPending()
{
    m_factory->outcomes.insert("a", Outcome::Hang);
    m_scheduler->addTask(makeTask("a"));
    m_scheduler->addTask(makeTask("b"));

    QSignalSpy canceled(m_scheduler, &BatchScheduler::batchCanceled);
    QSignalSpy taskCanceled(m_scheduler, &BatchScheduler::taskCanceled);
    QSignalSpy finished(m_scheduler, &BatchScheduler::batchFinished);

    QCOMPARE(m_scheduler->startBatch(), CoreError::None);
    QVERIFY(m_scheduler->task("a")->isRunning());

    m_scheduler->cancelBatch();
    m_scheduler->cancelBatch();

    QCOMPARE(canceled.count(), 1);
    QCOMPARE(taskCanceled.count(), 1);
    QVERIFY(m_factory->stopRequested);
    QCOMPARE(m_scheduler->task("a")->status, TaskStatus::Pending);
    QCOMPARE(m_scheduler->task("b")->status, TaskStatus::Pending);
    QVERIFY(!m_scheduler->isBusy());

    QTest::qWait(20);
    QCOMPARE(finished.count(), 0);
    QCOMPARE(m_factory->started, QStringList({"a"}));
}

void BatchSchedulerTest::testBatch_taskAddedWhileActiveIsPickedUp()
{
    m_scheduler->addTask(makeTask("a"));
    QSignalSpy finished(m_scheduler, &BatchScheduler::batchFinished);

    QCOMPARE(m_scheduler->startBatch(), CoreError::None);
    QCOMPARE(m_scheduler->addTask(makeTask("late")), CoreError::None);

    QVERIFY(finished.wait(2000));
    QCOMPARE(m_factory->started, QStringList({"a", "late"}));
    QCOMPARE(m_scheduler->task("late")->status, TaskStatus::Completed);
}

void BatchSchedulerTest::testBatch_failedTasksAreNotRetried()
{
    m_factory->outcomes.insert("a", Outcome::Fail);
    m_scheduler->addTask(makeTask("a"));
    QSignalSpy finished(m_scheduler, &BatchScheduler::batchFinished);

    m_scheduler->startBatch();
    QVERIFY(finished.wait(2000));

    m_scheduler->startBatch();
    QCOMPARE(finished.count(), 2);
    QCOMPARE(m_factory->started, QStringList({"a"}));
}

void BatchSchedulerTest::testBatch_canceledTaskRunsFirstOnRestart()
{
    m_factory->outcomes.insert("a", Outcome::Hang);
    m_scheduler->addTask(makeTask("a"));
    m_scheduler->addTask(makeTask("b"));
    QSignalSpy finished(m_scheduler, &BatchScheduler::batchFinished);

    QCOMPARE(m_scheduler->startBatch(), CoreError::None);
    m_scheduler->cancelBatch();
    QCOMPARE(m_scheduler->task("a")->status, TaskStatus::Pending);

    // The canceled task keeps its list position, so it is the first non-terminal one again
    m_factory->outcomes.insert("a", Outcome::Succeed);
    QCOMPARE(m_scheduler->startBatch(), CoreError::None);
    QCOMPARE(m_scheduler->runningTaskId(), QString("a"));
    QVERIFY(finished.wait(2000));

    QCOMPARE(m_factory->started, QStringList({"a", "a", "b"}));
    QCOMPARE(m_scheduler->task("a")->status, TaskStatus::Completed);
    QCOMPARE(m_scheduler->task("b")->status, TaskStatus::Completed);
}

void BatchSchedulerTest::testCancelBatch_whenIdleIsSilent()
{
    m_scheduler->addTask(makeTask("a"));
    QSignalSpy canceled(m_scheduler, &BatchScheduler::batchCanceled);
    QSignalSpy taskCanceled(m_scheduler, &BatchScheduler::taskCanceled);
    QSignalSpy finished(m_scheduler, &BatchScheduler::batchFinished);

    m_scheduler->cancelBatch();

    QCOMPARE(canceled.count(), 0);
    QCOMPARE(taskCanceled.count(), 0);
    QCOMPARE(finished.count(), 0);
    QCOMPARE(m_scheduler->state(), BatchScheduler::State::Idle);
    QCOMPARE(m_scheduler->task("a")->status, TaskStatus::Pending);
    QVERIFY(m_factory->started.isEmpty());
}

void BatchSchedulerTest::testAddTask_duplicateRejected()
{
    QSignalSpy added(m_scheduler, &BatchScheduler::taskAdded);

    QCOMPARE(m_scheduler->addTask(makeTask("a")), CoreError::None);
    QCOMPARE(m_scheduler->addTask(makeTask("a")), CoreError::DuplicateTask);

    QCOMPARE(added.count(), 1);
    QCOMPARE(m_scheduler->tasks().size(), 1);
}

void BatchSchedulerTest::testRemoveTask_unknownId()
{
    QCOMPARE(m_scheduler->removeTask("missing"), CoreError::TaskNotFound);
}

void BatchSchedulerTest::testStartTask_completedIsWarningOnly()
{
    m_scheduler->addTask(makeTask("a"));
    m_scheduler->task("a")->status = TaskStatus::Completed;

    QCOMPARE(m_scheduler->startTask("a"), CoreError::None);
    QVERIFY(m_factory->started.isEmpty());
    QCOMPARE(m_scheduler->task("a")->status, TaskStatus::Completed);
    QCOMPARE(m_scheduler->startTask("missing"), CoreError::TaskNotFound);
}

void BatchSchedulerTest::testStartTask_resetAllowsReprocess()
{
    m_scheduler->addTask(makeTask("a"));
    m_scheduler->task("a")->status = TaskStatus::Completed;
    QSignalSpy finished(m_scheduler, &BatchScheduler::taskFinished);

    QCOMPARE(m_scheduler->resetTask("a"), CoreError::None);
    QCOMPARE(m_scheduler->startTask("a"), CoreError::None);
    QVERIFY(!m_scheduler->isActive());
    QVERIFY(m_scheduler->isBusy());

    QVERIFY(finished.wait(2000));
    QCOMPARE(m_scheduler->task("a")->status, TaskStatus::Completed);
    QCOMPARE(m_factory->started, QStringList({"a"}));
}

void BatchSchedulerTest::testCancelTask_outsideBatch()
{
    m_factory->outcomes.insert("a", Outcome::Hang);
    m_scheduler->addTask(makeTask("a"));
    QSignalSpy batchCanceled(m_scheduler, &BatchScheduler::batchCanceled);

    QCOMPARE(m_scheduler->startTask("a"), CoreError::None);
    m_scheduler->cancelTask("other");
    QVERIFY(m_scheduler->isBusy());

    m_scheduler->cancelTask("a");
    QVERIFY(!m_scheduler->isBusy());
    QCOMPARE(m_scheduler->task("a")->status, TaskStatus::Pending);
    QCOMPARE(batchCanceled.count(), 0);
}

void BatchSchedulerTest::testStageChanges_reported()
{
    m_scheduler->addTask(makeTask("a"));
    QSignalSpy statusChanged(m_scheduler, &BatchScheduler::taskStatusChanged);
    QSignalSpy finished(m_scheduler, &BatchScheduler::batchFinished);

    m_scheduler->startBatch();
    QVERIFY(finished.wait(2000));

    QList<TaskStatus> statuses;
    for (const QList<QVariant>& args : statusChanged)
        statuses.append(args.at(1).value<TaskStatus>());
    QCOMPARE(statuses,
             QList<TaskStatus>({TaskStatus::Transcribing, TaskStatus::Optimizing, TaskStatus::Completed}));
}

void BatchSchedulerTest::testFindNextRunnable()
{
    TaskList tasks;
    QCOMPARE(BatchScheduler::findNextRunnable(tasks), -1);

    tasks.append(QSharedPointer<Task>::create(makeTask("a")));
    tasks.append(QSharedPointer<Task>::create(makeTask("b")));
    tasks.append(QSharedPointer<Task>::create(makeTask("c")));
    tasks[0]->status = TaskStatus::Completed;
    tasks[1]->status = TaskStatus::Failed;
    QCOMPARE(BatchScheduler::findNextRunnable(tasks), 2);

    tasks[2]->status = TaskStatus::Completed;
    QCOMPARE(BatchScheduler::findNextRunnable(tasks), -1);
}

QTEST_GUILESS_MAIN(BatchSchedulerTest)
#include "batchscheduler_test.moc"
