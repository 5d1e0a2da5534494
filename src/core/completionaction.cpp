#include "completionaction.h"

#include <QCoreApplication>
#include <QProcess>
#include <QTimer>

SystemPowerController::SystemPowerController(QObject* parent) : QObject(parent)
{
}

void SystemPowerController::quitApplication()
{
    emit logMessage("Exiting after the batch.", LogCategory::SYSTEM);
    QCoreApplication::quit();
}

void SystemPowerController::suspendHost()
{
    run(suspendCommand());
}

void SystemPowerController::shutdownHost()
{
    run(shutdownCommand());
}

QStringList SystemPowerController::suspendCommand()
{
#if defined(Q_OS_WIN)
    return {"rundll32.exe", "powrprof.dll,SetSuspendState", "0,1,0"};
#elif defined(Q_OS_MACOS)
    return {"pmset", "sleepnow"};
#else
    return {"systemctl", "suspend"};
#endif
}

QStringList SystemPowerController::shutdownCommand()
{
#if defined(Q_OS_WIN)
    return {"shutdown", "/s", "/t", "1"};
#elif defined(Q_OS_MACOS)
    return {"shutdown", "-h", "now"};
#else
    return {"systemctl", "poweroff"};
#endif
}

void SystemPowerController::run(const QStringList& command)
{
    QStringList args = command;
    const QString program = args.takeFirst();
    emit logMessage(QString("Starting: %1 %2").arg(program, args.join(" ")), LogCategory::SYSTEM);
    if (!QProcess::startDetached(program, args))
    {
        emit logMessage("Error: failed to start " + program, LogCategory::SYSTEM);
    }
}

CompletionActionDispatcher::CompletionActionDispatcher(PowerController* power, QObject* parent)
    : QObject(parent), m_power(power), m_timer(new QTimer(this))
{
    m_timer->setInterval(1000);
    connect(m_timer, &QTimer::timeout, this, &CompletionActionDispatcher::onTick);
}

void CompletionActionDispatcher::dispatch(CompletionPolicy policy)
{
    if (isCountingDown())
    {
        emit logMessage("A completion action is already pending.", LogCategory::SYSTEM);
        return;
    }

    switch (policy)
    {
    case CompletionPolicy::DoNothing:
        emit finished();
        return;
    case CompletionPolicy::ExitProcess:
        perform(policy);
        return;
    case CompletionPolicy::SuspendHost:
    case CompletionPolicy::ShutdownHost:
        startCountdown(policy);
        return;
    }
}

void CompletionActionDispatcher::setCountdownSeconds(int seconds)
{
    m_countdownSeconds = qMax(0, seconds);
}

void CompletionActionDispatcher::setTickInterval(int milliseconds)
{
    m_timer->setInterval(milliseconds);
}

bool CompletionActionDispatcher::isCountingDown() const
{
    return m_timer->isActive();
}

int CompletionActionDispatcher::remainingSeconds() const
{
    return isCountingDown() ? m_remaining : 0;
}

CompletionPolicy CompletionActionDispatcher::pendingPolicy() const
{
    return isCountingDown() ? m_pending : CompletionPolicy::DoNothing;
}

void CompletionActionDispatcher::abortPendingAction()
{
    if (!isCountingDown())
        return;
    m_timer->stop();
    emit logMessage(QString("Pending '%1' canceled, the computer stays on.").arg(completionPolicyToString(m_pending)),
                    LogCategory::SYSTEM);
    emit actionAborted(m_pending);
    emit finished();
}

void CompletionActionDispatcher::confirmPendingAction()
{
    if (!isCountingDown())
        return;
    m_timer->stop();
    perform(m_pending);
}

void CompletionActionDispatcher::onTick()
{
    --m_remaining;
    emit countdownTick(m_remaining);
    if (m_remaining > 0)
        return;

    m_timer->stop();
    perform(m_pending);
}

void CompletionActionDispatcher::startCountdown(CompletionPolicy policy)
{
    m_pending = policy;
    m_remaining = m_countdownSeconds;
    emit logMessage(QString("All tasks are done. '%1' in %2 seconds unless canceled.")
                        .arg(completionPolicyToString(policy))
                        .arg(m_remaining),
                    LogCategory::SYSTEM);
    emit countdownStarted(policy, m_remaining);

    if (m_remaining == 0)
    {
        perform(policy);
        return;
    }
    m_timer->start();
}

void CompletionActionDispatcher::perform(CompletionPolicy policy)
{
    switch (policy)
    {
    case CompletionPolicy::DoNothing:
        break;
    case CompletionPolicy::ExitProcess:
        m_power->quitApplication();
        break;
    case CompletionPolicy::SuspendHost:
        emit logMessage("Suspending the computer.", LogCategory::SYSTEM);
        m_power->suspendHost();
        break;
    case CompletionPolicy::ShutdownHost:
        emit logMessage("Shutting down the computer.", LogCategory::SYSTEM);
        m_power->shutdownHost();
        break;
    }
    emit actionPerformed(policy);
    emit finished();
}
