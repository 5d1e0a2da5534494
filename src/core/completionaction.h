#ifndef COMPLETIONACTION_H
#define COMPLETIONACTION_H

#include "appsettings.h"

#include <QObject>
#include <QStringList>

class QTimer;

/**
 * @brief Host-level side effects available once a batch is done.
 */
class PowerController
{
public:
    virtual ~PowerController() = default;
    virtual void quitApplication() = 0;
    virtual void suspendHost() = 0;
    virtual void shutdownHost() = 0;
};

/**
 * @brief Issues the platform's suspend/shutdown command as a detached process.
 *
 * Detached so the command survives this application quitting right after.
 */
class SystemPowerController : public QObject, public PowerController
{
    Q_OBJECT
public:
    explicit SystemPowerController(QObject* parent = nullptr);

    void quitApplication() override;
    void suspendHost() override;
    void shutdownHost() override;

    static QStringList suspendCommand();
    static QStringList shutdownCommand();

signals:
    void logMessage(const QString& message, LogCategory category);

private:
    void run(const QStringList& command);
};

/**
 * @brief Runs the configured completion policy once per finished batch.
 *
 * DoNothing and ExitProcess act immediately. SuspendHost and ShutdownHost
 * first count down (60 s by default); abortPendingAction() keeps the host
 * running, confirmPendingAction() or expiry carries the action out.
 * finished() is emitted exactly once per dispatch in every branch.
 */
class CompletionActionDispatcher : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(CompletionActionDispatcher)

public:
    static constexpr int kGraceSeconds = 60;

    explicit CompletionActionDispatcher(PowerController* power, QObject* parent = nullptr);

    void dispatch(CompletionPolicy policy);

    void setCountdownSeconds(int seconds);
    void setTickInterval(int milliseconds);
    bool isCountingDown() const;
    int remainingSeconds() const;
    CompletionPolicy pendingPolicy() const;

public slots:
    void abortPendingAction();
    void confirmPendingAction();

signals:
    void countdownStarted(CompletionPolicy policy, int seconds);
    void countdownTick(int remainingSeconds);
    void actionAborted(CompletionPolicy policy);
    void actionPerformed(CompletionPolicy policy);
    void finished();
    void logMessage(const QString& message, LogCategory category);

private slots:
    void onTick();

private:
    void perform(CompletionPolicy policy);
    void startCountdown(CompletionPolicy policy);

    PowerController* m_power;
    QTimer* m_timer;
    int m_countdownSeconds = kGraceSeconds;
    int m_remaining = 0;
    CompletionPolicy m_pending = CompletionPolicy::DoNothing;
};

#endif // COMPLETIONACTION_H
