#include "processmanager.h"

#include <QTimer>

ProcessManager::ProcessManager(QObject* parent) : QObject{parent}
{
}

ProcessManager::~ProcessManager()
{
    killProcess();
}

void ProcessManager::startProcess(const QString& program, const QStringList& arguments)
{
    m_wasKilled = false;
    emit processOutput(QString("Starting: %1 %2").arg(program, arguments.join(" ")));

    QProcess* newProcess = new QProcess(this);
    if (!m_workingDir.isEmpty())
    {
        newProcess->setWorkingDirectory(m_workingDir);
    }
    m_activeProcesses.append(newProcess);

    connect(newProcess, &QProcess::readyReadStandardOutput, this, &ProcessManager::onReadyReadStandardOutput);
    connect(newProcess, &QProcess::readyReadStandardError, this, &ProcessManager::onReadyReadStandardError);

    connect(newProcess, &QProcess::errorOccurred, this,
            [this, newProcess](QProcess::ProcessError error)
            {
                // Crashes and kills are reported through finished()
                if (error != QProcess::FailedToStart)
                    return;
                emit processError("Failed to start process: " + newProcess->errorString());
                m_activeProcesses.removeOne(newProcess);
                newProcess->deleteLater();
            });

    connect(newProcess, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this,
            [this, newProcess](int exitCode, QProcess::ExitStatus exitStatus)
            {
                emit processOutput(QString("Process finished with code %1.").arg(exitCode));
                m_activeProcesses.removeOne(newProcess);
                newProcess->deleteLater();
                emit processFinished(exitCode, exitStatus);
            });

    newProcess->start(program, arguments);
    m_workingDir.clear();
}

void ProcessManager::setWorkingDirectory(const QString& dir)
{
    m_workingDir = dir;
}

void ProcessManager::killProcess()
{
    if (m_activeProcesses.isEmpty())
        return;

    m_wasKilled = true;

    emit processOutput(QString("Terminating %1 child process(es)...").arg(m_activeProcesses.count()));

    // The list changes while processes report back
    QList<QProcess*> processesToKill = m_activeProcesses;
    m_activeProcesses.clear();

    for (QProcess* process : processesToKill)
    {
        if (!process)
            continue;

        // Detached from the manager so it can be reaped after the manager is gone
        process->setParent(nullptr);
        connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), process,
                &QObject::deleteLater);

        if (process->state() == QProcess::NotRunning)
        {
            process->deleteLater();
            continue;
        }

        process->terminate();
        QTimer::singleShot(kTerminateGraceMs, process,
                           [process]()
                           {
                               if (process->state() != QProcess::NotRunning)
                                   process->kill();
                           });
    }
}

bool ProcessManager::wasKilled() const
{
    return m_wasKilled;
}

void ProcessManager::onReadyReadStandardOutput()
{
    QProcess* process = qobject_cast<QProcess*>(sender());
    if (!process)
        return;
    emit processOutput(QString::fromUtf8(process->readAllStandardOutput()));
}

void ProcessManager::onReadyReadStandardError()
{
    QProcess* process = qobject_cast<QProcess*>(sender());
    if (!process)
        return;
    emit processStdErr(QString::fromUtf8(process->readAllStandardError()));
}
