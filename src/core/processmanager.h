#ifndef PROCESSMANAGER_H
#define PROCESSMANAGER_H

#include <QList>
#include <QObject>
#include <QProcess>

class ProcessManager : public QObject
{
    Q_OBJECT
public:
    static constexpr int kTerminateGraceMs = 500;

    explicit ProcessManager(QObject* parent = nullptr);
    ~ProcessManager();

    void startProcess(const QString& program, const QStringList& arguments);
    void setWorkingDirectory(const QString& dir);

    /**
     * @brief Ask every running child to terminate; kill it if it is still alive after kTerminateGraceMs.
     *
     * Returns immediately. processFinished() still arrives for each child while the manager lives.
     */
    void killProcess();
    bool wasKilled() const;

signals:
    void processOutput(const QString& output);
    void processFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void processError(const QString& error);
    void processStdErr(const QString& output);

private slots:
    void onReadyReadStandardOutput();
    void onReadyReadStandardError();

private:
    // Every process started by this manager that has not finished yet
    QList<QProcess*> m_activeProcesses;
    QString m_workingDir;
    bool m_wasKilled = false;
};

#endif // PROCESSMANAGER_H
