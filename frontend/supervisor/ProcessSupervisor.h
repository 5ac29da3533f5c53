#ifndef PROCESSSUPERVISOR_H
#define PROCESSSUPERVISOR_H

#include <QObject>
#include <QHash>
#include <QList>
#include <QMap>
#include <QProcess>
#include <QProcessEnvironment>
#include <QString>
#include <QMetaType>

class ExecutableResolver;

// Variables injected into the worker environment, on top of the inherited one
typedef QMap<QString, QString> EnvironmentOverrides;

enum class WorkerState {
    Running,  // spawned, exit not observed yet
    Reaped    // exit observed, handle no longer meaningful
};

enum class LaunchError {
    None,
    SpawnFailed
};

/**
 * @brief Snapshot of one worker process.
 */
struct WorkerHandle {
    qint64 pid = 0;
    quint16 port = 0;
    QString environmentMarker;  // "NAME=VALUE" of the supervised-mode flag
    WorkerState state = WorkerState::Running;
};

/**
 * @brief Result of starting a worker.
 */
struct LaunchResult {
    bool success = false;
    LaunchError error = LaunchError::None;
    QString errorMessage;

    WorkerHandle worker;
};

/**
 * @brief Spawns worker processes and reaps them when they exit.
 *
 * start() returns as soon as the OS has created the child; it never waits
 * for the worker to become ready. The exit is observed asynchronously on
 * this object's event loop and only used to release the child: the exit
 * status is dropped and nothing is restarted.
 *
 * The QProcess objects are owned by the supervisor alone and touched only
 * from its thread. Workers still running when the supervisor is destroyed
 * are stopped.
 */
class ProcessSupervisor : public QObject
{
    Q_OBJECT

public:
    explicit ProcessSupervisor(const ExecutableResolver *resolver, QObject *parent = nullptr);
    ~ProcessSupervisor();

    LaunchResult start(const QString &executableName,
                       const EnvironmentOverrides &overrides,
                       quint16 port = 0);

    // Terminates every running worker, killing those that ignore the request
    void stopAll(int graceMs = 3000);

    bool isRunning(qint64 pid) const;
    int runningCount() const;
    QList<WorkerHandle> workers() const;

    void setMarkerVariable(const QString &name) { m_markerVariable = name; }
    QString markerVariable() const { return m_markerVariable; }

    static QProcessEnvironment mergedEnvironment(const EnvironmentOverrides &overrides);

signals:
    void workerStarted(const WorkerHandle &worker);
    void workerReaped(qint64 pid);

private slots:
    void handleWorkerFinished();

private:
    struct Worker {
        QProcess *process = nullptr;
        WorkerHandle handle;
    };

    void reap(QProcess *process);
    static void stopProcess(QProcess *process, int graceMs);

    const ExecutableResolver *m_resolver;
    QString m_markerVariable;
    QHash<QProcess*, Worker> m_workers;
};

Q_DECLARE_METATYPE(WorkerHandle)

#endif // PROCESSSUPERVISOR_H
