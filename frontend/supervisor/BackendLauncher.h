#ifndef BACKENDLAUNCHER_H
#define BACKENDLAUNCHER_H

#include <QObject>
#include <QString>
#include "PortAllocator.h"
#include "ProcessSupervisor.h"

/**
 * @brief Settings used by every startBackend() call.
 */
struct LaunchSettings {
    QString sidecarName = "AudioTranscribe";
    QString modeVariable = "TAURI";
    QString modeValue = "1";
    QString portVariable;         // empty: the port is not passed to the worker
    bool singleInstance = false;  // reuse a running worker instead of spawning another
};

/**
 * @brief Result of the start-backend command: a port or an error string.
 */
struct StartBackendResult {
    bool success = false;
    QString errorMessage;

    quint16 port = 0;
    qint64 pid = 0;
    bool reused = false;
};

/**
 * @brief The start-backend command invoked by the shell UI.
 *
 * Picks a port, spawns the worker with the supervised-mode flag and returns
 * the port without waiting for the worker to come up. Whether the worker
 * really serves on that port is for the caller to find out.
 *
 * Calls are not serialized: unless singleInstance is set, every call
 * spawns a new worker.
 */
class BackendLauncher : public QObject
{
    Q_OBJECT

public:
    BackendLauncher(const LaunchSettings &settings,
                    const ExecutableResolver *resolver,
                    const PortAllocator &allocator = PortAllocator(),
                    QObject *parent = nullptr);

    StartBackendResult startBackend();

    EnvironmentOverrides environmentFor(quint16 port) const;

    const LaunchSettings &settings() const { return m_settings; }
    ProcessSupervisor *supervisor() const { return m_supervisor; }

    // Most recent worker, with its state kept current
    WorkerHandle lastWorker() const { return m_lastWorker; }

signals:
    void backendStarted(quint16 port);

private slots:
    void onWorkerReaped(qint64 pid);

private:
    LaunchSettings m_settings;
    PortAllocator m_allocator;
    ProcessSupervisor *m_supervisor;
    WorkerHandle m_lastWorker;
    bool m_hasWorker;
};

#endif // BACKENDLAUNCHER_H
