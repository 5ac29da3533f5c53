#include "ProcessSupervisor.h"
#include "ExecutableResolver.h"
#include <QFileInfo>
#include <QDebug>

ProcessSupervisor::ProcessSupervisor(const ExecutableResolver *resolver, QObject *parent)
    : QObject(parent)
    , m_resolver(resolver)
{
    qRegisterMetaType<WorkerHandle>("WorkerHandle");
}

ProcessSupervisor::~ProcessSupervisor()
{
    const QList<QProcess*> processes = m_workers.keys();
    for (QProcess *process : processes) {
        disconnect(process, nullptr, this, nullptr);
        stopProcess(process, 3000);
    }
    m_workers.clear();
}

QProcessEnvironment ProcessSupervisor::mergedEnvironment(const EnvironmentOverrides &overrides)
{
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        env.insert(it.key(), it.value());
    }
    return env;
}

// ============================================================================
// Spawn
// ============================================================================

LaunchResult ProcessSupervisor::start(const QString &executableName,
                                      const EnvironmentOverrides &overrides,
                                      quint16 port)
{
    LaunchResult result;

    if (!m_resolver) {
        result.error = LaunchError::SpawnFailed;
        result.errorMessage = "No executable resolver configured";
        return result;
    }

    QString errorMsg;
    const QString path = m_resolver->resolve(executableName, errorMsg);
    if (path.isEmpty()) {
        qWarning() << "Could not resolve worker" << executableName << ":" << errorMsg;
        result.error = LaunchError::SpawnFailed;
        result.errorMessage = errorMsg;
        return result;
    }

    QProcess *process = new QProcess(this);
    process->setProgram(path);
    process->setWorkingDirectory(QFileInfo(path).absolutePath());
    process->setProcessEnvironment(mergedEnvironment(overrides));
    // Nobody reads the worker's output; a pipe would eventually block it
    process->setProcessChannelMode(QProcess::ForwardedChannels);

    connect(process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, &ProcessSupervisor::handleWorkerFinished);

    process->start();
    if (!process->waitForStarted()) {
        qWarning() << "Failed to start worker" << path << ":" << process->errorString();
        result.error = LaunchError::SpawnFailed;
        result.errorMessage = QString("Failed to start %1: %2").arg(path, process->errorString());
        disconnect(process, nullptr, this, nullptr);
        delete process;
        return result;
    }

    Worker worker;
    worker.process = process;
    worker.handle.pid = process->processId();
    worker.handle.port = port;
    worker.handle.state = WorkerState::Running;
    if (!m_markerVariable.isEmpty() && overrides.contains(m_markerVariable)) {
        worker.handle.environmentMarker = m_markerVariable + "=" + overrides.value(m_markerVariable);
    }
    m_workers.insert(process, worker);

    qInfo() << "Worker started:" << path << "pid" << worker.handle.pid << "port" << port;

    result.success = true;
    result.worker = worker.handle;
    emit workerStarted(worker.handle);
    return result;
}

// ============================================================================
// Reaping
// ============================================================================

void ProcessSupervisor::handleWorkerFinished()
{
    QProcess *process = qobject_cast<QProcess*>(sender());
    if (!process) return;

    reap(process);
}

void ProcessSupervisor::reap(QProcess *process)
{
    auto it = m_workers.find(process);
    if (it == m_workers.end())
        return;

    const qint64 pid = it->handle.pid;
    m_workers.erase(it);
    process->deleteLater();

    qDebug() << "Worker" << pid << "reaped";
    emit workerReaped(pid);
}

// ============================================================================
// Shutdown
// ============================================================================

void ProcessSupervisor::stopProcess(QProcess *process, int graceMs)
{
    if (process->state() == QProcess::NotRunning)
        return;

    process->terminate();
    if (!process->waitForFinished(graceMs)) {
        process->kill();
        process->waitForFinished(1000);
    }
}

void ProcessSupervisor::stopAll(int graceMs)
{
    // finished() fires from waitForFinished and edits m_workers
    const QList<QProcess*> processes = m_workers.keys();
    for (QProcess *process : processes) {
        stopProcess(process, graceMs);
    }
}

// ============================================================================
// Queries
// ============================================================================

bool ProcessSupervisor::isRunning(qint64 pid) const
{
    for (const Worker &worker : m_workers) {
        if (worker.handle.pid == pid)
            return true;
    }
    return false;
}

int ProcessSupervisor::runningCount() const
{
    return m_workers.size();
}

QList<WorkerHandle> ProcessSupervisor::workers() const
{
    QList<WorkerHandle> handles;
    for (const Worker &worker : m_workers) {
        handles.append(worker.handle);
    }
    return handles;
}
