#include "BackendLauncher.h"
#include <QDebug>

BackendLauncher::BackendLauncher(const LaunchSettings &settings,
                                 const ExecutableResolver *resolver,
                                 const PortAllocator &allocator,
                                 QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_allocator(allocator)
    , m_supervisor(new ProcessSupervisor(resolver, this))
    , m_hasWorker(false)
{
    m_supervisor->setMarkerVariable(m_settings.modeVariable);
    connect(m_supervisor, &ProcessSupervisor::workerReaped, this, &BackendLauncher::onWorkerReaped);
}

EnvironmentOverrides BackendLauncher::environmentFor(quint16 port) const
{
    EnvironmentOverrides env;
    env.insert(m_settings.modeVariable, m_settings.modeValue);
    if (!m_settings.portVariable.isEmpty())
        env.insert(m_settings.portVariable, QString::number(port));
    return env;
}

StartBackendResult BackendLauncher::startBackend()
{
    StartBackendResult result;

    if (m_settings.singleInstance && m_hasWorker && m_lastWorker.state == WorkerState::Running) {
        qDebug() << "Backend already running on port" << m_lastWorker.port;
        result.success = true;
        result.port = m_lastWorker.port;
        result.pid = m_lastWorker.pid;
        result.reused = true;
        return result;
    }

    const quint16 port = m_allocator.allocate();

    LaunchResult launch = m_supervisor->start(m_settings.sidecarName, environmentFor(port), port);
    if (!launch.success) {
        result.errorMessage = launch.errorMessage;
        return result;
    }

    m_lastWorker = launch.worker;
    m_hasWorker = true;

    result.success = true;
    result.port = port;
    result.pid = launch.worker.pid;
    emit backendStarted(port);
    return result;
}

void BackendLauncher::onWorkerReaped(qint64 pid)
{
    if (m_hasWorker && m_lastWorker.pid == pid)
        m_lastWorker.state = WorkerState::Reaped;
}
