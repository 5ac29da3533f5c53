#include "PortAllocator.h"
#include <QTcpServer>
#include <QDebug>
#include <utility>

PortAllocator::PortAllocator(quint16 fallbackPort)
    : m_fallbackPort(fallbackPort)
    , m_source([]() { return findEphemeralPort(); })
{
}

PortAllocator::PortAllocator(quint16 fallbackPort, PortSource source)
    : m_fallbackPort(fallbackPort)
    , m_source(std::move(source))
{
}

quint16 PortAllocator::allocate() const
{
    quint16 port = m_source ? m_source() : 0;
    if (port == 0) {
        qWarning() << "No free local port found, falling back to" << m_fallbackPort;
        return m_fallbackPort;
    }

    qDebug() << "Allocated local port" << port;
    return port;
}

quint16 PortAllocator::findEphemeralPort(const QHostAddress &address)
{
    QTcpServer server;
    if (!server.listen(address, 0)) {
        qDebug() << "Ephemeral port lookup failed:" << server.errorString();
        return 0;
    }

    const quint16 port = server.serverPort();
    server.close();
    return port;
}
