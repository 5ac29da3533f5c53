#ifndef PORTALLOCATOR_H
#define PORTALLOCATOR_H

#include <QtGlobal>
#include <QHostAddress>
#include <functional>

/**
 * @brief Picks a local TCP port for the worker process.
 *
 * The OS is asked for an ephemeral port by binding port 0 on the loopback
 * interface; the socket is released straight away. The result is only a
 * hint: nothing keeps another process from taking the port before the
 * worker binds it.
 *
 * allocate() cannot fail. Any lookup failure yields the fallback port.
 */
class PortAllocator
{
public:
    // Returns the bound port, or 0 when no port could be obtained
    using PortSource = std::function<quint16()>;

    static constexpr quint16 DefaultFallbackPort = 8000;

    explicit PortAllocator(quint16 fallbackPort = DefaultFallbackPort);
    PortAllocator(quint16 fallbackPort, PortSource source);

    quint16 allocate() const;

    quint16 fallbackPort() const { return m_fallbackPort; }

    static quint16 findEphemeralPort(const QHostAddress &address = QHostAddress(QHostAddress::LocalHost));

private:
    quint16 m_fallbackPort;
    PortSource m_source;
};

#endif // PORTALLOCATOR_H
