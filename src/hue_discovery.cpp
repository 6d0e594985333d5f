#include "hue_discovery.h"

#include <QDeadlineTimer>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkDatagram>
#include <QTimer>
#include <QUdpSocket>

#include "hue_bridge.h"
#include "hue_dns.h"
#include "hue_envelope.h"
#include "hue_logging.h"

namespace hueclient {

MdnsDiscoverer::MdnsDiscoverer(MdnsOptions options)
    : m_options(std::move(options))
{
}

bool MdnsDiscoverer::discover(BridgeAddress *out, Error *error)
{
    const QByteArray query = dns::buildPtrQuery(m_options.queryId, m_options.serviceName);
    if (query.isEmpty())
        return fail(error, ErrorKind::Discovery, QStringLiteral("Invalid service name: %1").arg(m_options.serviceName));

    QUdpSocket socket;
    if (!socket.bind(QHostAddress(QHostAddress::AnyIPv4), 0))
        return fail(error, ErrorKind::Transport, QStringLiteral("mDNS bind failed: %1").arg(socket.errorString()));

    const qint64 written = socket.writeDatagram(query, m_options.group, m_options.port);
    if (written != query.size())
        return fail(error, ErrorKind::Transport, QStringLiteral("mDNS send failed: %1").arg(socket.errorString()));

    qCDebug(hueDiscoveryLog) << "mDNS query sent to" << m_options.group.toString() << m_options.port
                             << "for" << m_options.serviceName;

    const QDeadlineTimer deadline(m_options.timeoutMs > 0 ? m_options.timeoutMs : kMdnsTimeoutMs);
    for (;;) {
        while (!deadline.hasExpired() && socket.hasPendingDatagrams()) {
            const QNetworkDatagram datagram = socket.receiveDatagram(kMdnsBufferSize);
            if (!datagram.isValid()) {
                return fail(error,
                            ErrorKind::Transport,
                            QStringLiteral("mDNS receive failed: %1").arg(socket.errorString()));
            }

            const std::optional<QHostAddress> address =
                dns::validateResponse(datagram.data(), m_options.serviceName, m_options.queryId);
            if (!address) {
                qCDebug(hueDiscoveryLog) << "Ignoring datagram from" << datagram.senderAddress().toString();
                continue;
            }

            qCInfo(hueDiscoveryLog) << "mDNS found bridge at" << address->toString();
            out->ip = *address;
            out->id.reset();
            return true;
        }

        if (deadline.hasExpired())
            return fail(error, ErrorKind::Discovery, QStringLiteral("mDNS response was not received on time"));

        QEventLoop loop;
        QTimer timer;
        timer.setSingleShot(true);
        bool socketFailed = false;

        QObject::connect(&socket, &QUdpSocket::readyRead, &loop, &QEventLoop::quit);
        QObject::connect(&socket, &QAbstractSocket::errorOccurred, &loop, [&]() {
            socketFailed = true;
            loop.quit();
        });
        QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

        timer.start(static_cast<int>(deadline.remainingTime()));
        loop.exec();

        if (socketFailed && !socket.hasPendingDatagrams())
            return fail(error, ErrorKind::Transport, QStringLiteral("mDNS socket error: %1").arg(socket.errorString()));
    }
}

NupnpDiscoverer::NupnpDiscoverer(const HttpTransport &transport, const QUrl &endpoint, bool requireId, int timeoutMs)
    : m_transport(transport)
    , m_endpoint(endpoint)
    , m_requireId(requireId)
    , m_timeoutMs(timeoutMs > 0 ? timeoutMs : kRequestTimeoutMs)
{
}

bool NupnpDiscoverer::discover(BridgeAddress *out, Error *error)
{
    if (!m_endpoint.isValid() || m_endpoint.host().isEmpty())
        return fail(error, ErrorKind::Discovery, QStringLiteral("Invalid discovery URL: %1").arg(m_endpoint.toString()));

    ConnectionSettings settings;
    settings.host = m_endpoint.host();
    settings.useTls = m_endpoint.scheme() != QLatin1String("http");
    settings.port = m_endpoint.port(settings.useTls ? 443 : 80);

    const QString path = m_endpoint.path().isEmpty() ? QStringLiteral("/") : m_endpoint.path();
    qCDebug(hueDiscoveryLog) << "nUPnP lookup at" << m_endpoint.toString();

    const HttpResult result = m_transport.get(settings, path, false, QByteArrayLiteral("application/json"), m_timeoutMs);
    if (!checkHttpResult(result, QStringLiteral("GET %1").arg(m_endpoint.toString()), error))
        return false;

    if (!parseNupnpResponse(result.payload, m_requireId, out, error))
        return false;

    qCInfo(hueDiscoveryLog) << "nUPnP found bridge at" << out->ip.toString();
    return true;
}

bool parseNupnpResponse(const QByteArray &payload, bool requireId, BridgeAddress *out, Error *error)
{
    QJsonDocument doc;
    if (!parseJsonPayload(payload, &doc, error))
        return false;
    if (!doc.isArray())
        return fail(error, ErrorKind::Decode, QStringLiteral("Expected a JSON array"));

    const QJsonArray arr = doc.array();
    if (arr.isEmpty())
        return fail(error, ErrorKind::Protocol, QStringLiteral("expected non-empty array"));

    const QJsonValue first = arr.first();
    if (!first.isObject())
        return fail(error, ErrorKind::Decode, QStringLiteral("Expected an object as first element"));
    const QJsonObject entry = first.toObject();

    const QJsonValue ipValue = entry.value(QStringLiteral("internalipaddress"));
    if (!ipValue.isString())
        return fail(error, ErrorKind::Protocol, QStringLiteral("Expected internalipaddress"));

    QHostAddress ip;
    if (!ip.setAddress(ipValue.toString().trimmed()))
        return fail(error, ErrorKind::Decode, QStringLiteral("Invalid IP address: %1").arg(ipValue.toString()));

    std::optional<QString> id;
    const QJsonValue idValue = entry.value(QStringLiteral("id"));
    if (idValue.isString())
        id = idValue.toString();
    else if (requireId)
        return fail(error, ErrorKind::Protocol, QStringLiteral("Expected id"));

    out->ip = ip;
    out->id = id;
    return true;
}

DiscoveryCoordinator::DiscoveryCoordinator(BridgeDiscoverer &primary, BridgeDiscoverer &fallback)
    : m_primary(primary)
    , m_fallback(fallback)
{
}

bool DiscoveryCoordinator::discover(BridgeAddress *out, Error *error)
{
    Error primaryError;
    if (m_primary.discover(out, &primaryError))
        return true;
    qCDebug(hueDiscoveryLog) << m_primary.name() << "discovery failed:" << primaryError.toString();

    Error fallbackError;
    if (m_fallback.discover(out, &fallbackError))
        return true;
    qCDebug(hueDiscoveryLog) << m_fallback.name() << "discovery failed:" << fallbackError.toString();

    return fail(error, ErrorKind::Discovery, QStringLiteral("Could not discover bridge"));
}

} // namespace hueclient
