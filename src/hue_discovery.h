#pragma once

#include <optional>

#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include <QUrl>

#include "hue_error.h"
#include "hue_http.h"

namespace hueclient {

inline constexpr int kMdnsTimeoutMs = 3000;
inline constexpr int kMdnsBufferSize = 4096;
inline constexpr quint16 kMdnsQueryId = 4343;

struct BridgeAddress {
    QHostAddress ip;
    std::optional<QString> id;
};

class BridgeDiscoverer
{
public:
    virtual ~BridgeDiscoverer() = default;

    virtual QString name() const = 0;
    virtual bool discover(BridgeAddress *out, Error *error = nullptr) = 0;
};

struct MdnsOptions {
    QHostAddress group = QHostAddress(QStringLiteral("224.0.0.251"));
    quint16 port = 5353;
    QString serviceName = QStringLiteral("_hue._tcp.local");
    quint16 queryId = kMdnsQueryId;
    int timeoutMs = kMdnsTimeoutMs;
};

// One DNS-SD browse over an ephemeral IPv4 socket. Only the default
// multicast interface is used, so bridges reachable solely through another
// interface of a multi-homed host are not found.
class MdnsDiscoverer final : public BridgeDiscoverer
{
public:
    explicit MdnsDiscoverer(MdnsOptions options = MdnsOptions());

    QString name() const override { return QStringLiteral("mDNS"); }
    bool discover(BridgeAddress *out, Error *error = nullptr) override;

private:
    MdnsOptions m_options;
};

inline constexpr const char *kDefaultNupnpUrl = "https://discovery.meethue.com/";

// Cloud lookup: GET returns `[{"id": ..., "internalipaddress": ...}, ...]`.
class NupnpDiscoverer final : public BridgeDiscoverer
{
public:
    NupnpDiscoverer(const HttpTransport &transport,
                    const QUrl &endpoint = QUrl(QString::fromLatin1(kDefaultNupnpUrl)),
                    bool requireId = false,
                    int timeoutMs = kRequestTimeoutMs);

    QString name() const override { return QStringLiteral("nUPnP"); }
    bool discover(BridgeAddress *out, Error *error = nullptr) override;

private:
    const HttpTransport &m_transport;
    QUrl m_endpoint;
    bool m_requireId = false;
    int m_timeoutMs = kRequestTimeoutMs;
};

bool parseNupnpResponse(const QByteArray &payload, bool requireId, BridgeAddress *out, Error *error = nullptr);

// Runs `primary` to completion, then `fallback` once if it failed. Failures
// of either step are only logged; the caller sees one Discovery error.
class DiscoveryCoordinator final : public BridgeDiscoverer
{
public:
    DiscoveryCoordinator(BridgeDiscoverer &primary, BridgeDiscoverer &fallback);

    QString name() const override { return QStringLiteral("coordinator"); }
    bool discover(BridgeAddress *out, Error *error = nullptr) override;

private:
    BridgeDiscoverer &m_primary;
    BridgeDiscoverer &m_fallback;
};

} // namespace hueclient
