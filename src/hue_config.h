#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>

#include "hue_discovery.h"
#include "hue_error.h"
#include "hue_http.h"

namespace hueclient {

struct ClientConfig {
    QString host;
    int port = 0;
    bool useTls = true;
    QString appKey;
    // PEM file with the bridge trust anchor. Empty selects the built-in root.
    QString caCertificateFile;
    bool verifyPeer = true;
    int requestTimeoutMs = kRequestTimeoutMs;
    int mdnsTimeoutMs = kMdnsTimeoutMs;
    QString nupnpUrl = QString::fromLatin1(kDefaultNupnpUrl);
    // Skip the cloud lookup when multicast finds nothing.
    bool mdnsOnly = false;
    QString logRules;
};

// Overlays the keys present in `obj`. Out-of-range integers are clamped,
// values of the wrong type keep the current setting.
void applyConfigJson(const QJsonObject &obj, ClientConfig *config);

bool loadConfigFile(const QString &path, ClientConfig *config, Error *error = nullptr);

// HUECLIENT_HOST and HUECLIENT_APP_KEY.
void applyEnvironment(const QProcessEnvironment &env, ClientConfig *config);

bool loadTrustAnchor(const ClientConfig &config, QByteArray *pem, Error *error = nullptr);

bool connectionSettings(const ClientConfig &config, ConnectionSettings *out, Error *error = nullptr);

void applyLogRules(const ClientConfig &config, bool verbose);

// mDNS, then nUPnP through `transport` unless `mdnsOnly` is set.
bool discoverBridge(const HttpTransport &transport,
                    const ClientConfig &config,
                    BridgeAddress *out,
                    Error *error = nullptr);

} // namespace hueclient
