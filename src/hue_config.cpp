#include "hue_config.h"

#include <algorithm>

#include <QFile>
#include <QJsonDocument>
#include <QJsonValue>
#include <QLoggingCategory>
#include <QStringList>
#include <QVariant>
#if QT_CONFIG(ssl)
#include <QSslCertificate>
#endif

#include "hue_certificate.h"
#include "hue_envelope.h"

namespace hueclient {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

void readString(const QJsonObject &obj, const QString &key, QString *target)
{
    const QJsonValue value = obj.value(key);
    if (value.isString())
        *target = value.toString().trimmed();
}

void readBool(const QJsonObject &obj, const QString &key, bool *target)
{
    const QJsonValue value = obj.value(key);
    if (value.isBool())
        *target = value.toBool();
}

} // namespace

void applyConfigJson(const QJsonObject &obj, ClientConfig *config)
{
    readString(obj, QStringLiteral("host"), &config->host);
    readString(obj, QStringLiteral("appKey"), &config->appKey);
    readString(obj, QStringLiteral("caCertificateFile"), &config->caCertificateFile);
    readString(obj, QStringLiteral("nupnpUrl"), &config->nupnpUrl);
    readString(obj, QStringLiteral("logRules"), &config->logRules);
    readBool(obj, QStringLiteral("useTls"), &config->useTls);
    readBool(obj, QStringLiteral("verifyPeer"), &config->verifyPeer);
    readBool(obj, QStringLiteral("mdnsOnly"), &config->mdnsOnly);

    config->port = std::clamp(readInt(obj, QStringLiteral("port"), config->port), 0, 65535);
    config->requestTimeoutMs =
        std::clamp(readInt(obj, QStringLiteral("requestTimeoutMs"), config->requestTimeoutMs), 100, 60000);
    config->mdnsTimeoutMs = std::clamp(readInt(obj, QStringLiteral("mdnsTimeoutMs"), config->mdnsTimeoutMs), 100, 60000);
}

bool loadConfigFile(const QString &path, ClientConfig *config, Error *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return fail(error, ErrorKind::Decode, QStringLiteral("Cannot read %1: %2").arg(path, file.errorString()));

    QJsonDocument doc;
    if (!parseJsonPayload(file.readAll(), &doc, error))
        return false;
    if (!doc.isObject())
        return fail(error, ErrorKind::Decode, QStringLiteral("%1: expected a JSON object").arg(path));

    applyConfigJson(doc.object(), config);
    return true;
}

void applyEnvironment(const QProcessEnvironment &env, ClientConfig *config)
{
    const QString host = env.value(QStringLiteral("HUECLIENT_HOST")).trimmed();
    if (!host.isEmpty())
        config->host = host;
    const QString appKey = env.value(QStringLiteral("HUECLIENT_APP_KEY")).trimmed();
    if (!appKey.isEmpty())
        config->appKey = appKey;
}

bool loadTrustAnchor(const ClientConfig &config, QByteArray *pem, Error *error)
{
    if (config.caCertificateFile.isEmpty()) {
        *pem = QByteArray(kHueRootCaPem);
        return true;
    }

    QFile file(config.caCertificateFile);
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(error,
                    ErrorKind::Decode,
                    QStringLiteral("Cannot read %1: %2").arg(config.caCertificateFile, file.errorString()));
    }

    const QByteArray data = file.readAll();
#if QT_CONFIG(ssl)
    if (QSslCertificate::fromData(data, QSsl::Pem).isEmpty())
        return fail(error, ErrorKind::Decode, QStringLiteral("%1: no PEM certificate found").arg(config.caCertificateFile));
#endif

    *pem = data;
    return true;
}

bool connectionSettings(const ClientConfig &config, ConnectionSettings *out, Error *error)
{
    ConnectionSettings settings;
    settings.host = config.host.trimmed();
    settings.useTls = config.useTls;
    settings.port = config.port > 0 ? config.port : (config.useTls ? 443 : 80);
    settings.appKey = config.appKey;
    settings.verifyPeer = config.verifyPeer;
    settings.allowHostNameMismatch = config.useTls;

    if (settings.useTls && !loadTrustAnchor(config, &settings.caCertificatesPem, error))
        return false;

    *out = settings;
    return true;
}

void applyLogRules(const ClientConfig &config, bool verbose)
{
    QStringList rules;
    if (!config.logRules.isEmpty())
        rules.append(config.logRules.split(QLatin1Char(';'), Qt::SkipEmptyParts));
    if (verbose)
        rules.append(QStringLiteral("hueclient.*.debug=true"));
    if (!rules.isEmpty())
        QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));
}

bool discoverBridge(const HttpTransport &transport, const ClientConfig &config, BridgeAddress *out, Error *error)
{
    MdnsOptions options;
    options.timeoutMs = config.mdnsTimeoutMs;
    MdnsDiscoverer mdns(options);
    if (config.mdnsOnly)
        return mdns.discover(out, error);

    NupnpDiscoverer nupnp(transport, QUrl(config.nupnpUrl), false, config.requestTimeoutMs);
    DiscoveryCoordinator coordinator(mdns, nupnp);
    return coordinator.discover(out, error);
}

} // namespace hueclient
