#include "hue_registration.h"

#include <QHostInfo>
#include <QJsonDocument>
#include <QJsonObject>

#include "hue_bridge.h"
#include "hue_envelope.h"
#include "hue_logging.h"

namespace hueclient {

namespace {

struct RegistrationSuccess {
    QString username;
    QString clientKey;
};

bool fromJson(const QJsonObject &obj, RegistrationSuccess *out, QString *error)
{
    const QJsonValue success = obj.value(QStringLiteral("success"));
    if (!success.isObject()) {
        if (error)
            *error = QStringLiteral("field 'success': expected an object");
        return false;
    }

    const QJsonObject successObj = success.toObject();
    const QJsonValue username = successObj.value(QStringLiteral("username"));
    if (!username.isString()) {
        if (error)
            *error = QStringLiteral("field 'success.username': expected a string");
        return false;
    }

    out->username = username.toString().trimmed();
    out->clientKey = successObj.value(QStringLiteral("clientkey")).toString().trimmed();
    return true;
}

} // namespace

QString defaultDeviceType()
{
    const QString localHost = QHostInfo::localHostName().left(20);
    return QStringLiteral("hueclient#%1").arg(localHost.isEmpty() ? QStringLiteral("client") : localHost);
}

bool parseRegistrationResponse(const QByteArray &payload, Registration *out, Error *error)
{
    LegacyEnvelope<RegistrationSuccess> envelope;
    if (!LegacyEnvelope<RegistrationSuccess>::decode(payload, &envelope, error))
        return false;

    RegistrationSuccess success;
    Error envelopeError;
    if (!envelope.get(&success, &envelopeError)) {
        if (envelopeError.code == kLinkButtonNotPressed)
            envelopeError.message = QStringLiteral("Press the link button on the Hue bridge, then retry.");
        if (error)
            *error = envelopeError;
        return false;
    }

    if (success.username.isEmpty())
        return fail(error, ErrorKind::Protocol, QStringLiteral("Hue bridge returned an empty application key"));

    out->appKey = success.username;
    out->clientKey = success.clientKey;
    return true;
}

bool registerApplication(const HttpTransport &transport,
                         const ConnectionSettings &settings,
                         const QString &deviceType,
                         Registration *out,
                         Error *error,
                         bool generateClientKey,
                         int timeoutMs)
{
    if (HttpClient::effectiveHost(settings).isEmpty())
        return fail(error, ErrorKind::Transport, QStringLiteral("Host must not be empty"));

    const QString name = deviceType.trimmed().isEmpty() ? defaultDeviceType() : deviceType.trimmed();

    QJsonObject payload;
    payload.insert(QStringLiteral("devicetype"), name);
    if (generateClientKey)
        payload.insert(QStringLiteral("generateclientkey"), true);

    const HttpResult result = transport.postJson(settings,
                                                 QStringLiteral("/api"),
                                                 QJsonDocument(payload).toJson(QJsonDocument::Compact),
                                                 false,
                                                 timeoutMs);
    if (!checkHttpResult(result, QStringLiteral("POST /api"), error))
        return false;

    if (!parseRegistrationResponse(result.payload, out, error))
        return false;

    qCInfo(hueHttpLog) << "Registered" << name << "with bridge" << settings.host;
    return true;
}

} // namespace hueclient
