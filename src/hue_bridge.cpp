#include "hue_bridge.h"

#include <QJsonDocument>
#include <QUrl>

#include "hue_logging.h"

namespace hueclient {

namespace {

QString extractHueError(const QByteArray &payload)
{
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (doc.isObject()) {
        const QJsonArray errors = doc.object().value(QStringLiteral("errors")).toArray();
        if (!errors.isEmpty())
            return errors.last().toObject().value(QStringLiteral("description")).toString();
        return {};
    }

    if (doc.isArray()) {
        const QJsonArray arr = doc.array();
        for (auto it = arr.crbegin(); it != arr.crend(); ++it) {
            const QJsonObject errObj = it->toObject().value(QStringLiteral("error")).toObject();
            const QString description = errObj.value(QStringLiteral("description")).toString();
            if (!description.isEmpty())
                return description;
        }
    }

    return {};
}

} // namespace

bool checkHttpResult(const HttpResult &result, const QString &what, Error *error)
{
    if (result.ok)
        return true;

    if (result.statusCode == 0) {
        const QString reason = result.error.isEmpty() ? QStringLiteral("no response") : result.error;
        return fail(error, ErrorKind::Transport, QStringLiteral("%1: %2").arg(what, reason));
    }

    QString message = QStringLiteral("%1: HTTP %2").arg(what).arg(result.statusCode);
    const QString hueError = extractHueError(result.payload);
    if (!hueError.isEmpty())
        message += QStringLiteral(" (%1)").arg(hueError);
    return fail(error, ErrorKind::HttpStatus, message, result.statusCode);
}

Bridge::Bridge(const HttpTransport &transport, ConnectionSettings settings, int timeoutMs)
    : m_transport(transport)
    , m_settings(std::move(settings))
    , m_timeoutMs(timeoutMs > 0 ? timeoutMs : kRequestTimeoutMs)
{
}

QString Bridge::resourcePath(const QString &resourceType, const QString &id)
{
    QString path = QStringLiteral("/clip/v2/resource/%1").arg(resourceType);
    if (!id.isEmpty())
        path += QLatin1Char('/') + QString::fromUtf8(QUrl::toPercentEncoding(id));
    return path;
}

bool Bridge::fetchPayload(const QString &path, QByteArray *payload, Error *error) const
{
    const HttpResult result = m_transport.get(m_settings,
                                              path,
                                              true,
                                              QByteArrayLiteral("application/json"),
                                              m_timeoutMs);
    if (!checkHttpResult(result, QStringLiteral("GET %1").arg(path), error))
        return false;

    *payload = result.payload;
    return true;
}

bool Bridge::putCommand(const QString &resourceType,
                        const QString &id,
                        const QJsonObject &payload,
                        Error *error) const
{
    const QString path = resourcePath(resourceType, id);
    const HttpResult result = m_transport.putJson(m_settings,
                                                  path,
                                                  QJsonDocument(payload).toJson(QJsonDocument::Compact),
                                                  true,
                                                  m_timeoutMs);
    if (!checkHttpResult(result, QStringLiteral("PUT %1").arg(path), error))
        return false;

    ResourceEnvelope<ResourceIdentifier> envelope;
    if (!ResourceEnvelope<ResourceIdentifier>::decode(result.payload, &envelope, error))
        return false;

    QList<ResourceIdentifier> updated;
    return envelope.get(&updated, error);
}

bool Bridge::devices(QList<Device> *out, Error *error) const
{
    return fetchCollection(out, error);
}

bool Bridge::lights(QList<Light> *out, Error *error) const
{
    return fetchCollection(out, error);
}

bool Bridge::rooms(QList<Room> *out, Error *error) const
{
    return fetchCollection(out, error);
}

bool Bridge::zones(QList<Zone> *out, Error *error) const
{
    return fetchCollection(out, error);
}

bool Bridge::scenes(QList<Scene> *out, Error *error) const
{
    return fetchCollection(out, error);
}

bool Bridge::smartScenes(QList<SmartScene> *out, Error *error) const
{
    return fetchCollection(out, error);
}

bool Bridge::groupedLights(QList<GroupedLight> *out, Error *error) const
{
    return fetchCollection(out, error);
}

bool Bridge::bridgeHomes(QList<BridgeHome> *out, Error *error) const
{
    return fetchCollection(out, error);
}

bool Bridge::indexDevices(QHash<QString, Device> *out, Error *error) const
{
    return indexCollection(out, error);
}

bool Bridge::indexLights(QHash<QString, Light> *out, Error *error) const
{
    return indexCollection(out, error);
}

bool Bridge::setLightState(const QString &lightId, const LightCommand &command, Error *error) const
{
    return putCommand(QString::fromLatin1(ResourceTraits<Light>::kType), lightId, command.toJson(), error);
}

bool Bridge::setGroupState(const QString &groupedLightId, const LightCommand &command, Error *error) const
{
    return putCommand(QString::fromLatin1(ResourceTraits<GroupedLight>::kType),
                      groupedLightId,
                      command.toJson(),
                      error);
}

bool Bridge::recallScene(const QString &sceneId, Error *error) const
{
    return putCommand(QString::fromLatin1(ResourceTraits<Scene>::kType),
                      sceneId,
                      sceneRecallPayload(QStringLiteral("active")),
                      error);
}

bool Bridge::recallSmartScene(const QString &smartSceneId, Error *error) const
{
    return putCommand(QString::fromLatin1(ResourceTraits<SmartScene>::kType),
                      smartSceneId,
                      sceneRecallPayload(QStringLiteral("activate")),
                      error);
}

bool Bridge::verifyCredentials(BridgeResource *out, Error *error) const
{
    if (m_settings.appKey.trimmed().isEmpty())
        return fail(error, ErrorKind::Protocol, QStringLiteral("Hue application key missing"));

    QList<BridgeResource> bridges;
    if (!fetchCollection(&bridges, error))
        return false;
    if (bridges.isEmpty())
        return fail(error, ErrorKind::Protocol, QStringLiteral("Bridge returned no bridge resource"));

    if (out)
        *out = bridges.constFirst();
    qCDebug(hueHttpLog) << "Credentials accepted by bridge" << m_settings.host;
    return true;
}

} // namespace hueclient
