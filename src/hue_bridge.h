#pragma once

#include <algorithm>

#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QString>

#include "hue_envelope.h"
#include "hue_error.h"
#include "hue_http.h"
#include "hue_model.h"

namespace hueclient {

// Authenticated handle on one bridge: address, application key and
// transport. Read-only after construction; every read re-fetches.
class Bridge
{
public:
    Bridge(const HttpTransport &transport,
           ConnectionSettings settings,
           int timeoutMs = kRequestTimeoutMs);

    const ConnectionSettings &settings() const { return m_settings; }
    QString host() const { return m_settings.host; }
    QString applicationKey() const { return m_settings.appKey; }

    static QString resourcePath(const QString &resourceType, const QString &id = QString());

    // GET /clip/v2/resource/<type>, decoded and sorted by id.
    template <typename T>
    bool fetchCollection(QList<T> *out, Error *error = nullptr) const;

    template <typename T>
    bool indexCollection(QHash<QString, T> *out, Error *error = nullptr) const;

    // PUT /clip/v2/resource/<type>/<id>.
    bool putCommand(const QString &resourceType,
                    const QString &id,
                    const QJsonObject &payload,
                    Error *error = nullptr) const;

    bool devices(QList<Device> *out, Error *error = nullptr) const;
    bool lights(QList<Light> *out, Error *error = nullptr) const;
    bool rooms(QList<Room> *out, Error *error = nullptr) const;
    bool zones(QList<Zone> *out, Error *error = nullptr) const;
    bool scenes(QList<Scene> *out, Error *error = nullptr) const;
    bool smartScenes(QList<SmartScene> *out, Error *error = nullptr) const;
    bool groupedLights(QList<GroupedLight> *out, Error *error = nullptr) const;
    bool bridgeHomes(QList<BridgeHome> *out, Error *error = nullptr) const;

    bool indexDevices(QHash<QString, Device> *out, Error *error = nullptr) const;
    bool indexLights(QHash<QString, Light> *out, Error *error = nullptr) const;

    bool setLightState(const QString &lightId, const LightCommand &command, Error *error = nullptr) const;
    bool setGroupState(const QString &groupedLightId, const LightCommand &command, Error *error = nullptr) const;
    bool recallScene(const QString &sceneId, Error *error = nullptr) const;
    bool recallSmartScene(const QString &smartSceneId, Error *error = nullptr) const;

    // Fetches the `bridge` resource, which requires a valid application key.
    bool verifyCredentials(BridgeResource *out = nullptr, Error *error = nullptr) const;

private:
    bool fetchPayload(const QString &path, QByteArray *payload, Error *error) const;

    const HttpTransport &m_transport;
    ConnectionSettings m_settings;
    int m_timeoutMs = kRequestTimeoutMs;
};

// Maps a transport result to Transport/HttpStatus errors. Status failures
// carry the bridge's own error description when the body has one.
bool checkHttpResult(const HttpResult &result, const QString &what, Error *error);

template <typename T>
bool Bridge::fetchCollection(QList<T> *out, Error *error) const
{
    QByteArray payload;
    if (!fetchPayload(resourcePath(QString::fromLatin1(ResourceTraits<T>::kType)), &payload, error))
        return false;

    ResourceEnvelope<T> envelope;
    if (!ResourceEnvelope<T>::decode(payload, &envelope, error))
        return false;

    QList<T> items;
    if (!envelope.get(&items, error))
        return false;

    std::sort(items.begin(), items.end(), [](const T &a, const T &b) { return a.id < b.id; });
    *out = std::move(items);
    return true;
}

template <typename T>
bool Bridge::indexCollection(QHash<QString, T> *out, Error *error) const
{
    QList<T> items;
    if (!fetchCollection(&items, error))
        return false;

    QHash<QString, T> index;
    index.reserve(items.size());
    for (T &item : items) {
        const QString id = item.id;
        index.insert(id, std::move(item));
    }
    *out = std::move(index);
    return true;
}

} // namespace hueclient
