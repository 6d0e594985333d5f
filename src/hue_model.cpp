#include "hue_model.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <QJsonArray>
#include <QJsonValue>

namespace hueclient {

namespace {

bool fieldFailure(QString *error, const QString &key, const QString &message)
{
    if (error)
        *error = QStringLiteral("field '%1': %2").arg(key, message);
    return false;
}

bool isAbsent(const QJsonValue &value)
{
    return value.isUndefined() || value.isNull();
}

bool readString(const QJsonObject &obj, const QString &key, std::optional<QString> *out, QString *error)
{
    const QJsonValue value = obj.value(key);
    if (isAbsent(value)) {
        out->reset();
        return true;
    }
    if (!value.isString())
        return fieldFailure(error, key, QStringLiteral("expected a string"));
    *out = value.toString();
    return true;
}

bool requireString(const QJsonObject &obj, const QString &key, QString *out, QString *error)
{
    std::optional<QString> value;
    if (!readString(obj, key, &value, error))
        return false;
    if (!value)
        return fieldFailure(error, key, QStringLiteral("missing"));
    *out = *value;
    return true;
}

bool readDouble(const QJsonObject &obj, const QString &key, std::optional<double> *out, QString *error)
{
    const QJsonValue value = obj.value(key);
    if (isAbsent(value)) {
        out->reset();
        return true;
    }
    if (!value.isDouble())
        return fieldFailure(error, key, QStringLiteral("expected a number"));
    *out = value.toDouble();
    return true;
}

bool requireDouble(const QJsonObject &obj, const QString &key, double *out, QString *error)
{
    std::optional<double> value;
    if (!readDouble(obj, key, &value, error))
        return false;
    if (!value)
        return fieldFailure(error, key, QStringLiteral("missing"));
    *out = *value;
    return true;
}

bool readInt(const QJsonObject &obj, const QString &key, std::optional<int> *out, QString *error)
{
    std::optional<double> value;
    if (!readDouble(obj, key, &value, error))
        return false;
    if (!value) {
        out->reset();
        return true;
    }
    if (std::floor(*value) != *value)
        return fieldFailure(error, key, QStringLiteral("expected an integer"));
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
        return fieldFailure(error, key, QStringLiteral("out of range"));
    *out = static_cast<int>(*value);
    return true;
}

bool requireInt(const QJsonObject &obj, const QString &key, int *out, QString *error)
{
    std::optional<int> value;
    if (!readInt(obj, key, &value, error))
        return false;
    if (!value)
        return fieldFailure(error, key, QStringLiteral("missing"));
    *out = *value;
    return true;
}

bool readBool(const QJsonObject &obj, const QString &key, std::optional<bool> *out, QString *error)
{
    const QJsonValue value = obj.value(key);
    if (isAbsent(value)) {
        out->reset();
        return true;
    }
    if (!value.isBool())
        return fieldFailure(error, key, QStringLiteral("expected a boolean"));
    *out = value.toBool();
    return true;
}

template <typename T>
bool decodeNested(const QJsonValue &value, const QString &key, T *out, QString *error)
{
    if (!value.isObject())
        return fieldFailure(error, key, QStringLiteral("expected an object"));
    QString nestedError;
    if (!fromJson(value.toObject(), out, &nestedError))
        return fieldFailure(error, key, nestedError);
    return true;
}

template <typename T>
bool readObject(const QJsonObject &obj, const QString &key, std::optional<T> *out, QString *error)
{
    const QJsonValue value = obj.value(key);
    if (isAbsent(value)) {
        out->reset();
        return true;
    }
    T decoded;
    if (!decodeNested(value, key, &decoded, error))
        return false;
    *out = std::move(decoded);
    return true;
}

template <typename T>
bool requireObject(const QJsonObject &obj, const QString &key, T *out, QString *error)
{
    const QJsonValue value = obj.value(key);
    if (isAbsent(value))
        return fieldFailure(error, key, QStringLiteral("missing"));
    return decodeNested(value, key, out, error);
}

template <typename T>
bool readList(const QJsonObject &obj, const QString &key, std::optional<QList<T>> *out, QString *error)
{
    const QJsonValue value = obj.value(key);
    if (isAbsent(value)) {
        out->reset();
        return true;
    }
    if (!value.isArray())
        return fieldFailure(error, key, QStringLiteral("expected an array"));

    QList<T> items;
    const QJsonArray arr = value.toArray();
    items.reserve(arr.size());
    for (const QJsonValue &entry : arr) {
        T item;
        if (!decodeNested(entry, key, &item, error))
            return false;
        items.append(std::move(item));
    }
    *out = std::move(items);
    return true;
}

bool decodeGroup(const QJsonObject &obj, GroupResource *out, QString *error)
{
    GroupResource group;
    if (!requireString(obj, QStringLiteral("id"), &group.id, error)
        || !readString(obj, QStringLiteral("id_v1"), &group.idV1, error)
        || !readList(obj, QStringLiteral("children"), &group.children, error)
        || !readList(obj, QStringLiteral("services"), &group.services, error)
        || !readObject(obj, QStringLiteral("metadata"), &group.metadata, error)) {
        return false;
    }
    *out = std::move(group);
    return true;
}

SceneActiveState sceneActiveStateFromString(const QString &value)
{
    if (value == QLatin1String("inactive"))
        return SceneActiveState::Inactive;
    if (value == QLatin1String("static"))
        return SceneActiveState::Static;
    if (value == QLatin1String("dynamic_palette"))
        return SceneActiveState::DynamicPalette;
    return SceneActiveState::Unknown;
}

} // namespace

bool fromJson(const QJsonObject &obj, ResourceIdentifier *out, QString *error)
{
    return requireString(obj, QStringLiteral("rid"), &out->rid, error)
        && requireString(obj, QStringLiteral("rtype"), &out->rtype, error);
}

bool fromJson(const QJsonObject &obj, Metadata *out, QString *error)
{
    return readString(obj, QStringLiteral("name"), &out->name, error)
        && readString(obj, QStringLiteral("archetype"), &out->archetype, error);
}

bool fromJson(const QJsonObject &obj, LightMetadata *out, QString *error)
{
    return readString(obj, QStringLiteral("name"), &out->name, error)
        && readString(obj, QStringLiteral("archetype"), &out->archetype, error)
        && readInt(obj, QStringLiteral("fixed_mired"), &out->fixedMired, error)
        && readString(obj, QStringLiteral("function"), &out->function, error);
}

bool fromJson(const QJsonObject &obj, OnState *out, QString *error)
{
    std::optional<bool> on;
    if (!readBool(obj, QStringLiteral("on"), &on, error))
        return false;
    if (!on)
        return fieldFailure(error, QStringLiteral("on"), QStringLiteral("missing"));
    out->on = *on;
    return true;
}

bool fromJson(const QJsonObject &obj, Dimming *out, QString *error)
{
    return requireDouble(obj, QStringLiteral("brightness"), &out->brightness, error)
        && readDouble(obj, QStringLiteral("min_dim_level"), &out->minDimLevel, error);
}

bool fromJson(const QJsonObject &obj, MirekSchema *out, QString *error)
{
    return requireInt(obj, QStringLiteral("mirek_minimum"), &out->minimum, error)
        && requireInt(obj, QStringLiteral("mirek_maximum"), &out->maximum, error);
}

bool fromJson(const QJsonObject &obj, ColorTemperature *out, QString *error)
{
    return readInt(obj, QStringLiteral("mirek"), &out->mirek, error)
        && readBool(obj, QStringLiteral("mirek_valid"), &out->mirekValid, error)
        && readObject(obj, QStringLiteral("mirek_schema"), &out->schema, error);
}

bool fromJson(const QJsonObject &obj, XyPoint *out, QString *error)
{
    return requireDouble(obj, QStringLiteral("x"), &out->x, error)
        && requireDouble(obj, QStringLiteral("y"), &out->y, error);
}

bool fromJson(const QJsonObject &obj, Gamut *out, QString *error)
{
    return requireObject(obj, QStringLiteral("red"), &out->red, error)
        && requireObject(obj, QStringLiteral("green"), &out->green, error)
        && requireObject(obj, QStringLiteral("blue"), &out->blue, error);
}

bool fromJson(const QJsonObject &obj, Color *out, QString *error)
{
    return readObject(obj, QStringLiteral("xy"), &out->xy, error)
        && readObject(obj, QStringLiteral("gamut"), &out->gamut, error);
}

bool fromJson(const QJsonObject &obj, ProductData *out, QString *error)
{
    return readString(obj, QStringLiteral("model_id"), &out->modelId, error)
        && readString(obj, QStringLiteral("manufacturer_name"), &out->manufacturerName, error)
        && readString(obj, QStringLiteral("product_name"), &out->productName, error)
        && readString(obj, QStringLiteral("product_archetype"), &out->productArchetype, error)
        && readString(obj, QStringLiteral("software_version"), &out->softwareVersion, error);
}

bool fromJson(const QJsonObject &obj, Light *out, QString *error)
{
    Light light;
    if (!requireString(obj, QStringLiteral("id"), &light.id, error)
        || !readString(obj, QStringLiteral("id_v1"), &light.idV1, error)
        || !readObject(obj, QStringLiteral("owner"), &light.owner, error)
        || !readObject(obj, QStringLiteral("metadata"), &light.metadata, error)
        || !readObject(obj, QStringLiteral("product_data"), &light.productData, error)
        || !readInt(obj, QStringLiteral("service_id"), &light.serviceId, error)
        || !readObject(obj, QStringLiteral("on"), &light.on, error)
        || !readObject(obj, QStringLiteral("dimming"), &light.dimming, error)
        || !readObject(obj, QStringLiteral("color_temperature"), &light.colorTemperature, error)
        || !readObject(obj, QStringLiteral("color"), &light.color, error)) {
        return false;
    }
    *out = std::move(light);
    return true;
}

bool fromJson(const QJsonObject &obj, Device *out, QString *error)
{
    Device device;
    if (!requireString(obj, QStringLiteral("id"), &device.id, error)
        || !readString(obj, QStringLiteral("id_v1"), &device.idV1, error)
        || !readObject(obj, QStringLiteral("product_data"), &device.productData, error)
        || !readObject(obj, QStringLiteral("metadata"), &device.metadata, error)
        || !readList(obj, QStringLiteral("services"), &device.services, error)) {
        return false;
    }
    *out = std::move(device);
    return true;
}

bool fromJson(const QJsonObject &obj, Room *out, QString *error)
{
    return decodeGroup(obj, out, error);
}

bool fromJson(const QJsonObject &obj, Zone *out, QString *error)
{
    return decodeGroup(obj, out, error);
}

bool fromJson(const QJsonObject &obj, BridgeHome *out, QString *error)
{
    BridgeHome home;
    if (!requireString(obj, QStringLiteral("id"), &home.id, error)
        || !readString(obj, QStringLiteral("id_v1"), &home.idV1, error)
        || !readList(obj, QStringLiteral("children"), &home.children, error)
        || !readList(obj, QStringLiteral("services"), &home.services, error)) {
        return false;
    }
    *out = std::move(home);
    return true;
}

bool fromJson(const QJsonObject &obj, GroupedLight *out, QString *error)
{
    GroupedLight group;
    if (!requireString(obj, QStringLiteral("id"), &group.id, error)
        || !readString(obj, QStringLiteral("id_v1"), &group.idV1, error)
        || !readObject(obj, QStringLiteral("owner"), &group.owner, error)
        || !readObject(obj, QStringLiteral("on"), &group.on, error)
        || !readObject(obj, QStringLiteral("dimming"), &group.dimming, error)
        || !readObject(obj, QStringLiteral("color_temperature"), &group.colorTemperature, error)
        || !readObject(obj, QStringLiteral("color"), &group.color, error)) {
        return false;
    }
    *out = std::move(group);
    return true;
}

bool fromJson(const QJsonObject &obj, SceneStatus *out, QString *error)
{
    std::optional<QString> active;
    if (!readString(obj, QStringLiteral("active"), &active, error)
        || !readString(obj, QStringLiteral("last_recall"), &out->lastRecall, error)) {
        return false;
    }
    if (active)
        out->active = sceneActiveStateFromString(*active);
    return true;
}

bool fromJson(const QJsonObject &obj, SceneMetadata *out, QString *error)
{
    return readString(obj, QStringLiteral("name"), &out->name, error);
}

bool fromJson(const QJsonObject &obj, Scene *out, QString *error)
{
    Scene scene;
    if (!requireString(obj, QStringLiteral("id"), &scene.id, error)
        || !readString(obj, QStringLiteral("id_v1"), &scene.idV1, error)
        || !readObject(obj, QStringLiteral("metadata"), &scene.metadata, error)
        || !readObject(obj, QStringLiteral("group"), &scene.group, error)
        || !readObject(obj, QStringLiteral("status"), &scene.status, error)) {
        return false;
    }
    *out = std::move(scene);
    return true;
}

bool fromJson(const QJsonObject &obj, SmartScene *out, QString *error)
{
    SmartScene scene;
    if (!requireString(obj, QStringLiteral("id"), &scene.id, error)
        || !readString(obj, QStringLiteral("id_v1"), &scene.idV1, error)
        || !readObject(obj, QStringLiteral("metadata"), &scene.metadata, error)
        || !readObject(obj, QStringLiteral("group"), &scene.group, error)
        || !readString(obj, QStringLiteral("state"), &scene.state, error)) {
        return false;
    }
    *out = std::move(scene);
    return true;
}

bool fromJson(const QJsonObject &obj, BridgeResource *out, QString *error)
{
    BridgeResource bridge;
    if (!requireString(obj, QStringLiteral("id"), &bridge.id, error)
        || !readString(obj, QStringLiteral("id_v1"), &bridge.idV1, error)
        || !readObject(obj, QStringLiteral("owner"), &bridge.owner, error)
        || !readString(obj, QStringLiteral("bridge_id"), &bridge.bridgeId, error)) {
        return false;
    }
    *out = std::move(bridge);
    return true;
}

QJsonObject toJson(const ResourceIdentifier &identifier)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("rid"), identifier.rid);
    obj.insert(QStringLiteral("rtype"), identifier.rtype);
    return obj;
}

QStringList Device::lightIds() const
{
    QStringList ids;
    if (!services)
        return ids;
    for (const ResourceIdentifier &service : *services) {
        if (service.rtype == QLatin1String("light"))
            ids.append(service.rid);
    }
    return ids;
}

LightCommand &LightCommand::turnOn()
{
    on = true;
    return *this;
}

LightCommand &LightCommand::turnOff()
{
    on = false;
    return *this;
}

LightCommand &LightCommand::withBrightness(double value)
{
    brightness = value;
    return *this;
}

LightCommand &LightCommand::withMirek(int value)
{
    mirek = value;
    return *this;
}

LightCommand &LightCommand::withXy(double x, double y)
{
    xy = XyPoint{x, y};
    return *this;
}

LightCommand &LightCommand::withTransitionTime(int ms)
{
    transitionMs = ms;
    return *this;
}

bool LightCommand::isEmpty() const
{
    return !on && !brightness && !mirek && !xy && !transitionMs;
}

QJsonObject LightCommand::toJson() const
{
    QJsonObject body;

    if (on) {
        QJsonObject onObj;
        onObj.insert(QStringLiteral("on"), *on);
        body.insert(QStringLiteral("on"), onObj);
    }

    if (brightness) {
        QJsonObject dimObj;
        dimObj.insert(QStringLiteral("brightness"), std::clamp(*brightness, 0.0, 100.0));
        body.insert(QStringLiteral("dimming"), dimObj);
    }

    if (mirek) {
        QJsonObject ctObj;
        ctObj.insert(QStringLiteral("mirek"), *mirek);
        body.insert(QStringLiteral("color_temperature"), ctObj);
    }

    if (xy) {
        QJsonObject xyObj;
        xyObj.insert(QStringLiteral("x"), xy->x);
        xyObj.insert(QStringLiteral("y"), xy->y);

        QJsonObject colorObj;
        colorObj.insert(QStringLiteral("xy"), xyObj);
        body.insert(QStringLiteral("color"), colorObj);
    }

    if (transitionMs) {
        QJsonObject dynamicsObj;
        dynamicsObj.insert(QStringLiteral("duration"), *transitionMs);
        body.insert(QStringLiteral("dynamics"), dynamicsObj);
    }

    return body;
}

QJsonObject sceneRecallPayload(const QString &action)
{
    QJsonObject recall;
    recall.insert(QStringLiteral("action"), action);

    QJsonObject body;
    body.insert(QStringLiteral("recall"), recall);
    return body;
}

void rgbToXy(double r01, double g01, double b01, double *x, double *y)
{
    auto gamma = [](double value) {
        if (value <= 0.04045)
            return value / 12.92;
        return std::pow((value + 0.055) / 1.055, 2.4);
    };

    const double r = gamma(std::clamp(r01, 0.0, 1.0));
    const double g = gamma(std::clamp(g01, 0.0, 1.0));
    const double b = gamma(std::clamp(b01, 0.0, 1.0));

    const double X = r * 0.664511 + g * 0.154324 + b * 0.162028;
    const double Y = r * 0.283881 + g * 0.668433 + b * 0.047685;
    const double Z = r * 0.000088 + g * 0.072310 + b * 0.986039;

    const double sum = X + Y + Z;
    if (sum <= 0.0) {
        *x = 0.0;
        *y = 0.0;
        return;
    }

    *x = std::clamp(X / sum, 0.0, 1.0);
    *y = std::clamp(Y / sum, 0.0, 1.0);
}

} // namespace hueclient
