#pragma once

#include <optional>

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

namespace hueclient {

struct ResourceIdentifier {
    QString rid;
    QString rtype;
};

struct Metadata {
    std::optional<QString> name;
    std::optional<QString> archetype;
};

struct LightMetadata {
    std::optional<QString> name;
    std::optional<QString> archetype;
    std::optional<int> fixedMired;
    std::optional<QString> function;
};

struct OnState {
    bool on = false;
};

struct Dimming {
    double brightness = 0.0;
    std::optional<double> minDimLevel;
};

struct MirekSchema {
    int minimum = 0;
    int maximum = 0;
};

struct ColorTemperature {
    std::optional<int> mirek;
    std::optional<bool> mirekValid;
    std::optional<MirekSchema> schema;
};

struct XyPoint {
    double x = 0.0;
    double y = 0.0;
};

struct Gamut {
    XyPoint red;
    XyPoint green;
    XyPoint blue;
};

struct Color {
    std::optional<XyPoint> xy;
    std::optional<Gamut> gamut;
};

struct ProductData {
    std::optional<QString> modelId;
    std::optional<QString> manufacturerName;
    std::optional<QString> productName;
    std::optional<QString> productArchetype;
    std::optional<QString> softwareVersion;
};

struct Light {
    QString id;
    std::optional<QString> idV1;
    std::optional<ResourceIdentifier> owner;
    std::optional<LightMetadata> metadata;
    std::optional<LightMetadata> productData;
    std::optional<int> serviceId;
    std::optional<OnState> on;
    std::optional<Dimming> dimming;
    std::optional<ColorTemperature> colorTemperature;
    std::optional<Color> color;
};

struct Device {
    QString id;
    std::optional<QString> idV1;
    std::optional<ProductData> productData;
    std::optional<Metadata> metadata;
    std::optional<QList<ResourceIdentifier>> services;

    // Ids of the light services owned by this device, in service order.
    QStringList lightIds() const;
};

struct GroupResource {
    QString id;
    std::optional<QString> idV1;
    std::optional<QList<ResourceIdentifier>> children;
    std::optional<QList<ResourceIdentifier>> services;
    std::optional<Metadata> metadata;
};

struct Room : GroupResource {
};

struct Zone : GroupResource {
};

struct BridgeHome {
    QString id;
    std::optional<QString> idV1;
    std::optional<QList<ResourceIdentifier>> children;
    std::optional<QList<ResourceIdentifier>> services;
};

struct GroupedLight {
    QString id;
    std::optional<QString> idV1;
    std::optional<ResourceIdentifier> owner;
    std::optional<OnState> on;
    std::optional<Dimming> dimming;
    std::optional<ColorTemperature> colorTemperature;
    std::optional<Color> color;
};

enum class SceneActiveState {
    Inactive,
    Static,
    DynamicPalette,
    Unknown
};

struct SceneStatus {
    std::optional<SceneActiveState> active;
    std::optional<QString> lastRecall;
};

struct SceneMetadata {
    std::optional<QString> name;
};

struct Scene {
    QString id;
    std::optional<QString> idV1;
    std::optional<SceneMetadata> metadata;
    std::optional<ResourceIdentifier> group;
    std::optional<SceneStatus> status;
};

struct SmartScene {
    QString id;
    std::optional<QString> idV1;
    std::optional<SceneMetadata> metadata;
    std::optional<ResourceIdentifier> group;
    std::optional<QString> state;
};

struct BridgeResource {
    QString id;
    std::optional<QString> idV1;
    std::optional<ResourceIdentifier> owner;
    std::optional<QString> bridgeId;
};

template <typename T>
struct ResourceTraits;

template <>
struct ResourceTraits<Device> {
    static constexpr const char *kType = "device";
};

template <>
struct ResourceTraits<Light> {
    static constexpr const char *kType = "light";
};

template <>
struct ResourceTraits<Room> {
    static constexpr const char *kType = "room";
};

template <>
struct ResourceTraits<Zone> {
    static constexpr const char *kType = "zone";
};

template <>
struct ResourceTraits<Scene> {
    static constexpr const char *kType = "scene";
};

template <>
struct ResourceTraits<SmartScene> {
    static constexpr const char *kType = "smart_scene";
};

template <>
struct ResourceTraits<GroupedLight> {
    static constexpr const char *kType = "grouped_light";
};

template <>
struct ResourceTraits<BridgeHome> {
    static constexpr const char *kType = "bridge_home";
};

template <>
struct ResourceTraits<BridgeResource> {
    static constexpr const char *kType = "bridge";
};

// Strict decoders: a present field of the wrong JSON type, or a missing
// required field, fails the whole object. Absent optional fields stay unset.
bool fromJson(const QJsonObject &obj, ResourceIdentifier *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, Metadata *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, LightMetadata *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, OnState *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, Dimming *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, MirekSchema *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, ColorTemperature *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, XyPoint *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, Gamut *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, Color *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, ProductData *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, Light *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, Device *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, Room *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, Zone *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, BridgeHome *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, GroupedLight *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, SceneStatus *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, SceneMetadata *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, Scene *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, SmartScene *out, QString *error = nullptr);
bool fromJson(const QJsonObject &obj, BridgeResource *out, QString *error = nullptr);

QJsonObject toJson(const ResourceIdentifier &identifier);

// Sparse light/grouped_light command. Unset fields are left out of the
// payload and leave the corresponding bridge state untouched.
struct LightCommand {
    std::optional<bool> on;
    std::optional<double> brightness;
    std::optional<int> mirek;
    std::optional<XyPoint> xy;
    std::optional<int> transitionMs;

    LightCommand &turnOn();
    LightCommand &turnOff();
    LightCommand &withBrightness(double value);
    LightCommand &withMirek(int value);
    LightCommand &withXy(double x, double y);
    LightCommand &withTransitionTime(int ms);

    bool isEmpty() const;
    QJsonObject toJson() const;
};

QJsonObject sceneRecallPayload(const QString &action);

void rgbToXy(double r01, double g01, double b01, double *x, double *y);

} // namespace hueclient
