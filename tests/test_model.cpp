#include <gtest/gtest.h>

#include <QJsonDocument>

#include "hue_model.h"

using namespace hueclient;

namespace {

QJsonObject parseObject(const QByteArray &json)
{
    return QJsonDocument::fromJson(json).object();
}

} // namespace

TEST(LightCommand, OnlyOnIsSerialized)
{
    LightCommand command;
    command.turnOn();

    const QJsonObject body = command.toJson();
    EXPECT_EQ(body.size(), 1);
    EXPECT_EQ(body.value(QStringLiteral("on")).toObject().value(QStringLiteral("on")).toBool(), true);
}

TEST(LightCommand, OffIsSentExplicitly)
{
    LightCommand command;
    command.turnOff();

    const QJsonObject body = command.toJson();
    ASSERT_TRUE(body.contains(QStringLiteral("on")));
    EXPECT_FALSE(body.value(QStringLiteral("on")).toObject().value(QStringLiteral("on")).toBool(true));
}

TEST(LightCommand, EmptyCommandHasNoFields)
{
    LightCommand command;
    EXPECT_TRUE(command.isEmpty());
    EXPECT_TRUE(command.toJson().isEmpty());
}

TEST(LightCommand, AllFieldsUseBridgeNames)
{
    LightCommand command;
    command.turnOn().withBrightness(140.0).withMirek(366).withXy(0.3, 0.4).withTransitionTime(400);

    const QJsonObject body = command.toJson();
    EXPECT_EQ(body.size(), 5);
    EXPECT_DOUBLE_EQ(body.value(QStringLiteral("dimming")).toObject().value(QStringLiteral("brightness")).toDouble(), 100.0);
    EXPECT_EQ(body.value(QStringLiteral("color_temperature")).toObject().value(QStringLiteral("mirek")).toInt(), 366);
    const QJsonObject xy = body.value(QStringLiteral("color")).toObject().value(QStringLiteral("xy")).toObject();
    EXPECT_DOUBLE_EQ(xy.value(QStringLiteral("x")).toDouble(), 0.3);
    EXPECT_DOUBLE_EQ(xy.value(QStringLiteral("y")).toDouble(), 0.4);
    EXPECT_EQ(body.value(QStringLiteral("dynamics")).toObject().value(QStringLiteral("duration")).toInt(), 400);
}

TEST(LightCommand, ZeroBrightnessIsStillSent)
{
    LightCommand command;
    command.withBrightness(0.0);

    const QJsonObject body = command.toJson();
    EXPECT_EQ(body.size(), 1);
    EXPECT_TRUE(body.contains(QStringLiteral("dimming")));
}

TEST(SceneRecall, PayloadCarriesAction)
{
    const QJsonObject body = sceneRecallPayload(QStringLiteral("active"));
    EXPECT_EQ(body.value(QStringLiteral("recall")).toObject().value(QStringLiteral("action")).toString(),
              QStringLiteral("active"));
}

TEST(ModelDecode, LightWithNestedState)
{
    const QJsonObject obj = parseObject(R"({
        "id": "l1", "id_v1": "/lights/1", "type": "light",
        "owner": {"rid": "d1", "rtype": "device"},
        "metadata": {"name": "Desk", "archetype": "sultan_bulb"},
        "on": {"on": true},
        "dimming": {"brightness": 42.5, "min_dim_level": 0.2},
        "color_temperature": {"mirek": null, "mirek_valid": false,
                              "mirek_schema": {"mirek_minimum": 153, "mirek_maximum": 500}},
        "color": {"xy": {"x": 0.31, "y": 0.32},
                  "gamut": {"red": {"x": 0.68, "y": 0.3}, "green": {"x": 0.26, "y": 0.67},
                            "blue": {"x": 0.15, "y": 0.06}}}
    })");

    Light light;
    QString error;
    ASSERT_TRUE(fromJson(obj, &light, &error)) << error.toStdString();
    EXPECT_EQ(light.id, QStringLiteral("l1"));
    ASSERT_TRUE(light.owner.has_value());
    EXPECT_EQ(light.owner->rid, QStringLiteral("d1"));
    ASSERT_TRUE(light.metadata && light.metadata->name);
    EXPECT_EQ(*light.metadata->name, QStringLiteral("Desk"));
    ASSERT_TRUE(light.on.has_value());
    EXPECT_TRUE(light.on->on);
    ASSERT_TRUE(light.dimming.has_value());
    EXPECT_DOUBLE_EQ(light.dimming->brightness, 42.5);
    ASSERT_TRUE(light.colorTemperature.has_value());
    EXPECT_FALSE(light.colorTemperature->mirek.has_value());
    ASSERT_TRUE(light.colorTemperature->schema.has_value());
    EXPECT_EQ(light.colorTemperature->schema->maximum, 500);
    ASSERT_TRUE(light.color && light.color->gamut);
    EXPECT_DOUBLE_EQ(light.color->gamut->blue.y, 0.06);
}

TEST(ModelDecode, MissingIdFails)
{
    Light light;
    QString error;
    EXPECT_FALSE(fromJson(parseObject(R"({"type": "light"})"), &light, &error));
    EXPECT_EQ(error, QStringLiteral("field 'id': missing"));
}

TEST(ModelDecode, WrongNestedTypeNamesTheField)
{
    Light light;
    QString error;
    EXPECT_FALSE(fromJson(parseObject(R"({"id": "l1", "dimming": {"brightness": "high"}})"), &light, &error));
    EXPECT_EQ(error, QStringLiteral("field 'dimming': field 'brightness': expected a number"));
}

TEST(ModelDecode, IntegerOutsideIntRangeFails)
{
    Light light;
    QString error;
    EXPECT_FALSE(fromJson(parseObject(R"({"id": "l1", "type": "light", "service_id": 1e10})"), &light, &error));
    EXPECT_EQ(error, QStringLiteral("field 'service_id': out of range"));

    EXPECT_FALSE(fromJson(parseObject(R"({"id": "l1", "color_temperature": {"mirek": -3e9}})"), &light, &error));
    EXPECT_TRUE(error.endsWith(QStringLiteral("field 'mirek': out of range")));

    ASSERT_TRUE(fromJson(parseObject(R"({"id": "l1", "service_id": 2147483647})"), &light, &error));
    ASSERT_TRUE(light.serviceId.has_value());
    EXPECT_EQ(*light.serviceId, 2147483647);
}

TEST(ModelDecode, DeviceListsItsLightServices)
{
    Device device;
    ASSERT_TRUE(fromJson(parseObject(R"({
        "id": "d1",
        "services": [{"rid": "l1", "rtype": "light"}, {"rid": "z1", "rtype": "zigbee_connectivity"},
                     {"rid": "l2", "rtype": "light"}]
    })"), &device));
    EXPECT_EQ(device.lightIds(), QStringList({QStringLiteral("l1"), QStringLiteral("l2")}));
}

TEST(ModelDecode, SceneActiveStateToleratesNewValues)
{
    Scene scene;
    ASSERT_TRUE(fromJson(parseObject(R"({"id": "s1", "status": {"active": "something_new"}})"), &scene));
    ASSERT_TRUE(scene.status && scene.status->active);
    EXPECT_EQ(*scene.status->active, SceneActiveState::Unknown);
}

TEST(ColorConversion, WhiteAndPrimaries)
{
    double x = 0.0;
    double y = 0.0;
    rgbToXy(1.0, 1.0, 1.0, &x, &y);
    EXPECT_NEAR(x, 0.3227, 0.001);
    EXPECT_NEAR(y, 0.3290, 0.001);

    rgbToXy(1.0, 0.0, 0.0, &x, &y);
    EXPECT_NEAR(x, 0.7006, 0.001);
    EXPECT_NEAR(y, 0.2993, 0.001);

    rgbToXy(0.0, 0.0, 0.0, &x, &y);
    EXPECT_DOUBLE_EQ(x, 0.0);
    EXPECT_DOUBLE_EQ(y, 0.0);
}
