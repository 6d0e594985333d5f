#include <gtest/gtest.h>

#include <QJsonDocument>
#include <QJsonObject>

#include "fake_transport.h"
#include "hue_registration.h"

using namespace hueclient;
using hueclient::test::FakeTransport;

namespace {

ConnectionSettings bridgeSettings()
{
    ConnectionSettings settings;
    settings.host = QStringLiteral("192.168.1.20");
    return settings;
}

} // namespace

TEST(Registration, ReturnsUsernameAsAppKey)
{
    FakeTransport transport;
    transport.respond("POST", QStringLiteral("/api"), 200,
                      R"([{"success": {"username": "abc123", "clientkey": "CAFE"}}])");

    Registration registration;
    Error error;
    ASSERT_TRUE(registerApplication(transport, bridgeSettings(), QStringLiteral("hueclient#test"), &registration, &error))
        << error.toString().toStdString();
    EXPECT_EQ(registration.appKey, QStringLiteral("abc123"));
    EXPECT_EQ(registration.clientKey, QStringLiteral("CAFE"));

    ASSERT_EQ(transport.requests().size(), 1);
    EXPECT_FALSE(transport.requests().first().includeAppKey);
    const QJsonObject sent = QJsonDocument::fromJson(transport.requests().first().payload).object();
    EXPECT_EQ(sent.value(QStringLiteral("devicetype")).toString(), QStringLiteral("hueclient#test"));
    EXPECT_FALSE(sent.contains(QStringLiteral("generateclientkey")));
}

TEST(Registration, LinkButtonNotPressed)
{
    FakeTransport transport;
    transport.respond("POST", QStringLiteral("/api"), 200,
                      R"([{"error": {"type": 101, "address": "", "description": "link button not pressed"}}])");

    Registration registration;
    Error error;
    EXPECT_FALSE(registerApplication(transport, bridgeSettings(), QStringLiteral("x"), &registration, &error));
    EXPECT_EQ(error.kind, ErrorKind::Protocol);
    EXPECT_EQ(error.code, kLinkButtonNotPressed);
    EXPECT_TRUE(error.message.contains(QStringLiteral("link button")));
}

TEST(Registration, OtherBridgeErrorKeepsDescription)
{
    Registration registration;
    Error error;
    EXPECT_FALSE(parseRegistrationResponse(
        R"([{"error": {"type": 7, "address": "/devicetype", "description": "invalid value"}}])", &registration, &error));
    EXPECT_EQ(error.code, 7);
    EXPECT_EQ(error.message, QStringLiteral("invalid value"));
}

TEST(Registration, EmptyResponseArray)
{
    Registration registration;
    Error error;
    EXPECT_FALSE(parseRegistrationResponse("[]", &registration, &error));
    EXPECT_EQ(error.kind, ErrorKind::Protocol);
    EXPECT_EQ(error.message, QStringLiteral("expected non-empty array"));
}

TEST(Registration, EmptyHostFailsWithoutRequest)
{
    FakeTransport transport;
    Registration registration;
    Error error;
    EXPECT_FALSE(registerApplication(transport, ConnectionSettings(), QString(), &registration, &error));
    EXPECT_TRUE(transport.requests().isEmpty());
}

TEST(Registration, DefaultDeviceTypeFitsBridgeLimit)
{
    const QString deviceType = defaultDeviceType();
    EXPECT_TRUE(deviceType.startsWith(QStringLiteral("hueclient#")));
    EXPECT_LE(deviceType.size(), 40);
}
