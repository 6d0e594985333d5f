#include <gtest/gtest.h>

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "hue_certificate.h"
#include "fake_transport.h"
#include "hue_config.h"

using namespace hueclient;

TEST(ClientConfig, Defaults)
{
    const ClientConfig config;
    EXPECT_EQ(config.requestTimeoutMs, 2000);
    EXPECT_EQ(config.mdnsTimeoutMs, 3000);
    EXPECT_EQ(config.nupnpUrl, QStringLiteral("https://discovery.meethue.com/"));
    EXPECT_TRUE(config.useTls);
    EXPECT_TRUE(config.verifyPeer);
    EXPECT_FALSE(config.mdnsOnly);
}

TEST(ClientConfig, JsonOverlayClampsAndIgnoresWrongTypes)
{
    ClientConfig config;
    applyConfigJson(QJsonDocument::fromJson(R"({
        "host": " 192.168.1.20 ",
        "port": 70000,
        "useTls": "yes",
        "requestTimeoutMs": 5,
        "mdnsTimeoutMs": 4500,
        "mdnsOnly": true,
        "logRules": "hueclient.http.debug=true"
    })").object(), &config);

    EXPECT_EQ(config.host, QStringLiteral("192.168.1.20"));
    EXPECT_EQ(config.port, 65535);
    EXPECT_TRUE(config.useTls);
    EXPECT_EQ(config.requestTimeoutMs, 100);
    EXPECT_EQ(config.mdnsTimeoutMs, 4500);
    EXPECT_TRUE(config.mdnsOnly);
    EXPECT_EQ(config.logRules, QStringLiteral("hueclient.http.debug=true"));
}

TEST(ClientConfig, EnvironmentOverridesFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("hueclient.json"));
    {
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(R"({"host": "file-host", "appKey": "file-key"})");
    }

    ClientConfig config;
    Error error;
    ASSERT_TRUE(loadConfigFile(path, &config, &error)) << error.toString().toStdString();
    EXPECT_EQ(config.host, QStringLiteral("file-host"));

    QProcessEnvironment env;
    env.insert(QStringLiteral("HUECLIENT_APP_KEY"), QStringLiteral("env-key"));
    applyEnvironment(env, &config);
    EXPECT_EQ(config.host, QStringLiteral("file-host"));
    EXPECT_EQ(config.appKey, QStringLiteral("env-key"));
}

TEST(ClientConfig, MissingOrInvalidFile)
{
    ClientConfig config;
    Error error;
    EXPECT_FALSE(loadConfigFile(QStringLiteral("/nonexistent/hueclient.json"), &config, &error));
    EXPECT_EQ(error.kind, ErrorKind::Decode);

    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("bad.json"));
    {
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write("[1, 2");
    }
    EXPECT_FALSE(loadConfigFile(path, &config, &error));
    EXPECT_EQ(error.kind, ErrorKind::Decode);
}

TEST(ClientConfig, ConnectionSettingsUseBuiltInTrustAnchor)
{
    ClientConfig config;
    config.host = QStringLiteral("192.168.1.20");
    config.appKey = QStringLiteral("key");

    ConnectionSettings settings;
    ASSERT_TRUE(connectionSettings(config, &settings));
    EXPECT_EQ(settings.port, 443);
    EXPECT_EQ(settings.appKey, QStringLiteral("key"));
    EXPECT_EQ(settings.caCertificatesPem, QByteArray(kHueRootCaPem));
    EXPECT_TRUE(settings.caCertificatesPem.startsWith("-----BEGIN CERTIFICATE-----"));
    EXPECT_TRUE(settings.allowHostNameMismatch);

    config.useTls = false;
    ASSERT_TRUE(connectionSettings(config, &settings));
    EXPECT_EQ(settings.port, 80);
    EXPECT_TRUE(settings.caCertificatesPem.isEmpty());
    EXPECT_FALSE(settings.allowHostNameMismatch);
}

TEST(ClientConfig, UnreadableTrustAnchorFails)
{
    ClientConfig config;
    config.host = QStringLiteral("192.168.1.20");
    config.caCertificateFile = QStringLiteral("/nonexistent/ca.pem");

    ConnectionSettings settings;
    Error error;
    EXPECT_FALSE(connectionSettings(config, &settings, &error));
    EXPECT_EQ(error.kind, ErrorKind::Decode);
}

TEST(ClientConfig, MdnsOnlyDiscoveryNeverAsksTheCloud)
{
    test::FakeTransport transport;
    transport.respond("GET", QStringLiteral("/"), 200, R"([{"id": "b", "internalipaddress": "10.0.0.9"}])");

    ClientConfig config;
    config.mdnsOnly = true;
    config.mdnsTimeoutMs = 100;
    BridgeAddress address;
    discoverBridge(transport, config, &address);
    EXPECT_TRUE(transport.requests().isEmpty());
}

TEST(ClientConfig, DefaultDiscoveryFallsBackToTheCloud)
{
    test::FakeTransport transport;
    transport.respond("GET", QStringLiteral("/"), 200, R"([{"id": "b", "internalipaddress": "10.0.0.9"}])");

    ClientConfig config;
    config.mdnsTimeoutMs = 100;
    BridgeAddress address;
    ASSERT_TRUE(discoverBridge(transport, config, &address));
    if (!transport.requests().isEmpty()) {
        EXPECT_EQ(address.ip, QHostAddress(QStringLiteral("10.0.0.9")));
        EXPECT_EQ(transport.requests().first().host, QStringLiteral("discovery.meethue.com"));
    }
}
