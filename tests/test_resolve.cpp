#include <gtest/gtest.h>

#include "fake_transport.h"
#include "hue_bridge.h"
#include "hue_resolve.h"

using namespace hueclient;
using hueclient::test::FakeTransport;

namespace {

ResourceIdentifier ref(const QString &rid, const QString &rtype)
{
    return ResourceIdentifier{rid, rtype};
}

Light light(const QString &id)
{
    Light out;
    out.id = id;
    return out;
}

Device device(const QString &id, const QList<ResourceIdentifier> &services)
{
    Device out;
    out.id = id;
    out.services = services;
    return out;
}

QStringList ids(const QList<Light> &lights)
{
    QStringList out;
    for (const Light &item : lights)
        out.append(item.id);
    return out;
}

} // namespace

TEST(ResolveRooms, JoinsThroughDevicesAndDropsUnknownReferences)
{
    QHash<QString, Light> lights;
    lights.insert(QStringLiteral("l1"), light(QStringLiteral("l1")));
    lights.insert(QStringLiteral("l2"), light(QStringLiteral("l2")));

    QHash<QString, Device> devices;
    devices.insert(QStringLiteral("d1"),
                   device(QStringLiteral("d1"),
                          {ref(QStringLiteral("l2"), QStringLiteral("light")),
                           ref(QStringLiteral("zc"), QStringLiteral("zigbee_connectivity")),
                           ref(QStringLiteral("l1"), QStringLiteral("light"))}));

    Room room;
    room.id = QStringLiteral("r1");
    room.children = QList<ResourceIdentifier>{ref(QStringLiteral("d1"), QStringLiteral("device")),
                                              ref(QStringLiteral("gone"), QStringLiteral("device"))};
    room.services = QList<ResourceIdentifier>{ref(QStringLiteral("g1"), QStringLiteral("grouped_light"))};

    const QList<ResolvedRoom> resolved = resolveRooms({room}, devices, lights);
    ASSERT_EQ(resolved.size(), 1);
    EXPECT_EQ(resolved.first().id, QStringLiteral("r1"));
    EXPECT_EQ(ids(resolved.first().children), QStringList({QStringLiteral("l2"), QStringLiteral("l1")}));
    ASSERT_EQ(resolved.first().services.size(), 1);
    EXPECT_EQ(resolved.first().services.first().rid, QStringLiteral("g1"));
}

TEST(ResolveRooms, MissingLightOfKnownDeviceIsDropped)
{
    QHash<QString, Light> lights;
    lights.insert(QStringLiteral("l1"), light(QStringLiteral("l1")));

    QHash<QString, Device> devices;
    devices.insert(QStringLiteral("d1"),
                   device(QStringLiteral("d1"),
                          {ref(QStringLiteral("l1"), QStringLiteral("light")),
                           ref(QStringLiteral("deleted"), QStringLiteral("light"))}));
    devices.insert(QStringLiteral("d2"), device(QStringLiteral("d2"), {}));

    Room room;
    room.id = QStringLiteral("r1");
    room.children = QList<ResourceIdentifier>{ref(QStringLiteral("d2"), QStringLiteral("device")),
                                              ref(QStringLiteral("d1"), QStringLiteral("device"))};

    Room empty;
    empty.id = QStringLiteral("r2");

    const QList<ResolvedRoom> resolved = resolveRooms({room, empty}, devices, lights);
    ASSERT_EQ(resolved.size(), 2);
    EXPECT_EQ(ids(resolved.at(0).children), QStringList({QStringLiteral("l1")}));
    EXPECT_TRUE(resolved.at(1).children.isEmpty());
}

TEST(ResolveZones, ChildrenAreLights)
{
    QHash<QString, Light> lights;
    lights.insert(QStringLiteral("l1"), light(QStringLiteral("l1")));
    lights.insert(QStringLiteral("l3"), light(QStringLiteral("l3")));

    Zone zone;
    zone.id = QStringLiteral("z1");
    zone.children = QList<ResourceIdentifier>{ref(QStringLiteral("l3"), QStringLiteral("light")),
                                              ref(QStringLiteral("l9"), QStringLiteral("light")),
                                              ref(QStringLiteral("l1"), QStringLiteral("light"))};

    const QList<ResolvedZone> resolved = resolveZones({zone}, lights);
    ASSERT_EQ(resolved.size(), 1);
    EXPECT_EQ(ids(resolved.first().children), QStringList({QStringLiteral("l3"), QStringLiteral("l1")}));
}

TEST(ResolveAll, FetchesAndPreservesRoomOrder)
{
    FakeTransport transport;
    transport.respond("GET", QStringLiteral("/clip/v2/resource/device"), 200, R"({"errors": [], "data": [
        {"id": "d1", "services": [{"rid": "l1", "rtype": "light"}, {"rid": "l2", "rtype": "light"}]}]})");
    transport.respond("GET", QStringLiteral("/clip/v2/resource/light"), 200, R"({"errors": [], "data": [
        {"id": "l2"}, {"id": "l1"}]})");
    transport.respond("GET", QStringLiteral("/clip/v2/resource/room"), 200, R"({"errors": [], "data": [
        {"id": "r2", "children": [{"rid": "d1", "rtype": "device"}, {"rid": "dx", "rtype": "device"}],
         "metadata": {"name": "Kitchen"}},
        {"id": "r1", "children": []}]})");

    ConnectionSettings settings;
    settings.host = QStringLiteral("bridge");
    settings.appKey = QStringLiteral("key");
    const Bridge bridge(transport, settings);

    QList<ResolvedRoom> rooms;
    Error error;
    ASSERT_TRUE(resolveAllRooms(bridge, &rooms, &error)) << error.toString().toStdString();
    ASSERT_EQ(rooms.size(), 2);
    EXPECT_EQ(rooms.at(0).id, QStringLiteral("r1"));
    EXPECT_EQ(rooms.at(1).id, QStringLiteral("r2"));
    EXPECT_EQ(*rooms.at(1).metadata->name, QStringLiteral("Kitchen"));
    EXPECT_EQ(ids(rooms.at(1).children), QStringList({QStringLiteral("l1"), QStringLiteral("l2")}));

    ASSERT_EQ(transport.requests().size(), 3);
    EXPECT_EQ(transport.requests().at(0).path, QStringLiteral("/clip/v2/resource/device"));
    EXPECT_EQ(transport.requests().at(1).path, QStringLiteral("/clip/v2/resource/light"));
    EXPECT_EQ(transport.requests().at(2).path, QStringLiteral("/clip/v2/resource/room"));
}

TEST(ResolveAll, FetchFailureAborts)
{
    FakeTransport transport;
    transport.respond("GET", QStringLiteral("/clip/v2/resource/light"), 200, R"({"errors": [], "data": []})");
    transport.respond("GET", QStringLiteral("/clip/v2/resource/zone"), 503, "");

    ConnectionSettings settings;
    settings.host = QStringLiteral("bridge");
    const Bridge bridge(transport, settings);

    QList<ResolvedZone> zones;
    Error error;
    EXPECT_FALSE(resolveAllZones(bridge, &zones, &error));
    EXPECT_EQ(error.kind, ErrorKind::HttpStatus);
    EXPECT_EQ(error.code, 503);
}
