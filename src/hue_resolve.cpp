#include "hue_resolve.h"

#include "hue_bridge.h"
#include "hue_logging.h"

namespace hueclient {

namespace {

template <typename Resolved>
Resolved resolvedShell(const GroupResource &group)
{
    Resolved out;
    out.id = group.id;
    out.idV1 = group.idV1;
    out.metadata = group.metadata;
    out.services = group.services.value_or(QList<ResourceIdentifier>());
    return out;
}

} // namespace

QList<ResolvedRoom> resolveRooms(const QList<Room> &rooms,
                                 const QHash<QString, Device> &devices,
                                 const QHash<QString, Light> &lights)
{
    QList<ResolvedRoom> out;
    out.reserve(rooms.size());

    for (const Room &room : rooms) {
        ResolvedRoom resolved = resolvedShell<ResolvedRoom>(room);
        if (room.children) {
            for (const ResourceIdentifier &child : *room.children) {
                if (!child.rtype.isEmpty() && child.rtype != QLatin1String("device"))
                    continue;

                const auto deviceIt = devices.constFind(child.rid);
                if (deviceIt == devices.cend()) {
                    qCDebug(hueHttpLog) << "Room" << room.id << "references unknown device" << child.rid;
                    continue;
                }

                for (const QString &lightId : deviceIt->lightIds()) {
                    const auto lightIt = lights.constFind(lightId);
                    if (lightIt != lights.cend())
                        resolved.children.append(*lightIt);
                }
            }
        }
        out.append(std::move(resolved));
    }

    return out;
}

QList<ResolvedZone> resolveZones(const QList<Zone> &zones, const QHash<QString, Light> &lights)
{
    QList<ResolvedZone> out;
    out.reserve(zones.size());

    for (const Zone &zone : zones) {
        ResolvedZone resolved = resolvedShell<ResolvedZone>(zone);
        if (zone.children) {
            for (const ResourceIdentifier &child : *zone.children) {
                const auto lightIt = lights.constFind(child.rid);
                if (lightIt != lights.cend())
                    resolved.children.append(*lightIt);
            }
        }
        out.append(std::move(resolved));
    }

    return out;
}

bool resolveAllRooms(const Bridge &bridge, QList<ResolvedRoom> *out, Error *error)
{
    QHash<QString, Device> devices;
    if (!bridge.indexDevices(&devices, error))
        return false;

    QHash<QString, Light> lights;
    if (!bridge.indexLights(&lights, error))
        return false;

    QList<Room> rooms;
    if (!bridge.rooms(&rooms, error))
        return false;

    *out = resolveRooms(rooms, devices, lights);
    return true;
}

bool resolveAllZones(const Bridge &bridge, QList<ResolvedZone> *out, Error *error)
{
    QHash<QString, Light> lights;
    if (!bridge.indexLights(&lights, error))
        return false;

    QList<Zone> zones;
    if (!bridge.zones(&zones, error))
        return false;

    *out = resolveZones(zones, lights);
    return true;
}

} // namespace hueclient
