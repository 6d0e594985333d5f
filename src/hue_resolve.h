#pragma once

#include <optional>

#include <QHash>
#include <QList>
#include <QString>

#include "hue_error.h"
#include "hue_model.h"

namespace hueclient {

class Bridge;

struct ResolvedRoom {
    QString id;
    std::optional<QString> idV1;
    std::optional<Metadata> metadata;
    QList<Light> children;
    QList<ResourceIdentifier> services;
};

struct ResolvedZone {
    QString id;
    std::optional<QString> idV1;
    std::optional<Metadata> metadata;
    QList<Light> children;
    QList<ResourceIdentifier> services;
};

// Room children are devices; each device contributes the lights it owns.
// References that do not resolve are dropped.
QList<ResolvedRoom> resolveRooms(const QList<Room> &rooms,
                                 const QHash<QString, Device> &devices,
                                 const QHash<QString, Light> &lights);

// Zone children reference lights directly.
QList<ResolvedZone> resolveZones(const QList<Zone> &zones, const QHash<QString, Light> &lights);

// Fetch devices, lights, then rooms (or zones) one after the other and join
// them. The three reads are not atomic: a resource changed between them
// shows up as a dropped reference.
bool resolveAllRooms(const Bridge &bridge, QList<ResolvedRoom> *out, Error *error = nullptr);
bool resolveAllZones(const Bridge &bridge, QList<ResolvedZone> *out, Error *error = nullptr);

} // namespace hueclient
