#pragma once

#include <QString>

#include "hue_error.h"
#include "hue_http.h"

namespace hueclient {

inline constexpr int kLinkButtonNotPressed = 101;

struct Registration {
    QString appKey;
    QString clientKey;
};

// `hueclient#<hostname>`, the bridge limits device types to 40 characters.
QString defaultDeviceType();

// POST /api with the given device type. Requires the bridge's link button to
// have been pressed shortly before; otherwise fails with a Protocol error of
// code kLinkButtonNotPressed.
bool registerApplication(const HttpTransport &transport,
                         const ConnectionSettings &settings,
                         const QString &deviceType,
                         Registration *out,
                         Error *error = nullptr,
                         bool generateClientKey = false,
                         int timeoutMs = kRequestTimeoutMs);

// Decodes the body of a registration response.
bool parseRegistrationResponse(const QByteArray &payload, Registration *out, Error *error = nullptr);

} // namespace hueclient
