#pragma once

#include <QString>

#include "hue_model.h"

namespace hueclient {

// Parses a light state written as one of
//   on | off | bri:<0-100> | ct:<mirek>[:<bri>] | xy:<x>,<y>[:<bri>] | #RRGGBB[:<bri>]
// Colour and brightness states also switch the light on; `bri:0` switches it off.
bool parseLightState(const QString &text, LightCommand *out, QString *error = nullptr);

} // namespace hueclient
