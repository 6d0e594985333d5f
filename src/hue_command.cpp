#include "hue_command.h"

#include <QStringList>

namespace hueclient {

namespace {

bool setError(QString *error, const QString &message)
{
    if (error)
        *error = message;
    return false;
}

bool parseBrightness(const QString &text, double *out, QString *error)
{
    bool ok = false;
    const double value = text.toDouble(&ok);
    if (!ok || value < 0.0 || value > 100.0)
        return setError(error, QStringLiteral("Brightness must be a number between 0 and 100: %1").arg(text));
    *out = value;
    return true;
}

// Splits "<body>[:<bri>]" and applies the optional brightness.
bool applyTrailingBrightness(const QString &text, QString *body, LightCommand *command, QString *error)
{
    const int colon = text.lastIndexOf(QLatin1Char(':'));
    if (colon < 0) {
        *body = text;
        return true;
    }

    double brightness = 0.0;
    if (!parseBrightness(text.mid(colon + 1), &brightness, error))
        return false;
    command->withBrightness(brightness);
    *body = text.left(colon);
    return true;
}

} // namespace

bool parseLightState(const QString &text, LightCommand *out, QString *error)
{
    const QString state = text.trimmed().toLower();
    if (state.isEmpty())
        return setError(error, QStringLiteral("Empty light state"));

    LightCommand command;

    if (state == QLatin1String("on")) {
        command.turnOn();
    } else if (state == QLatin1String("off")) {
        command.turnOff();
    } else if (state.startsWith(QLatin1String("bri:"))) {
        double brightness = 0.0;
        if (!parseBrightness(state.mid(4), &brightness, error))
            return false;
        if (brightness > 0.0)
            command.turnOn().withBrightness(brightness);
        else
            command.turnOff();
    } else if (state.startsWith(QLatin1String("ct:"))) {
        QString body;
        if (!applyTrailingBrightness(state.mid(3), &body, &command, error))
            return false;
        bool ok = false;
        const int mirek = body.toInt(&ok);
        if (!ok || mirek < 153 || mirek > 500)
            return setError(error, QStringLiteral("Colour temperature must be 153-500 mirek: %1").arg(body));
        command.turnOn().withMirek(mirek);
    } else if (state.startsWith(QLatin1String("xy:"))) {
        QString body;
        if (!applyTrailingBrightness(state.mid(3), &body, &command, error))
            return false;
        const QStringList parts = body.split(QLatin1Char(','));
        bool okX = false;
        bool okY = false;
        const double x = parts.size() == 2 ? parts.at(0).toDouble(&okX) : 0.0;
        const double y = parts.size() == 2 ? parts.at(1).toDouble(&okY) : 0.0;
        if (!okX || !okY || x < 0.0 || x > 1.0 || y < 0.0 || y > 1.0)
            return setError(error, QStringLiteral("Expected xy:<x>,<y> with both in 0..1: %1").arg(body));
        command.turnOn().withXy(x, y);
    } else if (state.startsWith(QLatin1Char('#'))) {
        QString body;
        if (!applyTrailingBrightness(state.mid(1), &body, &command, error))
            return false;
        bool ok = false;
        const uint rgb = body.toUInt(&ok, 16);
        if (!ok || body.size() != 6)
            return setError(error, QStringLiteral("Expected #RRGGBB: #%1").arg(body));
        double x = 0.0;
        double y = 0.0;
        rgbToXy(((rgb >> 16) & 0xff) / 255.0, ((rgb >> 8) & 0xff) / 255.0, (rgb & 0xff) / 255.0, &x, &y);
        command.turnOn().withXy(x, y);
    } else {
        return setError(error, QStringLiteral("Unknown light state: %1").arg(text));
    }

    *out = command;
    return true;
}

} // namespace hueclient
