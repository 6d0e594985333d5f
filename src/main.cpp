#include <atomic>
#include <csignal>
#include <iostream>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QNetworkAccessManager>
#include <QProcessEnvironment>
#include <QTimer>

#include "hue_bridge.h"
#include "hue_command.h"
#include "hue_config.h"
#include "hue_discovery.h"
#include "hue_events.h"
#include "hue_http.h"
#include "hue_registration.h"
#include "hue_resolve.h"

using namespace hueclient;

namespace {

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

std::ostream &operator<<(std::ostream &os, const QString &value)
{
    return os << value.toStdString();
}

QString optionalText(const std::optional<QString> &value)
{
    return value.value_or(QStringLiteral("-"));
}

template <typename T>
QString nameOf(const T &resource)
{
    if (resource.metadata && resource.metadata->name)
        return *resource.metadata->name;
    return QStringLiteral("-");
}

int reportError(const Error &error)
{
    std::cerr << "error: " << error.toString() << '\n';
    return 1;
}

QString describeLight(const Light &light)
{
    QString state = light.on ? (light.on->on ? QStringLiteral("on") : QStringLiteral("off")) : QStringLiteral("?");
    if (light.dimming)
        state += QStringLiteral(" %1%").arg(light.dimming->brightness, 0, 'f', 1);
    if (light.colorTemperature && light.colorTemperature->mirek)
        state += QStringLiteral(" ct=%1").arg(*light.colorTemperature->mirek);
    if (light.color && light.color->xy)
        state += QStringLiteral(" xy=%1,%2").arg(light.color->xy->x, 0, 'f', 4).arg(light.color->xy->y, 0, 'f', 4);
    return QStringLiteral("%1  %2  %3").arg(light.id, nameOf(light), state);
}

int listCollection(const Bridge &bridge, const QString &command)
{
    Error error;
    if (command == QLatin1String("devices")) {
        QList<Device> devices;
        if (!bridge.devices(&devices, &error))
            return reportError(error);
        for (const Device &device : devices) {
            const QString product = device.productData ? optionalText(device.productData->productName) : QStringLiteral("-");
            std::cout << device.id << "  " << nameOf(device) << "  " << product << "  lights="
                      << device.lightIds().join(QLatin1Char(',')) << '\n';
        }
    } else if (command == QLatin1String("lights")) {
        QList<Light> lights;
        if (!bridge.lights(&lights, &error))
            return reportError(error);
        for (const Light &light : lights)
            std::cout << describeLight(light) << '\n';
    } else if (command == QLatin1String("rooms")) {
        QList<ResolvedRoom> rooms;
        if (!resolveAllRooms(bridge, &rooms, &error))
            return reportError(error);
        for (const ResolvedRoom &room : rooms) {
            std::cout << room.id << "  " << nameOf(room) << '\n';
            for (const Light &light : room.children)
                std::cout << "    " << describeLight(light) << '\n';
        }
    } else if (command == QLatin1String("zones")) {
        QList<ResolvedZone> zones;
        if (!resolveAllZones(bridge, &zones, &error))
            return reportError(error);
        for (const ResolvedZone &zone : zones) {
            std::cout << zone.id << "  " << nameOf(zone) << '\n';
            for (const Light &light : zone.children)
                std::cout << "    " << describeLight(light) << '\n';
        }
    } else if (command == QLatin1String("scenes")) {
        QList<Scene> scenes;
        if (!bridge.scenes(&scenes, &error))
            return reportError(error);
        for (const Scene &scene : scenes) {
            const QString group = scene.group ? scene.group->rid : QStringLiteral("-");
            std::cout << scene.id << "  " << nameOf(scene) << "  group=" << group << '\n';
        }
    } else {
        QList<SmartScene> scenes;
        if (!bridge.smartScenes(&scenes, &error))
            return reportError(error);
        for (const SmartScene &scene : scenes)
            std::cout << scene.id << "  " << nameOf(scene) << "  " << optionalText(scene.state) << '\n';
    }
    return 0;
}

int runEvents(const HttpClient &http, const ConnectionSettings &settings)
{
    EventStream stream(http, settings);
    Error error;
    if (!stream.open(&error))
        return reportError(error);

    QTimer stopPoll;
    QObject::connect(&stopPoll, &QTimer::timeout, [&stream]() {
        if (!g_running.load())
            stream.close();
    });
    stopPoll.start(250);

    StreamEvent item;
    while (stream.next(&item)) {
        if (item.kind == StreamEvent::Kind::Error) {
            std::cerr << "event error: " << item.error << '\n';
            continue;
        }
        for (const Event &event : item.events) {
            for (const EventData &data : event.data)
                std::cout << eventKindName(event.kind) << "  " << resourceTypeOf(data) << "  " << resourceIdOf(data)
                          << '\n';
        }
        std::cout.flush();
    }
    return g_running.load() ? 1 : 0;
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("hueclient-cli"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Discover and control a Hue bridge."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("JSON configuration file."), QStringLiteral("path"));
    const QCommandLineOption hostOption(QStringLiteral("host"), QStringLiteral("Bridge address; discovered when absent."), QStringLiteral("host"));
    const QCommandLineOption portOption(QStringLiteral("port"), QStringLiteral("Bridge port."), QStringLiteral("port"));
    const QCommandLineOption keyOption(QStringLiteral("app-key"), QStringLiteral("Hue application key."), QStringLiteral("key"));
    const QCommandLineOption caOption(QStringLiteral("ca-file"), QStringLiteral("PEM trust anchor for the bridge."), QStringLiteral("path"));
    const QCommandLineOption plainOption(QStringLiteral("no-tls"), QStringLiteral("Use plain HTTP."));
    const QCommandLineOption insecureOption(QStringLiteral("insecure"), QStringLiteral("Do not verify the bridge certificate."));
    const QCommandLineOption mdnsOnlyOption(QStringLiteral("mdns-only"), QStringLiteral("Discover over mDNS without the cloud fallback."));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")}, QStringLiteral("Enable debug logging."));
    parser.addOptions({configOption, hostOption, portOption, keyOption, caOption, plainOption, insecureOption, mdnsOnlyOption, verboseOption});

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("discover | register [name] | devices | lights | rooms | zones | scenes | "
                                                "smart-scenes | light <id> <state> [ms] | group <id> <state> [ms] | "
                                                "scene <id> | smart-scene <id> | events"));
    parser.process(app);

    ClientConfig config;
    Error error;
    if (parser.isSet(configOption) && !loadConfigFile(parser.value(configOption), &config, &error))
        return reportError(error);
    applyEnvironment(QProcessEnvironment::systemEnvironment(), &config);

    if (parser.isSet(hostOption))
        config.host = parser.value(hostOption).trimmed();
    if (parser.isSet(portOption))
        config.port = parser.value(portOption).toInt();
    if (parser.isSet(keyOption))
        config.appKey = parser.value(keyOption).trimmed();
    if (parser.isSet(caOption))
        config.caCertificateFile = parser.value(caOption);
    if (parser.isSet(plainOption))
        config.useTls = false;
    if (parser.isSet(insecureOption))
        config.verifyPeer = false;
    if (parser.isSet(mdnsOnlyOption))
        config.mdnsOnly = true;
    applyLogRules(config, parser.isSet(verboseOption));

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);
    const QString command = args.first();

    QNetworkAccessManager network;
    HttpClient http(&network);

    if (config.host.isEmpty() || command == QLatin1String("discover")) {
        BridgeAddress address;
        if (!discoverBridge(http, config, &address, &error))
            return reportError(error);
        if (command == QLatin1String("discover")) {
            std::cout << address.ip.toString() << "  " << optionalText(address.id) << '\n';
            return 0;
        }
        config.host = address.ip.toString();
    }

    ConnectionSettings settings;
    if (!connectionSettings(config, &settings, &error))
        return reportError(error);

    if (command == QLatin1String("register")) {
        Registration registration;
        const QString deviceType = args.size() > 1 ? args.at(1) : defaultDeviceType();
        if (!registerApplication(http, settings, deviceType, &registration, &error, false, config.requestTimeoutMs))
            return reportError(error);
        std::cout << registration.appKey << '\n';
        return 0;
    }

    if (settings.appKey.isEmpty()) {
        std::cerr << "error: an application key is required (--app-key or HUECLIENT_APP_KEY)\n";
        return 1;
    }

    if (command == QLatin1String("events"))
        return runEvents(http, settings);

    const Bridge bridge(http, settings, config.requestTimeoutMs);

    static const QStringList listCommands = {QStringLiteral("devices"), QStringLiteral("lights"), QStringLiteral("rooms"),
                                             QStringLiteral("zones"),   QStringLiteral("scenes"), QStringLiteral("smart-scenes")};
    if (listCommands.contains(command))
        return listCollection(bridge, command);

    if (command == QLatin1String("light") || command == QLatin1String("group")) {
        if (args.size() < 3) {
            std::cerr << "usage: " << command << " <id> <state> [transition-ms]\n";
            return 1;
        }
        LightCommand lightCommand;
        QString parseError;
        if (!parseLightState(args.at(2), &lightCommand, &parseError)) {
            std::cerr << "error: " << parseError << '\n';
            return 1;
        }
        if (args.size() > 3) {
            bool ok = false;
            const int transitionMs = args.at(3).toInt(&ok);
            if (!ok || transitionMs < 0) {
                std::cerr << "error: invalid transition time: " << args.at(3) << '\n';
                return 1;
            }
            lightCommand.withTransitionTime(transitionMs);
        }

        const bool ok = command == QLatin1String("light")
            ? bridge.setLightState(args.at(1), lightCommand, &error)
            : bridge.setGroupState(args.at(1), lightCommand, &error);
        return ok ? 0 : reportError(error);
    }

    if (command == QLatin1String("scene") || command == QLatin1String("smart-scene")) {
        if (args.size() < 2) {
            std::cerr << "usage: " << command << " <id>\n";
            return 1;
        }
        const bool ok = command == QLatin1String("scene") ? bridge.recallScene(args.at(1), &error)
                                                          : bridge.recallSmartScene(args.at(1), &error);
        return ok ? 0 : reportError(error);
    }

    std::cerr << "unknown command: " << command << '\n';
    return 1;
}
