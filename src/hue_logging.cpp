#include "hue_logging.h"

Q_LOGGING_CATEGORY(hueDiscoveryLog, "hueclient.discovery");
Q_LOGGING_CATEGORY(hueHttpLog, "hueclient.http");
Q_LOGGING_CATEGORY(hueEventsLog, "hueclient.events");
