#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(hueDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(hueHttpLog)
Q_DECLARE_LOGGING_CATEGORY(hueEventsLog)
