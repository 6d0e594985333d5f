#include "hue_error.h"

namespace hueclient {

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return QStringLiteral("none");
    case ErrorKind::Discovery:
        return QStringLiteral("discovery");
    case ErrorKind::Transport:
        return QStringLiteral("transport");
    case ErrorKind::HttpStatus:
        return QStringLiteral("http");
    case ErrorKind::Decode:
        return QStringLiteral("decode");
    case ErrorKind::Protocol:
        return QStringLiteral("protocol");
    }
    return QStringLiteral("unknown");
}

QString Error::toString() const
{
    if (code != 0)
        return QStringLiteral("%1 error %2: %3").arg(errorKindName(kind)).arg(code).arg(message);
    return QStringLiteral("%1 error: %2").arg(errorKindName(kind), message);
}

bool fail(Error *error, ErrorKind kind, const QString &message, int code)
{
    if (error) {
        error->kind = kind;
        error->code = code;
        error->message = message;
    }
    return false;
}

} // namespace hueclient
