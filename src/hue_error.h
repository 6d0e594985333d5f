#pragma once

#include <QString>

namespace hueclient {

enum class ErrorKind {
    None,
    Discovery,
    Transport,
    HttpStatus,
    Decode,
    Protocol
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    // Legacy bridge error type (101 = link button not pressed) or HTTP status.
    int code = 0;
    QString message;

    bool isError() const { return kind != ErrorKind::None; }
    QString toString() const;
};

QString errorKindName(ErrorKind kind);

// Fills *error when non-null and returns false, so callers can write
// `return fail(error, ...);`.
bool fail(Error *error, ErrorKind kind, const QString &message, int code = 0);

} // namespace hueclient
