#pragma once

#include <optional>

#include <QByteArray>
#include <QHostAddress>
#include <QList>
#include <QString>

namespace hueclient::dns {

inline constexpr quint16 kTypeA = 1;
inline constexpr quint16 kTypePtr = 12;
inline constexpr quint16 kClassIn = 1;

// Top bit of the question class (QU, RFC 6762 5.4) and of the record class
// (cache-flush, RFC 6762 10.2).
inline constexpr quint16 kClassTopBit = 0x8000;

struct Header {
    quint16 id = 0;
    quint16 flags = 0;
    quint16 questionCount = 0;
    quint16 answerCount = 0;
    quint16 authorityCount = 0;
    quint16 additionalCount = 0;
};

struct Question {
    QString name;
    quint16 type = 0;
    quint16 qclass = 0;
    bool unicastResponse = false;
};

struct Record {
    QString name;
    quint16 type = 0;
    quint16 rclass = 0;
    bool cacheFlush = false;
    quint32 ttl = 0;
    QByteArray data;

    // Decoded payload for the record types this codec understands.
    QString ptrName;
    QHostAddress address;
};

struct Packet {
    Header header;
    QList<Question> questions;
    QList<Record> answers;
    QList<Record> authorities;
    QList<Record> additional;
};

// Builds a single-question PTR/IN query. Returns an empty array if the
// service name is not a valid DNS name.
QByteArray buildPtrQuery(quint16 id, const QString &serviceName, bool unicastResponse = true);

// Parses an arbitrary datagram. Returns false for anything that is not a
// well-formed DNS message; never throws.
bool parsePacket(const QByteArray &datagram, Packet *out);

// Accepts a response when the transaction id matches and at least one answer
// is a PTR record named after the queried service. The address is the first
// A record of the additional section (RFC 6763 12.1).
std::optional<QHostAddress> validateResponse(const Packet &packet,
                                             const QString &serviceName,
                                             quint16 queryId);
std::optional<QHostAddress> validateResponse(const QByteArray &datagram,
                                             const QString &serviceName,
                                             quint16 queryId);

} // namespace hueclient::dns
