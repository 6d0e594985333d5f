#pragma once

#include <variant>

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QNetworkReply>
#include <QPointer>
#include <QString>

#include "hue_error.h"
#include "hue_http.h"
#include "hue_model.h"

namespace hueclient {

enum class EventKind {
    Update,
    Add,
    Delete,
    Error,
    Unknown
};

EventKind eventKindFromString(const QString &value);
QString eventKindName(EventKind kind);

// A resource whose type this client does not model. Kept verbatim.
struct UnknownResource {
    QString type;
    QJsonObject raw;
};

using EventData = std::variant<UnknownResource,
                               BridgeHome,
                               Device,
                               GroupedLight,
                               Light,
                               Room,
                               Scene,
                               SmartScene,
                               Zone>;

QString resourceTypeOf(const EventData &data);
QString resourceIdOf(const EventData &data);

struct Event {
    EventKind kind = EventKind::Unknown;
    QString id;
    QString creationTime;
    QList<EventData> data;
};

// Decodes one resource of an event by its `type` tag.
bool decodeEventData(const QJsonObject &obj, EventData *out, QString *error = nullptr);

// Decodes the body of one stream message: a JSON array of events.
bool decodeEventMessage(const QByteArray &body, QList<Event> *out, QString *error = nullptr);

struct StreamEvent {
    enum class Kind {
        Events,
        Error
    };

    Kind kind = Kind::Events;
    QList<Event> events;
    QString error;
};

// Incremental text/event-stream parser. Bytes go in through feed(), decoded
// messages come out of takeNext() one at a time. A message that fails to
// decode comes out as an Error event and parsing continues with the next one.
class EventStreamDecoder
{
public:
    void feed(const QByteArray &chunk);

    // Ends the stream: one Error event carrying `reason` follows any
    // messages still buffered, then atEnd() turns true.
    void finish(const QString &reason);

    bool takeNext(StreamEvent *out);
    bool atEnd() const { return m_ended; }

private:
    bool takeLine(QByteArray *line);
    void dispatch(StreamEvent *out);

    QByteArray m_buffer;
    QByteArray m_data;
    bool m_hasData = false;
    bool m_finished = false;
    bool m_ended = false;
    QString m_finishReason;
};

// Live `/eventstream/clip/v2` feed. Single consumer, pull based, no
// reconnect: after a stream-level failure next() yields one Error event and
// then returns false.
class EventStream
{
public:
    EventStream(const HttpClient &client, ConnectionSettings settings);
    ~EventStream();

    EventStream(const EventStream &) = delete;
    EventStream &operator=(const EventStream &) = delete;

    bool open(Error *error = nullptr);

    // Blocks until the next batch, an error event, or the end of the feed.
    bool next(StreamEvent *out);

    // A closed or ended stream cannot be reopened.
    void close();
    bool isOpen() const { return !m_reply.isNull(); }

private:
    void finishFromReply();
    bool checkStatus();
    void releaseReply();

    const HttpClient &m_client;
    ConnectionSettings m_settings;
    QPointer<QNetworkReply> m_reply;
    EventStreamDecoder m_decoder;
    bool m_statusChecked = false;
    bool m_closed = false;
};

} // namespace hueclient
