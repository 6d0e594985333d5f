#include "hue_events.h"

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkReply>
#include <QNetworkRequest>

#include "hue_logging.h"

namespace hueclient {

namespace {

template <typename T>
bool decodeTyped(const QJsonObject &obj, EventData *out, QString *error)
{
    T resource;
    if (!fromJson(obj, &resource, error))
        return false;
    *out = std::move(resource);
    return true;
}

struct TypeVisitor {
    QString operator()(const UnknownResource &resource) const { return resource.type; }

    template <typename T>
    QString operator()(const T &) const
    {
        return QString::fromLatin1(ResourceTraits<T>::kType);
    }
};

struct IdVisitor {
    QString operator()(const UnknownResource &resource) const
    {
        return resource.raw.value(QStringLiteral("id")).toString();
    }

    template <typename T>
    QString operator()(const T &resource) const
    {
        return resource.id;
    }
};

bool decodeEvent(const QJsonObject &obj, Event *out, QString *error)
{
    const QJsonValue type = obj.value(QStringLiteral("type"));
    if (!type.isString()) {
        if (error)
            *error = QStringLiteral("field 'type': expected a string");
        return false;
    }

    const QJsonValue data = obj.value(QStringLiteral("data"));
    if (!data.isArray()) {
        if (error)
            *error = QStringLiteral("field 'data': expected an array");
        return false;
    }

    Event event;
    event.kind = eventKindFromString(type.toString());
    event.id = obj.value(QStringLiteral("id")).toString();
    event.creationTime = obj.value(QStringLiteral("creationtime")).toString();

    const QJsonArray arr = data.toArray();
    for (int i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).isObject()) {
            if (error)
                *error = QStringLiteral("data[%1]: expected an object").arg(i);
            return false;
        }
        EventData item;
        QString itemError;
        if (!decodeEventData(arr.at(i).toObject(), &item, &itemError)) {
            if (error)
                *error = QStringLiteral("data[%1]: %2").arg(i).arg(itemError);
            return false;
        }
        event.data.append(std::move(item));
    }

    *out = std::move(event);
    return true;
}

} // namespace

EventKind eventKindFromString(const QString &value)
{
    if (value == QLatin1String("update"))
        return EventKind::Update;
    if (value == QLatin1String("add"))
        return EventKind::Add;
    if (value == QLatin1String("delete"))
        return EventKind::Delete;
    if (value == QLatin1String("error"))
        return EventKind::Error;
    return EventKind::Unknown;
}

QString eventKindName(EventKind kind)
{
    switch (kind) {
    case EventKind::Update:
        return QStringLiteral("update");
    case EventKind::Add:
        return QStringLiteral("add");
    case EventKind::Delete:
        return QStringLiteral("delete");
    case EventKind::Error:
        return QStringLiteral("error");
    case EventKind::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

QString resourceTypeOf(const EventData &data)
{
    return std::visit(TypeVisitor{}, data);
}

QString resourceIdOf(const EventData &data)
{
    return std::visit(IdVisitor{}, data);
}

bool decodeEventData(const QJsonObject &obj, EventData *out, QString *error)
{
    const QJsonValue typeValue = obj.value(QStringLiteral("type"));
    if (!typeValue.isString()) {
        if (error)
            *error = QStringLiteral("field 'type': expected a string");
        return false;
    }

    const QString type = typeValue.toString();
    if (type == QLatin1String(ResourceTraits<BridgeHome>::kType))
        return decodeTyped<BridgeHome>(obj, out, error);
    if (type == QLatin1String(ResourceTraits<Device>::kType))
        return decodeTyped<Device>(obj, out, error);
    if (type == QLatin1String(ResourceTraits<GroupedLight>::kType))
        return decodeTyped<GroupedLight>(obj, out, error);
    if (type == QLatin1String(ResourceTraits<Light>::kType))
        return decodeTyped<Light>(obj, out, error);
    if (type == QLatin1String(ResourceTraits<Room>::kType))
        return decodeTyped<Room>(obj, out, error);
    if (type == QLatin1String(ResourceTraits<Scene>::kType))
        return decodeTyped<Scene>(obj, out, error);
    if (type == QLatin1String(ResourceTraits<SmartScene>::kType))
        return decodeTyped<SmartScene>(obj, out, error);
    if (type == QLatin1String(ResourceTraits<Zone>::kType))
        return decodeTyped<Zone>(obj, out, error);

    *out = UnknownResource { type, obj };
    return true;
}

bool decodeEventMessage(const QByteArray &body, QList<Event> *out, QString *error)
{
    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QStringLiteral("Invalid JSON at offset %1: %2").arg(parseError.offset).arg(parseError.errorString());
        return false;
    }
    if (!doc.isArray()) {
        if (error)
            *error = QStringLiteral("Expected a JSON array of events");
        return false;
    }

    QList<Event> events;
    const QJsonArray arr = doc.array();
    for (int i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).isObject()) {
            if (error)
                *error = QStringLiteral("event[%1]: expected an object").arg(i);
            return false;
        }
        Event event;
        QString eventError;
        if (!decodeEvent(arr.at(i).toObject(), &event, &eventError)) {
            if (error)
                *error = QStringLiteral("event[%1]: %2").arg(i).arg(eventError);
            return false;
        }
        events.append(std::move(event));
    }

    *out = std::move(events);
    return true;
}

void EventStreamDecoder::feed(const QByteArray &chunk)
{
    if (!m_finished)
        m_buffer.append(chunk);
}

void EventStreamDecoder::finish(const QString &reason)
{
    if (m_finished)
        return;
    m_finished = true;
    m_finishReason = reason;
}

bool EventStreamDecoder::takeLine(QByteArray *line)
{
    const int newline = m_buffer.indexOf('\n');
    if (newline < 0)
        return false;

    int length = newline;
    if (length > 0 && m_buffer.at(length - 1) == '\r')
        --length;
    *line = m_buffer.left(length);
    m_buffer.remove(0, newline + 1);
    return true;
}

void EventStreamDecoder::dispatch(StreamEvent *out)
{
    QList<Event> events;
    QString decodeError;
    if (decodeEventMessage(m_data, &events, &decodeError)) {
        out->kind = StreamEvent::Kind::Events;
        out->events = std::move(events);
        out->error.clear();
    } else {
        qCWarning(hueEventsLog) << "Failed to decode event message:" << decodeError;
        out->kind = StreamEvent::Kind::Error;
        out->events.clear();
        out->error = decodeError;
    }

    m_data.clear();
    m_hasData = false;
}

bool EventStreamDecoder::takeNext(StreamEvent *out)
{
    if (m_ended)
        return false;

    QByteArray line;
    while (takeLine(&line)) {
        if (line.isEmpty()) {
            if (!m_hasData)
                continue;
            dispatch(out);
            return true;
        }

        // Comment, the bridge greets with ": hi".
        if (line.startsWith(':'))
            continue;

        const int colon = line.indexOf(':');
        const QByteArray field = colon < 0 ? line : line.left(colon);
        QByteArray value = colon < 0 ? QByteArray() : line.mid(colon + 1);
        if (value.startsWith(' '))
            value.remove(0, 1);

        if (field == "data") {
            if (m_hasData)
                m_data.append('\n');
            m_data.append(value);
            m_hasData = true;
        }
    }

    if (!m_finished)
        return false;

    // An unterminated trailing message is discarded with the connection.
    m_ended = true;
    out->kind = StreamEvent::Kind::Error;
    out->events.clear();
    out->error = m_finishReason;
    return true;
}

EventStream::EventStream(const HttpClient &client, ConnectionSettings settings)
    : m_client(client)
    , m_settings(std::move(settings))
{
}

EventStream::~EventStream()
{
    close();
}

bool EventStream::open(Error *error)
{
    if (m_reply)
        return true;
    if (m_closed)
        return fail(error, ErrorKind::Transport, QStringLiteral("Event stream already ended"));

    QString openError;
    QNetworkReply *reply = m_client.openStream(m_settings,
                                               QStringLiteral("/eventstream/clip/v2"),
                                               QByteArrayLiteral("text/event-stream"),
                                               &openError);
    if (!reply)
        return fail(error, ErrorKind::Transport, openError);

    m_reply = reply;
    qCInfo(hueEventsLog) << "Event stream opened on" << m_settings.host;
    return true;
}

bool EventStream::checkStatus()
{
    if (m_statusChecked || !m_reply)
        return true;

    const QVariant status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!status.isValid())
        return true;

    m_statusChecked = true;
    const int code = status.toInt();
    if (code >= 200 && code < 300)
        return true;

    qCWarning(hueEventsLog) << "Event stream rejected with HTTP" << code;
    m_decoder.finish(QStringLiteral("HTTP %1").arg(code));
    releaseReply();
    return false;
}

void EventStream::finishFromReply()
{
    if (!m_reply)
        return;

    m_decoder.feed(m_reply->readAll());

    QString reason;
    if (m_reply->error() != QNetworkReply::NoError)
        reason = m_reply->errorString();
    else
        reason = QStringLiteral("Event stream closed by the bridge");

    qCWarning(hueEventsLog) << "Event stream ended:" << reason;
    m_decoder.finish(reason);
    releaseReply();
}

void EventStream::releaseReply()
{
    if (!m_reply)
        return;
    QNetworkReply *reply = m_reply.data();
    m_reply.clear();
    m_closed = true;
    if (!reply->isFinished())
        reply->abort();
    reply->deleteLater();
}

bool EventStream::next(StreamEvent *out)
{
    for (;;) {
        if (m_decoder.takeNext(out))
            return true;
        if (m_decoder.atEnd() || !m_reply)
            return false;

        if (!checkStatus())
            continue;

        if (m_reply->bytesAvailable() > 0) {
            m_decoder.feed(m_reply->readAll());
            continue;
        }
        if (m_reply->isFinished()) {
            if (checkStatus())
                finishFromReply();
            continue;
        }

        QEventLoop loop;
        QObject::connect(m_reply.data(), &QNetworkReply::readyRead, &loop, &QEventLoop::quit);
        QObject::connect(m_reply.data(), &QNetworkReply::metaDataChanged, &loop, &QEventLoop::quit);
        QObject::connect(m_reply.data(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        QObject::connect(m_reply.data(), &QObject::destroyed, &loop, &QEventLoop::quit);
        loop.exec();
    }
}

void EventStream::close()
{
    if (!m_reply)
        return;
    qCInfo(hueEventsLog) << "Event stream closed";
    releaseReply();
}

} // namespace hueclient
