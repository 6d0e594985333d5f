#pragma once

#include <variant>

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include "hue_error.h"

namespace hueclient {

struct LegacyError {
    int type = 0;
    QString address;
    QString description;
};

// Decodes `{"error": {"type", "address", "description"}}`.
bool fromJson(const QJsonObject &obj, LegacyError *out, QString *error = nullptr);

bool parseJsonPayload(const QByteArray &payload, QJsonDocument *out, Error *error);

// Descriptions of the `errors` array of a current-generation response.
bool decodeResourceErrors(const QJsonObject &root, QStringList *descriptions, Error *error);

// Legacy (/api) response shape. Decoding tries, in order: a single T object,
// an array whose every element is a T, an array of error entries.
template <typename T>
class LegacyEnvelope
{
public:
    using Value = std::variant<T, QList<T>, QList<LegacyError>>;

    static bool decode(const QByteArray &payload, LegacyEnvelope *out, Error *error);

    // A list yields its last element, the bridge puts the authoritative
    // result of a batch last. An error list surfaces its last entry.
    bool get(T *out, Error *error) const;

    const Value &value() const { return m_value; }

private:
    Value m_value;
};

// Current (/clip/v2) response shape: `{ "errors": [...], "data": [...] }`.
template <typename T>
class ResourceEnvelope
{
public:
    static bool decode(const QByteArray &payload, ResourceEnvelope *out, Error *error);

    // A non-empty `errors` wins over `data`. An empty `data` is a valid,
    // empty result.
    bool get(QList<T> *out, Error *error) const;

    const QStringList &errors() const { return m_errors; }
    const QList<T> &data() const { return m_data; }

private:
    QStringList m_errors;
    QList<T> m_data;
};

namespace detail {

template <typename T>
bool decodeArrayAs(const QJsonArray &arr, QList<T> *out)
{
    QList<T> items;
    items.reserve(arr.size());
    for (const QJsonValue &value : arr) {
        if (!value.isObject())
            return false;
        T item;
        if (!fromJson(value.toObject(), &item, nullptr))
            return false;
        items.append(std::move(item));
    }
    *out = std::move(items);
    return true;
}

} // namespace detail

template <typename T>
bool LegacyEnvelope<T>::decode(const QByteArray &payload, LegacyEnvelope *out, Error *error)
{
    QJsonDocument doc;
    if (!parseJsonPayload(payload, &doc, error))
        return false;

    if (doc.isObject()) {
        T element;
        QString decodeError;
        if (!fromJson(doc.object(), &element, &decodeError))
            return fail(error, ErrorKind::Decode, QStringLiteral("Unexpected response object: %1").arg(decodeError));
        out->m_value = std::move(element);
        return true;
    }

    if (!doc.isArray())
        return fail(error, ErrorKind::Decode, QStringLiteral("Expected a JSON object or array"));

    const QJsonArray arr = doc.array();
    QList<T> elements;
    if (detail::decodeArrayAs(arr, &elements)) {
        out->m_value = std::move(elements);
        return true;
    }

    QList<LegacyError> errors;
    if (detail::decodeArrayAs(arr, &errors)) {
        out->m_value = std::move(errors);
        return true;
    }

    return fail(error, ErrorKind::Decode, QStringLiteral("Response array did not match any known shape"));
}

template <typename T>
bool LegacyEnvelope<T>::get(T *out, Error *error) const
{
    if (const auto *element = std::get_if<T>(&m_value)) {
        *out = *element;
        return true;
    }
    if (const auto *list = std::get_if<QList<T>>(&m_value)) {
        if (list->isEmpty())
            return fail(error, ErrorKind::Protocol, QStringLiteral("expected non-empty array"));
        *out = list->constLast();
        return true;
    }

    // Empty arrays always decode as an element list, so this is never empty.
    const QList<LegacyError> &errors = std::get<QList<LegacyError>>(m_value);
    const LegacyError &last = errors.constLast();
    return fail(error, ErrorKind::Protocol, last.description, last.type);
}

template <typename T>
bool ResourceEnvelope<T>::decode(const QByteArray &payload, ResourceEnvelope *out, Error *error)
{
    QJsonDocument doc;
    if (!parseJsonPayload(payload, &doc, error))
        return false;
    if (!doc.isObject())
        return fail(error, ErrorKind::Decode, QStringLiteral("Expected a JSON object"));

    const QJsonObject root = doc.object();
    QStringList errors;
    if (!decodeResourceErrors(root, &errors, error))
        return false;

    const QJsonValue data = root.value(QStringLiteral("data"));
    if (!data.isArray())
        return fail(error, ErrorKind::Decode, QStringLiteral("field 'data': expected an array"));

    QList<T> items;
    if (errors.isEmpty()) {
        const QJsonArray arr = data.toArray();
        items.reserve(arr.size());
        for (int i = 0; i < arr.size(); ++i) {
            const QJsonValue value = arr.at(i);
            if (!value.isObject())
                return fail(error, ErrorKind::Decode, QStringLiteral("data[%1]: expected an object").arg(i));
            T item;
            QString decodeError;
            if (!fromJson(value.toObject(), &item, &decodeError))
                return fail(error, ErrorKind::Decode, QStringLiteral("data[%1]: %2").arg(i).arg(decodeError));
            items.append(std::move(item));
        }
    }

    out->m_errors = std::move(errors);
    out->m_data = std::move(items);
    return true;
}

template <typename T>
bool ResourceEnvelope<T>::get(QList<T> *out, Error *error) const
{
    if (!m_errors.isEmpty())
        return fail(error, ErrorKind::Protocol, m_errors.constLast());
    *out = m_data;
    return true;
}

} // namespace hueclient
