#include "hue_envelope.h"

#include <QJsonParseError>
#include <QJsonValue>

namespace hueclient {

bool fromJson(const QJsonObject &obj, LegacyError *out, QString *error)
{
    const QJsonValue inner = obj.value(QStringLiteral("error"));
    if (!inner.isObject()) {
        if (error)
            *error = QStringLiteral("field 'error': expected an object");
        return false;
    }

    const QJsonObject errObj = inner.toObject();
    const QJsonValue type = errObj.value(QStringLiteral("type"));
    const QJsonValue description = errObj.value(QStringLiteral("description"));
    if (!type.isDouble() || !description.isString()) {
        if (error)
            *error = QStringLiteral("error entry needs a numeric 'type' and a 'description'");
        return false;
    }

    out->type = type.toInt();
    out->description = description.toString();
    out->address = errObj.value(QStringLiteral("address")).toString();
    return true;
}

bool parseJsonPayload(const QByteArray &payload, QJsonDocument *out, Error *error)
{
    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail(error,
                    ErrorKind::Decode,
                    QStringLiteral("Invalid JSON at offset %1: %2").arg(parseError.offset).arg(parseError.errorString()));
    }
    *out = doc;
    return true;
}

bool decodeResourceErrors(const QJsonObject &root, QStringList *descriptions, Error *error)
{
    const QJsonValue errors = root.value(QStringLiteral("errors"));
    if (!errors.isArray())
        return fail(error, ErrorKind::Decode, QStringLiteral("field 'errors': expected an array"));

    QStringList out;
    const QJsonArray arr = errors.toArray();
    for (int i = 0; i < arr.size(); ++i) {
        const QJsonValue description = arr.at(i).toObject().value(QStringLiteral("description"));
        if (!description.isString())
            return fail(error, ErrorKind::Decode, QStringLiteral("errors[%1]: missing 'description'").arg(i));
        out.append(description.toString());
    }

    *descriptions = std::move(out);
    return true;
}

} // namespace hueclient
