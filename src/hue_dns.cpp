#include "hue_dns.h"

#include <QStringList>

namespace hueclient::dns {

namespace {

constexpr int kHeaderSize = 12;
constexpr int kMaxLabelLength = 63;
constexpr int kMaxNameLength = 255;
constexpr int kMaxCompressionJumps = 16;

void writeU16(QByteArray *buffer, quint16 value)
{
    buffer->append(static_cast<char>(value >> 8));
    buffer->append(static_cast<char>(value & 0xFF));
}

bool writeName(QByteArray *buffer, const QString &name)
{
    const QByteArray encoded = name.toUtf8();
    if (encoded.size() > kMaxNameLength)
        return false;

    int labels = 0;
    for (const QByteArray &label : encoded.split('.')) {
        if (label.isEmpty())
            continue;
        if (label.size() > kMaxLabelLength)
            return false;
        buffer->append(static_cast<char>(label.size()));
        buffer->append(label);
        ++labels;
    }
    buffer->append('\0');
    return labels > 0;
}

QString normalizedName(const QString &name)
{
    QString out = name.trimmed();
    while (out.endsWith(QLatin1Char('.')))
        out.chop(1);
    return out;
}

class Reader
{
public:
    explicit Reader(const QByteArray &data)
        : m_data(data)
    {
    }

    int position() const { return m_pos; }
    void skip(int count) { m_pos += count; }
    bool hasBytes(int count) const { return count >= 0 && m_pos + count <= m_data.size(); }
    QByteArray peek(int count) const { return m_data.mid(m_pos, count); }

    bool readU16(quint16 *value)
    {
        if (!hasBytes(2))
            return false;
        *value = static_cast<quint16>((byteAt(m_pos) << 8) | byteAt(m_pos + 1));
        m_pos += 2;
        return true;
    }

    bool readU32(quint32 *value)
    {
        if (!hasBytes(4))
            return false;
        *value = (static_cast<quint32>(byteAt(m_pos)) << 24)
            | (static_cast<quint32>(byteAt(m_pos + 1)) << 16)
            | (static_cast<quint32>(byteAt(m_pos + 2)) << 8)
            | static_cast<quint32>(byteAt(m_pos + 3));
        m_pos += 4;
        return true;
    }

    // Reads a possibly compressed name starting at the current position and
    // leaves the position right after the name as it appears in place.
    bool readName(QString *name)
    {
        int end = -1;
        if (!decodeNameAt(m_pos, name, &end))
            return false;
        m_pos = end;
        return true;
    }

    bool decodeNameAt(int offset, QString *name, int *endOffset) const
    {
        QStringList labels;
        int pos = offset;
        int jumps = 0;
        int totalLength = 0;
        int end = -1;

        while (true) {
            if (pos < 0 || pos >= m_data.size())
                return false;
            const quint8 length = byteAt(pos);

            if (length == 0) {
                if (end < 0)
                    end = pos + 1;
                break;
            }

            if ((length & 0xC0) == 0xC0) {
                if (pos + 1 >= m_data.size())
                    return false;
                if (++jumps > kMaxCompressionJumps)
                    return false;
                if (end < 0)
                    end = pos + 2;
                pos = ((length & 0x3F) << 8) | byteAt(pos + 1);
                continue;
            }

            // 0x40 and 0x80 label types are reserved.
            if (length > kMaxLabelLength)
                return false;
            if (pos + 1 + length > m_data.size())
                return false;

            totalLength += length + 1;
            if (totalLength > kMaxNameLength)
                return false;

            labels.append(QString::fromUtf8(m_data.constData() + pos + 1, length));
            pos += 1 + length;
        }

        *name = labels.join(QLatin1Char('.'));
        *endOffset = end;
        return true;
    }

private:
    quint8 byteAt(int offset) const { return static_cast<quint8>(m_data.at(offset)); }

    const QByteArray &m_data;
    int m_pos = 0;
};

bool readQuestions(Reader &reader, quint16 count, QList<Question> *out)
{
    out->clear();
    for (quint16 i = 0; i < count; ++i) {
        Question question;
        quint16 qclass = 0;
        if (!reader.readName(&question.name)
            || !reader.readU16(&question.type)
            || !reader.readU16(&qclass)) {
            return false;
        }
        question.unicastResponse = (qclass & kClassTopBit) != 0;
        question.qclass = static_cast<quint16>(qclass & ~kClassTopBit);
        out->append(question);
    }
    return true;
}

bool readRecords(Reader &reader, quint16 count, QList<Record> *out)
{
    out->clear();
    for (quint16 i = 0; i < count; ++i) {
        Record record;
        quint16 rclass = 0;
        quint16 dataLength = 0;
        if (!reader.readName(&record.name)
            || !reader.readU16(&record.type)
            || !reader.readU16(&rclass)
            || !reader.readU32(&record.ttl)
            || !reader.readU16(&dataLength)) {
            return false;
        }
        record.cacheFlush = (rclass & kClassTopBit) != 0;
        record.rclass = static_cast<quint16>(rclass & ~kClassTopBit);

        if (!reader.hasBytes(dataLength))
            return false;
        record.data = reader.peek(dataLength);

        if (record.type == kTypePtr) {
            // PTR targets may point back into earlier parts of the packet, but
            // their in-place part must stay inside the rdata.
            int inPlaceEnd = 0;
            if (!reader.decodeNameAt(reader.position(), &record.ptrName, &inPlaceEnd))
                return false;
            if (inPlaceEnd > reader.position() + dataLength)
                return false;
        } else if (record.type == kTypeA) {
            if (dataLength != 4)
                return false;
            const auto octet = [&record](int i) {
                return static_cast<quint32>(static_cast<quint8>(record.data.at(i)));
            };
            record.address = QHostAddress((octet(0) << 24) | (octet(1) << 16) | (octet(2) << 8) | octet(3));
        }

        reader.skip(dataLength);
        out->append(std::move(record));
    }
    return true;
}

} // namespace

QByteArray buildPtrQuery(quint16 id, const QString &serviceName, bool unicastResponse)
{
    QByteArray packet;
    packet.reserve(kHeaderSize + serviceName.size() + 6);

    writeU16(&packet, id);
    writeU16(&packet, 0); // standard query, no recursion
    writeU16(&packet, 1);
    writeU16(&packet, 0);
    writeU16(&packet, 0);
    writeU16(&packet, 0);

    if (!writeName(&packet, serviceName))
        return {};

    writeU16(&packet, kTypePtr);
    writeU16(&packet, unicastResponse ? static_cast<quint16>(kClassIn | kClassTopBit) : kClassIn);
    return packet;
}

bool parsePacket(const QByteArray &datagram, Packet *out)
{
    if (!out || datagram.size() < kHeaderSize)
        return false;

    Reader reader(datagram);
    Packet packet;
    Header &header = packet.header;
    if (!reader.readU16(&header.id)
        || !reader.readU16(&header.flags)
        || !reader.readU16(&header.questionCount)
        || !reader.readU16(&header.answerCount)
        || !reader.readU16(&header.authorityCount)
        || !reader.readU16(&header.additionalCount)) {
        return false;
    }

    if (!readQuestions(reader, header.questionCount, &packet.questions))
        return false;

    if (!readRecords(reader, header.answerCount, &packet.answers))
        return false;
    if (!readRecords(reader, header.authorityCount, &packet.authorities))
        return false;
    if (!readRecords(reader, header.additionalCount, &packet.additional))
        return false;

    *out = std::move(packet);
    return true;
}

std::optional<QHostAddress> validateResponse(const Packet &packet,
                                             const QString &serviceName,
                                             quint16 queryId)
{
    if (packet.header.id != queryId)
        return std::nullopt;

    const QString expected = normalizedName(serviceName);
    bool hasMatchingPtr = false;
    for (const Record &answer : packet.answers) {
        if (answer.type != kTypePtr)
            continue;
        if (normalizedName(answer.name).compare(expected, Qt::CaseInsensitive) == 0) {
            hasMatchingPtr = true;
            break;
        }
    }
    if (!hasMatchingPtr)
        return std::nullopt;

    for (const Record &record : packet.additional) {
        if (record.type == kTypeA && !record.address.isNull())
            return record.address;
    }
    return std::nullopt;
}

std::optional<QHostAddress> validateResponse(const QByteArray &datagram,
                                             const QString &serviceName,
                                             quint16 queryId)
{
    Packet packet;
    if (!parsePacket(datagram, &packet))
        return std::nullopt;
    return validateResponse(packet, serviceName, queryId);
}

} // namespace hueclient::dns
