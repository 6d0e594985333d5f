#include <gtest/gtest.h>

#include "hue_envelope.h"
#include "hue_model.h"

using namespace hueclient;

namespace {

QList<ResourceIdentifier> decodeCurrent(const QByteArray &payload, Error *error)
{
    ResourceEnvelope<ResourceIdentifier> envelope;
    QList<ResourceIdentifier> out;
    if (!ResourceEnvelope<ResourceIdentifier>::decode(payload, &envelope, error))
        return out;
    envelope.get(&out, error);
    return out;
}

} // namespace

TEST(LegacyEnvelope, SingleObjectIsTheElement)
{
    LegacyEnvelope<ResourceIdentifier> envelope;
    ASSERT_TRUE(LegacyEnvelope<ResourceIdentifier>::decode(R"({"rid":"a","rtype":"light"})", &envelope, nullptr));

    ResourceIdentifier out;
    ASSERT_TRUE(envelope.get(&out, nullptr));
    EXPECT_EQ(out.rid, QStringLiteral("a"));
}

TEST(LegacyEnvelope, ListYieldsLastElement)
{
    LegacyEnvelope<ResourceIdentifier> envelope;
    ASSERT_TRUE(LegacyEnvelope<ResourceIdentifier>::decode(
        R"([{"rid":"A","rtype":"light"},{"rid":"B","rtype":"light"}])", &envelope, nullptr));

    ResourceIdentifier out;
    ASSERT_TRUE(envelope.get(&out, nullptr));
    EXPECT_EQ(out.rid, QStringLiteral("B"));
}

TEST(LegacyEnvelope, EmptyListIsProtocolError)
{
    LegacyEnvelope<ResourceIdentifier> envelope;
    ASSERT_TRUE(LegacyEnvelope<ResourceIdentifier>::decode("[]", &envelope, nullptr));

    ResourceIdentifier out;
    Error error;
    EXPECT_FALSE(envelope.get(&out, &error));
    EXPECT_EQ(error.kind, ErrorKind::Protocol);
    EXPECT_EQ(error.message, QStringLiteral("expected non-empty array"));
}

TEST(LegacyEnvelope, ErrorListSurfacesLastEntry)
{
    const QByteArray payload = R"([
        {"error": {"type": 7, "address": "/a", "description": "e1"}},
        {"error": {"type": 101, "address": "/", "description": "e2"}}
    ])";
    LegacyEnvelope<ResourceIdentifier> envelope;
    ASSERT_TRUE(LegacyEnvelope<ResourceIdentifier>::decode(payload, &envelope, nullptr));
    ASSERT_TRUE(std::holds_alternative<QList<LegacyError>>(envelope.value()));

    ResourceIdentifier out;
    Error error;
    EXPECT_FALSE(envelope.get(&out, &error));
    EXPECT_EQ(error.kind, ErrorKind::Protocol);
    EXPECT_EQ(error.code, 101);
    EXPECT_EQ(error.message, QStringLiteral("e2"));
}

TEST(LegacyEnvelope, UnrecognisedShapesAreDecodeErrors)
{
    LegacyEnvelope<ResourceIdentifier> envelope;
    Error error;
    EXPECT_FALSE(LegacyEnvelope<ResourceIdentifier>::decode("[1, 2]", &envelope, &error));
    EXPECT_EQ(error.kind, ErrorKind::Decode);

    EXPECT_FALSE(LegacyEnvelope<ResourceIdentifier>::decode("{not json", &envelope, &error));
    EXPECT_EQ(error.kind, ErrorKind::Decode);

    EXPECT_FALSE(LegacyEnvelope<ResourceIdentifier>::decode(R"({"rid": 3})", &envelope, &error));
    EXPECT_EQ(error.kind, ErrorKind::Decode);
}

TEST(ResourceEnvelope, ReturnsWholeDataList)
{
    Error error;
    const QList<ResourceIdentifier> items = decodeCurrent(
        R"({"errors": [], "data": [{"rid":"X","rtype":"light"},{"rid":"Y","rtype":"light"}]})", &error);
    EXPECT_FALSE(error.isError());
    ASSERT_EQ(items.size(), 2);
    EXPECT_EQ(items.at(0).rid, QStringLiteral("X"));
    EXPECT_EQ(items.at(1).rid, QStringLiteral("Y"));
}

TEST(ResourceEnvelope, ErrorsWinOverData)
{
    Error error;
    const QList<ResourceIdentifier> items = decodeCurrent(
        R"({"errors": [{"description":"first"},{"description":"E"}], "data": [{"rid":"X","rtype":"light"}]})",
        &error);
    EXPECT_TRUE(items.isEmpty());
    EXPECT_EQ(error.kind, ErrorKind::Protocol);
    EXPECT_EQ(error.message, QStringLiteral("E"));
}

TEST(ResourceEnvelope, ErrorsWinEvenWhenDataIsMalformed)
{
    Error error;
    decodeCurrent(R"({"errors": [{"description":"unauthorized user"}], "data": [{"bogus": true}]})", &error);
    EXPECT_EQ(error.kind, ErrorKind::Protocol);
    EXPECT_EQ(error.message, QStringLiteral("unauthorized user"));
}

TEST(ResourceEnvelope, EmptyDataIsNotAnError)
{
    Error error;
    const QList<ResourceIdentifier> items = decodeCurrent(R"({"errors": [], "data": []})", &error);
    EXPECT_FALSE(error.isError());
    EXPECT_TRUE(items.isEmpty());
}

TEST(ResourceEnvelope, MissingFieldsAreDecodeErrors)
{
    Error error;
    decodeCurrent(R"({"data": []})", &error);
    EXPECT_EQ(error.kind, ErrorKind::Decode);

    error = Error();
    decodeCurrent(R"({"errors": []})", &error);
    EXPECT_EQ(error.kind, ErrorKind::Decode);

    error = Error();
    decodeCurrent(R"([])", &error);
    EXPECT_EQ(error.kind, ErrorKind::Decode);
}

TEST(ResourceEnvelope, BadElementNamesItsIndex)
{
    Error error;
    decodeCurrent(R"({"errors": [], "data": [{"rid":"X","rtype":"light"},{"rid":"Y"}]})", &error);
    EXPECT_EQ(error.kind, ErrorKind::Decode);
    EXPECT_TRUE(error.message.startsWith(QStringLiteral("data[1]:")));
}
