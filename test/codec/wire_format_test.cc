#include <gtest/gtest.h>
#include "../../src/codec/wire_format.h"

using namespace SalKafka;

TEST(WireFormatTest, HeaderIsMagicThenBigEndianId) {
    const std::string framed = wire::Frame(0x01020304, "body");
    ASSERT_EQ(framed.size(), wire::HEADER_SIZE + 4);
    EXPECT_EQ(framed[0], '\0');
    EXPECT_EQ(framed[1], '\x01');
    EXPECT_EQ(framed[2], '\x02');
    EXPECT_EQ(framed[3], '\x03');
    EXPECT_EQ(framed[4], '\x04');
    EXPECT_EQ(framed.substr(wire::HEADER_SIZE), "body");
}

TEST(WireFormatTest, UnframeSplitsIdAndBody) {
    const std::string framed = wire::Frame(42, "xyz");
    wire::FramedPayload payload = wire::Unframe(framed);
    EXPECT_EQ(payload.schema_id, 42);
    EXPECT_EQ(payload.body, "xyz");
}

TEST(WireFormatTest, EmptyBodyIsValid) {
    wire::FramedPayload payload = wire::Unframe(wire::Frame(7, ""));
    EXPECT_EQ(payload.schema_id, 7);
    EXPECT_TRUE(payload.body.empty());
}

TEST(WireFormatTest, RejectsShortOrBadMagic) {
    EXPECT_THROW(wire::Unframe(std::string("\0\0\0", 3)), CodecError);
    std::string framed = wire::Frame(1, "a");
    framed[0] = '\x01';
    EXPECT_THROW(wire::Unframe(framed), CodecError);
}

TEST(WireFormatTest, LargeBodyIsNotCapped) {
    const std::string body(3 * 1024 * 1024, 'x');
    wire::FramedPayload payload = wire::Unframe(wire::Frame(7, body));
    EXPECT_EQ(payload.schema_id, 7);
    EXPECT_EQ(payload.body.size(), body.size());
}
