#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "obf_protocol.hpp"
#include "scripted_transport.hpp"

using obf_test::ScriptedTransport;

TEST(PadField, ZeroPadsToFourDigits) {
    EXPECT_EQ(obf::pad_field(0), "0000");
    EXPECT_EQ(obf::pad_field(7), "0007");
    EXPECT_EQ(obf::pad_field(1550), "1550");
    EXPECT_EQ(obf::pad_field(9999), "9999");
}

TEST(PadField, RejectsValuesWiderThanField) {
    EXPECT_THROW(obf::pad_field(10000), obf::RangeError);
    EXPECT_THROW(obf::pad_field(-1), obf::RangeError);
}

TEST(MakeFrame, LetterFieldTerminator) {
    const auto f = obf::make_frame('L', "1510");
    EXPECT_EQ(std::string(f.begin(), f.end()), "L1510,");

    const auto q = obf::make_frame('V', "");
    EXPECT_EQ(std::string(q.begin(), q.end()), "V,");
}

TEST(ParseResponse, PayloadBetweenEchoAndDelimiter) {
    const obf::ResponseFrame r = obf::parse_response("L1520 ", 'L');
    EXPECT_EQ(r.letter, 'L');
    EXPECT_TRUE(r.has_payload);
    EXPECT_EQ(r.payload, "1520");
}

TEST(ParseResponse, EchoFollowedByDelimiterHasNoValue) {
    const obf::ResponseFrame r = obf::parse_response("L ,", 'L');
    EXPECT_FALSE(r.has_payload);
    EXPECT_TRUE(r.payload.empty());
}

TEST(ParseResponse, WrongEchoCarriesRawText) {
    try {
        obf::parse_response("X1234,", 'L');
        FAIL() << "ProtocolViolation が送出されなかった";
    } catch (const obf::ProtocolViolation& e) {
        EXPECT_EQ(e.raw(), "X1234,");
        EXPECT_NE(std::string(e.what()).find("X1234,"), std::string::npos);
    }
}

TEST(ParseResponse, EmptyAndTruncatedResponsesAreViolations) {
    EXPECT_THROW(obf::parse_response("", 'L'), obf::ProtocolViolation);
    EXPECT_THROW(obf::parse_response("L15", 'L'), obf::ProtocolViolation);
}

TEST(DecodeInt, AcceptsSignAndSurroundingSpaces) {
    EXPECT_EQ(obf::decode_int("1520"), 1520);
    EXPECT_EQ(obf::decode_int(" 12 "), 12);
    EXPECT_EQ(obf::decode_int("-3"), -3);
}

TEST(DecodeInt, RejectsNonNumericPayload) {
    EXPECT_THROW(obf::decode_int("abc"), obf::DecodeError);
    EXPECT_THROW(obf::decode_int("12x"), obf::DecodeError);
    EXPECT_THROW(obf::decode_int("99999999999"), obf::DecodeError);
}

TEST(DecodeText, RejectsInvalidUtf8) {
    EXPECT_EQ(obf::decode_text({'V', '2', ' '}), "V2 ");
    EXPECT_EQ(obf::decode_text({0xE6, 0xB3, 0xA2}), "\xE6\xB3\xA2");
    EXPECT_THROW(obf::decode_text({0xFF, 'V'}), obf::DecodeError);
    EXPECT_THROW(obf::decode_text({0xE6, 0xB3}), obf::DecodeError);
}

TEST(DecodeText, RejectsOverlongSurrogateAndOutOfRangeForms) {
    const std::vector<std::vector<uint8_t>> bad = {
        {'V', '2', 0xC0, 0x80, ' '},               // 冗長表現（2バイト）
        {'V', '2', 0xC1, 0xBF, ' '},
        {'V', '2', 0xE0, 0x80, 0x80, ' '},         // 冗長表現（3バイト）
        {'V', '2', 0xE0, 0x9F, 0xBF, ' '},
        {'V', '2', 0xED, 0xA0, 0x80, ' '},         // サロゲート
        {'V', '2', 0xED, 0xBF, 0xBF, ' '},
        {'V', '2', 0xF0, 0x8F, 0xBF, 0xBF, ' '},   // 冗長表現（4バイト）
        {'V', '2', 0xF4, 0x90, 0x80, 0x80, ' '},   // U+10FFFF 超
        {'V', '2', 0xF5, 0x80, 0x80, 0x80, ' '},
        {'V', '2', 0xF7, 0xBF, 0xBF, 0xBF, ' '},
    };
    for (const auto& b : bad) {
        EXPECT_THROW(obf::decode_text(b), obf::DecodeError) << std::hex << int(b[2]) << ' ' << int(b[3]);
    }
}

TEST(DecodeText, AcceptsBoundaryCodePoints) {
    EXPECT_NO_THROW(obf::decode_text({0xC2, 0x80}));               // U+0080
    EXPECT_NO_THROW(obf::decode_text({0xE0, 0xA0, 0x80}));         // U+0800
    EXPECT_NO_THROW(obf::decode_text({0xED, 0x9F, 0xBF}));         // U+D7FF
    EXPECT_NO_THROW(obf::decode_text({0xEE, 0x80, 0x80}));         // U+E000
    EXPECT_NO_THROW(obf::decode_text({0xF0, 0x90, 0x80, 0x80}));   // U+10000
    EXPECT_NO_THROW(obf::decode_text({0xF4, 0x8F, 0xBF, 0xBF}));   // U+10FFFF
}

TEST(Exchange, ResetsBuffersWritesFlushesThenReads) {
    ScriptedTransport dev;
    dev.reply("L1515 ");

    int v = 0;
    EXPECT_TRUE(obf::exchange(dev, "1510", 'L', v));
    EXPECT_EQ(v, 1515);

    const std::vector<std::string> expected = {"in", "out", "w:L1510,", "flush", "read"};
    EXPECT_EQ(dev.state().events, expected);
}

TEST(Exchange, AcknowledgementWithoutPayloadLeavesValueUntouched) {
    ScriptedTransport dev;
    dev.reply("H ");

    int v = 42;
    EXPECT_FALSE(obf::exchange(dev, "1589", 'H', v));
    EXPECT_EQ(v, 42);
}

TEST(Exchange, TimeoutIsProtocolViolationWithEmptyRaw) {
    ScriptedTransport dev;   // 応答なし

    int v = 0;
    try {
        obf::exchange(dev, "1510", 'L', v);
        FAIL() << "ProtocolViolation が送出されなかった";
    } catch (const obf::ProtocolViolation& e) {
        EXPECT_TRUE(e.raw().empty());
    }
}

TEST(Exchange, UndecodablePayloadIsDecodeError) {
    ScriptedTransport dev;
    dev.reply("T1x ");

    int v = 0;
    EXPECT_THROW(obf::exchange(dev, "0010", 'T', v), obf::DecodeError);
}

TEST(Exchange, WriteFailureIsTransportError) {
    ScriptedTransport dev;
    dev.state().fail_write_on = 'L';

    int v = 0;
    EXPECT_THROW(obf::exchange(dev, "1510", 'L', v), obf::TransportError);
    EXPECT_TRUE(dev.state().writes.empty());
}

TEST(Exchange, LinkLossIsTransportError) {
    ScriptedTransport dev;
    dev.state().link_down = true;

    int v = 0;
    EXPECT_THROW(obf::exchange(dev, "1510", 'L', v), obf::TransportError);
}

TEST(ExchangeAck, DiscardsPayloadButChecksEcho) {
    ScriptedTransport dev;
    dev.reply("C1550 ");
    dev.reply("Z ");

    EXPECT_NO_THROW(obf::exchange_ack(dev, "1550", 'C'));
    EXPECT_THROW(obf::exchange_ack(dev, "0001", 'I'), obf::ProtocolViolation);
}
