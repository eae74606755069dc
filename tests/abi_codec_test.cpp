#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "src/abi/abi_codec.hpp"
#include "src/error/gateway_error.hpp"
#include "src/utils/hex_utils.hpp"
#include "support/fake_backend.hpp"

using namespace wttp;

namespace {
    std::string word_hex(const Bytes& encoded, std::size_t slot) {
        const std::span<const std::uint8_t> all(encoded);
        return hex_utils::to_hex(all.subspan(slot * constants::WORD_SIZE, constants::WORD_SIZE), false);
    }

    const std::string ZERO_WORD(64, '0');
}  // namespace

TEST(EncoderTest, StaticValuesFillOneWordEach) {
    wttp::abi::Encoder encoder;
    encoder.add_uint(0x2a).add_bool(true).add_address(test_support::address_of_byte(0x11));
    const Bytes encoded = encoder.encode();

    ASSERT_EQ(encoded.size(), 3 * constants::WORD_SIZE);
    EXPECT_EQ(word_hex(encoded, 0), std::string(62, '0') + "2a");
    EXPECT_EQ(word_hex(encoded, 1), std::string(63, '0') + "1");
    EXPECT_EQ(word_hex(encoded, 2), std::string(24, '0') + std::string(40, '1'));
    EXPECT_FALSE(encoder.is_dynamic());
}

TEST(EncoderTest, NegativeIntsAreSignExtended) {
    wttp::abi::Encoder encoder;
    encoder.add_int(-1).add_int(5);
    const Bytes encoded = encoder.encode();

    EXPECT_EQ(word_hex(encoded, 0), std::string(64, 'f'));
    EXPECT_EQ(word_hex(encoded, 1), std::string(63, '0') + "5");
}

TEST(EncoderTest, StringsGoToTheTail) {
    wttp::abi::Encoder encoder;
    encoder.add_uint(7).add_string("/index.html");
    const Bytes encoded = encoder.encode();

    ASSERT_EQ(encoded.size(), 4 * constants::WORD_SIZE);
    EXPECT_TRUE(encoder.is_dynamic());
    EXPECT_EQ(word_hex(encoded, 1), std::string(62, '0') + "40");
    EXPECT_EQ(word_hex(encoded, 2), std::string(62, '0') + "0b");

    wttp::abi::Decoder decoder(encoded);
    EXPECT_EQ(decoder.uint_at(0), 7U);
    EXPECT_EQ(decoder.string_at(1), "/index.html");
}

TEST(EncoderTest, HeadRequestCallData) {
    wttp::abi::Encoder request;
    request.add_string("/").add_uint(0).add_bytes32(ZERO_HASH);
    wttp::abi::Encoder args;
    args.add_tuple(request);

    const Bytes call = args.encode_call("HEAD((string,uint256,bytes32))");
    ASSERT_EQ(call.size(), constants::SELECTOR_SIZE + 6 * constants::WORD_SIZE);
    EXPECT_EQ(hex_utils::to_hex(std::span<const std::uint8_t>(call).first(4)), "0x28699f17");

    const Bytes body(call.begin() + constants::SELECTOR_SIZE, call.end());
    EXPECT_EQ(word_hex(body, 0), std::string(62, '0') + "20");
    EXPECT_EQ(word_hex(body, 1), std::string(62, '0') + "60");
    EXPECT_EQ(word_hex(body, 2), ZERO_WORD);
    EXPECT_EQ(word_hex(body, 3), ZERO_WORD);
    EXPECT_EQ(word_hex(body, 4), std::string(63, '0') + "1");
    EXPECT_EQ(word_hex(body, 5), "2f" + std::string(62, '0'));
}

TEST(EncoderTest, StaticTuplesAreInlined) {
    wttp::abi::Encoder range;
    range.add_int(0).add_int(-1);
    wttp::abi::Encoder outer;
    outer.add_uint(1).add_tuple(range);

    const Bytes encoded = outer.encode();
    ASSERT_EQ(encoded.size(), 3 * constants::WORD_SIZE);
    EXPECT_EQ(word_hex(encoded, 1), ZERO_WORD);
    EXPECT_EQ(word_hex(encoded, 2), std::string(64, 'f'));
}

TEST(DecoderTest, Bytes32Arrays) {
    const std::vector<Hash32> ids = {test_support::chunk_id(1), test_support::chunk_id(2), test_support::chunk_id(3)};
    wttp::abi::Encoder encoder;
    encoder.add_bytes32_array(ids).add_uint(3);

    const Bytes encoded = encoder.encode();
    wttp::abi::Decoder decoder(encoded);
    EXPECT_EQ(decoder.bytes32_array_at(0), ids);
    EXPECT_EQ(decoder.uint_at(1), 3U);
}

TEST(DecoderTest, ReadingPastTheEndThrows) {
    const Bytes short_data(40, 0);
    wttp::abi::Decoder decoder(short_data);
    EXPECT_NO_THROW(decoder.word(0));
    EXPECT_THROW(decoder.word(1), error::AbiError);
}

TEST(DecoderTest, OversizedIntegersThrow) {
    Bytes data(constants::WORD_SIZE, 0);
    data[0] = 1;
    EXPECT_THROW(wttp::abi::Decoder(data).uint_at(0), error::AbiError);
}

TEST(DecoderTest, BogusOffsetsThrow) {
    wttp::abi::Encoder encoder;
    encoder.add_uint(0xFFFF);
    const Bytes encoded = encoder.encode();
    EXPECT_THROW(wttp::abi::Decoder(encoded).string_at(0), error::AbiError);
    EXPECT_THROW(wttp::abi::Decoder(encoded).bytes32_array_at(0), error::AbiError);
}

TEST(DecoderTest, AddressAndBytes2) {
    Bytes data(2 * constants::WORD_SIZE, 0);
    data[0] = 't';
    data[1] = 'h';
    for (std::size_t i = 2 * constants::WORD_SIZE - constants::ADDRESS_SIZE; i < data.size(); ++i) {
        data[i] = 0x42;
    }

    wttp::abi::Decoder decoder(data);
    EXPECT_EQ(decoder.bytes2_at(0), test_support::mime("th"));
    EXPECT_EQ(decoder.address_at(1), test_support::address_of_byte(0x42));
}
