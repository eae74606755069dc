#ifndef WTTP_GATEWAY_ABI_CODEC_HPP
#define WTTP_GATEWAY_ABI_CODEC_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../utils/types.hpp"

namespace wttp::abi {
    using Selector = std::array<std::uint8_t, constants::SELECTOR_SIZE>;

    Selector selector(std::string_view signature);

    // Builds the head/tail layout of a Solidity ABI tuple. Nested tuples are inlined when all of
    // their members are static and referenced by offset otherwise.
    class Encoder {
       public:
        Encoder& add_uint(std::uint64_t value);
        Encoder& add_int(std::int64_t value);
        Encoder& add_bool(bool value);
        Encoder& add_bytes32(const Hash32& value);
        Encoder& add_address(const Address& value);
        Encoder& add_string(std::string_view value);
        Encoder& add_bytes32_array(const std::vector<Hash32>& values);
        Encoder& add_tuple(const Encoder& tuple);

        [[nodiscard]] bool is_dynamic() const;
        [[nodiscard]] Bytes encode() const;
        [[nodiscard]] Bytes encode_call(std::string_view signature) const;

       private:
        struct Slot {
            bool dynamic_ = false;
            Bytes data_;
        };

        std::vector<Slot> slots_;
    };

    // Read-only view over an encoded tuple. Slots are 32-byte words counted from the tuple start;
    // dynamic members are followed through their offsets, which are relative to that start.
    class Decoder {
       public:
        explicit Decoder(std::span<const std::uint8_t> data, std::size_t base = 0);

        [[nodiscard]] std::span<const std::uint8_t> word(std::size_t slot) const;
        [[nodiscard]] std::uint64_t uint_at(std::size_t slot) const;
        [[nodiscard]] bool bool_at(std::size_t slot) const;
        [[nodiscard]] Hash32 bytes32_at(std::size_t slot) const;
        [[nodiscard]] MimeCode bytes2_at(std::size_t slot) const;
        [[nodiscard]] Address address_at(std::size_t slot) const;
        [[nodiscard]] std::string string_at(std::size_t slot) const;
        [[nodiscard]] Bytes bytes_at(std::size_t slot) const;
        [[nodiscard]] std::vector<Hash32> bytes32_array_at(std::size_t slot) const;
        [[nodiscard]] Decoder tuple_at(std::size_t slot) const;
        [[nodiscard]] Decoder inline_at(std::size_t slot) const;

       private:
        [[nodiscard]] std::size_t offset_at(std::size_t slot) const;
        [[nodiscard]] std::span<const std::uint8_t> slice(std::size_t position, std::size_t length) const;

        std::span<const std::uint8_t> data_;
        std::size_t base_;
    };
}  // namespace wttp::abi

#endif
