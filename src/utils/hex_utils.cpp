#include "hex_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

#include "../error/gateway_error.hpp"
#include "constants.hpp"

namespace wttp::hex_utils {
    namespace {
        constexpr const char* HEX_DIGITS = "0123456789abcdef";

        int nibble(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + constants::BASE_10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + constants::BASE_10;
            }
            return -1;
        }

        std::string_view strip_prefix(std::string_view hex) {
            if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
                hex.remove_prefix(2);
            }
            return hex;
        }

        template <size_t N>
        std::array<std::uint8_t, N> parse_fixed(std::string_view text, const char* what) {
            std::string_view digits = strip_prefix(text);
            if (digits.size() != N * 2) {
                throw error::InvalidArgumentError(std::string("Invalid ") + what + ": " + std::string(text));
            }
            Bytes raw = from_hex(digits);
            std::array<std::uint8_t, N> out{};
            std::copy(raw.begin(), raw.end(), out.begin());
            return out;
        }
    }  // namespace

    std::string to_hex(std::span<const std::uint8_t> data, bool with_prefix) {
        std::string out;
        out.reserve(data.size() * 2 + 2);
        if (with_prefix) {
            out += "0x";
        }
        for (const std::uint8_t b : data) {
            out += HEX_DIGITS[b >> 4];
            out += HEX_DIGITS[b & 0x0F];
        }
        return out;
    }

    Bytes from_hex(std::string_view hex) {
        std::string_view digits = strip_prefix(hex);
        Bytes out;
        out.reserve((digits.size() + 1) / 2);

        size_t i = 0;
        if (digits.size() % 2 != 0) {
            const int lo = nibble(digits[0]);
            if (lo < 0) {
                throw error::InvalidArgumentError("Invalid hex string: " + std::string(hex));
            }
            out.push_back(static_cast<std::uint8_t>(lo));
            i = 1;
        }

        for (; i < digits.size(); i += 2) {
            const int hi = nibble(digits[i]);
            const int lo = nibble(digits[i + 1]);
            if (hi < 0 || lo < 0) {
                throw error::InvalidArgumentError("Invalid hex string: " + std::string(hex));
            }
            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
        return out;
    }

    bool is_address(std::string_view text) {
        if (text.size() != 2 + constants::ADDRESS_SIZE * 2 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
            return false;
        }
        return std::all_of(text.begin() + 2, text.end(), [](char c) { return nibble(c) >= 0; });
    }

    Address parse_address(std::string_view text) { return parse_fixed<constants::ADDRESS_SIZE>(text, "address"); }

    Hash32 parse_hash(std::string_view text) { return parse_fixed<constants::HASH_SIZE>(text, "hash"); }

    std::string preview(std::span<const std::uint8_t> data) { return to_hex(data).substr(0, constants::HEX_PREVIEW_LENGTH) + "..."; }
}  // namespace wttp::hex_utils
