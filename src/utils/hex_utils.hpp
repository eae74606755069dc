#ifndef WTTP_GATEWAY_HEX_UTILS_HPP
#define WTTP_GATEWAY_HEX_UTILS_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "types.hpp"

namespace wttp::hex_utils {
    std::string to_hex(std::span<const std::uint8_t> data, bool with_prefix = true);

    // Accepts an optional 0x prefix; odd-length input is left-padded with a zero nibble.
    Bytes from_hex(std::string_view hex);

    [[nodiscard]] bool is_address(std::string_view text);

    Address parse_address(std::string_view text);

    Hash32 parse_hash(std::string_view text);

    // First HEX_PREVIEW_LENGTH characters of the 0x-prefixed form, for log lines.
    std::string preview(std::span<const std::uint8_t> data);
}  // namespace wttp::hex_utils

#endif
