#ifndef WTTP_GATEWAY_TYPES_HPP
#define WTTP_GATEWAY_TYPES_HPP

#include <array>
#include <cstdint>
#include <vector>

#include "constants.hpp"

namespace wttp {
    using Bytes = std::vector<std::uint8_t>;
    using Address = std::array<std::uint8_t, constants::ADDRESS_SIZE>;
    using Hash32 = std::array<std::uint8_t, constants::HASH_SIZE>;
    using MimeCode = std::array<std::uint8_t, constants::MIME_CODE_SIZE>;

    inline constexpr Address ZERO_ADDRESS{};
    inline constexpr Hash32 ZERO_HASH{};
}  // namespace wttp

#endif
