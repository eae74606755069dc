#ifndef WTTP_GATEWAY_CONSTANTS_HPP
#define WTTP_GATEWAY_CONSTANTS_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace wttp::constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int BASE_16 = 16;
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr std::size_t WORD_SIZE = 32;
    inline constexpr std::size_t SELECTOR_SIZE = 4;
    inline constexpr std::size_t ADDRESS_SIZE = 20;
    inline constexpr std::size_t HASH_SIZE = 32;
    inline constexpr std::size_t MIME_CODE_SIZE = 2;
    inline constexpr std::size_t HEX_PREVIEW_LENGTH = 10;
    inline constexpr int DEFAULT_MAX_REDIRECTS = 5;
    inline constexpr std::int64_t RANGE_TO_END = -1;
    inline constexpr std::uint64_t ROOT_CHAIN_ID = 1;
    inline constexpr const char* DEFAULT_NETWORK = "polygon";
    inline constexpr const char* ROOT_NETWORK = "ethereum";
    inline constexpr const char* NAME_SUFFIX = ".eth";
    inline constexpr const char* FOREIGN_SITE_SCHEME = "wttp://";
    inline constexpr std::array<const char*, 4> INDEX_CANDIDATES = {"index.html", "index.htm", "index.md", "index.txt"};
}  // namespace wttp::constants

#endif
