#ifndef WTTP_GATEWAY_NAMEHASH_HPP
#define WTTP_GATEWAY_NAMEHASH_HPP

#include <string>
#include <string_view>

#include "../utils/types.hpp"

namespace wttp::names {
    // node = keccak(node || keccak(label)) for each label from the rightmost leftwards, starting at 32 zero bytes.
    Hash32 namehash(std::string_view name);

    // Lowercased and trimmed; the form names are hashed and cached under.
    std::string normalize_name(std::string_view name);

    // Dotted names ("site.eth") need resolution; 20-byte hex addresses do not.
    bool is_resolvable_name(std::string_view site);
}  // namespace wttp::names

#endif
