#include "namehash.hpp"

#include <algorithm>
#include <span>
#include <string>

#include "../abi/keccak.hpp"
#include "../utils/hex_utils.hpp"
#include "../utils/string_utils.hpp"

namespace wttp::names {
    Hash32 namehash(std::string_view name) {
        Hash32 node = ZERO_HASH;
        if (name.empty()) {
            return node;
        }

        size_t end = name.size();
        for (;;) {
            const size_t dot = name.rfind('.', end == 0 ? 0 : end - 1);
            const size_t start = (dot == std::string_view::npos || dot >= end) ? 0 : dot + 1;
            const Hash32 label_hash = abi::Keccak256::digest(name.substr(start, end - start));

            abi::Keccak256 hasher;
            hasher.update(std::span<const std::uint8_t>(node));
            hasher.update(std::span<const std::uint8_t>(label_hash));
            node = hasher.finalize();

            if (start == 0) {
                break;
            }
            end = start - 1;
        }
        return node;
    }

    std::string normalize_name(std::string_view name) { return string_utils::to_lower(string_utils::trim(std::string(name))); }

    bool is_resolvable_name(std::string_view site) {
        if (hex_utils::is_address(site)) {
            return false;
        }
        return std::find(site.begin(), site.end(), '.') != site.end();
    }
}  // namespace wttp::names
