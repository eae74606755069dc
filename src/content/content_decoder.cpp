#include "content_decoder.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "../utils/hex_utils.hpp"

namespace wttp::content {
    namespace {
        struct MimeEntry {
            std::string_view code_;
            std::string_view name_;
            bool is_text_;
        };

        constexpr std::string_view OCTET_STREAM = "application/octet-stream";

        constexpr std::array<MimeEntry, 16> MIME_TABLE = {{
            {.code_ = "tp", .name_ = "text/plain", .is_text_ = true},
            {.code_ = "th", .name_ = "text/html", .is_text_ = true},
            {.code_ = "tc", .name_ = "text/css", .is_text_ = true},
            {.code_ = "tm", .name_ = "text/markdown", .is_text_ = true},
            {.code_ = "aj", .name_ = "application/javascript", .is_text_ = true},
            {.code_ = "ao", .name_ = "application/json", .is_text_ = true},
            {.code_ = "ax", .name_ = "application/xml", .is_text_ = true},
            {.code_ = "is", .name_ = "image/svg+xml", .is_text_ = true},
            {.code_ = "ip", .name_ = "image/png", .is_text_ = false},
            {.code_ = "ij", .name_ = "image/jpeg", .is_text_ = false},
            {.code_ = "ig", .name_ = "image/gif", .is_text_ = false},
            {.code_ = "iw", .name_ = "image/webp", .is_text_ = false},
            {.code_ = "ii", .name_ = "image/x-icon", .is_text_ = false},
            {.code_ = "ap", .name_ = "application/pdf", .is_text_ = false},
            {.code_ = "aw", .name_ = "application/wasm", .is_text_ = false},
            {.code_ = "fw", .name_ = "font/woff2", .is_text_ = false},
        }};

        const MimeEntry* find_entry(const MimeCode& mime) {
            const auto* it = std::find_if(MIME_TABLE.begin(), MIME_TABLE.end(), [&mime](const MimeEntry& entry) {
                return static_cast<std::uint8_t>(entry.code_[0]) == mime[0] && static_cast<std::uint8_t>(entry.code_[1]) == mime[1];
            });
            return it == MIME_TABLE.end() ? nullptr : it;
        }
    }  // namespace

    bool is_text_content_type(const MimeCode& mime) {
        const MimeEntry* entry = find_entry(mime);
        return entry != nullptr && entry->is_text_;
    }

    DecodedContent decode(const Bytes& content, const MimeCode& mime) {
        if (is_text_content_type(mime)) {
            return std::string(content.begin(), content.end());
        }
        return content;
    }

    std::string mime_type_name(const MimeCode& mime) {
        const MimeEntry* entry = find_entry(mime);
        return std::string(entry == nullptr ? OCTET_STREAM : entry->name_);
    }

    std::string mime_code_hex(const MimeCode& mime) { return hex_utils::to_hex(mime); }
}  // namespace wttp::content
