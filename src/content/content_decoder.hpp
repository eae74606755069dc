#ifndef WTTP_GATEWAY_CONTENT_DECODER_HPP
#define WTTP_GATEWAY_CONTENT_DECODER_HPP

#include <string>
#include <variant>

#include "../utils/types.hpp"

namespace wttp::content {
    using DecodedContent = std::variant<std::string, Bytes>;

    // Text types: tp th tc tm aj ao ax is.
    [[nodiscard]] bool is_text_content_type(const MimeCode& mime);

    // Text types come back as a string holding the raw UTF-8 bytes; everything else is passed through.
    DecodedContent decode(const Bytes& content, const MimeCode& mime);

    // "text/html" for th; application/octet-stream for codes without a known mapping.
    std::string mime_type_name(const MimeCode& mime);

    // "0x7468" form used in logs and CLI output.
    std::string mime_code_hex(const MimeCode& mime);
}  // namespace wttp::content

#endif
