#ifndef WTTP_GATEWAY_PATH_NORMALIZER_HPP
#define WTTP_GATEWAY_PATH_NORMALIZER_HPP

#include <string>
#include <string_view>

namespace wttp::path {
    // Canonical request path: always begins with '/'. Throws InvalidPathError on control characters.
    std::string normalize(std::string_view path);

    // Resolves a redirect location against the path that produced it. Never climbs above root.
    std::string resolve_redirect(std::string_view current, std::string_view location);

    // Collapses empty, "." and ".." segments.
    std::string resolve_segments(std::string_view path);

    // Ends with '/' or has no '.' anywhere.
    bool is_directory_like(std::string_view path);

    std::string join_index(std::string_view directory, std::string_view candidate);
}  // namespace wttp::path

#endif
