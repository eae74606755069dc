#include "path_normalizer.hpp"

#include <string>
#include <vector>

#include "../error/gateway_error.hpp"
#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace wttp::path {
    namespace {
        constexpr unsigned char ASCII_DELETE = 0x7f;
        constexpr unsigned char FIRST_PRINTABLE = 0x20;

        void reject_control_characters(std::string_view path) {
            for (const char c : path) {
                const auto byte = static_cast<unsigned char>(c);
                if (byte < FIRST_PRINTABLE || byte == ASCII_DELETE) {
                    throw error::InvalidPathError(std::string(path), "control characters are not allowed");
                }
            }
        }

        bool starts_with(std::string_view text, std::string_view prefix) { return text.substr(0, prefix.size()) == prefix; }
    }  // namespace

    std::string normalize(std::string_view path) {
        reject_control_characters(path);

        if (path.empty()) {
            return "/";
        }
        if (path.front() == '/') {
            return std::string(path);
        }
        if (starts_with(path, "./")) {
            return "/" + std::string(path.substr(2));
        }
        // The parent of root is root.
        if (starts_with(path, "../")) {
            return "/" + std::string(path.substr(3));
        }
        return "/" + std::string(path);
    }

    std::string resolve_segments(std::string_view path) {
        std::vector<std::string> stack;
        for (auto& segment : string_utils::split(path, '/')) {
            if (segment.empty() || segment == ".") {
                continue;
            }
            if (segment == "..") {
                if (!stack.empty()) {
                    stack.pop_back();
                }
                continue;
            }
            stack.push_back(std::move(segment));
        }
        return "/" + string_utils::join(stack, "/");
    }

    std::string resolve_redirect(std::string_view current, std::string_view location) {
        reject_control_characters(location);

        if (!location.empty() && location.front() == '/') {
            return normalize(location);
        }

        // wttp://site:network:/path keeps only what follows the last ':'.
        if (starts_with(location, constants::FOREIGN_SITE_SCHEME)) {
            const size_t colon = location.rfind(':');
            return normalize(location.substr(colon + 1));
        }

        const size_t slash = current.rfind('/');
        const std::string_view base = slash == std::string_view::npos ? std::string_view("/") : current.substr(0, slash + 1);
        return resolve_segments(std::string(base) + std::string(location));
    }

    bool is_directory_like(std::string_view path) {
        if (!path.empty() && path.back() == '/') {
            return true;
        }
        return path.find('.') == std::string_view::npos;
    }

    std::string join_index(std::string_view directory, std::string_view candidate) {
        std::string joined(directory);
        if (joined.empty() || joined.back() != '/') {
            joined += '/';
        }
        joined += candidate;
        return normalize(joined);
    }
}  // namespace wttp::path
