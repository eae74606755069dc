#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>
#include <vector>

#include "constants.hpp"

namespace wttp::string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(buf[i]) != std::tolower(key[i])) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    bool extract_header_value(const char *buffer, size_t bytes, const char *key, std::string &out_property) {
        size_t key_len = std::char_traits<char>::length(key);
        if (bytes < key_len) {
            return false;
        }
        for (size_t i = 0; i < key_len; ++i) {
            if ((buffer[i] | constants::ASCII_LOWERCASE_BIT) != (key[i] | constants::ASCII_LOWERCASE_BIT)) {
                return false;
            }  // ASCII-only fold
        }
        const char *start = buffer + key_len;
        const char *end = buffer + bytes;
        while (start < end && (*start == ' ' || *start == '\t')) {
            ++start;
        }
        while (end > start && (end[-1] == '\r' || end[-1] == '\n' || end[-1] == ' ' || end[-1] == '\t')) {
            --end;
        }
        out_property.assign(start, end);
        return true;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool is_digits(std::string_view sv) {
        return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    std::vector<std::string> split(std::string_view sv, char delimiter) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(delimiter, start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;
            out.emplace_back(sv.substr(start, end - start));

            if (pos == std::string_view::npos) {
                break;
            }

            start = pos + 1;
        }
        return out;
    }

    std::string join(const std::vector<std::string> &parts, std::string_view separator) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                out.append(separator);
            }
            out.append(parts[i]);
        }
        return out;
    }

    std::string escape_json(std::string_view sv) {
        std::string out;
        out.reserve(sv.size());
        for (const char c : sv) {
            switch (c) {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[7];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                        out += buf;
                    } else {
                        out += c;
                    }
            }
        }
        return out;
    }
}  // namespace wttp::string_utils
