#ifndef WTTP_GATEWAY_STRING_UTILS_HPP
#define WTTP_GATEWAY_STRING_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace wttp::string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    bool extract_header_value(const char* buffer, size_t bytes, const char* key, std::string& out_property);

    std::string trim(std::string s);

    std::string to_lower(std::string s);

    bool is_digits(std::string_view sv);

    std::vector<std::string> split(std::string_view sv, char delimiter);

    std::string join(const std::vector<std::string>& parts, std::string_view separator);

    std::string escape_json(std::string_view sv);
}  // namespace wttp::string_utils

#endif
