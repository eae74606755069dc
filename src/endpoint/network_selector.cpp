#include "network_selector.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace wttp::endpoint {
    namespace {
        bool is_url(const std::string& value) {
            return string_utils::ieq_prefix(value.c_str(), value.size(), "http://") || string_utils::ieq_prefix(value.c_str(), value.size(), "https://");
        }
    }  // namespace

    NetworkSelector::NetworkSelector(std::string value) : value_(string_utils::trim(std::move(value))) {
        if (value_.empty()) {
            kind_ = Kind::DEFAULT;
            return;
        }

        if (is_url(value_)) {
            kind_ = Kind::URL;
            return;
        }

        if (string_utils::is_digits(value_)) {
            errno = 0;
            const unsigned long long parsed = std::strtoull(value_.c_str(), nullptr, constants::BASE_10);
            if (errno != ERANGE) {
                kind_ = Kind::CHAIN_ID;
                chain_id_ = static_cast<std::uint64_t>(parsed);
                return;
            }
        }

        kind_ = Kind::NAME;
        value_ = string_utils::to_lower(value_);
    }

    NetworkSelector::NetworkSelector(const char* value) : NetworkSelector(std::string(value != nullptr ? value : "")) {}

    NetworkSelector::NetworkSelector(std::uint64_t chain_id) : kind_(Kind::CHAIN_ID), value_(std::to_string(chain_id)), chain_id_(chain_id) {}

    NetworkSelector::Kind NetworkSelector::kind() const { return kind_; }

    const std::string& NetworkSelector::value() const { return value_; }

    std::optional<std::uint64_t> NetworkSelector::chain_id() const {
        if (kind_ != Kind::CHAIN_ID) {
            return std::nullopt;
        }
        return chain_id_;
    }

    std::string NetworkSelector::to_string() const {
        switch (kind_) {
            case Kind::DEFAULT:
                return "(default)";
            case Kind::CHAIN_ID:
                return "chain " + value_;
            case Kind::NAME:
            case Kind::URL:
                break;
        }
        return value_;
    }
}  // namespace wttp::endpoint
