#ifndef WTTP_GATEWAY_NETWORK_SELECTOR_HPP
#define WTTP_GATEWAY_NETWORK_SELECTOR_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace wttp::endpoint {
    // What a caller names a network by: a symbolic name ("polygon"), a chain id (137 or "137"), or a
    // literal RPC URL. Default-constructed selectors mean the configured default network.
    class NetworkSelector {
       public:
        enum class Kind { DEFAULT, NAME, CHAIN_ID, URL };

        NetworkSelector() = default;
        NetworkSelector(std::string value);  // NOLINT(google-explicit-constructor)
        NetworkSelector(const char* value);  // NOLINT(google-explicit-constructor)
        NetworkSelector(std::uint64_t chain_id);  // NOLINT(google-explicit-constructor)

        [[nodiscard]] Kind kind() const;
        [[nodiscard]] const std::string& value() const;
        [[nodiscard]] std::optional<std::uint64_t> chain_id() const;
        [[nodiscard]] std::string to_string() const;

       private:
        Kind kind_ = Kind::DEFAULT;
        std::string value_;
        std::uint64_t chain_id_ = 0;
    };
}  // namespace wttp::endpoint

#endif
