#ifndef WTTP_GATEWAY_ENDPOINT_HPP
#define WTTP_GATEWAY_ENDPOINT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "../backend/interface.hpp"

namespace wttp::endpoint {
    struct NetworkInfo {
        std::uint64_t chain_id_ = 0;
    };

    // Shared, read-only after construction. key_ is the normalized selector the endpoint is cached under.
    struct Endpoint {
        std::string key_;
        std::string rpc_url_;
        std::shared_ptr<backend::IContractBackend> backend_;
        std::optional<NetworkInfo> network_;

        [[nodiscard]] std::optional<std::uint64_t> chain_id() const {
            if (!network_) {
                return std::nullopt;
            }
            return network_->chain_id_;
        }
    };
}  // namespace wttp::endpoint

#endif
