#ifndef WTTP_GATEWAY_ENDPOINT_REGISTRY_HPP
#define WTTP_GATEWAY_ENDPOINT_REGISTRY_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../backend/interface.hpp"
#include "../cache/cache_set.hpp"
#include "../config/gateway_config.hpp"
#include "endpoint.hpp"
#include "network_selector.hpp"

namespace wttp::endpoint {
    using BackendFactory = std::function<std::shared_ptr<backend::IContractBackend>(const std::string& rpc_url)>;

    struct EndpointTarget {
        std::string key_;
        std::string rpc_url_;
    };

    class EndpointRegistry {
       public:
        EndpointRegistry(std::shared_ptr<const config::GatewayConfig> config, cache::CacheSet caches, BackendFactory backend_factory);

        ~EndpointRegistry() = default;
        EndpointRegistry(const EndpointRegistry&) = delete;
        EndpointRegistry& operator=(const EndpointRegistry&) = delete;
        EndpointRegistry(EndpointRegistry&&) = delete;
        EndpointRegistry& operator=(EndpointRegistry&&) = delete;

        // Cached per normalized selector. Throws UnsupportedNetworkError for unknown names and chain ids.
        std::shared_ptr<const Endpoint> get_endpoint(const NetworkSelector& selector);
        [[nodiscard]] EndpointTarget resolve_target(const NetworkSelector& selector) const;
        [[nodiscard]] std::vector<std::string> supported_networks() const;
        [[nodiscard]] const config::GatewayConfig& config() const;
        void clear();

       private:
        std::shared_ptr<const config::GatewayConfig> config_;
        cache::CacheSet caches_;
        BackendFactory backend_factory_;
    };
}  // namespace wttp::endpoint

#endif
