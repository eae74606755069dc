#ifndef WTTP_GATEWAY_GATEWAY_HPP
#define WTTP_GATEWAY_GATEWAY_HPP

#pragma once

#include <cstddef>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../cache/cache_set.hpp"
#include "../config/gateway_config.hpp"
#include "../endpoint/endpoint_registry.hpp"
#include "../endpoint/network_selector.hpp"
#include "../names/name_resolver.hpp"
#include "../protocol/model.hpp"

namespace wttp::gateway {
    struct FetchRequest {
        std::string site_;
        std::string path_ = "/";
        endpoint::NetworkSelector network_;
        protocol::RequestOptions options_;
        names::ResolveOptions name_options_;
    };

    // Exactly one of result_ and error_ is set.
    struct FetchOutcome {
        std::optional<protocol::FetchResult> result_;
        std::exception_ptr error_;
    };

    // Backends speaking JSON-RPC over libcurl, configured from the transport and retry settings.
    endpoint::BackendFactory make_rpc_backend_factory(const config::GatewayConfig& config);

    class Gateway {
       public:
        Gateway(std::shared_ptr<const config::GatewayConfig> config, cache::CacheSet caches, endpoint::BackendFactory backend_factory);

        ~Gateway() = default;
        Gateway(const Gateway&) = delete;
        Gateway& operator=(const Gateway&) = delete;
        Gateway(Gateway&&) = delete;
        Gateway& operator=(Gateway&&) = delete;

        protocol::FetchResult fetch(const FetchRequest& request);

        // Runs independent requests on a pool of num_workers threads. Results keep request order.
        std::vector<FetchOutcome> fetch_many(const std::vector<FetchRequest>& requests, std::size_t num_workers);

        Address resolve_site(const endpoint::Endpoint& endpoint, const std::string& site, const names::ResolveOptions& options = {});
        bool name_exists(const endpoint::NetworkSelector& network, const std::string& name);

        endpoint::EndpointRegistry& registry();
        names::NameResolver& resolver();
        [[nodiscard]] const config::GatewayConfig& config() const;

        void clear_caches();

       private:
        std::shared_ptr<const config::GatewayConfig> config_;
        cache::CacheSet caches_;
        endpoint::EndpointRegistry registry_;
        names::NameResolver resolver_;
    };

    class GatewayBuilder {
       public:
        GatewayBuilder() = default;

        GatewayBuilder& with_config(config::GatewayConfig config);
        GatewayBuilder& with_config_file(const std::filesystem::path& path);
        GatewayBuilder& with_backend_factory(endpoint::BackendFactory backend_factory);
        GatewayBuilder& with_caches(cache::CacheSet caches);
        GatewayBuilder& validate();
        std::unique_ptr<Gateway> build();

       private:
        config::GatewayConfig config_;
        std::optional<cache::CacheSet> caches_;
        endpoint::BackendFactory backend_factory_;
    };
}  // namespace wttp::gateway

#endif
