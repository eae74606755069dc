#include "gateway.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <memory>
#include <string>
#include <utility>

#include "../backend/contract_backend.hpp"
#include "../error/gateway_error.hpp"
#include "../names/namehash.hpp"
#include "../protocol/resource_client.hpp"
#include "../rpc/client/curl_easy.hpp"
#include "../rpc/json_rpc.hpp"
#include "../utils/hex_utils.hpp"
#include "../utils/string_utils.hpp"
#include "../utils/worker_pool.hpp"

namespace wttp::gateway {
    endpoint::BackendFactory make_rpc_backend_factory(const config::GatewayConfig& config) {
        return [transport = config.transport_, retry = config.retry_](const std::string& rpc_url) -> std::shared_ptr<backend::IContractBackend> {
            auto curl = std::make_unique<rpc::client::CurlEasy>(transport);
            auto json_rpc = std::make_unique<rpc::JsonRpcClient>(rpc_url, std::move(curl), retry);
            return std::make_shared<backend::ContractBackend>(std::move(json_rpc));
        };
    }

    //
    // GatewayBuilder implementation
    //

    GatewayBuilder& GatewayBuilder::with_config(config::GatewayConfig config) {
        config_ = std::move(config);
        return *this;
    }

    GatewayBuilder& GatewayBuilder::with_config_file(const std::filesystem::path& path) {
        config_ = config::load_config_file(path);
        return *this;
    }

    GatewayBuilder& GatewayBuilder::with_backend_factory(endpoint::BackendFactory backend_factory) {
        backend_factory_ = std::move(backend_factory);
        return *this;
    }

    GatewayBuilder& GatewayBuilder::with_caches(cache::CacheSet caches) {
        caches_ = std::move(caches);
        return *this;
    }

    GatewayBuilder& GatewayBuilder::validate() {
        if (config_.networks_.empty()) {
            throw error::ConfigError("At least one network is required");
        }
        if (!config_.find_network(config_.default_network_)) {
            throw error::ConfigError("Default network " + config_.default_network_ + " is not configured");
        }
        if (!config_.find_network(config_.root_network_)) {
            throw error::ConfigError("Root network " + config_.root_network_ + " is not configured");
        }
        if (config_.retry_.max_tries_ == 0) {
            throw error::ConfigError("Retry policy needs at least one try");
        }
        return *this;
    }

    std::unique_ptr<Gateway> GatewayBuilder::build() {
        if (backend_factory_ == nullptr) {
            backend_factory_ = make_rpc_backend_factory(config_);
        }
        auto config = std::make_shared<const config::GatewayConfig>(std::move(config_));
        return std::make_unique<Gateway>(std::move(config), caches_.value_or(cache::CacheSet{}), std::move(backend_factory_));
    }

    //
    // Gateway implementation
    //

    Gateway::Gateway(std::shared_ptr<const config::GatewayConfig> config, cache::CacheSet caches, endpoint::BackendFactory backend_factory)
        : config_(std::move(config)),
          caches_(std::move(caches)),
          registry_(config_, caches_, std::move(backend_factory)),
          resolver_(registry_, caches_.names_) {}

    endpoint::EndpointRegistry& Gateway::registry() { return registry_; }

    names::NameResolver& Gateway::resolver() { return resolver_; }

    const config::GatewayConfig& Gateway::config() const { return *config_; }

    void Gateway::clear_caches() { caches_.clear_all(); }

    Address Gateway::resolve_site(const endpoint::Endpoint& endpoint, const std::string& site, const names::ResolveOptions& options) {
        const std::string trimmed = string_utils::trim(site);
        if (hex_utils::is_address(trimmed)) {
            return hex_utils::parse_address(trimmed);
        }
        if (names::is_resolvable_name(trimmed)) {
            return resolver_.resolve(endpoint, trimmed, options);
        }
        throw error::InvalidArgumentError("Site must be a 0x-prefixed 20-byte address or a dotted name: " + trimmed);
    }

    bool Gateway::name_exists(const endpoint::NetworkSelector& network, const std::string& name) {
        auto endpoint = registry_.get_endpoint(network);
        return resolver_.exists(*endpoint, name);
    }

    protocol::FetchResult Gateway::fetch(const FetchRequest& request) {
        auto endpoint = registry_.get_endpoint(request.network_);
        const Address site = resolve_site(*endpoint, request.site_, request.name_options_);
        spdlog::debug("Fetching {} from {} on {}", request.path_, hex_utils::to_hex(site), endpoint->key_);

        protocol::ResourceClient client(endpoint);
        return client.fetch(site, request.path_, request.options_);
    }

    std::vector<FetchOutcome> Gateway::fetch_many(const std::vector<FetchRequest>& requests, std::size_t num_workers) {
        std::vector<std::future<protocol::FetchResult>> pending;
        pending.reserve(requests.size());

        {
            concurrency::WorkerPool pool(num_workers);
            for (const auto& request : requests) {
                pending.push_back(pool.submit([this, &request]() { return fetch(request); }));
            }
        }

        std::vector<FetchOutcome> outcomes;
        outcomes.reserve(pending.size());
        for (auto& future : pending) {
            FetchOutcome outcome;
            try {
                outcome.result_ = future.get();
            } catch (const std::exception& e) {
                spdlog::warn("Batch fetch failed: {}", e.what());
                outcome.error_ = std::current_exception();
            }
            outcomes.push_back(std::move(outcome));
        }
        return outcomes;
    }
}  // namespace wttp::gateway
