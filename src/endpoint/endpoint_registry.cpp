#include "endpoint_registry.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "../error/gateway_error.hpp"

namespace wttp::endpoint {
    EndpointRegistry::EndpointRegistry(std::shared_ptr<const config::GatewayConfig> config, cache::CacheSet caches, BackendFactory backend_factory)
        : config_(std::move(config)), caches_(std::move(caches)), backend_factory_(std::move(backend_factory)) {}

    const config::GatewayConfig& EndpointRegistry::config() const { return *config_; }

    std::vector<std::string> EndpointRegistry::supported_networks() const { return config_->network_names(); }

    EndpointTarget EndpointRegistry::resolve_target(const NetworkSelector& selector) const {
        switch (selector.kind()) {
            case NetworkSelector::Kind::URL:
                return EndpointTarget{.key_ = selector.value(), .rpc_url_ = selector.value()};
            case NetworkSelector::Kind::CHAIN_ID: {
                auto network = config_->find_network_by_chain(*selector.chain_id());
                if (!network) {
                    throw error::UnsupportedNetworkError(selector.to_string(), supported_networks());
                }
                spdlog::debug("Resolved chain id {} to network {}", selector.value(), network->name_);
                return EndpointTarget{.key_ = network->name_, .rpc_url_ = network->rpc_url_};
            }
            case NetworkSelector::Kind::DEFAULT:
            case NetworkSelector::Kind::NAME: {
                const std::string& name = selector.kind() == NetworkSelector::Kind::DEFAULT ? config_->default_network_ : selector.value();
                auto network = config_->find_network(name);
                if (!network) {
                    throw error::UnsupportedNetworkError(name, supported_networks());
                }
                return EndpointTarget{.key_ = network->name_, .rpc_url_ = network->rpc_url_};
            }
        }
        throw error::UnsupportedNetworkError(selector.to_string(), supported_networks());
    }

    std::shared_ptr<const Endpoint> EndpointRegistry::get_endpoint(const NetworkSelector& selector) {
        const EndpointTarget target = resolve_target(selector);

        if (auto cached = caches_.endpoints_->get(target.key_)) {
            spdlog::debug("Using cached endpoint for network {}", target.key_);
            return *cached;
        }

        std::shared_ptr<backend::IContractBackend> backend = backend_factory_(target.rpc_url_);
        if (backend == nullptr) {
            throw error::GatewayError("Backend factory returned no backend for " + target.rpc_url_);
        }

        auto created = std::make_shared<Endpoint>();
        created->key_ = target.key_;
        created->rpc_url_ = target.rpc_url_;
        created->backend_ = std::move(backend);
        created->network_ = caches_.network_info_->get(target.key_);

        if (!created->network_) {
            try {
                created->network_ = NetworkInfo{.chain_id_ = created->backend_->chain_id()};
                caches_.network_info_->put(target.key_, *created->network_);
                spdlog::debug("Cached network info for {}: chain {}", target.key_, created->network_->chain_id_);
            } catch (const std::exception& e) {
                spdlog::warn("Failed to cache network info for {}: {}", target.key_, e.what());
            }
        }

        std::shared_ptr<const Endpoint> stored = caches_.endpoints_->insert_if_absent(target.key_, created);
        if (stored != created) {
            spdlog::debug("Endpoint for {} was created concurrently, discarding duplicate", target.key_);
        } else {
            spdlog::debug("Cached endpoint for network {} ({})", target.key_, target.rpc_url_);
        }
        return stored;
    }

    void EndpointRegistry::clear() {
        caches_.endpoints_->clear();
        caches_.network_info_->clear();
    }
}  // namespace wttp::endpoint
