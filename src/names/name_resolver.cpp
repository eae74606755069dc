#include "name_resolver.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "../error/gateway_error.hpp"
#include "../utils/constants.hpp"
#include "../utils/hex_utils.hpp"
#include "namehash.hpp"

namespace wttp::names {
    NameResolver::NameResolver(endpoint::EndpointRegistry& registry, std::shared_ptr<cache::NameCache> cache)
        : registry_(registry), cache_(std::move(cache)) {}

    Address NameResolver::resolve(const endpoint::Endpoint& endpoint, const std::string& name, const ResolveOptions& options) {
        const std::string normalized = normalize_name(name);
        if (normalized.empty()) {
            throw error::InvalidArgumentError("Name must not be empty");
        }

        if (options.use_cache_) {
            if (auto cached = cache_->get(normalized)) {
                spdlog::debug("Name cache hit for {}: {}", normalized, hex_utils::to_hex(*cached));
                return *cached;
            }
        }

        Address resolved{};
        try {
            resolved = resolve_on(endpoint, normalized);
        } catch (const std::exception& primary) {
            if (!options.fallback_to_root_ || is_root(endpoint)) {
                throw;
            }

            const std::string primary_error = primary.what();
            spdlog::info("Resolving {} on {} failed ({}), falling back to {}", normalized, endpoint.key_, primary_error,
                         registry_.config().root_network_);

            try {
                auto root = registry_.get_endpoint(registry_.config().root_network_);
                resolved = resolve_on(*root, normalized);
            } catch (const std::exception& fallback) {
                spdlog::warn("Fallback resolution of {} failed: {}", normalized, fallback.what());
                throw error::NameResolutionError(normalized, primary_error, fallback.what());
            }
        }

        spdlog::info("Resolved {} to {}", normalized, hex_utils::to_hex(resolved));
        if (options.use_cache_) {
            cache_->insert_if_absent(normalized, resolved);
        }
        return resolved;
    }

    bool NameResolver::exists(const endpoint::Endpoint& endpoint, const std::string& name) {
        const std::string normalized = normalize_name(name);
        try {
            const Address registry = registry_for(endpoint, normalized);
            return endpoint.backend_->owner_of(registry, namehash(normalized)) != ZERO_ADDRESS;
        } catch (const std::exception& e) {
            spdlog::debug("Owner lookup for {} failed: {}", normalized, e.what());
            return false;
        }
    }

    void NameResolver::clear_cache() { cache_->clear(); }

    Address NameResolver::registry_for(const endpoint::Endpoint& endpoint, const std::string& name) const {
        const auto chain_id = endpoint.chain_id();
        if (!chain_id) {
            throw error::NameNotRegisteredError(name, std::nullopt, "network identity of " + endpoint.key_ + " is unknown");
        }

        auto registry = registry_.config().find_registry(*chain_id);
        if (!registry) {
            throw error::NameNotRegisteredError(name, chain_id, "no naming registry on this network");
        }
        return *registry;
    }

    Address NameResolver::resolve_on(const endpoint::Endpoint& endpoint, const std::string& name) const {
        const Address registry = registry_for(endpoint, name);
        const Hash32 node = namehash(name);
        spdlog::debug("Namehash of {} is {}", name, hex_utils::to_hex(node));

        const Address resolver = endpoint.backend_->resolver_of(registry, node);
        if (resolver == ZERO_ADDRESS) {
            throw error::NameNotRegisteredError(name, endpoint.chain_id(), "no resolver set");
        }

        const Address resolved = endpoint.backend_->address_of(resolver, node);
        if (resolved == ZERO_ADDRESS) {
            throw error::NameNotRegisteredError(name, endpoint.chain_id(), "resolver returned the zero address");
        }
        return resolved;
    }

    bool NameResolver::is_root(const endpoint::Endpoint& endpoint) const {
        if (endpoint.key_ == registry_.config().root_network_) {
            return true;
        }
        return endpoint.chain_id() == constants::ROOT_CHAIN_ID;
    }
}  // namespace wttp::names
