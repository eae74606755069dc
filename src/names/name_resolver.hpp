#ifndef WTTP_GATEWAY_NAME_RESOLVER_HPP
#define WTTP_GATEWAY_NAME_RESOLVER_HPP

#include <memory>
#include <string>

#include "../cache/cache_set.hpp"
#include "../endpoint/endpoint.hpp"
#include "../endpoint/endpoint_registry.hpp"
#include "../utils/types.hpp"

namespace wttp::names {
    struct ResolveOptions {
        bool fallback_to_root_ = true;
        bool use_cache_ = true;
    };

    class NameResolver {
       public:
        NameResolver(endpoint::EndpointRegistry& registry, std::shared_ptr<cache::NameCache> cache);

        // Throws NameNotRegisteredError (no fallback attempted) or NameResolutionError (both networks failed).
        Address resolve(const endpoint::Endpoint& endpoint, const std::string& name, const ResolveOptions& options = {});

        // True when the name has a non-zero owner in the network's registry. Never throws.
        bool exists(const endpoint::Endpoint& endpoint, const std::string& name);

        void clear_cache();

       private:
        Address resolve_on(const endpoint::Endpoint& endpoint, const std::string& name) const;
        Address registry_for(const endpoint::Endpoint& endpoint, const std::string& name) const;
        [[nodiscard]] bool is_root(const endpoint::Endpoint& endpoint) const;

        endpoint::EndpointRegistry& registry_;
        std::shared_ptr<cache::NameCache> cache_;
    };
}  // namespace wttp::names

#endif
