#ifndef WTTP_GATEWAY_CACHE_SET_HPP
#define WTTP_GATEWAY_CACHE_SET_HPP

#pragma once

#include <memory>
#include <string>

#include "../endpoint/endpoint.hpp"
#include "../utils/types.hpp"
#include "locked_map.hpp"

namespace wttp::cache {
    using EndpointCache = LockedMap<std::string, std::shared_ptr<const endpoint::Endpoint>>;
    using NetworkInfoCache = LockedMap<std::string, endpoint::NetworkInfo>;
    using NameCache = LockedMap<std::string, Address>;

    // The gateway's only shared mutable state. Owned by whoever builds the gateway; tests build a
    // fresh set per case.
    struct CacheSet {
        std::shared_ptr<EndpointCache> endpoints_ = std::make_shared<EndpointCache>();
        std::shared_ptr<NetworkInfoCache> network_info_ = std::make_shared<NetworkInfoCache>();
        std::shared_ptr<NameCache> names_ = std::make_shared<NameCache>();

        void clear_all() const {
            endpoints_->clear();
            network_info_->clear();
            names_->clear();
        }
    };
}  // namespace wttp::cache

#endif
