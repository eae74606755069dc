#ifndef WTTP_GATEWAY_BACKEND_INTERFACE_HPP
#define WTTP_GATEWAY_BACKEND_INTERFACE_HPP

#include <cstdint>
#include <string>

#include "../protocol/model.hpp"
#include "../utils/types.hpp"

namespace wttp::backend {
    // Capabilities the gateway needs from a chain: the site contract's HEAD/GET/DPS queries, the
    // storage contract's chunk read and the two-hop naming lookup. Any failure is reported by
    // throwing; callers decide which failures are folded into protocol statuses.
    class IContractBackend {
       public:
        IContractBackend() = default;
        virtual ~IContractBackend() = default;
        IContractBackend(const IContractBackend&) = delete;
        IContractBackend& operator=(const IContractBackend&) = delete;
        IContractBackend(IContractBackend&&) = delete;
        IContractBackend& operator=(IContractBackend&&) = delete;

        virtual std::uint64_t chain_id() = 0;

        virtual protocol::ResponseHead head(const Address& site, const protocol::HeadRequest& req) = 0;
        virtual protocol::ResourceLocation locate(const Address& site, const protocol::LocateRequest& req) = 0;
        virtual Address storage_of(const Address& site) = 0;
        virtual Bytes read_chunk(const Address& storage, const Hash32& chunk_id) = 0;

        virtual Address resolver_of(const Address& registry, const Hash32& node) = 0;
        virtual Address address_of(const Address& resolver, const Hash32& node) = 0;
        virtual Address owner_of(const Address& registry, const Hash32& node) = 0;

        [[nodiscard]] virtual std::string describe() const = 0;
    };
}  // namespace wttp::backend

#endif
