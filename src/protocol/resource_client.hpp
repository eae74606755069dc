#ifndef WTTP_GATEWAY_RESOURCE_CLIENT_HPP
#define WTTP_GATEWAY_RESOURCE_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "../endpoint/endpoint.hpp"
#include "../utils/types.hpp"
#include "chunk_reassembler.hpp"
#include "model.hpp"

namespace wttp::protocol {
    // HTTP-style retrieval over a site contract's HEAD and GET queries.
    //
    // A fetch walks RESOLVE_HEAD -> [REDIRECT]* -> [INDEX_FALLBACK]? -> GET_LOCATION -> DONE. Backend
    // failures during HEAD/GET become 404 results unless strict_transport_ is set; not-found and
    // redirect outcomes are returned, never thrown.
    class ResourceClient {
       public:
        explicit ResourceClient(std::shared_ptr<const endpoint::Endpoint> endpoint);

        ResponseHead head(const Address& site, const std::string& path, std::uint64_t if_modified_since = 0, const Hash32& if_none_match = ZERO_HASH,
                          bool strict = false) const;

        // Retried once with the full range on failure; a second failure yields a 404 location.
        ResourceLocation locate(const Address& site, const std::string& path, const ChunkRange& range, std::uint64_t if_modified_since = 0,
                                const Hash32& if_none_match = ZERO_HASH, bool strict = false) const;

        FetchResult fetch(const Address& site, const std::string& path, const RequestOptions& options = {}) const;

       private:
        std::optional<ResponseHead> try_head(const Address& site, const HeadRequest& req, std::string& failure) const;
        std::optional<ResourceLocation> try_locate(const Address& site, const LocateRequest& req, std::string& failure) const;

        void follow_redirects(const Address& site, const RequestOptions& options, std::string& path, ResponseHead& head) const;
        bool try_index_fallback(const Address& site, const RequestOptions& options, std::string& path, ResponseHead& head) const;
        void repair_undercount(const Address& site, const std::string& path, const RequestOptions& options, ResourceLocation& location) const;

        [[nodiscard]] HeadRequest make_head_request(const std::string& path, const RequestOptions& options) const;

        std::shared_ptr<const endpoint::Endpoint> endpoint_;
        ChunkReassembler reassembler_;
    };
}  // namespace wttp::protocol

#endif
