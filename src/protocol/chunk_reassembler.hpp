#ifndef WTTP_GATEWAY_CHUNK_REASSEMBLER_HPP
#define WTTP_GATEWAY_CHUNK_REASSEMBLER_HPP

#include <memory>
#include <vector>

#include "../endpoint/endpoint.hpp"
#include "../utils/types.hpp"

namespace wttp::protocol {
    // Reads a resource's chunks from the site's storage contract and concatenates them in list order.
    class ChunkReassembler {
       public:
        explicit ChunkReassembler(std::shared_ptr<const endpoint::Endpoint> endpoint);

        // Throws InvalidArgumentError on an empty list and ChunkReadError on the first failed read.
        Bytes reassemble(const Address& site, const std::vector<Hash32>& chunk_ids) const;

       private:
        std::shared_ptr<const endpoint::Endpoint> endpoint_;
    };
}  // namespace wttp::protocol

#endif
