#include "chunk_reassembler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../error/gateway_error.hpp"
#include "../utils/hex_utils.hpp"

namespace wttp::protocol {
    ChunkReassembler::ChunkReassembler(std::shared_ptr<const endpoint::Endpoint> endpoint) : endpoint_(std::move(endpoint)) {}

    Bytes ChunkReassembler::reassemble(const Address& site, const std::vector<Hash32>& chunk_ids) const {
        if (chunk_ids.empty()) {
            throw error::InvalidArgumentError("No chunk ids to reassemble");
        }

        const std::size_t total = chunk_ids.size();
        Address storage{};
        try {
            storage = endpoint_->backend_->storage_of(site);
        } catch (const std::exception& e) {
            throw error::ChunkReadError(0, total, std::string("storage lookup failed: ") + e.what());
        }

        std::vector<Bytes> chunks;
        chunks.reserve(total);
        std::size_t total_size = 0;

        for (std::size_t i = 0; i < total; ++i) {
            spdlog::debug("Reading chunk {}/{} ({})", i + 1, total, hex_utils::preview(chunk_ids[i]));
            try {
                chunks.push_back(endpoint_->backend_->read_chunk(storage, chunk_ids[i]));
            } catch (const std::exception& e) {
                throw error::ChunkReadError(i, total, e.what());
            }
            total_size += chunks.back().size();
        }

        Bytes content(total_size);
        std::size_t offset = 0;
        for (const auto& chunk : chunks) {
            std::copy(chunk.begin(), chunk.end(), content.begin() + static_cast<std::ptrdiff_t>(offset));
            offset += chunk.size();
        }

        spdlog::info("Reassembled {} bytes from {} chunks", total_size, total);
        return content;
    }
}  // namespace wttp::protocol
