#ifndef WTTP_GATEWAY_PROTOCOL_MODEL_HPP
#define WTTP_GATEWAY_PROTOCOL_MODEL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../utils/constants.hpp"
#include "../utils/types.hpp"

namespace wttp::protocol {
    enum class Status : std::uint16_t {
        OK = 200,
        PARTIAL_CONTENT = 206,
        MOVED_PERMANENTLY = 301,
        FOUND = 302,
        NOT_MODIFIED = 304,
        TEMPORARY_REDIRECT = 307,
        PERMANENT_REDIRECT = 308,
        NOT_FOUND = 404,
    };

    struct CachePolicy {
        bool immutable_ = false;
        std::uint64_t preset_ = 0;
        std::string custom_;
    };

    struct CorsPolicy {
        std::uint64_t methods_ = 1;
        std::vector<Hash32> origins_;
        std::uint64_t preset_ = 0;
        std::string custom_;
    };

    struct Redirect {
        std::uint64_t code_ = 0;
        std::string location_;
    };

    struct HeaderInfo {
        CachePolicy cache_;
        CorsPolicy cors_;
        Redirect redirect_;
    };

    // 2-byte codes as stored on chain, e.g. "th" (0x7468) for text/html.
    struct ContentProperties {
        MimeCode mime_type_{};
        MimeCode charset_{};
        MimeCode encoding_{};
        MimeCode language_{};
    };

    struct ResourceMetadata {
        ContentProperties properties_;
        std::uint64_t size_ = 0;
        std::uint64_t version_ = 0;
        std::uint64_t last_modified_ = 0;
        Hash32 header_{};
    };

    struct ResponseHead {
        std::uint64_t status_ = static_cast<std::uint64_t>(Status::NOT_FOUND);
        HeaderInfo header_info_;
        ResourceMetadata metadata_;
        Hash32 etag_{};
    };

    struct ChunkRange {
        std::int64_t start_ = 0;
        std::int64_t end_ = constants::RANGE_TO_END;

        [[nodiscard]] bool is_full() const { return start_ == 0 && end_ == constants::RANGE_TO_END; }
    };

    struct ResourceChunks {
        std::vector<Hash32> chunk_ids_;
        std::uint64_t total_chunks_ = 0;
    };

    struct ResourceLocation {
        ResponseHead head_;
        ResourceChunks resource_;
    };

    struct HeadRequest {
        std::string path_;
        std::uint64_t if_modified_since_ = 0;
        Hash32 if_none_match_{};
    };

    struct LocateRequest {
        HeadRequest head_;
        ChunkRange range_;
    };

    struct RequestOptions {
        std::uint64_t if_modified_since_ = 0;
        Hash32 if_none_match_{};
        ChunkRange range_;
        bool head_only_ = false;
        bool chunk_ids_only_ = false;
        int max_redirects_ = constants::DEFAULT_MAX_REDIRECTS;
        // Surface "endpoint unreachable after retry" as EndpointUnreachableError instead of a 404.
        bool strict_transport_ = false;
    };

    struct FetchResult {
        ResourceLocation response_;
        std::optional<Bytes> content_;
        // Path the response was served from after redirects and index fallback.
        std::string resolved_path_;
    };

    [[nodiscard]] inline bool is_success(std::uint64_t status) {
        return status == static_cast<std::uint64_t>(Status::OK) || status == static_cast<std::uint64_t>(Status::PARTIAL_CONTENT);
    }

    [[nodiscard]] inline bool is_redirect(std::uint64_t status) {
        return status == static_cast<std::uint64_t>(Status::MOVED_PERMANENTLY) || status == static_cast<std::uint64_t>(Status::FOUND) ||
               status == static_cast<std::uint64_t>(Status::TEMPORARY_REDIRECT) || status == static_cast<std::uint64_t>(Status::PERMANENT_REDIRECT);
    }

    [[nodiscard]] inline ResponseHead not_found_head() { return ResponseHead{}; }

    [[nodiscard]] inline ResourceLocation not_found_location() { return ResourceLocation{}; }
}  // namespace wttp::protocol

#endif
