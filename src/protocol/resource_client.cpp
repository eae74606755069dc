#include "resource_client.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <string>
#include <utility>

#include "../error/gateway_error.hpp"
#include "../path/path_normalizer.hpp"
#include "../utils/constants.hpp"

namespace wttp::protocol {
    ResourceClient::ResourceClient(std::shared_ptr<const endpoint::Endpoint> endpoint) : endpoint_(std::move(endpoint)), reassembler_(endpoint_) {}

    HeadRequest ResourceClient::make_head_request(const std::string& path, const RequestOptions& options) const {
        return HeadRequest{.path_ = path, .if_modified_since_ = options.if_modified_since_, .if_none_match_ = options.if_none_match_};
    }

    std::optional<ResponseHead> ResourceClient::try_head(const Address& site, const HeadRequest& req, std::string& failure) const {
        try {
            return endpoint_->backend_->head(site, req);
        } catch (const std::exception& e) {
            failure = e.what();
            spdlog::warn("HEAD {} failed on {}: {}", req.path_, endpoint_->key_, failure);
            return std::nullopt;
        }
    }

    std::optional<ResourceLocation> ResourceClient::try_locate(const Address& site, const LocateRequest& req, std::string& failure) const {
        try {
            return endpoint_->backend_->locate(site, req);
        } catch (const std::exception& e) {
            failure = e.what();
            spdlog::warn("GET {} [{}, {}] failed on {}: {}", req.head_.path_, req.range_.start_, req.range_.end_, endpoint_->key_, failure);
            return std::nullopt;
        }
    }

    ResponseHead ResourceClient::head(const Address& site, const std::string& path, std::uint64_t if_modified_since, const Hash32& if_none_match,
                                      bool strict) const {
        std::string failure;
        auto result = try_head(site, HeadRequest{.path_ = path, .if_modified_since_ = if_modified_since, .if_none_match_ = if_none_match}, failure);
        if (result) {
            return *result;
        }
        if (strict) {
            throw error::EndpointUnreachableError(endpoint_->key_, path, failure);
        }
        return not_found_head();
    }

    ResourceLocation ResourceClient::locate(const Address& site, const std::string& path, const ChunkRange& range, std::uint64_t if_modified_since,
                                            const Hash32& if_none_match, bool strict) const {
        LocateRequest req{.head_ = HeadRequest{.path_ = path, .if_modified_since_ = if_modified_since, .if_none_match_ = if_none_match}, .range_ = range};

        std::string failure;
        if (auto result = try_locate(site, req, failure)) {
            return *result;
        }

        req.range_ = ChunkRange{};
        if (auto retried = try_locate(site, req, failure)) {
            return *retried;
        }

        if (strict) {
            throw error::EndpointUnreachableError(endpoint_->key_, path, failure);
        }
        spdlog::warn("GET {} failed after retry, answering 404", path);
        return not_found_location();
    }

    void ResourceClient::follow_redirects(const Address& site, const RequestOptions& options, std::string& path, ResponseHead& head) const {
        int redirects_left = options.max_redirects_;
        while (is_redirect(head.status_) && !head.header_info_.redirect_.location_.empty() && redirects_left > 0) {
            const std::string next = path::resolve_redirect(path, head.header_info_.redirect_.location_);
            spdlog::info("{} {} -> {}", head.status_, path, next);
            --redirects_left;
            path = next;
            head = this->head(site, path, options.if_modified_since_, options.if_none_match_, options.strict_transport_);
        }

        if (is_redirect(head.status_) && redirects_left == 0) {
            spdlog::warn("Redirect limit of {} reached at {}", options.max_redirects_, path);
        }
    }

    bool ResourceClient::try_index_fallback(const Address& site, const RequestOptions& options, std::string& path, ResponseHead& head) const {
        for (const char* candidate : constants::INDEX_CANDIDATES) {
            const std::string candidate_path = path::join_index(path, candidate);
            std::string failure;
            auto candidate_head = try_head(site, make_head_request(candidate_path, options), failure);
            if (candidate_head && is_success(candidate_head->status_)) {
                spdlog::info("Index fallback succeeded at {}", candidate_path);
                head = *candidate_head;
                path = candidate_path;
                return true;
            }
        }
        return false;
    }

    void ResourceClient::repair_undercount(const Address& site, const std::string& path, const RequestOptions& options, ResourceLocation& location) const {
        const std::uint64_t total = location.resource_.total_chunks_;
        if (total == 0 || !is_success(location.head_.status_)) {
            return;
        }

        std::string failure;
        if (location.resource_.chunk_ids_.size() < total && options.range_.is_full()) {
            spdlog::warn("Missing chunks for {}: expected {}, got {}", path, total, location.resource_.chunk_ids_.size());
            LocateRequest req{.head_ = make_head_request(path, options), .range_ = ChunkRange{.start_ = 0, .end_ = static_cast<std::int64_t>(total - 1)}};
            auto full = try_locate(site, req, failure);
            if (full && full->resource_.chunk_ids_.size() > location.resource_.chunk_ids_.size()) {
                spdlog::info("Fetched {}/{} chunk ids for {}", full->resource_.chunk_ids_.size(), total, path);
                location = std::move(*full);
            } else if (full) {
                spdlog::warn("Still missing chunks for {} after explicit range", path);
            }
        }

        // Page in the first chunk so the caller can see content exists.
        if (location.resource_.chunk_ids_.empty() && location.resource_.total_chunks_ > 0 && is_success(location.head_.status_)) {
            LocateRequest req{.head_ = make_head_request(path, options), .range_ = ChunkRange{.start_ = 0, .end_ = 0}};
            if (auto first = try_locate(site, req, failure)) {
                spdlog::info("Paged first chunk of {}: {} returned", path, first->resource_.chunk_ids_.size());
                location = std::move(*first);
            }
        }
    }

    FetchResult ResourceClient::fetch(const Address& site, const std::string& requested_path, const RequestOptions& options) const {
        std::string path = path::normalize(requested_path);

        if (options.head_only_) {
            ResponseHead only = head(site, path, options.if_modified_since_, options.if_none_match_, options.strict_transport_);
            return FetchResult{.response_ = ResourceLocation{.head_ = std::move(only), .resource_ = {}}, .content_ = std::nullopt, .resolved_path_ = path};
        }

        ResponseHead current = head(site, path, options.if_modified_since_, options.if_none_match_, options.strict_transport_);
        follow_redirects(site, options, path, current);

        ResourceLocation location;
        if (is_success(current.status_)) {
            location = locate(site, path, options.range_, options.if_modified_since_, options.if_none_match_, options.strict_transport_);
        } else {
            if (current.status_ == static_cast<std::uint64_t>(Status::NOT_FOUND) && path::is_directory_like(path)) {
                try_index_fallback(site, options, path, current);
            }

            if (is_success(current.status_)) {
                location = locate(site, path, options.range_, options.if_modified_since_, options.if_none_match_, options.strict_transport_);
            } else {
                // HEAD may be refused where GET is allowed.
                std::string failure;
                auto direct = try_locate(site, LocateRequest{.head_ = make_head_request(path, options), .range_ = options.range_}, failure);
                if (!direct || !is_success(direct->head_.status_)) {
                    return FetchResult{
                        .response_ = ResourceLocation{.head_ = std::move(current), .resource_ = {}}, .content_ = std::nullopt, .resolved_path_ = path};
                }
                spdlog::info("Direct GET succeeded for {} after HEAD returned {}", path, current.status_);
                location = std::move(*direct);
            }
        }

        repair_undercount(site, path, options, location);

        FetchResult result{.response_ = std::move(location), .content_ = std::nullopt, .resolved_path_ = path};
        const auto& resource = result.response_.resource_;
        if (options.chunk_ids_only_ || !is_success(result.response_.head_.status_)) {
            return result;
        }

        if (!resource.chunk_ids_.empty()) {
            result.content_ = reassembler_.reassemble(site, resource.chunk_ids_);
        } else if (resource.total_chunks_ == 0) {
            result.content_ = Bytes{};
        } else {
            spdlog::warn("{} declares {} chunks but none could be located", path, resource.total_chunks_);
        }
        return result;
    }
}  // namespace wttp::protocol
