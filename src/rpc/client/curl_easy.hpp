#ifndef WTTP_GATEWAY_CURL_EASY_HPP
#define WTTP_GATEWAY_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace wttp::rpc::client {
    const size_t ERROR_BUFFER_SIZE = 256;

    enum class HttpStatusCode : long {
        OK = 200,
        TOO_MANY_REQUESTS = 429,
        BAD_GATEWAY = 502,
        SERVICE_UNAVAILABLE = 503,
        GATEWAY_TIMEOUT = 504,
    };

    // JSON-RPC over HTTP POST on a single easy handle, so the node connection is reused between calls.
    // Not thread-safe; callers serialize access.
    class CurlEasy : public IRpcTransport {
       public:
        explicit CurlEasy(model::TransportOptions options = {});

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        model::Response post(const model::Request& req) override;
        model::Response post_with_retries(const model::Request& req, const model::RetryPolicy& p = {}) override;

        // Exponential back-off with jitter; returns the next delay, capped at max_delay_.
        static std::chrono::milliseconds backoff(const model::RetryPolicy& p, std::chrono::milliseconds delay);

        // Retry-After in whole seconds, capped at max_delay_. nullopt when absent or not a positive number.
        static std::optional<std::chrono::milliseconds> retry_after_delay(const model::Response& resp, const model::RetryPolicy& p);

        static bool is_retryable_http(long code) {
            return code == static_cast<long>(HttpStatusCode::TOO_MANY_REQUESTS) || code == static_cast<long>(HttpStatusCode::BAD_GATEWAY) ||
                   code == static_cast<long>(HttpStatusCode::SERVICE_UNAVAILABLE) || code == static_cast<long>(HttpStatusCode::GATEWAY_TIMEOUT);
        }

       private:
        template <typename T>
        void setopt(CURLoption option, T value);

        void apply_defaults();
        void apply_request(const model::Request& req, std::string& body);
        void perform(const std::string& url);
        model::Response collect_response(const std::string& url, std::string& body);
        static size_t on_header(char* buffer, size_t size, size_t n_items, void* userdata);

        model::TransportOptions options_;

        std::string retry_after_;
        std::string content_type_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        // Rebuilt only when a request carries a different header set.
        std::vector<std::string> applied_headers_;
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace wttp::rpc::client

#endif
