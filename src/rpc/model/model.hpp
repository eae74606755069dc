#ifndef WTTP_GATEWAY_RPC_MODEL_HPP
#define WTTP_GATEWAY_RPC_MODEL_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace wttp::rpc::model {
    const long BASE_DELAY_MS = 300;
    const long MAX_DELAY_MS = 1500;
    const long CONNECT_TIMEOUT_MS = 10'000L;
    const long TIMEOUT_MS = 30'000L;

    struct RetryPolicy {
        size_t max_tries_ = 3;
        std::chrono::milliseconds base_delay_{BASE_DELAY_MS};
        std::chrono::milliseconds max_delay_{MAX_DELAY_MS};
    };

    struct TransportOptions {
        long connect_timeout_ms_ = CONNECT_TIMEOUT_MS;
        long timeout_ms_ = TIMEOUT_MS;
        std::string user_agent_ = "wttp-gateway/1.0";
    };

    struct Request {
        std::string url_;
        std::string method_ = "POST";
        std::string body_;

        std::vector<std::string> headers_;
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        std::string effective_url_;

        std::string retry_after_;
        std::string content_type_;
    };
}  // namespace wttp::rpc::model

#endif
