#ifndef WTTP_GATEWAY_JSON_RPC_HPP
#define WTTP_GATEWAY_JSON_RPC_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>

#include "../utils/types.hpp"
#include "client/interface.hpp"
#include "model/model.hpp"

namespace wttp::rpc {
    // Ethereum JSON-RPC over a single transport handle. Calls are serialized so one client can be
    // shared by concurrent requests against the same endpoint.
    class JsonRpcClient {
       public:
        JsonRpcClient(std::string url, std::unique_ptr<client::IRpcTransport> transport, model::RetryPolicy retry_policy = {});

        Bytes eth_call(const Address& to, std::span<const std::uint8_t> data);
        std::uint64_t chain_id();

        [[nodiscard]] const std::string& url() const;

        static std::string build_envelope(std::uint64_t id, const std::string& method, const std::string& params_json);
        // Returns the "result" member as a string, throwing RpcError for error objects or malformed replies.
        static std::string parse_result(const model::Response& resp);

       private:
        std::string call(const std::string& method, const std::string& params_json);

        std::string url_;
        std::unique_ptr<client::IRpcTransport> transport_;
        model::RetryPolicy retry_policy_;
        std::mutex mutex_;
        std::atomic<std::uint64_t> next_id_{1};
    };
}  // namespace wttp::rpc

#endif
