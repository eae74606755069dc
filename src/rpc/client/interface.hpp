#ifndef WTTP_GATEWAY_RPC_CLIENT_INTERFACE_HPP
#define WTTP_GATEWAY_RPC_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace wttp::rpc::client {
    class IRpcTransport {
       public:
        IRpcTransport() = default;
        virtual ~IRpcTransport() = default;
        IRpcTransport(const IRpcTransport&) = delete;
        IRpcTransport& operator=(const IRpcTransport&) = delete;
        IRpcTransport(IRpcTransport&&) = delete;
        IRpcTransport& operator=(IRpcTransport&&) = delete;

        virtual model::Response post(const model::Request& req) = 0;
        virtual model::Response post_with_retries(const model::Request& req, const model::RetryPolicy& p = {}) = 0;
    };
}  // namespace wttp::rpc::client

#endif
