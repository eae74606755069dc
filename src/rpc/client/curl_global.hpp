#ifndef WTTP_GATEWAY_CURL_GLOBAL_HPP
#define WTTP_GATEWAY_CURL_GLOBAL_HPP

namespace wttp::rpc::client {

    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace wttp::rpc::client

#endif
