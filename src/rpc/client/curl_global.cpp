#include "curl_global.hpp"

#include <curl/curl.h>

#include "../../error/gateway_error.hpp"

namespace wttp::rpc::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw error::GatewayError("Failed to initialize libcurl");
        }
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

}  // namespace wttp::rpc::client
