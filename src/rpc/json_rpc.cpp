#include "json_rpc.hpp"

#include <simdjson.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <string>

#include "../error/gateway_error.hpp"
#include "../utils/constants.hpp"
#include "../utils/hex_utils.hpp"
#include "../utils/string_utils.hpp"

using namespace simdjson;

const long HTTP_SUCCESS_LOWER_BOUNDARY = 200;
const long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
const long MALFORMED_REPLY_CODE = -32700;

namespace wttp::rpc {
    struct JsonRpcMethods {
        static constexpr const char* ETH_CALL = "eth_call";
        static constexpr const char* ETH_CHAIN_ID = "eth_chainId";
    };

    JsonRpcClient::JsonRpcClient(std::string url, std::unique_ptr<client::IRpcTransport> transport, model::RetryPolicy retry_policy)
        : url_(std::move(url)), transport_(std::move(transport)), retry_policy_(retry_policy) {}

    const std::string& JsonRpcClient::url() const { return url_; }

    std::string JsonRpcClient::build_envelope(std::uint64_t id, const std::string& method, const std::string& params_json) {
        return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":")" + string_utils::escape_json(method) + R"(","params":)" +
               params_json + "}";
    }

    std::string JsonRpcClient::parse_result(const model::Response& resp) {
        const std::string preview = resp.body_.substr(0, error::ERROR_MESSAGE_LENGTH);

        if (resp.status_ < HTTP_SUCCESS_LOWER_BOUNDARY || resp.status_ >= HTTP_SUCCESS_UPPER_BOUNDARY) {
            throw error::RpcError(resp.status_, resp.effective_url_, preview, "RPC request failed with status " + std::to_string(resp.status_));
        }

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);
            ondemand::object root = doc.get_object();

            auto error_field = root["error"];
            if (error_field.error() == simdjson::SUCCESS) {
                ondemand::object error_object = error_field.get_object();

                int64_t code = MALFORMED_REPLY_CODE;
                std::string_view message = "unknown error";
                if (error_object["code"].get_int64().get(code) != simdjson::SUCCESS) {
                    code = MALFORMED_REPLY_CODE;
                }
                if (error_object["message"].get_string().get(message) != simdjson::SUCCESS) {
                    message = "unknown error";
                }
                throw error::RpcError(static_cast<long>(code), resp.effective_url_, preview, "RPC error: " + std::string(message));
            }

            std::string_view result = root["result"].get_string();
            return std::string(result);
        } catch (const simdjson::simdjson_error& e) {
            throw error::RpcError(MALFORMED_REPLY_CODE, resp.effective_url_, preview, "Failed to parse JSON-RPC response: " + std::string(e.what()));
        }
    }

    std::string JsonRpcClient::call(const std::string& method, const std::string& params_json) {
        model::Request req;
        req.url_ = url_;
        req.method_ = "POST";
        req.headers_ = {"Content-Type: application/json", "Accept: application/json"};
        req.body_ = build_envelope(next_id_++, method, params_json);

        model::Response resp;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            resp = transport_->post_with_retries(req, retry_policy_);
        }

        if (resp.effective_url_.empty()) {
            resp.effective_url_ = url_;
        }

        return parse_result(resp);
    }

    Bytes JsonRpcClient::eth_call(const Address& to, std::span<const std::uint8_t> data) {
        const std::string params = R"([{"to":")" + hex_utils::to_hex(to) + R"(","data":")" + hex_utils::to_hex(data) + R"("},"latest"])";
        spdlog::debug("eth_call {} selector {}", hex_utils::to_hex(to), hex_utils::to_hex(data.first(std::min(data.size(), constants::SELECTOR_SIZE))));
        return hex_utils::from_hex(call(JsonRpcMethods::ETH_CALL, params));
    }

    std::uint64_t JsonRpcClient::chain_id() {
        const std::string result = call(JsonRpcMethods::ETH_CHAIN_ID, "[]");

        char* end = nullptr;
        const unsigned long long value = std::strtoull(result.c_str(), &end, constants::BASE_16);
        if (end == result.c_str() || *end != '\0') {
            throw error::RpcError(MALFORMED_REPLY_CODE, url_, result, "Invalid chain id in RPC response: " + result);
        }
        return static_cast<std::uint64_t>(value);
    }
}  // namespace wttp::rpc
