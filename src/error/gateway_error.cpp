#include "gateway_error.hpp"

#include <stdexcept>
#include <string>

namespace wttp::error {
    namespace {
        std::string join_names(const std::vector<std::string> &names) {
            std::string out;
            for (const auto &name : names) {
                if (!out.empty()) {
                    out += ", ";
                }
                out += name;
            }
            return out;
        }

        std::string describe_chain(std::optional<std::uint64_t> chain_id) {
            return chain_id ? "chain " + std::to_string(*chain_id) : std::string("unknown chain");
        }
    }  // namespace

    GatewayError::GatewayError(const std::string &msg) : std::runtime_error(msg) {}

    RpcError::RpcError(long code, std::string endpoint,
                       std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                       const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : GatewayError(msg), code_(code), endpoint_(std::move(endpoint)), body_preview_(std::move(preview)) {}

    AbiError::AbiError(const std::string &msg) : GatewayError("ABI decoding failed: " + msg) {}

    ConfigError::ConfigError(const std::string &msg) : GatewayError(msg) {}

    InvalidArgumentError::InvalidArgumentError(const std::string &msg) : GatewayError(msg) {}

    UnsupportedNetworkError::UnsupportedNetworkError(std::string selector, std::vector<std::string> supported)
        : GatewayError("Unsupported network: " + selector + ". Supported networks: " + join_names(supported)),
          selector_(std::move(selector)),
          supported_(std::move(supported)) {}

    InvalidPathError::InvalidPathError(std::string path, const std::string &reason)
        : GatewayError("Invalid path format: " + reason), path_(std::move(path)) {}

    NameNotRegisteredError::NameNotRegisteredError(std::string name, std::optional<std::uint64_t> chain_id, const std::string &reason)
        : GatewayError(reason + " for " + name + " on " + describe_chain(chain_id)), name_(std::move(name)), chain_id_(chain_id) {}

    NameResolutionError::NameResolutionError(std::string name, std::string primary_error, std::string fallback_error)
        : GatewayError("Name resolution failed for " + name + ": " + primary_error +
                       (fallback_error.empty() ? std::string() : " (root network fallback: " + fallback_error + ")") +
                       ". This name may not be registered or configured on the requested network."),
          name_(std::move(name)),
          primary_error_(std::move(primary_error)),
          fallback_error_(std::move(fallback_error)) {}

    ChunkReadError::ChunkReadError(std::size_t index, std::size_t total, std::string cause)
        : GatewayError("Failed to read chunk " + std::to_string(index + 1) + "/" + std::to_string(total) + ": " + cause),
          index_(index),
          total_(total),
          cause_(std::move(cause)) {}

    EndpointUnreachableError::EndpointUnreachableError(std::string endpoint, std::string path, const std::string &cause)
        : GatewayError("RPC endpoint " + endpoint + " unreachable for " + path + " after retry: " + cause),
          endpoint_(std::move(endpoint)),
          path_(std::move(path)) {}
}  // namespace wttp::error
