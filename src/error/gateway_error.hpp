#ifndef WTTP_GATEWAY_GATEWAY_ERROR_HPP
#define WTTP_GATEWAY_GATEWAY_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wttp::error {
    const long ERROR_MESSAGE_LENGTH = 512;

    struct GatewayError : public std::runtime_error {
        explicit GatewayError(const std::string &msg);
    };

    // Transport or JSON-RPC level failure. code_ is the HTTP status for transport errors and the
    // JSON-RPC error code when the node answered with an error object.
    struct RpcError : public GatewayError {
        long code_;
        std::string endpoint_;
        std::string body_preview_;
        explicit RpcError(long code, std::string endpoint, std::string preview, const std::string &msg);
    };

    struct AbiError : public GatewayError {
        explicit AbiError(const std::string &msg);
    };

    struct ConfigError : public GatewayError {
        explicit ConfigError(const std::string &msg);
    };

    struct InvalidArgumentError : public GatewayError {
        explicit InvalidArgumentError(const std::string &msg);
    };

    struct UnsupportedNetworkError : public GatewayError {
        std::string selector_;
        std::vector<std::string> supported_;
        UnsupportedNetworkError(std::string selector, std::vector<std::string> supported);
    };

    struct InvalidPathError : public GatewayError {
        std::string path_;
        InvalidPathError(std::string path, const std::string &reason);
    };

    struct NameNotRegisteredError : public GatewayError {
        std::string name_;
        std::optional<std::uint64_t> chain_id_;
        NameNotRegisteredError(std::string name, std::optional<std::uint64_t> chain_id, const std::string &reason);
    };

    struct NameResolutionError : public GatewayError {
        std::string name_;
        std::string primary_error_;
        std::string fallback_error_;
        NameResolutionError(std::string name, std::string primary_error, std::string fallback_error);
    };

    struct ChunkReadError : public GatewayError {
        std::size_t index_;
        std::size_t total_;
        std::string cause_;
        ChunkReadError(std::size_t index, std::size_t total, std::string cause);
    };

    struct EndpointUnreachableError : public GatewayError {
        std::string endpoint_;
        std::string path_;
        EndpointUnreachableError(std::string endpoint, std::string path, const std::string &cause);
    };
}  // namespace wttp::error

#endif
