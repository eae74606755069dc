#ifndef WTTP_GATEWAY_GATEWAY_CONFIG_HPP
#define WTTP_GATEWAY_GATEWAY_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../rpc/model/model.hpp"
#include "../utils/constants.hpp"
#include "../utils/types.hpp"

namespace wttp::config {

    template <typename T>
    struct ParserOptions {
        bool is_required_ = true;
        std::vector<T> allowed_values_;
        T fallback_value_;
        std::string error_message_;
    };

    struct NetworkConfig {
        std::string name_;
        std::uint64_t chain_id_ = 0;
        std::string rpc_url_;
    };

    // Naming registry deployment for one chain.
    struct NamingConfig {
        std::uint64_t chain_id_ = 0;
        Address registry_{};
    };

    std::vector<NetworkConfig> default_networks();
    std::vector<NamingConfig> default_naming();

    struct GatewayConfig {
        std::vector<NetworkConfig> networks_ = default_networks();
        std::vector<NamingConfig> naming_ = default_naming();
        std::string default_network_ = constants::DEFAULT_NETWORK;
        std::string root_network_ = constants::ROOT_NETWORK;
        rpc::model::TransportOptions transport_;
        rpc::model::RetryPolicy retry_;

        [[nodiscard]] std::optional<NetworkConfig> find_network(const std::string& name) const;
        [[nodiscard]] std::optional<NetworkConfig> find_network_by_chain(std::uint64_t chain_id) const;
        [[nodiscard]] std::optional<Address> find_registry(std::uint64_t chain_id) const;
        [[nodiscard]] std::vector<std::string> network_names() const;
        // Replaces the entry with the same name, or appends a new one.
        void upsert_network(NetworkConfig network);
        void upsert_naming(NamingConfig naming);
    };

    // Reads a JSON file and layers it over the built-in tables.
    [[nodiscard]] GatewayConfig load_config_file(const std::filesystem::path& path);
    [[nodiscard]] GatewayConfig parse_config(const std::string& json);

    const ParserOptions<std::string_view> NETWORK_NAME_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid network name"};
    const ParserOptions<uint64_t> CHAIN_ID_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = 0, .error_message_ = "Invalid chain id"};
    const ParserOptions<std::string_view> RPC_URL_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid rpc url"};
    const ParserOptions<std::string_view> REGISTRY_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid naming registry address"};
    const ParserOptions<std::string_view> DEFAULT_NETWORK_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = constants::DEFAULT_NETWORK, .error_message_ = "Invalid default network"};
    const ParserOptions<std::string_view> ROOT_NETWORK_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = constants::ROOT_NETWORK, .error_message_ = "Invalid root network"};
    const ParserOptions<uint64_t> CONNECT_TIMEOUT_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = rpc::model::CONNECT_TIMEOUT_MS, .error_message_ = "Invalid connect timeout"};
    const ParserOptions<uint64_t> TIMEOUT_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = rpc::model::TIMEOUT_MS, .error_message_ = "Invalid timeout"};
    const ParserOptions<uint64_t> MAX_TRIES_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {1, 2, 3, 4, 5}, .fallback_value_ = 3, .error_message_ = "Invalid max tries"};

}  // namespace wttp::config

#endif
