#include "gateway_config.hpp"

#include <simdjson.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>

#include "../error/gateway_error.hpp"
#include "../utils/hex_utils.hpp"
#include "../utils/string_utils.hpp"

namespace wttp::config {
    namespace parser {
        template <typename T>
        static T parse_value(simdjson::simdjson_result<T> result, const ParserOptions<T>& options) {
            if (result.error() == simdjson::error_code::NO_SUCH_FIELD && !options.is_required_) {
                return options.fallback_value_;
            }

            if (result.error() != simdjson::error_code::SUCCESS) {
                throw error::ConfigError(options.error_message_);
            }

            auto value = result.value();

            if (options.allowed_values_.empty()) {
                return T(value);
            }

            if (!std::ranges::any_of(options.allowed_values_, [value](const T& allowed_value) { return allowed_value == value; })) {
                throw error::ConfigError(options.error_message_);
            }

            return T(value);
        }
    }  // namespace parser

    std::vector<NetworkConfig> default_networks() {
        return {
            {.name_ = "polygon", .chain_id_ = 137, .rpc_url_ = "https://polygon-bor-rpc.publicnode.com"},
            {.name_ = "ethereum", .chain_id_ = 1, .rpc_url_ = "https://eth.llamarpc.com"},
            {.name_ = "sepolia", .chain_id_ = 11155111, .rpc_url_ = "https://ethereum-sepolia-rpc.publicnode.com"},
            {.name_ = "localhost", .chain_id_ = 31337, .rpc_url_ = "http://127.0.0.1:8545"},
        };
    }

    std::vector<NamingConfig> default_naming() {
        const Address registry = hex_utils::parse_address("0x00000000000C2E074eC69A0dFb2997BA6C7d2e1e");
        return {
            {.chain_id_ = 1, .registry_ = registry},
            {.chain_id_ = 11155111, .registry_ = registry},
        };
    }

    std::optional<NetworkConfig> GatewayConfig::find_network(const std::string& name) const {
        auto it = std::find_if(networks_.begin(), networks_.end(), [&name](const NetworkConfig& n) { return n.name_ == name; });
        if (it == networks_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<NetworkConfig> GatewayConfig::find_network_by_chain(std::uint64_t chain_id) const {
        auto it = std::find_if(networks_.begin(), networks_.end(), [chain_id](const NetworkConfig& n) { return n.chain_id_ == chain_id; });
        if (it == networks_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<Address> GatewayConfig::find_registry(std::uint64_t chain_id) const {
        auto it = std::find_if(naming_.begin(), naming_.end(), [chain_id](const NamingConfig& n) { return n.chain_id_ == chain_id; });
        if (it == naming_.end()) {
            return std::nullopt;
        }
        return it->registry_;
    }

    std::vector<std::string> GatewayConfig::network_names() const {
        std::vector<std::string> names;
        names.reserve(networks_.size());
        for (const auto& network : networks_) {
            names.push_back(network.name_);
        }
        return names;
    }

    void GatewayConfig::upsert_network(NetworkConfig network) {
        auto it = std::find_if(networks_.begin(), networks_.end(), [&network](const NetworkConfig& n) { return n.name_ == network.name_; });
        if (it != networks_.end()) {
            *it = std::move(network);
        } else {
            networks_.push_back(std::move(network));
        }
    }

    void GatewayConfig::upsert_naming(NamingConfig naming) {
        auto it = std::find_if(naming_.begin(), naming_.end(), [&naming](const NamingConfig& n) { return n.chain_id_ == naming.chain_id_; });
        if (it != naming_.end()) {
            *it = naming;
        } else {
            naming_.push_back(naming);
        }
    }

    GatewayConfig parse_config(const std::string& json) {
        GatewayConfig config;

        try {
            simdjson::ondemand::parser json_parser;
            simdjson::padded_string padded(json);
            simdjson::ondemand::document doc = json_parser.iterate(padded);

            config.default_network_ = string_utils::to_lower(std::string(parser::parse_value(doc["default_network"].get_string(), DEFAULT_NETWORK_PARSER_OPTIONS)));
            config.root_network_ = string_utils::to_lower(std::string(parser::parse_value(doc["root_network"].get_string(), ROOT_NETWORK_PARSER_OPTIONS)));

            auto networks = doc["networks"];
            if (networks.error() == simdjson::SUCCESS) {
                for (auto entry : networks.get_array()) {
                    simdjson::ondemand::object network = entry.get_object();
                    NetworkConfig parsed;
                    parsed.name_ = string_utils::to_lower(std::string(parser::parse_value(network["name"].get_string(), NETWORK_NAME_PARSER_OPTIONS)));
                    parsed.chain_id_ = parser::parse_value(network["chain_id"].get_uint64(), CHAIN_ID_PARSER_OPTIONS);
                    parsed.rpc_url_ = std::string(parser::parse_value(network["rpc_url"].get_string(), RPC_URL_PARSER_OPTIONS));
                    if (parsed.name_.empty() || parsed.rpc_url_.empty()) {
                        throw error::ConfigError("Network entries need a name and an rpc_url");
                    }
                    config.upsert_network(std::move(parsed));
                }
            }

            auto naming = doc["naming"];
            if (naming.error() == simdjson::SUCCESS) {
                for (auto entry : naming.get_array()) {
                    simdjson::ondemand::object registry = entry.get_object();
                    NamingConfig parsed;
                    parsed.chain_id_ = parser::parse_value(registry["chain_id"].get_uint64(), CHAIN_ID_PARSER_OPTIONS);
                    const std::string_view address = parser::parse_value(registry["registry"].get_string(), REGISTRY_PARSER_OPTIONS);
                    if (!hex_utils::is_address(address)) {
                        throw error::ConfigError(REGISTRY_PARSER_OPTIONS.error_message_ + ": " + std::string(address));
                    }
                    parsed.registry_ = hex_utils::parse_address(address);
                    config.upsert_naming(parsed);
                }
            }

            auto transport = doc["transport"];
            if (transport.error() == simdjson::SUCCESS) {
                simdjson::ondemand::object options = transport.get_object();
                config.transport_.connect_timeout_ms_ =
                    static_cast<long>(parser::parse_value(options["connect_timeout_ms"].get_uint64(), CONNECT_TIMEOUT_PARSER_OPTIONS));
                config.transport_.timeout_ms_ = static_cast<long>(parser::parse_value(options["timeout_ms"].get_uint64(), TIMEOUT_PARSER_OPTIONS));
                config.retry_.max_tries_ = static_cast<size_t>(parser::parse_value(options["max_tries"].get_uint64(), MAX_TRIES_PARSER_OPTIONS));
            }
        } catch (const simdjson::simdjson_error& e) {
            throw error::ConfigError("Failed to parse gateway config: " + std::string(e.what()));
        }

        if (!config.find_network(config.default_network_)) {
            throw error::ConfigError("Default network " + config.default_network_ + " is not configured");
        }
        if (!config.find_network(config.root_network_)) {
            throw error::ConfigError("Root network " + config.root_network_ + " is not configured");
        }

        return config;
    }

    GatewayConfig load_config_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw error::ConfigError("Config file not found: " + path.string());
        }

        simdjson::padded_string json;
        if (simdjson::padded_string::load(path.string()).get(json) != simdjson::SUCCESS) {
            throw error::ConfigError("Failed to read config file: " + path.string());
        }

        return parse_config(std::string(json.data(), json.size()));
    }
}  // namespace wttp::config
