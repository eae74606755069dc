#include <CLI/CLI.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "src/content/content_decoder.hpp"
#include "src/error/gateway_error.hpp"
#include "src/gateway/gateway.hpp"
#include "src/protocol/model.hpp"
#include "src/rpc/client/curl_global.hpp"
#include "src/utils/constants.hpp"
#include "src/utils/hex_utils.hpp"

namespace {
    const int EXIT_OTHER_ERROR = 1;
    const int EXIT_RPC_ERROR = 2;
    const int EXIT_NOT_SUCCESS = 3;

    struct CliOptions {
        std::string network_;
        std::string config_path_;
        std::string range_;
        std::string site_;
        std::vector<std::string> paths_;
        bool head_only_ = false;
        bool chunks_only_ = false;
        bool no_fallback_ = false;
        bool no_cache_ = false;
        bool verbose_ = false;
        bool strict_ = false;
        int max_redirects_ = wttp::constants::DEFAULT_MAX_REDIRECTS;
    };

    wttp::protocol::ChunkRange parse_range(const std::string& text) {
        const size_t colon = text.find(':');
        if (colon == std::string::npos) {
            throw wttp::error::InvalidArgumentError("Range must look like START:END, got " + text);
        }
        try {
            return wttp::protocol::ChunkRange{.start_ = std::stoll(text.substr(0, colon)), .end_ = std::stoll(text.substr(colon + 1))};
        } catch (const std::logic_error&) {
            throw wttp::error::InvalidArgumentError("Range bounds must be integers, got " + text);
        }
    }

    int exit_code_for(const std::exception_ptr& error) {
        try {
            std::rethrow_exception(error);
        } catch (const wttp::error::RpcError& e) {
            std::cerr << "RPC Error: " << e.what() << " (endpoint: " << e.endpoint_ << ", code: " << e.code_ << ")\n";
            return EXIT_RPC_ERROR;
        } catch (const wttp::error::NameResolutionError& e) {
            std::cerr << "Resolution Error: " << e.what() << "\n";
            return EXIT_RPC_ERROR;
        } catch (const wttp::error::NameNotRegisteredError& e) {
            std::cerr << "Resolution Error: " << e.what() << "\n";
            return EXIT_RPC_ERROR;
        } catch (const wttp::error::EndpointUnreachableError& e) {
            std::cerr << "RPC Error: " << e.what() << "\n";
            return EXIT_RPC_ERROR;
        } catch (const wttp::error::ChunkReadError& e) {
            std::cerr << "RPC Error: " << e.what() << "\n";
            return EXIT_RPC_ERROR;
        } catch (const std::exception& e) {
            std::cerr << "Fatal Error: " << e.what() << std::endl;
            return EXIT_OTHER_ERROR;
        }
    }

    void print_head(const std::string& path, const wttp::protocol::FetchResult& result) {
        const auto& head = result.response_.head_;
        const auto& metadata = head.metadata_;
        std::cerr << "Path: " << path << " -> " << result.resolved_path_ << "\n"
                  << "Status: " << head.status_ << "\n"
                  << "Content-Type: " << wttp::content::mime_type_name(metadata.properties_.mime_type_) << " ("
                  << wttp::content::mime_code_hex(metadata.properties_.mime_type_) << ")\n"
                  << "Size: " << metadata.size_ << "\n"
                  << "Version: " << metadata.version_ << "\n"
                  << "Last-Modified: " << metadata.last_modified_ << "\n"
                  << "ETag: " << wttp::hex_utils::to_hex(head.etag_) << "\n"
                  << "Chunks: " << result.response_.resource_.chunk_ids_.size() << "/" << result.response_.resource_.total_chunks_ << "\n";
        if (wttp::protocol::is_redirect(head.status_)) {
            std::cerr << "Location: " << head.header_info_.redirect_.location_ << "\n";
        }
    }

    void print_body(const CliOptions& cli, const wttp::protocol::FetchResult& result) {
        if (cli.chunks_only_) {
            for (const auto& chunk_id : result.response_.resource_.chunk_ids_) {
                std::cout << wttp::hex_utils::to_hex(chunk_id) << "\n";
            }
            return;
        }
        if (result.content_) {
            std::cout.write(reinterpret_cast<const char*>(result.content_->data()), static_cast<std::streamsize>(result.content_->size()));
            std::cout.flush();
        }
    }
}  // namespace

int main(int argc, char** argv) {
    CliOptions cli;

    CLI::App app{"wttp-fetch - retrieve resources from WTTP sites"};
    app.add_option("--network", cli.network_, "Network name, chain id or RPC URL");
    app.add_option("--config", cli.config_path_, "JSON configuration file")->check(CLI::ExistingFile);
    app.add_option("--range", cli.range_, "Chunk range START:END (-1 means to the end)");
    app.add_option("--max-redirects", cli.max_redirects_, "Redirects to follow")->check(CLI::NonNegativeNumber);
    app.add_flag("--head", cli.head_only_, "Send a single HEAD, no content");
    app.add_flag("--chunks", cli.chunks_only_, "Print chunk ids instead of content");
    app.add_flag("--no-fallback", cli.no_fallback_, "Do not retry name resolution on the root network");
    app.add_flag("--no-cache", cli.no_cache_, "Bypass the name cache");
    app.add_flag("--strict", cli.strict_, "Fail when the endpoint is unreachable instead of answering 404");
    app.add_flag("-v,--verbose", cli.verbose_, "Debug logging");
    app.add_option("site", cli.site_, "Site address (0x...) or name (site.eth)")->required();
    app.add_option("paths", cli.paths_, "Resource paths (default /)");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_default_logger(spdlog::stderr_color_mt("wttp"));
    spdlog::set_level(cli.verbose_ ? spdlog::level::debug : spdlog::level::warn);

    if (cli.paths_.empty()) {
        cli.paths_.emplace_back("/");
    }

    try {
        wttp::rpc::client::CurlGlobal curl_global;

        wttp::gateway::GatewayBuilder builder;
        if (!cli.config_path_.empty()) {
            builder.with_config_file(cli.config_path_);
        }
        auto gateway = builder.validate().build();

        wttp::protocol::RequestOptions options{.head_only_ = cli.head_only_, .chunk_ids_only_ = cli.chunks_only_, .max_redirects_ = cli.max_redirects_,
                                                .strict_transport_ = cli.strict_};
        if (!cli.range_.empty()) {
            options.range_ = parse_range(cli.range_);
        }

        std::vector<wttp::gateway::FetchRequest> requests;
        for (const auto& path : cli.paths_) {
            requests.push_back(wttp::gateway::FetchRequest{.site_ = cli.site_,
                                                           .path_ = path,
                                                           .network_ = cli.network_,
                                                           .options_ = options,
                                                           .name_options_ = {.fallback_to_root_ = !cli.no_fallback_, .use_cache_ = !cli.no_cache_}});
        }

        std::vector<wttp::gateway::FetchOutcome> outcomes;
        if (requests.size() == 1) {
            outcomes.push_back(wttp::gateway::FetchOutcome{.result_ = gateway->fetch(requests.front()), .error_ = nullptr});
        } else {
            const size_t workers = std::max<size_t>(1, std::min<size_t>(requests.size(), std::thread::hardware_concurrency()));
            outcomes = gateway->fetch_many(requests, workers);
        }

        int exit_code = EXIT_SUCCESS;
        for (size_t i = 0; i < outcomes.size(); ++i) {
            if (outcomes[i].error_) {
                exit_code = std::max(exit_code, exit_code_for(outcomes[i].error_));
                continue;
            }
            const auto& result = *outcomes[i].result_;
            print_head(requests[i].path_, result);
            print_body(cli, result);
            if (!wttp::protocol::is_success(result.response_.head_.status_)) {
                exit_code = std::max(exit_code, EXIT_NOT_SUCCESS);
            }
        }
        return exit_code;
    } catch (const std::exception&) {
        return exit_code_for(std::current_exception());
    }
}
