#include "curl_easy.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <random>
#include <string>
#include <thread>
#include <utility>

#include "../../error/gateway_error.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

using namespace std::chrono;

namespace wttp::rpc::client {
    namespace {
        constexpr long ENABLED = 1L;
        constexpr long DISABLED = 0L;
        constexpr long KEEPALIVE_IDLE_S = 120L;
        constexpr long KEEPALIVE_INTERVAL_S = 60L;

        constexpr const char* CONTENT_TYPE_KEY = "content-type:";
        constexpr const char* RETRY_AFTER_KEY = "retry-after:";
    }  // namespace

    CurlEasy::CurlEasy(model::TransportOptions options) : options_(std::move(options)), handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw error::GatewayError("Failed to create CURL easy handle");
        }

        apply_defaults();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }
        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    template <typename T>
    void CurlEasy::setopt(CURLoption option, T value) {
        const auto rc = curl_easy_setopt(handle_, option, value);
        if (rc != CURLE_OK) {
            throw error::GatewayError(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::apply_defaults() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        // A node that redirects is misconfigured; surface the 3xx instead of re-POSTing elsewhere.
        setopt(CURLOPT_FOLLOWLOCATION, DISABLED);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms_);
        setopt(CURLOPT_TIMEOUT_MS, options_.timeout_ms_);
        setopt(CURLOPT_NOPROGRESS, ENABLED);
        setopt(CURLOPT_NOSIGNAL, ENABLED);
        setopt(CURLOPT_USERAGENT, options_.user_agent_.c_str());
        setopt(CURLOPT_TCP_KEEPALIVE, ENABLED);
        setopt(CURLOPT_TCP_KEEPIDLE, KEEPALIVE_IDLE_S);
        setopt(CURLOPT_TCP_KEEPINTVL, KEEPALIVE_INTERVAL_S);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::on_header);
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));
        setopt(CURLOPT_WRITEFUNCTION, &string_utils::write_to_string);
    }

    void CurlEasy::apply_request(const model::Request& req, std::string& body) {
        retry_after_.clear();
        content_type_.clear();
        error_buf_[0] = '\0';

        if (req.headers_ != applied_headers_) {
            if (headers_ != nullptr) {
                curl_slist_free_all(headers_);
                headers_ = nullptr;
            }
            for (const auto& header : req.headers_) {
                headers_ = curl_slist_append(headers_, header.c_str());
            }
            setopt(CURLOPT_HTTPHEADER, headers_);
            applied_headers_ = req.headers_;
        }

        setopt(CURLOPT_URL, req.url_.c_str());
        setopt(CURLOPT_POST, ENABLED);
        setopt(CURLOPT_POSTFIELDS, req.body_.c_str());
        setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body_.size()));
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&body));
    }

    size_t CurlEasy::on_header(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        string_utils::extract_header_value(buffer, bytes, CONTENT_TYPE_KEY, self->content_type_);
        string_utils::extract_header_value(buffer, bytes, RETRY_AFTER_KEY, self->retry_after_);

        return bytes;
    }

    void CurlEasy::perform(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);
        if (rc == CURLE_OK) {
            return;
        }

        const std::string detail = error_buf_[0] != '\0' ? std::string(error_buf_.data()) : std::string(curl_easy_strerror(rc));
        throw error::RpcError(static_cast<long>(rc), url, std::string{}, "Transport failure talking to " + url + ": " + detail);
    }

    model::Response CurlEasy::collect_response(const std::string& url, std::string& body) {
        long code = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);

        model::Response resp;
        resp.status_ = code;
        resp.body_ = std::move(body);
        resp.effective_url_ = url;
        resp.retry_after_ = std::move(retry_after_);
        resp.content_type_ = std::move(content_type_);
        return resp;
    }

    model::Response CurlEasy::post(const model::Request& req) {
        std::string body;
        apply_request(req, body);
        perform(req.url_);
        return collect_response(req.url_, body);
    }

    model::Response CurlEasy::post_with_retries(const model::Request& req, const model::RetryPolicy& p) {
        if (p.max_tries_ == 0) {
            throw error::InvalidArgumentError("Retry policy needs at least one try");
        }

        milliseconds delay = p.base_delay_;
        size_t attempt = 0;

        while (true) {
            ++attempt;
            const bool last = attempt >= p.max_tries_;

            model::Response resp;
            try {
                resp = post(req);
            } catch (const error::RpcError& e) {
                if (last) {
                    throw;
                }
                spdlog::debug("RPC {} unreachable: {} (attempt {}/{})", req.url_, e.what(), attempt, p.max_tries_);
                delay = backoff(p, delay);
                continue;
            }

            if (last || !is_retryable_http(resp.status_)) {
                return resp;
            }

            spdlog::debug("RPC {} answered HTTP {} (attempt {}/{})", req.url_, resp.status_, attempt, p.max_tries_);
            if (auto wait = retry_after_delay(resp, p)) {
                std::this_thread::sleep_for(*wait);
            } else {
                delay = backoff(p, delay);
            }
        }
    }

    milliseconds CurlEasy::backoff(const model::RetryPolicy& p, milliseconds delay) {
        thread_local std::minstd_rand rng{std::random_device{}()};
        std::uniform_int_distribution<long> jitter(0, static_cast<long>(p.base_delay_.count()));

        std::this_thread::sleep_for(delay + milliseconds{jitter(rng)});
        return std::min(delay * 2, p.max_delay_);
    }

    std::optional<milliseconds> CurlEasy::retry_after_delay(const model::Response& resp, const model::RetryPolicy& p) {
        if (resp.status_ != static_cast<long>(HttpStatusCode::TOO_MANY_REQUESTS) || resp.retry_after_.empty()) {
            return std::nullopt;
        }

        char* end = nullptr;
        const long seconds_to_wait = std::strtol(resp.retry_after_.c_str(), &end, constants::BASE_10);
        if (end == resp.retry_after_.c_str() || seconds_to_wait <= 0) {
            return std::nullopt;
        }
        return std::min<milliseconds>(seconds{seconds_to_wait}, p.max_delay_);
    }
}  // namespace wttp::rpc::client
