#include "keccak.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <string>

#include "../error/gateway_error.hpp"

namespace wttp::abi {
    namespace {
        constexpr const char* KECCAK_256_NAME = "KECCAK-256";

        struct MdDeleter {
            void operator()(EVP_MD* md) const { EVP_MD_free(md); }
        };

        std::string openssl_error(const std::string& what) {
            const unsigned long code = ERR_get_error();
            if (code == 0) {
                return what;
            }
            std::array<char, 256> buffer{};
            ERR_error_string_n(code, buffer.data(), buffer.size());
            return what + ": " + buffer.data();
        }

        // Fetched once per process; the default provider owns the implementation.
        const EVP_MD* keccak_256() {
            static const std::unique_ptr<EVP_MD, MdDeleter> md(EVP_MD_fetch(nullptr, KECCAK_256_NAME, nullptr));
            if (md == nullptr) {
                throw error::GatewayError(openssl_error("OpenSSL does not provide KECCAK-256 (OpenSSL 3.2 or newer is required)"));
            }
            return md.get();
        }
    }  // namespace

    Keccak256::Keccak256() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_ == nullptr) {
            throw error::GatewayError("EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex(ctx_, keccak_256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw error::GatewayError(openssl_error("EVP_DigestInit_ex failed for KECCAK-256"));
        }
    }

    Keccak256::~Keccak256() { EVP_MD_CTX_free(ctx_); }

    void Keccak256::update(std::span<const std::uint8_t> data) {
        if (finalized_) {
            throw error::InvalidArgumentError("Keccak256 hasher already finalized");
        }
        if (data.empty()) {
            return;
        }
        if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
            throw error::GatewayError(openssl_error("EVP_DigestUpdate failed"));
        }
    }

    void Keccak256::update(std::string_view text) {
        update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
    }

    Hash32 Keccak256::finalize() {
        if (finalized_) {
            throw error::InvalidArgumentError("Keccak256 hasher already finalized");
        }
        finalized_ = true;

        Hash32 out{};
        unsigned int size = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &size) != 1) {
            throw error::GatewayError(openssl_error("EVP_DigestFinal_ex failed"));
        }
        if (size != out.size()) {
            throw error::GatewayError("KECCAK-256 produced " + std::to_string(size) + " bytes");
        }
        return out;
    }

    Hash32 Keccak256::digest(std::span<const std::uint8_t> data) {
        Keccak256 hasher;
        hasher.update(data);
        return hasher.finalize();
    }

    Hash32 Keccak256::digest(std::string_view text) {
        Keccak256 hasher;
        hasher.update(text);
        return hasher.finalize();
    }
}  // namespace wttp::abi
