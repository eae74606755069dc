#ifndef WTTP_GATEWAY_KECCAK_HPP
#define WTTP_GATEWAY_KECCAK_HPP

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "../utils/types.hpp"

namespace wttp::abi {
    // Sponge rate in bytes; inputs of this length fill exactly one block.
    inline constexpr std::size_t KECCAK_256_RATE = 136;

    // Keccak-256 as used by Ethereum (original 0x01 padding, not the FIPS-202 SHA3 padding).
    // Computed through OpenSSL's "KECCAK-256" digest, available from OpenSSL 3.2.
    class Keccak256 {
       public:
        Keccak256();

        ~Keccak256();
        Keccak256(const Keccak256&) = delete;
        Keccak256& operator=(const Keccak256&) = delete;
        Keccak256(Keccak256&&) = delete;
        Keccak256& operator=(Keccak256&&) = delete;

        void update(std::span<const std::uint8_t> data);
        void update(std::string_view text);

        // Single use: the hasher cannot be updated again afterwards.
        Hash32 finalize();

        static Hash32 digest(std::span<const std::uint8_t> data);
        static Hash32 digest(std::string_view text);

       private:
        EVP_MD_CTX* ctx_{};
        bool finalized_{false};
    };
}  // namespace wttp::abi

#endif
