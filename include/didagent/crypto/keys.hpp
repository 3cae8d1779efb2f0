#pragma once
/**
 * @file keys.hpp
 * @brief Digest, randomness and text encodings used for identifiers.
 * @details Backed by OpenSSL EVP. Key derivation here produces stable
 *          identifiers only; signing keys live in the wallet.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "didagent/config/constants.hpp"

namespace didagent::crypto {

    using Bytes  = std::vector<std::uint8_t>;
    using Digest = std::array<std::uint8_t, 32>;

    /// OpenSSL reported a failure.
    class CryptoError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    Digest sha256(std::span<const std::uint8_t> data);
    Digest sha256(std::string_view data);

    /// Cryptographically secure random bytes.
    Bytes random_bytes(std::size_t n);

    std::string base58_encode(std::span<const std::uint8_t> data);
    std::string base64url_encode(std::span<const std::uint8_t> data, bool pad = true);
    Bytes       base64url_decode(std::string_view text);
    std::string hex_encode(std::span<const std::uint8_t> data);

    /// Random RFC 4122 version-4 UUID in canonical text form.
    std::string uuid4();

    /** @struct DidKeyPair
     *  @brief Identifier material derived from a seed.
     */
    struct DidKeyPair {
        std::string did;    ///< base58(first 16 verkey bytes)
        std::string verkey; ///< base58(32-byte verification key)
    };

    /**
     * @brief Deterministically derive a DID and verkey from a 32-byte seed.
     * @throws std::invalid_argument if @p seed is not 32 bytes.
     */
    DidKeyPair derive_did(std::span<const std::uint8_t> seed);

    /// Fresh random DID and verkey.
    DidKeyPair generate_did();

} // namespace didagent::crypto
