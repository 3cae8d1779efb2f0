/**
 * @file keys.cpp
 * @brief OpenSSL-backed digests plus base58/base64url codecs.
 */
#include "didagent/crypto/keys.hpp"

#include <algorithm>
#include <memory>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace didagent::crypto {

    using namespace didagent::config::constants;

    namespace {

        constexpr std::string_view kBase58Alphabet =
            "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
        constexpr std::string_view kBase64UrlAlphabet =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

        // Verkey = SHA-256 over a domain tag and the seed.
        constexpr std::string_view kVerkeyTag = "didagent-verkey-v1";

    } // namespace

    Digest sha256(std::span<const std::uint8_t> data) {
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx) throw CryptoError("EVP_MD_CTX_new failed");

        Digest out{};
        unsigned int len = 0;
        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
            EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
            EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
            throw CryptoError("SHA-256 digest failed");
        }
        return out;
    }

    Digest sha256(std::string_view data) {
        return sha256(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
    }

    Bytes random_bytes(std::size_t n) {
        Bytes out(n);
        if (n && RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
            throw CryptoError("RAND_bytes failed");
        }
        return out;
    }

    std::string base58_encode(std::span<const std::uint8_t> data) {
        // Leading zero bytes map to leading '1's.
        std::size_t zeros = 0;
        while (zeros < data.size() && data[zeros] == 0) ++zeros;

        // log(256)/log(58) ~= 1.37
        std::vector<std::uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
        std::size_t used = 0;
        for (std::size_t i = zeros; i < data.size(); ++i) {
            int carry = data[i];
            std::size_t j = 0;
            for (auto it = digits.rbegin(); (carry != 0 || j < used) && it != digits.rend(); ++it, ++j) {
                carry += 256 * (*it);
                *it = static_cast<std::uint8_t>(carry % 58);
                carry /= 58;
            }
            used = j;
        }

        auto it = std::find_if(digits.begin(), digits.end(), [](std::uint8_t d) { return d != 0; });
        std::string out(zeros, '1');
        for (; it != digits.end(); ++it) out += kBase58Alphabet[*it];
        return out;
    }

    std::string base64url_encode(std::span<const std::uint8_t> data, bool pad) {
        std::string out;
        out.reserve((data.size() + 2) / 3 * 4);
        std::size_t i = 0;
        for (; i + 2 < data.size(); i += 3) {
            const std::uint32_t v = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
            out += kBase64UrlAlphabet[(v >> 18) & 0x3F];
            out += kBase64UrlAlphabet[(v >> 12) & 0x3F];
            out += kBase64UrlAlphabet[(v >> 6) & 0x3F];
            out += kBase64UrlAlphabet[v & 0x3F];
        }
        const std::size_t rest = data.size() - i;
        if (rest == 1) {
            const std::uint32_t v = data[i] << 16;
            out += kBase64UrlAlphabet[(v >> 18) & 0x3F];
            out += kBase64UrlAlphabet[(v >> 12) & 0x3F];
            if (pad) out += "==";
        } else if (rest == 2) {
            const std::uint32_t v = (data[i] << 16) | (data[i + 1] << 8);
            out += kBase64UrlAlphabet[(v >> 18) & 0x3F];
            out += kBase64UrlAlphabet[(v >> 12) & 0x3F];
            out += kBase64UrlAlphabet[(v >> 6) & 0x3F];
            if (pad) out += '=';
        }
        return out;
    }

    Bytes base64url_decode(std::string_view text) {
        Bytes out;
        std::uint32_t acc = 0;
        int bits = 0;
        for (char c : text) {
            if (c == '=') break;
            const auto pos = kBase64UrlAlphabet.find(c);
            if (pos == std::string_view::npos) {
                throw std::invalid_argument("invalid base64url character");
            }
            acc = (acc << 6) | static_cast<std::uint32_t>(pos);
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
            }
        }
        return out;
    }

    std::string hex_encode(std::span<const std::uint8_t> data) {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(data.size() * 2);
        for (auto b : data) {
            out += kHex[b >> 4];
            out += kHex[b & 0x0F];
        }
        return out;
    }

    std::string uuid4() {
        auto b = random_bytes(16);
        b[6] = static_cast<std::uint8_t>((b[6] & 0x0F) | 0x40);
        b[8] = static_cast<std::uint8_t>((b[8] & 0x3F) | 0x80);
        const auto h = hex_encode(b);
        return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
               h.substr(16, 4) + "-" + h.substr(20);
    }

    DidKeyPair derive_did(std::span<const std::uint8_t> seed) {
        if (seed.size() != SEED_BYTES) {
            throw std::invalid_argument("seed must be " + std::to_string(SEED_BYTES) + " bytes");
        }
        Bytes material(kVerkeyTag.begin(), kVerkeyTag.end());
        material.insert(material.end(), seed.begin(), seed.end());
        const auto verkey = sha256(std::span<const std::uint8_t>(material));

        return DidKeyPair{
            base58_encode(std::span<const std::uint8_t>(verkey.data(), DID_BYTES)),
            base58_encode(verkey),
        };
    }

    DidKeyPair generate_did() {
        const auto seed = random_bytes(SEED_BYTES);
        return derive_did(seed);
    }

} // namespace didagent::crypto
