#pragma once

/**
 * HashUtils.hpp
 *
 * SHA-1 digests over OpenSSL EVP. Used for cache file names and for
 * verifying copied payloads.
 */

#include <openssl/evp.h>

#include <cctype>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

namespace courier::utils {

/**
 * Incremental SHA-1 digest
 *
 * Feed data with update() as it streams past, then read the hex digest with
 * hexDigest(). A hasher is single-use.
 */
class Sha1Hasher {
public:
    Sha1Hasher() : m_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!m_ctx || EVP_DigestInit_ex(m_ctx.get(), EVP_sha1(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialize SHA-1 context");
        }
    }

    void update(const void* data, size_t size) {
        if (m_finished) {
            throw std::logic_error("Sha1Hasher updated after hexDigest()");
        }
        if (EVP_DigestUpdate(m_ctx.get(), data, size) != 1) {
            throw std::runtime_error("SHA-1 update failed");
        }
    }

    std::string hexDigest() {
        static const char kHex[] = "0123456789abcdef";

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (m_finished || EVP_DigestFinal_ex(m_ctx.get(), digest, &length) != 1) {
            throw std::logic_error("SHA-1 digest already taken or failed");
        }
        m_finished = true;

        std::string hex;
        hex.reserve(length * 2);
        for (unsigned int i = 0; i < length; ++i) {
            hex += kHex[digest[i] >> 4];
            hex += kHex[digest[i] & 0x0F];
        }
        return hex;
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> m_ctx;
    bool m_finished{false};
};

class HashUtils {
public:
    static std::string sha1String(const std::string& data) {
        Sha1Hasher hasher;
        hasher.update(data.data(), data.size());
        return hasher.hexDigest();
    }

    // Hex digests compare case-insensitively
    static bool digestsEqual(const std::string& a, const std::string& b) {
        if (a.empty() || a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }
};

} // namespace courier::utils
