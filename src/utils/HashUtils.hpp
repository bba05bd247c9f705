#pragma once

#include <string>
#include <fstream>
#include <vector>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

namespace wum::utils {

/**
 * @brief Streaming content hashes over OpenSSL EVP.
 *
 * All functions return a lowercase hex digest, or an empty string when the
 * file cannot be read or the digest cannot be computed.
 */
class HashUtils {
public:
    static std::string sha1File(const std::string& filePath) {
        return digestFile(filePath, EVP_sha1());
    }

    static std::string sha256File(const std::string& filePath) {
        return digestFile(filePath, EVP_sha256());
    }

    static std::string sha1String(const std::string& data) {
        return digestBuffer(data.data(), data.size(), EVP_sha1());
    }

    static std::string sha256String(const std::string& data) {
        return digestBuffer(data.data(), data.size(), EVP_sha256());
    }

    static std::string digestFile(const std::string& filePath, const EVP_MD* md,
                                  size_t chunkSize = 1024 * 1024) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) return "";

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) return "";

        if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }

        std::vector<char> buffer(chunkSize > 0 ? chunkSize : 8192);
        while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx, buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
                EVP_MD_CTX_free(ctx);
                return "";
            }
        }
        if (file.bad()) {
            EVP_MD_CTX_free(ctx);
            return "";
        }

        return finish(ctx);
    }

private:
    static std::string digestBuffer(const char* data, size_t size, const EVP_MD* md) {
        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) return "";

        if (EVP_DigestInit_ex(ctx, md, nullptr) != 1 ||
            EVP_DigestUpdate(ctx, data, size) != 1) {
            EVP_MD_CTX_free(ctx);
            return "";
        }
        return finish(ctx);
    }

    // Takes ownership of ctx.
    static std::string finish(EVP_MD_CTX* ctx) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        int ok = EVP_DigestFinal_ex(ctx, hash, &hashLen);
        EVP_MD_CTX_free(ctx);
        if (ok != 1) return "";

        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }
};

} // namespace wum::utils
