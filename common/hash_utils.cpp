#include "hash_utils.hpp"
#include "config.hpp"
#include <openssl/evp.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <vector>

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

}

std::string HashUtils::toHex(const unsigned char* bytes, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result += hex[(bytes[i] >> 4) & 0xF];
        result += hex[bytes[i] & 0xF];
    }
    return result;
}

Result<std::string> HashUtils::computeFileDigest(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        return Result<std::string>::Error("cannot open " + filePath + ": " + std::strerror(errno));
    }

    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Result<std::string>::Error("digest initialisation failed");
    }

    std::vector<char> buffer(Config::DIGEST_BUFFER_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
            return Result<std::string>::Error("digest update failed for " + filePath);
        }
    }
    if (file.bad()) {
        return Result<std::string>::Error("read error on " + filePath);
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLength) != 1) {
        return Result<std::string>::Error("digest finalisation failed for " + filePath);
    }
    return Result<std::string>::Ok(toHex(hash, hashLength));
}
