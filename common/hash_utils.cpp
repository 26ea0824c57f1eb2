#include "hash_utils.hpp"
#include "config.hpp"
#include <openssl/evp.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <vector>

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

EvpMdCtxPtr newMd5Context() {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
        ctx.reset();
    return ctx;
}

}

Result<std::string> HashUtils::computeFileDigest(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        return Result<std::string>::Error(ErrorType::IOError,
            "Failed to open file: " + filePath + " (" + std::strerror(errno) + ")");
    }

    EvpMdCtxPtr ctx = newMd5Context();
    if (!ctx) {
        return Result<std::string>::Error(ErrorType::IOError, "Failed to initialise MD5 context");
    }

    std::vector<char> buffer(Config::CHUNK_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        size_t bytesRead = static_cast<size_t>(file.gcount());
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), bytesRead) != 1) {
            return Result<std::string>::Error(ErrorType::IOError, "Digest update failed for: " + filePath);
        }
        if (file.eof()) break;
    }

    // eof alone is the normal end; badbit means the read itself failed
    if (file.bad()) {
        return Result<std::string>::Error(ErrorType::IOError, "Read failed mid-stream: " + filePath);
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        return Result<std::string>::Error(ErrorType::IOError, "Digest finalisation failed for: " + filePath);
    }

    return Result<std::string>::Ok(toHex(digest, digestLen));
}

std::string HashUtils::computeDigest(const char* data, size_t len) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(data, len, digest, &digestLen, EVP_md5(), nullptr) != 1)
        return {};
    return toHex(digest, digestLen);
}
