#include "upload_guard/common/hash.hpp"
#include "upload_guard/common/logger.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>

namespace upload_guard {
namespace common {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string lastOpenSslError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return buf;
}

}

std::string toHex(const uint8_t* data, size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::optional<std::string> sha256Hex(const uint8_t* data, size_t size) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        Logger::instance().error("[Hash] Context allocation failed | error={}", lastOpenSslError());
        return std::nullopt;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        Logger::instance().error("[Hash] Digest init failed | error={}", lastOpenSslError());
        return std::nullopt;
    }

    if (size > 0 && EVP_DigestUpdate(ctx.get(), data, size) != 1) {
        Logger::instance().error("[Hash] Digest update failed | size={} | error={}",
                                size, lastOpenSslError());
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        Logger::instance().error("[Hash] Digest final failed | error={}", lastOpenSslError());
        return std::nullopt;
    }

    return toHex(digest, digest_len);
}

std::optional<std::string> sha256Hex(const std::string& data) {
    return sha256Hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

}}
