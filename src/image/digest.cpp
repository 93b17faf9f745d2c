#include "katsu/digest.hpp"

#include <fstream>

#include <openssl/evp.h>

namespace katsu {

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

bool begin(EvpMdCtx& ctx, HashResult& result) {
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return false;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_blake2b512(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return false;
    }
    return true;
}

void finish(EvpMdCtx& ctx, HashResult& result) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
}

} // namespace

HashResult compute_blake2b512_data(const std::string& data) {
    HashResult result;
    EvpMdCtx ctx;
    if (!begin(ctx, result)) return result;

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    finish(ctx, result);
    return result;
}

HashResult compute_blake2b512(const std::string& file_path) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    EvpMdCtx ctx;
    if (!begin(ctx, result)) return result;

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
    }

    finish(ctx, result);
    return result;
}

} // namespace katsu
