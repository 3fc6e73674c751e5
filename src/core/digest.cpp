/**
 * SHA-256 Digests (OpenSSL EVP)
 */

#include "digest.hpp"
#include "codec.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace cryptex {
namespace digest {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

Sha256Hash digest_bytes(const uint8_t* data, size_t len) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    Sha256Hash hash{};
    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash.data(), &out_len) != 1 ||
        out_len != SHA256_SIZE) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return hash;
}

}  // namespace

Sha256Hash sha256(std::string_view data) {
    return digest_bytes(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Sha256Hash sha256d(std::string_view data) {
    Sha256Hash first = sha256(data);
    return digest_bytes(first.data(), first.size());
}

std::string to_hex(const Sha256Hash& hash) {
    return codec::hex_encode(std::string_view(reinterpret_cast<const char*>(hash.data()), hash.size()));
}

bool is_sha256_hex(std::string_view text) {
    if (text.size() != SHA256_SIZE * 2) return false;
    for (char c : text) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex) return false;
    }
    return true;
}

}  // namespace digest
}  // namespace cryptex
