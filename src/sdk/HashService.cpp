#include "mcprelay/sdk/HashService.hpp"
#include "mcprelay/sdk/SecureLogger.hpp"
#include <openssl/evp.h>
#include <sodium.h>
#include <memory>
#include <stdexcept>

namespace mcprelay {
namespace sdk {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

} // namespace

HashService::HashService(std::string salt) : salt_(std::move(salt)) {
    if (salt_.empty()) {
        throw std::invalid_argument("Hash salt must not be empty");
    }

    if (sodium_init() == -1) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

HashService::~HashService() {
    wipe(salt_);
}

Result<std::string> HashService::hash(const std::string& value) const {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        SecureLogger::instance().error("EVP_MD_CTX_new failed");
        return ErrorCode::HASH_FAILED;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), value.data(), value.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), salt_.data(), salt_.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        SecureLogger::instance().error("SHA-256 digest computation failed");
        return ErrorCode::HASH_FAILED;
    }

    return to_hex(digest, digest_length);
}

bool HashService::equals(const std::string& lhs, const std::string& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    if (lhs.empty()) {
        return true;
    }
    return sodium_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

void HashService::wipe(std::string& secret) {
    if (!secret.empty()) {
        sodium_memzero(&secret[0], secret.size());
    }
    secret.clear();
}

std::string HashService::to_hex(const unsigned char* data, std::size_t size) {
    static const char digits[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0f]);
    }
    return hex;
}

} // namespace sdk
} // namespace mcprelay
