#pragma once

#include "mcprelay/sdk/types.hpp"
#include <string>

namespace mcprelay {
namespace sdk {

/**
 * @brief Salted one-way hash used for node identities and credential fingerprints
 *
 * hash(value) = lowercase hex SHA-256(value || salt). The salt only exists on
 * the relay; it is never logged or returned.
 */
class HashService {
public:
    /**
     * @throws std::invalid_argument if the salt is empty
     */
    explicit HashService(std::string salt);

    ~HashService();

    HashService(const HashService&) = delete;
    HashService& operator=(const HashService&) = delete;

    /**
     * @brief Compute the fingerprint of a value
     * @return 64 character lowercase hex digest (the empty string hashes
     *         like any other value), HASH_FAILED if the digest could not be
     *         computed
     */
    Result<std::string> hash(const std::string& value) const;

    /**
     * @brief Full-length, constant-time comparison of two fingerprints
     */
    static bool equals(const std::string& lhs, const std::string& rhs);

    /**
     * @brief Overwrite a secret held in a string before it is released
     */
    static void wipe(std::string& secret);

    /**
     * @brief Lowercase hex encoding
     */
    static std::string to_hex(const unsigned char* data, std::size_t size);

private:
    std::string salt_;
};

} // namespace sdk
} // namespace mcprelay
