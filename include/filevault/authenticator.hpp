#pragma once

#include <array>
#include <string>

namespace filevault {

/**
 * @class Authenticator
 * @brief Checks a submitted shared secret against the configured one.
 *
 * Both sides are reduced to SHA-256 digests and compared with
 * CRYPTO_memcmp, so timing does not depend on where the values differ or
 * on their lengths. Without a configured secret every check fails, running
 * the same work against a random placeholder digest.
 */
class Authenticator {
public:
    explicit Authenticator(const std::string& configuredSecret);

    bool verify(const std::string& submittedSecret) const;

    bool isConfigured() const { return configured_; }

private:
    using Digest = std::array<unsigned char, 32>;

    static Digest digest(const std::string& value);

    Digest expected_;
    bool configured_;
};

} // namespace filevault
