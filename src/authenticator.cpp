#include "filevault/authenticator.hpp"
#include "filevault/errors.hpp"
#include "filevault/logger.hpp"

#include <memory>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace filevault {

Authenticator::Authenticator(const std::string& configuredSecret)
    : configured_(!configuredSecret.empty()) {
    if (configured_) {
        expected_ = digest(configuredSecret);
        return;
    }

    // Placeholder so the unconfigured path does the same work as a mismatch
    if (RAND_bytes(expected_.data(), static_cast<int>(expected_.size())) != 1) {
        throw StorageError("Random generator unavailable", Stage::AUTHENTICATION);
    }
    FV_LOG_WARNING("No upload password configured; all authenticated requests will be rejected");
}

bool Authenticator::verify(const std::string& submittedSecret) const {
    Digest submitted = digest(submittedSecret);
    bool equal = CRYPTO_memcmp(submitted.data(), expected_.data(), submitted.size()) == 0;
    return equal & configured_;
}

Authenticator::Digest Authenticator::digest(const std::string& value) {
    Digest out{};
    unsigned int length = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), value.data(), value.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1 ||
        length != out.size()) {
        throw StorageError("Digest computation failed", Stage::AUTHENTICATION);
    }

    return out;
}

} // namespace filevault
