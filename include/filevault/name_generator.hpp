#pragma once

#include <chrono>
#include <string>

namespace filevault {

/**
 * @class NameGenerator
 * @brief Builds stored names of the form <time>_<token>[_<fragment>][.<ext>]
 *
 * time is the UTC timestamp as YYYYMMDDHHMMSSmmm, token is 16 hex digits
 * from the OpenSSL CSPRNG, fragment is at most 8 [A-Za-z0-9_-] characters
 * of the original stem, ext is the lowercased original extension when it
 * is 1-16 [a-z0-9] characters.
 */
class NameGenerator {
public:
    static constexpr size_t kTokenBytes = 8;
    static constexpr size_t kMaxFragmentLength = 8;
    static constexpr size_t kMaxExtensionLength = 16;

    NameGenerator() = default;

    std::string generate(const std::string& originalName) const;

    std::string generate(const std::string& originalName,
                         std::chrono::system_clock::time_point now) const;

    // Lowercased extension after the final '.', or "" when absent or not allow-listed.
    static std::string extractExtension(const std::string& name);

    static std::string extractFragment(const std::string& originalName);

    static std::string randomToken(size_t bytes = kTokenBytes);

    static std::string timePrefix(std::chrono::system_clock::time_point now);

    static bool isValidStoredName(const std::string& name);
};

} // namespace filevault
