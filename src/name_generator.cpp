#include "filevault/name_generator.hpp"
#include "filevault/errors.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>
#include <openssl/rand.h>

namespace filevault {

namespace {

    bool isAsciiAlnum(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    }

    std::string lastComponent(const std::string& name) {
        size_t pos = name.find_last_of("/\\");
        return pos == std::string::npos ? name : name.substr(pos + 1);
    }

} // namespace

std::string NameGenerator::generate(const std::string& originalName) const {
    return generate(originalName, std::chrono::system_clock::now());
}

std::string NameGenerator::generate(const std::string& originalName,
                                    std::chrono::system_clock::time_point now) const {
    std::string name = timePrefix(now) + "_" + randomToken();

    std::string fragment = extractFragment(originalName);
    if (!fragment.empty()) {
        name += "_" + fragment;
    }

    std::string extension = extractExtension(originalName);
    if (!extension.empty()) {
        name += "." + extension;
    }

    return name;
}

std::string NameGenerator::extractExtension(const std::string& name) {
    std::string component = lastComponent(name);
    size_t dot = component.rfind('.');

    // ".bashrc" has no extension, "archive." neither
    if (dot == std::string::npos || dot == 0 || dot + 1 == component.size()) {
        return "";
    }

    std::string extension = component.substr(dot + 1);
    if (extension.size() > kMaxExtensionLength) {
        return "";
    }

    for (char& c : extension) {
        if (!isAsciiAlnum(c)) {
            return "";
        }
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }

    return extension;
}

std::string NameGenerator::extractFragment(const std::string& originalName) {
    std::string component = lastComponent(originalName);
    size_t dot = component.rfind('.');
    std::string stem = (dot == std::string::npos || dot == 0) ? component : component.substr(0, dot);

    std::string fragment;
    for (char c : stem) {
        if (fragment.size() == kMaxFragmentLength) {
            break;
        }
        if (isAsciiAlnum(c) || c == '-' || c == '_') {
            fragment += c;
        }
    }

    return fragment;
}

std::string NameGenerator::randomToken(size_t bytes) {
    static const char* hex = "0123456789abcdef";

    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw StorageError("Random generator unavailable");
    }

    std::string token;
    token.reserve(bytes * 2);
    for (unsigned char b : buffer) {
        token += hex[b >> 4];
        token += hex[b & 0x0f];
    }

    return token;
}

std::string NameGenerator::timePrefix(std::chrono::system_clock::time_point now) {
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y%m%d%H%M%S")
       << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

bool NameGenerator::isValidStoredName(const std::string& name) {
    if (name.empty() || name.front() == '.' || name.back() == '.') {
        return false;
    }

    size_t dots = 0;
    for (char c : name) {
        if (c == '.') {
            ++dots;
        } else if (!isAsciiAlnum(c) && c != '-' && c != '_') {
            return false;
        }
    }

    return dots <= 1;
}

} // namespace filevault
