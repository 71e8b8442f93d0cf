#include "filevault/multipart.hpp"
#include "filevault/errors.hpp"

#include <algorithm>
#include <cctype>

namespace filevault {

namespace {

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return value;
    }

    std::string trim(std::string_view value) {
        size_t begin = 0;
        size_t end = value.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
            ++begin;
        }
        while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
            --end;
        }
        return std::string(value.substr(begin, end - begin));
    }

    std::string unquote(const std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }

    // form-data; name="file"; filename="a.txt"
    void parseDisposition(const std::string& value, MultipartPart& part) {
        size_t start = 0;
        while (start <= value.size()) {
            size_t end = value.find(';', start);
            std::string token = trim(std::string_view(value).substr(start, end == std::string::npos ? std::string::npos : end - start));

            size_t equals = token.find('=');
            if (equals != std::string::npos) {
                std::string key = toLower(trim(std::string_view(token).substr(0, equals)));
                std::string param = unquote(trim(std::string_view(token).substr(equals + 1)));
                if (key == "name") {
                    part.name = param;
                } else if (key == "filename") {
                    part.filename = param;
                    part.hasFilename = true;
                }
            }

            if (end == std::string::npos) {
                break;
            }
            start = end + 1;
        }
    }

    void parsePartHeaders(std::string_view block, MultipartPart& part) {
        size_t start = 0;
        while (start < block.size()) {
            size_t end = block.find("\r\n", start);
            std::string_view line = block.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);

            size_t colon = line.find(':');
            if (colon != std::string_view::npos) {
                std::string name = toLower(trim(line.substr(0, colon)));
                std::string value = trim(line.substr(colon + 1));
                if (name == "content-disposition") {
                    parseDisposition(value, part);
                } else if (name == "content-type") {
                    part.contentType = value;
                }
            }

            if (end == std::string_view::npos) {
                break;
            }
            start = end + 2;
        }
    }

} // namespace

std::string extractBoundary(const std::string& contentType) {
    std::string lowered = toLower(contentType);
    if (lowered.compare(0, 19, "multipart/form-data") != 0) {
        return "";
    }

    size_t pos = lowered.find("boundary=");
    if (pos == std::string::npos) {
        return "";
    }

    std::string boundary = contentType.substr(pos + 9);
    size_t semicolon = boundary.find(';');
    if (semicolon != std::string::npos) {
        boundary = boundary.substr(0, semicolon);
    }
    return unquote(trim(boundary));
}

std::vector<MultipartPart> parseMultipart(std::string_view body, const std::string& boundary) {
    if (boundary.empty()) {
        throw ValidationError("Missing multipart boundary");
    }

    const std::string delimiter = "--" + boundary;
    const std::string partSeparator = "\r\n" + delimiter;

    size_t pos = body.find(delimiter);
    if (pos == std::string_view::npos) {
        throw ValidationError("Malformed multipart body");
    }
    pos += delimiter.size();

    std::vector<MultipartPart> parts;
    while (true) {
        if (body.substr(pos, 2) == "--") {
            return parts;
        }
        if (body.substr(pos, 2) != "\r\n") {
            throw ValidationError("Malformed multipart body");
        }
        pos += 2;

        size_t headerEnd = body.find("\r\n\r\n", pos);
        if (headerEnd == std::string_view::npos) {
            throw ValidationError("Malformed multipart body");
        }

        MultipartPart part;
        parsePartHeaders(body.substr(pos, headerEnd - pos), part);

        size_t dataStart = headerEnd + 4;
        size_t next = body.find(partSeparator, dataStart);
        if (next == std::string_view::npos) {
            throw ValidationError("Malformed multipart body");
        }

        part.data = body.substr(dataStart, next - dataStart);
        parts.push_back(std::move(part));

        pos = next + partSeparator.size();
    }
}

const MultipartPart* findPart(const std::vector<MultipartPart>& parts, const std::string& name) {
    for (const auto& part : parts) {
        if (part.name == name) {
            return &part;
        }
    }
    return nullptr;
}

} // namespace filevault
