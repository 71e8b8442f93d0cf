#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace filevault {

struct MultipartPart {
    std::string name;
    std::string filename;
    std::string contentType;
    bool hasFilename = false;
    // Points into the body passed to parseMultipart
    std::string_view data;
};

// Extracts the boundary parameter of a multipart/form-data Content-Type, or "".
std::string extractBoundary(const std::string& contentType);

/**
 * @brief Split a multipart/form-data body into its parts
 * @param body Raw request body; must outlive the returned parts
 * @param boundary Boundary without the leading "--"
 * @return Parts in body order
 * @throws ValidationError when the body is not well-formed
 */
std::vector<MultipartPart> parseMultipart(std::string_view body, const std::string& boundary);

const MultipartPart* findPart(const std::vector<MultipartPart>& parts, const std::string& name);

} // namespace filevault
