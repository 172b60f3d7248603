#include "PathValidator.h"

#include "Exceptions.h"
#include "Logger.h"

namespace GlobalSend {

bool PathValidator::isSafeRelativePath(const std::string& path) {
    if (path.empty() || path.front() == '/' || path.back() == '/') {
        return false;
    }
    if (path.find('\0') != std::string::npos || path.find('\\') != std::string::npos) {
        return false;
    }

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string component = path.substr(start, end - start);
        if (component.empty() || component == "." || component == "..") {
            return false;
        }
        start = end + 1;
    }
    return true;
}

std::filesystem::path PathValidator::resolveWithin(const std::filesystem::path& root, const std::string& relativePath) {
    if (!isSafeRelativePath(relativePath)) {
        Logger::instance().warn("Rejected unsafe path: " + relativePath, "PathValidator");
        throw ProtocolError("Unsafe manifest path: " + relativePath, ErrorCode::UNSAFE_PATH);
    }
    return root / std::filesystem::path(relativePath);
}

std::string PathValidator::toManifestPath(const std::filesystem::path& relative) {
    std::string result;
    for (const auto& part : relative.lexically_normal()) {
        if (!result.empty()) {
            result += '/';
        }
        result += part.string();
    }
    return result;
}

} // namespace GlobalSend
