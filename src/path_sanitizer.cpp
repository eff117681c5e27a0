#include "path_sanitizer.hpp"
#include <vector>
#include <cctype>

namespace zipstage {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

static std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

// Root as a string without trailing separators ("/" stays "/")
static std::string root_string(const std::filesystem::path& root) {
    std::string s = root.lexically_normal().string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

PathSanitizer::PathSanitizer(std::filesystem::path sandbox_root)
    : root_(root_string(sandbox_root)) {}

std::expected<NormalizedPath, StagingErrorInfo> PathSanitizer::sanitize(std::string_view candidate) const {
    return sanitize(candidate, root_);
}

std::expected<NormalizedPath, StagingErrorInfo> PathSanitizer::sanitize(
    std::string_view candidate,
    const std::filesystem::path& sandbox_root
) {
    if (candidate.find('\0') != std::string_view::npos) {
        return std::unexpected(StagingErrorInfo{StagingError::InvalidInput, "Path contains null bytes"});
    }
    auto trimmed = trim(candidate);
    if (trimmed.empty()) {
        return std::unexpected(StagingErrorInfo{StagingError::InvalidInput, "Path cannot be empty or whitespace-only"});
    }
    if (!sandbox_root.is_absolute()) {
        return std::unexpected(StagingErrorInfo{StagingError::InvalidInput, "Sandbox root must be an absolute path"});
    }

    std::string unified(trimmed);
    for (auto& c : unified) {
        if (c == '\\') c = '/';
    }

    if (unified.front() == '/') {
        return std::unexpected(StagingErrorInfo{StagingError::PathTraversal, "Absolute paths are not allowed; use a sandbox-relative path"});
    }
    if (unified.size() >= 2 && std::isalpha(static_cast<unsigned char>(unified[0])) && unified[1] == ':') {
        return std::unexpected(StagingErrorInfo{StagingError::PathTraversal, "Absolute drive-letter paths are not allowed; use a sandbox-relative path"});
    }

    std::vector<std::string_view> segments;
    std::string_view rest(unified);
    while (!rest.empty()) {
        size_t slash = rest.find('/');
        auto segment = rest.substr(0, slash);
        rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);

        if (segment.empty() || segment == ".") continue;
        if (segment == "..") {
            if (segments.empty()) {
                return std::unexpected(StagingErrorInfo{StagingError::PathTraversal, "Path traversal attempt detected"});
            }
            segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string resolved = root_string(sandbox_root);
    for (auto segment : segments) {
        if (resolved.back() != '/') resolved += '/';
        resolved.append(segment);
    }

    NormalizedPath result(resolved);
    if (!is_within(sandbox_root, result)) {
        return std::unexpected(StagingErrorInfo{StagingError::PathTraversal, "Path traversal attempt detected"});
    }
    return result;
}

bool PathSanitizer::is_within(const std::filesystem::path& root, const std::filesystem::path& path) {
    auto r = root_string(root);
    auto p = path.lexically_normal().string();
    while (p.size() > 1 && p.back() == '/') p.pop_back();

    if (p == r) return true;
    if (r == "/") return p.starts_with("/");
    // Prefix alone is not enough: /sandbox/user1-evil starts with /sandbox/user1
    return p.size() > r.size() && p.starts_with(r) && p[r.size()] == '/';
}

std::optional<std::string> PathSanitizer::validate_filename(std::string_view filename) {
    if (filename.empty() ||
        filename.find('/') != std::string_view::npos ||
        filename.find('\\') != std::string_view::npos ||
        filename.find("..") != std::string_view::npos ||
        filename.find('\0') != std::string_view::npos ||
        filename.front() == '.' ||
        (filename.size() >= 2 && filename[1] == ':')) {
        return "Filenames must not include path separators, dot segments, or be empty. "
               "Only bare filenames in the sandbox are allowed.";
    }
    return std::nullopt;
}

} // namespace zipstage
