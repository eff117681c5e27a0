#include "upload_policy.hpp"
#include "compact_log.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace zipstage {

UploadPolicy::UploadPolicy(const StagingConfig& config)
    : allowed_extensions_(config.allowed_extensions),
      max_bytes_(config.max_upload_bytes) {
    for (auto& ext : allowed_extensions_) {
        if (!ext.empty() && ext[0] != '.') ext = "." + ext;
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
}

std::string UploadPolicy::lowercase_extension(const std::filesystem::path& file_path) {
    auto ext = file_path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool UploadPolicy::is_allowed_extension(const std::filesystem::path& file_path) const {
    auto ext = lowercase_extension(file_path);
    return std::find(allowed_extensions_.begin(), allowed_extensions_.end(), ext) != allowed_extensions_.end();
}

std::expected<void, StagingErrorInfo> UploadPolicy::check(const std::filesystem::path& file_path, size_t size) const {
    if (!is_allowed_extension(file_path)) {
        auto ext = lowercase_extension(file_path);
        std::string supported;
        for (const auto& allowed : allowed_extensions_) {
            if (!supported.empty()) supported += ", ";
            supported += allowed;
        }
        return std::unexpected(StagingErrorInfo{
            StagingError::UnsupportedType,
            "File type " + (ext.empty() ? std::string("(none)") : ext) + " not supported. Supported types: " + supported
        });
    }
    if (size > max_bytes_) {
        return std::unexpected(StagingErrorInfo{
            StagingError::SizeExceeded,
            "File size " + format_file_size(size) + " exceeds the limit of " + format_file_size(max_bytes_) +
            " by " + log::num(size - max_bytes_) + " bytes"
        });
    }
    return {};
}

std::string UploadPolicy::detect_mime_type(const std::filesystem::path& file_path) {
    static const std::map<std::string, std::string> video_types = {
        {".mp4", "video/mp4"},
        {".mkv", "video/x-matroska"},
        {".webm", "video/webm"},
        {".avi", "video/avi"},
    };
    static const std::map<std::string, std::string> other_types = {
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".pdf", "application/pdf"},
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".zip", "application/zip"},
    };

    auto ext = lowercase_extension(file_path);
    if (ext.empty()) return "application/octet-stream";
    if (auto it = video_types.find(ext); it != video_types.end()) return it->second;
    if (auto it = other_types.find(ext); it != other_types.end()) return it->second;
    return "application/octet-stream";
}

std::string format_file_size(size_t bytes) {
    if (bytes < 1024) return log::num(bytes) + " bytes";
    if (bytes < 1024 * 1024) return log::num_fixed(bytes / 1024.0, 1) + " KB";
    return log::num_fixed(bytes / (1024.0 * 1024.0), 1) + " MB";
}

} // namespace zipstage
