#pragma once

#include "staging_config.hpp"
#include "staging_error.hpp"
#include <string>
#include <vector>
#include <expected>
#include <filesystem>

namespace zipstage {

// Type and size rules applied after a staged artifact has passed the secret scan
class UploadPolicy {
public:
    explicit UploadPolicy(const StagingConfig& config);

    // UnsupportedType for extensions outside the allow-list, SizeExceeded above the ceiling
    std::expected<void, StagingErrorInfo> check(const std::filesystem::path& file_path, size_t size) const;

    bool is_allowed_extension(const std::filesystem::path& file_path) const;

    size_t max_bytes() const { return max_bytes_; }
    const std::vector<std::string>& allowed_extensions() const { return allowed_extensions_; }

    static std::string lowercase_extension(const std::filesystem::path& file_path);

    // Video types take priority, then common document and image types
    static std::string detect_mime_type(const std::filesystem::path& file_path);

private:
    std::vector<std::string> allowed_extensions_;
    size_t max_bytes_;
};

// "512 bytes", "1.5 KB", "4.9 MB"
std::string format_file_size(size_t bytes);

} // namespace zipstage
