#pragma once

#include "staging_config.hpp"
#include "staging_error.hpp"
#include "path_sanitizer.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <expected>
#include <filesystem>

namespace zipstage {

struct SandboxFile {
    std::string name;
    size_t size = 0;
};

// Owns the per-user sandbox directory: creation, stale cleanup, the advisory
// lock, and bare-filename file management inside it.
class SandboxManager {
public:
    static constexpr const char* kLockFile = ".lock";

    explicit SandboxManager(const StagingConfig& config);

    // <tmp>/users/<sha256(credential)>, or <tmp> itself when sandboxing is off
    static std::filesystem::path sandbox_path_for(
        const std::filesystem::path& tmp_dir,
        std::string_view credential,
        bool sandboxing_enabled
    );

    static std::string sha256_hex(std::string_view data);

    // Create the sandbox (mode 0700) if missing
    std::expected<std::filesystem::path, StagingErrorInfo> ensure() const;

    // Remove per-user sandboxes not modified within the configured age
    size_t cleanup_stale() const;

    bool is_locked() const;
    bool acquire_lock() const;
    bool release_lock() const;

    std::expected<std::vector<SandboxFile>, StagingErrorInfo> list_files() const;
    std::expected<NormalizedPath, StagingErrorInfo> path_of(std::string_view filename) const;
    std::expected<size_t, StagingErrorInfo> create_file(std::string_view filename, std::string_view content) const;
    std::expected<std::string, StagingErrorInfo> read_file(std::string_view filename) const;

    const std::filesystem::path& root() const { return sanitizer_.root(); }

private:
    std::filesystem::path tmp_dir_;
    bool sandboxing_enabled_;
    std::string owner_;
    std::chrono::hours stale_age_;
    std::chrono::minutes lock_timeout_;
    size_t max_read_bytes_;
    PathSanitizer sanitizer_;

    std::filesystem::path lock_path() const { return root() / kLockFile; }
    std::expected<NormalizedPath, StagingErrorInfo> checked_filename(std::string_view filename) const;
};

} // namespace zipstage
