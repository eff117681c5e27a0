#pragma once

#include "staging_error.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <expected>
#include <filesystem>

namespace zipstage {

std::vector<std::string> default_allowed_extensions();

// Built once at startup and handed to each component; never mutated afterwards.
struct StagingConfig {
    std::string credential;                              // Supplied externally, never logged
    std::filesystem::path tmp_dir;                       // Base of all sandboxes
    bool sandboxing_enabled = true;                      // Per-user sandbox under tmp_dir/users
    std::filesystem::path sandbox_root;                  // Derived, absolute
    size_t memory_threshold = 5 * 1024 * 1024;           // Memory staging below this size
    std::chrono::milliseconds download_timeout{30'000};
    size_t max_download_bytes = 100 * 1024 * 1024;
    size_t max_upload_bytes = 100 * 1024 * 1024;         // Largest artifact the gate will stage
    size_t max_read_bytes = 1024 * 1024;                 // File manager READ limit
    std::chrono::hours stale_sandbox_age{24};
    std::chrono::minutes lock_timeout{30};
    std::vector<std::string> allowed_extensions = default_allowed_extensions();

    // ZIPLINE_TOKEN, ZIPLINE_TMP_DIR, ZIPLINE_DISABLE_SANDBOXING,
    // ZIPSTAGE_MEMORY_THRESHOLD, ZIPSTAGE_DOWNLOAD_TIMEOUT_MS,
    // ZIPSTAGE_MAX_DOWNLOAD_BYTES, ZIPSTAGE_MAX_UPLOAD_BYTES
    static std::expected<StagingConfig, StagingErrorInfo> from_environment();

    // Fixed sandbox root, defaults elsewhere. Used by embedders and tests.
    static StagingConfig with_sandbox_root(const std::filesystem::path& root);
};

} // namespace zipstage
