#include "staging_config.hpp"
#include "sandbox_manager.hpp"
#include <cstdlib>
#include <charconv>
#include <optional>

namespace zipstage {

std::vector<std::string> default_allowed_extensions() {
    return {
        ".txt", ".md", ".gpx", ".html", ".htm", ".json", ".xml", ".csv",
        ".js", ".ts", ".css", ".py", ".sh", ".yaml", ".yml", ".toml",
        ".mp4", ".mkv", ".webm", ".avi",
        ".png", ".jpg", ".jpeg", ".gif", ".webp", ".svg"
    };
}

static std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value) return std::nullopt;
    return std::string(value);
}

static std::expected<size_t, StagingErrorInfo> env_size(const char* name, size_t fallback) {
    auto raw = env(name);
    if (!raw || raw->empty()) return fallback;
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc() || ptr != raw->data() + raw->size() || value == 0) {
        return std::unexpected(StagingErrorInfo{
            StagingError::InvalidInput,
            std::string(name) + " must be a positive integer"
        });
    }
    return value;
}

std::expected<StagingConfig, StagingErrorInfo> StagingConfig::from_environment() {
    StagingConfig config;

    auto token = env("ZIPLINE_TOKEN");
    if (!token || token->empty()) {
        return std::unexpected(StagingErrorInfo{
            StagingError::InvalidInput, "Environment variable ZIPLINE_TOKEN is required"
        });
    }
    config.credential = *token;

    if (auto tmp = env("ZIPLINE_TMP_DIR"); tmp && !tmp->empty()) {
        config.tmp_dir = *tmp;
    } else {
        auto home = env("HOME");
        if (!home || home->empty()) {
            return std::unexpected(StagingErrorInfo{
                StagingError::InvalidInput, "HOME is not set and ZIPLINE_TMP_DIR was not given"
            });
        }
        config.tmp_dir = std::filesystem::path(*home) / ".zipline_tmp";
    }
    if (config.tmp_dir.is_relative()) {
        return std::unexpected(StagingErrorInfo{
            StagingError::InvalidInput, "ZIPLINE_TMP_DIR must be an absolute path"
        });
    }
    config.tmp_dir = config.tmp_dir.lexically_normal();

    config.sandboxing_enabled = env("ZIPLINE_DISABLE_SANDBOXING").value_or("") != "true";
    config.sandbox_root = SandboxManager::sandbox_path_for(
        config.tmp_dir, config.credential, config.sandboxing_enabled);

    auto threshold = env_size("ZIPSTAGE_MEMORY_THRESHOLD", config.memory_threshold);
    if (!threshold) return std::unexpected(threshold.error());
    config.memory_threshold = *threshold;

    auto timeout_ms = env_size("ZIPSTAGE_DOWNLOAD_TIMEOUT_MS", static_cast<size_t>(config.download_timeout.count()));
    if (!timeout_ms) return std::unexpected(timeout_ms.error());
    config.download_timeout = std::chrono::milliseconds(*timeout_ms);

    auto max_download = env_size("ZIPSTAGE_MAX_DOWNLOAD_BYTES", config.max_download_bytes);
    if (!max_download) return std::unexpected(max_download.error());
    config.max_download_bytes = *max_download;

    auto max_upload = env_size("ZIPSTAGE_MAX_UPLOAD_BYTES", config.max_upload_bytes);
    if (!max_upload) return std::unexpected(max_upload.error());
    config.max_upload_bytes = *max_upload;

    return config;
}

StagingConfig StagingConfig::with_sandbox_root(const std::filesystem::path& root) {
    StagingConfig config;
    config.tmp_dir = root.lexically_normal();
    config.sandboxing_enabled = false;
    config.sandbox_root = config.tmp_dir;
    return config;
}

} // namespace zipstage
