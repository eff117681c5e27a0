#include "sandbox_manager.hpp"
#include "compact_log.hpp"
#include "upload_policy.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <charconv>
#include <algorithm>
#include <optional>

namespace zipstage {

SandboxManager::SandboxManager(const StagingConfig& config)
    : tmp_dir_(config.tmp_dir),
      sandboxing_enabled_(config.sandboxing_enabled),
      owner_(sha256_hex(config.credential)),
      stale_age_(config.stale_sandbox_age),
      lock_timeout_(config.lock_timeout),
      max_read_bytes_(config.max_read_bytes),
      sanitizer_(config.sandbox_root) {}

std::string SandboxManager::sha256_hex(std::string_view data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx ||
        EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        EVP_MD_CTX_free(ctx);
        return {};
    }
    EVP_MD_CTX_free(ctx);

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        out += kHex[hash[i] >> 4];
        out += kHex[hash[i] & 0x0f];
    }
    return out;
}

std::filesystem::path SandboxManager::sandbox_path_for(
    const std::filesystem::path& tmp_dir,
    std::string_view credential,
    bool sandboxing_enabled
) {
    if (!sandboxing_enabled) return tmp_dir;
    return tmp_dir / "users" / sha256_hex(credential);
}

std::expected<std::filesystem::path, StagingErrorInfo> SandboxManager::ensure() const {
    std::error_code ec;
    std::filesystem::create_directories(root(), ec);
    if (ec) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Unable to create sandbox directory: " + ec.message()});
    }
    std::filesystem::permissions(root(), std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) log::warn("Could not restrict sandbox permissions: " + ec.message());
    return root();
}

size_t SandboxManager::cleanup_stale() const {
    if (!sandboxing_enabled_) return 0;

    auto users_dir = tmp_dir_ / "users";
    std::error_code ec;
    std::filesystem::directory_iterator it(users_dir, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory) {
            log::audit("SANDBOX_CLEANUP_ERROR", {}, "Error: " + ec.message());
        }
        return 0;
    }

    size_t cleaned = 0;
    auto now = std::filesystem::file_time_type::clock::now();
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) continue;

        auto mtime = entry.last_write_time(entry_ec);
        if (entry_ec) {
            log::audit("SANDBOX_STAT_FAILED", {}, "Error: " + entry_ec.message());
            continue;
        }
        auto age = now - mtime;
        if (age <= stale_age_) continue;

        std::filesystem::remove_all(entry.path(), entry_ec);
        if (entry_ec) {
            log::audit("SANDBOX_CLEANUP_FAILED", {}, "Error: " + entry_ec.message());
            continue;
        }
        ++cleaned;
        auto hours = std::chrono::duration_cast<std::chrono::hours>(age).count();
        log::audit("SANDBOX_CLEANED", {}, "Age: " + log::num(hours) + " hours");
    }
    return cleaned;
}

namespace {

struct LockData {
    long long timestamp_ms = 0;
    std::string owner;
};

long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// "timestamp=<ms>\nowner=<hash>\n"; anything else is corrupt
std::optional<LockData> read_lock(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    LockData data;
    bool has_ts = false;
    std::string line;
    while (std::getline(file, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) return std::nullopt;
        auto key = std::string_view(line).substr(0, eq);
        auto value = std::string_view(line).substr(eq + 1);
        if (key == "timestamp") {
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), data.timestamp_ms);
            if (ec != std::errc() || ptr != value.data() + value.size()) return std::nullopt;
            has_ts = true;
        } else if (key == "owner") {
            data.owner = std::string(value);
        }
    }
    if (!has_ts || data.owner.empty()) return std::nullopt;
    return data;
}

} // namespace

bool SandboxManager::is_locked() const {
    if (!sandboxing_enabled_) return false;

    std::error_code ec;
    if (!std::filesystem::exists(lock_path(), ec)) return false;

    auto data = read_lock(lock_path());
    if (!data) {
        std::filesystem::remove(lock_path(), ec);
        return false;
    }
    auto timeout_ms = std::chrono::duration_cast<std::chrono::milliseconds>(lock_timeout_).count();
    if (now_ms() - data->timestamp_ms > timeout_ms) {
        std::filesystem::remove(lock_path(), ec);
        return false;
    }
    return true;
}

bool SandboxManager::acquire_lock() const {
    if (!sandboxing_enabled_) return true;

    if (is_locked()) {
        log::audit("LOCK_ACQUIRE_FAILED", {}, "Reason: Already locked");
        return false;
    }
    std::ofstream file(lock_path(), std::ios::trunc);
    file << "timestamp=" << now_ms() << "\nowner=" << owner_ << "\n";
    file.close();
    if (!file) {
        log::audit("LOCK_ACQUIRE_FAILED", {}, "Reason: Could not write lock file");
        return false;
    }
    log::audit("LOCK_ACQUIRED", {}, "Timeout: " + log::num(lock_timeout_.count()) + " minutes");
    return true;
}

bool SandboxManager::release_lock() const {
    if (!sandboxing_enabled_) return true;

    std::error_code ec;
    if (!std::filesystem::exists(lock_path(), ec)) {
        log::audit("LOCK_RELEASE_NOT_NEEDED", {}, "Reason: No lock file exists");
        return true;
    }
    auto data = read_lock(lock_path());
    if (data && data->owner != owner_) {
        log::audit("LOCK_RELEASE_FAILED", {}, "Reason: Owner mismatch");
        return false;
    }
    std::filesystem::remove(lock_path(), ec);
    log::audit("LOCK_RELEASED", {}, data ? "Reason: Manual release" : "Reason: Lock file corrupted");
    return !ec;
}

std::expected<NormalizedPath, StagingErrorInfo> SandboxManager::checked_filename(std::string_view filename) const {
    if (auto reason = PathSanitizer::validate_filename(filename)) {
        return std::unexpected(StagingErrorInfo{StagingError::InvalidInput, *reason});
    }
    return sanitizer_.sanitize(filename);
}

std::expected<std::vector<SandboxFile>, StagingErrorInfo> SandboxManager::list_files() const {
    std::error_code ec;
    std::filesystem::directory_iterator it(root(), ec);
    if (ec) {
        log::audit("FILE_LIST_FAILED", {}, "Error: " + ec.message());
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Unable to list sandbox: " + ec.message()});
    }
    std::vector<SandboxFile> files;
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        auto name = entry.path().filename().string();
        // Lock file and in-flight download parts
        if (name.starts_with('.')) continue;
        files.push_back(SandboxFile{name, static_cast<size_t>(entry.file_size(entry_ec))});
    }
    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
    log::audit("FILE_LIST", {}, "Files: " + log::num(files.size()));
    return files;
}

std::expected<NormalizedPath, StagingErrorInfo> SandboxManager::path_of(std::string_view filename) const {
    auto path = checked_filename(filename);
    if (!path) {
        log::audit("FILE_PATH_FAILED", filename, "Error: " + path.error().message);
        return path;
    }
    log::audit("FILE_PATH", filename);
    return path;
}

std::expected<size_t, StagingErrorInfo> SandboxManager::create_file(std::string_view filename, std::string_view content) const {
    auto path = checked_filename(filename);
    if (!path) return std::unexpected(path.error());

    std::ofstream file(*path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        log::audit("FILE_CREATE_FAILED", filename, "Error: write failed");
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Unable to write file in sandbox"});
    }
    log::audit("FILE_CREATED", filename, "Size: " + format_file_size(content.size()));
    return content.size();
}

std::expected<std::string, StagingErrorInfo> SandboxManager::read_file(std::string_view filename) const {
    auto path = checked_filename(filename);
    if (!path) return std::unexpected(path.error());

    std::error_code ec;
    auto size = std::filesystem::file_size(*path, ec);
    if (ec) {
        log::audit("FILE_READ_FAILED", filename, "Error: " + ec.message());
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "File not found in sandbox"});
    }
    if (size > max_read_bytes_) {
        log::audit("FILE_READ_FAILED", filename, "Reason: File too large (" + format_file_size(size) + ")");
        return std::unexpected(StagingErrorInfo{
            StagingError::SizeExceeded,
            "File too large (" + format_file_size(size) + "). Max allowed: " + format_file_size(max_read_bytes_) + "."
        });
    }

    std::ifstream file(*path, std::ios::binary);
    std::ostringstream oss;
    oss << file.rdbuf();
    if (!file && !file.eof()) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Unable to read file in sandbox"});
    }
    log::audit("FILE_READ", filename, "Size: " + format_file_size(size));
    return oss.str();
}

} // namespace zipstage
