#pragma once

#include "path_sanitizer.hpp"
#include "staging_error.hpp"
#include <string>
#include <string_view>
#include <memory>
#include <chrono>
#include <optional>
#include <expected>
#include <filesystem>
#include <sys/types.h>

namespace zipstage {

struct FetchOptions {
    std::chrono::milliseconds timeout{30'000};
    size_t max_bytes = 100 * 1024 * 1024;
};

// Device and inode of a file this process created
struct FileIdentity {
    dev_t device = 0;
    ino_t inode = 0;

    bool operator==(const FileIdentity&) const = default;
};

struct Download {
    NormalizedPath path;
    FileIdentity identity;
};

// Deletes a committed download only if the name still refers to the file
// that was downloaded. False when it is gone, replaced or not removable.
bool remove_download(const Download& download);

// One in-flight download. Bytes land in a uniquely named hidden part file
// beside the destination. commit() links it under the destination name, or
// under "<stem>-N<ext>" when that name is taken, so an existing file is
// never replaced. Until then the destructor removes it. bytes_received()
// never exceeds the byte limit.
class DownloadSession {
public:
    DownloadSession(
        std::string url,
        std::filesystem::path destination,
        size_t byte_limit,
        std::chrono::milliseconds timeout
    );
    ~DownloadSession();

    DownloadSession(const DownloadSession&) = delete;
    DownloadSession& operator=(const DownloadSession&) = delete;

    // Write a body chunk. Refused (and the session failed) when it would
    // cross the byte limit, the deadline has passed, or the write fails.
    bool append(const char* data, size_t size);

    // Flush to stable storage and move into place under a free name
    std::expected<void, StagingErrorInfo> commit();

    // Record the first failure; later ones are ignored
    void fail(StagingErrorInfo info);

    StagingErrorInfo timeout_error() const;
    StagingErrorInfo too_large_error() const;

    bool expired() const { return std::chrono::steady_clock::now() >= deadline_; }

    const std::string& url() const { return url_; }
    // Requested name before commit, the name actually used after
    const std::filesystem::path& destination() const { return destination_; }
    // Empty until the first byte arrives
    const std::filesystem::path& part_path() const { return part_path_; }
    const FileIdentity& identity() const { return identity_; }
    size_t byte_limit() const { return byte_limit_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    size_t bytes_received() const { return bytes_received_; }
    const std::optional<StagingErrorInfo>& failure() const { return failure_; }

    static constexpr int kMaxNameAttempts = 100;

private:
    std::string url_;
    std::filesystem::path destination_;
    std::filesystem::path part_path_;
    size_t byte_limit_;
    std::chrono::milliseconds timeout_;
    std::chrono::steady_clock::time_point deadline_;
    size_t bytes_received_ = 0;
    int fd_ = -1;
    bool committed_ = false;
    FileIdentity identity_;
    std::optional<StagingErrorInfo> failure_;

    bool open_part();
    void close_part();
    std::filesystem::path candidate_name(int attempt) const;
};

// Bounded HTTP(S) acquisition into the sandbox
class StreamingFetcher {
public:
    explicit StreamingFetcher(std::filesystem::path sandbox_root);
    ~StreamingFetcher();

    StreamingFetcher(const StreamingFetcher&) = delete;
    StreamingFetcher& operator=(const StreamingFetcher&) = delete;

    StreamingFetcher(StreamingFetcher&&) noexcept;
    StreamingFetcher& operator=(StreamingFetcher&&) noexcept;

    // InvalidProtocol, Timeout, TooLarge or NetworkError on failure, with
    // nothing left behind in the sandbox
    std::expected<Download, StagingErrorInfo> fetch(
        std::string_view url,
        const FetchOptions& options
    );

    // http:// or https://, case-insensitive
    static bool is_allowed_scheme(std::string_view url);

    // Last path segment of the URL if it is a usable file name, else "download"
    static std::string destination_name(std::string_view url);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace zipstage
