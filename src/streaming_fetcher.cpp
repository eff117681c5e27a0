#include "streaming_fetcher.hpp"
#include "compact_log.hpp"
#include "upload_policy.hpp"
#include <curl/curl.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <charconv>
#include <algorithm>
#include <cctype>

namespace zipstage {

DownloadSession::DownloadSession(
    std::string url,
    std::filesystem::path destination,
    size_t byte_limit,
    std::chrono::milliseconds timeout
) : url_(std::move(url)),
    destination_(std::move(destination)),
    byte_limit_(byte_limit),
    timeout_(timeout),
    deadline_(std::chrono::steady_clock::now() + timeout) {}

DownloadSession::~DownloadSession() {
    close_part();
    if (!part_path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(part_path_, ec);
    }
}

StagingErrorInfo DownloadSession::timeout_error() const {
    return StagingErrorInfo{StagingError::Timeout,
        "Download timed out after " + log::num(timeout_.count()) + " ms"};
}

StagingErrorInfo DownloadSession::too_large_error() const {
    return StagingErrorInfo{StagingError::TooLarge,
        "Download exceeds the limit of " + log::num(byte_limit_) + " bytes"};
}

void DownloadSession::fail(StagingErrorInfo info) {
    if (!failure_) failure_ = std::move(info);
}

// ".<name>.XXXXXX.part" beside the destination, created exclusively
bool DownloadSession::open_part() {
    constexpr int kSuffixLength = 5;    // ".part"
    auto pattern = (destination_.parent_path() / ("." + destination_.filename().string() + ".XXXXXX.part")).string();
    fd_ = ::mkostemps(pattern.data(), kSuffixLength, O_CLOEXEC);
    if (fd_ == -1) {
        fail(StagingErrorInfo{StagingError::NetworkError,
            std::string("Unable to create download file: ") + std::strerror(errno)});
        return false;
    }
    part_path_ = pattern;
    return true;
}

void DownloadSession::close_part() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool DownloadSession::append(const char* data, size_t size) {
    if (failure_) return false;
    if (expired()) {
        fail(timeout_error());
        return false;
    }
    if (size > byte_limit_ - bytes_received_) {
        fail(too_large_error());
        return false;
    }
    if (fd_ == -1 && !open_part()) return false;

    size_t done = 0;
    while (done < size) {
        ssize_t n = pwrite(fd_, data + done, size - done, static_cast<off_t>(bytes_received_ + done));
        if (n == -1) {
            if (errno == EINTR) continue;
            fail(StagingErrorInfo{StagingError::NetworkError,
                std::string("Write to download file failed: ") + std::strerror(errno)});
            return false;
        }
        done += static_cast<size_t>(n);
    }
    bytes_received_ += size;
    return true;
}

// report.txt, report-1.txt, report-2.txt, ...
std::filesystem::path DownloadSession::candidate_name(int attempt) const {
    if (attempt == 0) return destination_;
    auto name = destination_.stem().string() + "-" + log::num(attempt) + destination_.extension().string();
    return destination_.parent_path() / name;
}

std::expected<void, StagingErrorInfo> DownloadSession::commit() {
    if (failure_) return std::unexpected(*failure_);
    if (committed_) return {};
    // Empty body: nothing was written yet
    if (fd_ == -1 && !open_part()) return std::unexpected(*failure_);

    if (fdatasync(fd_) == -1) {
        fail(StagingErrorInfo{StagingError::NetworkError,
            std::string("fdatasync failed: ") + std::strerror(errno)});
        return std::unexpected(*failure_);
    }
    struct stat st{};
    if (::fstat(fd_, &st) == -1) {
        fail(StagingErrorInfo{StagingError::NetworkError,
            std::string("Unable to stat download file: ") + std::strerror(errno)});
        return std::unexpected(*failure_);
    }
    close_part();

    // link() fails with EEXIST instead of replacing, unlike rename()
    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        auto candidate = candidate_name(attempt);
        if (::link(part_path_.c_str(), candidate.c_str()) == 0) {
            if (::unlink(part_path_.c_str()) == -1) {
                log::warn("Could not remove download part file: " + std::string(std::strerror(errno)));
            }
            part_path_.clear();
            destination_ = std::move(candidate);
            identity_ = FileIdentity{st.st_dev, st.st_ino};
            committed_ = true;
            return {};
        }
        if (errno != EEXIST) {
            fail(StagingErrorInfo{StagingError::NetworkError,
                std::string("Unable to finalize download: ") + std::strerror(errno)});
            return std::unexpected(*failure_);
        }
    }
    fail(StagingErrorInfo{StagingError::NetworkError,
        "Unable to finalize download: no free name for " + destination_.filename().string()});
    return std::unexpected(*failure_);
}

bool remove_download(const Download& download) {
    struct stat st{};
    if (::lstat(download.path.c_str(), &st) == -1) return false;
    if (FileIdentity{st.st_dev, st.st_ino} != download.identity) return false;
    return ::unlink(download.path.c_str()) == 0;
}

namespace {

struct FetchContext {
    DownloadSession* session;
    long status = 0;    // Status of the response whose headers are arriving
};

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.remove_suffix(1);
    return s;
}

size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* ctx = static_cast<FetchContext*>(userp);
    if (!ctx->session->append(contents, realsize)) return 0;
    return realsize;
}

// Rejects an oversized body from its declared length, before any byte is written
size_t header_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* ctx = static_cast<FetchContext*>(userp);
    std::string_view line(contents, realsize);

    if (line.starts_with("HTTP/")) {
        ctx->status = 0;
        auto sp = line.find(' ');
        if (sp != std::string_view::npos) {
            std::from_chars(line.data() + sp + 1, line.data() + line.size(), ctx->status);
        }
        return realsize;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return realsize;
    if (!iequals(line.substr(0, colon), "content-length")) return realsize;
    // Redirect and error bodies are never written
    if (ctx->status < 200 || ctx->status >= 300) return realsize;

    auto value = trim(line.substr(colon + 1));
    unsigned long long declared = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), declared);
    if (ec != std::errc()) return realsize;

    if (declared > ctx->session->byte_limit()) {
        ctx->session->fail(StagingErrorInfo{StagingError::TooLarge,
            "Declared size of " + log::num(declared) + " bytes exceeds the limit of " +
            log::num(ctx->session->byte_limit()) + " bytes"});
        return 0;
    }
    return realsize;
}

int xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<FetchContext*>(clientp);
    if (ctx->session->expired()) {
        ctx->session->fail(ctx->session->timeout_error());
        return 1;
    }
    return 0;
}

StagingErrorInfo map_curl_error(CURLcode res, long http_code, const DownloadSession& session) {
    switch (res) {
        case CURLE_OPERATION_TIMEDOUT:
            return session.timeout_error();
        case CURLE_FILESIZE_EXCEEDED:
            return session.too_large_error();
        case CURLE_UNSUPPORTED_PROTOCOL:
            return StagingErrorInfo{StagingError::InvalidProtocol, "Redirect to a protocol other than http or https"};
        case CURLE_HTTP_RETURNED_ERROR:
            return StagingErrorInfo{StagingError::NetworkError, "HTTP " + log::num(http_code)};
        default:
            return StagingErrorInfo{StagingError::NetworkError, curl_easy_strerror(res)};
    }
}

} // namespace

class StreamingFetcher::Impl {
public:
    std::filesystem::path sandbox_root;
    long max_redirects = 5;
    explicit Impl(std::filesystem::path root) : sandbox_root(std::move(root)) { curl_global_init(CURL_GLOBAL_ALL); }
    ~Impl() { curl_global_cleanup(); }
};

StreamingFetcher::StreamingFetcher(std::filesystem::path sandbox_root)
    : pImpl_(std::make_unique<Impl>(std::move(sandbox_root))) {}
StreamingFetcher::~StreamingFetcher() = default;
StreamingFetcher::StreamingFetcher(StreamingFetcher&&) noexcept = default;
StreamingFetcher& StreamingFetcher::operator=(StreamingFetcher&&) noexcept = default;

bool StreamingFetcher::is_allowed_scheme(std::string_view url) {
    auto has_prefix = [url](std::string_view prefix) {
        return url.size() >= prefix.size() && iequals(url.substr(0, prefix.size()), prefix);
    };
    return has_prefix("http://") || has_prefix("https://");
}

std::string StreamingFetcher::destination_name(std::string_view url) {
    constexpr std::string_view kFallback = "download";
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) return std::string(kFallback);
    auto rest = url.substr(scheme_end + 3);
    if (auto cut = rest.find_first_of("?#"); cut != std::string_view::npos) rest = rest.substr(0, cut);

    auto slash = rest.find('/');
    if (slash == std::string_view::npos) return std::string(kFallback);
    auto path = rest.substr(slash);
    auto name = path.substr(path.rfind('/') + 1);

    if (PathSanitizer::validate_filename(name) || name.ends_with(".part")) return std::string(kFallback);
    return std::string(name);
}

std::expected<Download, StagingErrorInfo> StreamingFetcher::fetch(
    std::string_view url_sv,
    const FetchOptions& options
) {
    if (!is_allowed_scheme(url_sv)) {
        return std::unexpected(StagingErrorInfo{StagingError::InvalidProtocol, "Only http and https URLs are allowed"});
    }
    if (options.max_bytes == 0 || options.timeout.count() <= 0) {
        return std::unexpected(StagingErrorInfo{StagingError::InvalidInput, "Timeout and byte limit must be positive"});
    }

    auto destination = PathSanitizer::sanitize(destination_name(url_sv), pImpl_->sandbox_root);
    if (!destination) return std::unexpected(destination.error());

    std::error_code ec;
    std::filesystem::create_directories(destination->parent_path(), ec);
    if (ec) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Unable to prepare sandbox directory: " + ec.message()});
    }

    std::string url(url_sv);
    DownloadSession session(url, *destination, options.max_bytes, options.timeout);
    FetchContext ctx{&session};

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) return std::unexpected(StagingErrorInfo{StagingError::NetworkError, "Failed to init CURL"});

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, pImpl_->max_redirects);
    curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(h, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(options.max_bytes));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(h);
    long http_code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_code);

    // A failure recorded by a callback is the real cause; curl only saw the abort
    if (session.failure()) {
        log::audit("DOWNLOAD_FAILED", destination->filename().string(), "Error: " + session.failure()->message);
        return std::unexpected(*session.failure());
    }
    if (res != CURLE_OK) {
        auto error = map_curl_error(res, http_code, session);
        log::audit("DOWNLOAD_FAILED", destination->filename().string(), "Error: " + error.message);
        return std::unexpected(error);
    }

    if (auto committed = session.commit(); !committed) {
        log::audit("DOWNLOAD_FAILED", destination->filename().string(), "Error: " + committed.error().message);
        return std::unexpected(committed.error());
    }
    log::audit("DOWNLOAD", session.destination().filename().string(), "Size: " + format_file_size(session.bytes_received()));
    return Download{session.destination(), session.identity()};
}

} // namespace zipstage
