#pragma once

#include "staging_config.hpp"
#include "staging_error.hpp"
#include "path_sanitizer.hpp"
#include "secret_scanner.hpp"
#include "ephemeral_store.hpp"
#include "upload_policy.hpp"
#include "streaming_fetcher.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <variant>
#include <optional>
#include <expected>
#include <functional>

namespace zipstage {

enum class GateState {
    Received,
    PathResolved,
    ContentAcquired,
    SecretsScanned,
    Staged,
    Completed,
    Rejected
};

std::string_view to_string(GateState state);

// Sandbox-relative path supplied by the caller
struct LocalSource {
    std::string candidate;
};

// Remote content, materialized inside the sandbox before staging.
// Unset limits fall back to the configured defaults.
struct RemoteSource {
    std::string url;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<size_t> max_bytes;
};

using StagingRequest = std::variant<LocalSource, RemoteSource>;

struct OperationError {
    std::string message;
};

using OperationResult = std::expected<std::string, OperationError>;
using Operation = std::function<OperationResult(const NormalizedPath&, const StagedContent&)>;

// Pipeline succeeded; outcome is whatever the operation returned
struct Completion {
    NormalizedPath path;
    StagingMode mode;
    OperationResult outcome;
};

// Runs one request through resolve, acquire, scan, policy and execute.
// Staged content is released exactly once on every exit path, and
// downloads the gate made itself are deleted when the request is rejected.
// Exceptions thrown by the operation, of any type, become OperationError.
class StagingGate {
public:
    StagingGate(const StagingConfig& config, const SecretScanner& scanner);

    StagingGate(const StagingGate&) = delete;
    StagingGate& operator=(const StagingGate&) = delete;

    std::expected<Completion, StagingErrorInfo> run(const StagingRequest& request, const Operation& operation);

    GateState state() const { return trail_.back(); }
    const std::vector<GateState>& trail() const { return trail_; }

    // Release or purge actions performed; 1 once the gate reaches a terminal state
    size_t cleanup_count() const { return cleanup_count_; }

private:
    const StagingConfig& config_;
    EphemeralStore store_;
    UploadPolicy policy_;
    std::vector<GateState> trail_{GateState::Received};
    size_t cleanup_count_ = 0;

    NormalizedPath path_;
    std::optional<Download> download_;    // Set when this gate fetched the artifact
    StagedHandle handle_;

    std::expected<NormalizedPath, StagingErrorInfo> resolve(const StagingRequest& request);
    std::expected<std::pair<std::filesystem::path, size_t>, StagingErrorInfo> acquire() const;

    void advance(GateState next) { trail_.push_back(next); }
    std::string display_name() const;
    std::unexpected<StagingErrorInfo> reject(StagingErrorInfo info);
};

} // namespace zipstage
