#include "staging_gate.hpp"
#include "compact_log.hpp"
#include <exception>

namespace zipstage {

std::string_view to_string(GateState state) {
    switch (state) {
        case GateState::Received:        return "Received";
        case GateState::PathResolved:    return "PathResolved";
        case GateState::ContentAcquired: return "ContentAcquired";
        case GateState::SecretsScanned:  return "SecretsScanned";
        case GateState::Staged:          return "Staged";
        case GateState::Completed:       return "Completed";
        case GateState::Rejected:        return "Rejected";
    }
    return "Unknown";
}

StagingGate::StagingGate(const StagingConfig& config, const SecretScanner& scanner)
    : config_(config), store_(scanner), policy_(config) {}

std::string StagingGate::display_name() const {
    if (path_.empty()) return {};
    auto relative = path_.lexically_relative(config_.sandbox_root);
    return relative.empty() ? path_.filename().string() : relative.string();
}

std::unexpected<StagingErrorInfo> StagingGate::reject(StagingErrorInfo info) {
    handle_.release();
    if (download_) {
        if (!remove_download(*download_)) log::warn("Rejected download left in place: " + display_name());
        download_.reset();
    }
    ++cleanup_count_;
    advance(GateState::Rejected);
    log::audit("STAGING_REJECTED", display_name(), "Reason: " + std::string(to_string(info.error)));
    return std::unexpected(std::move(info));
}

std::expected<NormalizedPath, StagingErrorInfo> StagingGate::resolve(const StagingRequest& request) {
    return std::visit(overloaded{
        [&](const LocalSource& local) -> std::expected<NormalizedPath, StagingErrorInfo> {
            return PathSanitizer::sanitize(local.candidate, config_.sandbox_root);
        },
        [&](const RemoteSource& remote) -> std::expected<NormalizedPath, StagingErrorInfo> {
            StreamingFetcher fetcher(config_.sandbox_root);
            FetchOptions options{
                remote.timeout.value_or(config_.download_timeout),
                remote.max_bytes.value_or(config_.max_download_bytes)
            };
            auto fetched = fetcher.fetch(remote.url, options);
            if (!fetched) return std::unexpected(fetched.error());
            download_ = *fetched;
            return fetched->path;
        },
    }, request);
}

// Canonical location and size of the resolved artifact
std::expected<std::pair<std::filesystem::path, size_t>, StagingErrorInfo> StagingGate::acquire() const {
    std::error_code ec;
    auto status = std::filesystem::status(path_, ec);
    if (ec || !std::filesystem::exists(status)) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "File not found: " + display_name()});
    }
    if (!std::filesystem::is_regular_file(status)) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Not a regular file: " + display_name()});
    }

    // Lexical confinement is not enough once symlinks are followed
    auto canonical_root = std::filesystem::weakly_canonical(config_.sandbox_root, ec);
    if (ec) return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Sandbox root is not accessible"});
    auto canonical = std::filesystem::canonical(path_, ec);
    if (ec) return std::unexpected(StagingErrorInfo{StagingError::NotFound, "File not found: " + display_name()});
    if (!PathSanitizer::is_within(canonical_root, canonical)) {
        return std::unexpected(StagingErrorInfo{StagingError::PathTraversal, "Path resolves outside the sandbox"});
    }

    auto size = std::filesystem::file_size(canonical, ec);
    if (ec) return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Unable to read file size: " + display_name()});
    return std::pair{canonical, static_cast<size_t>(size)};
}

std::expected<Completion, StagingErrorInfo> StagingGate::run(const StagingRequest& request, const Operation& operation) {
    if (state() != GateState::Received) {
        return std::unexpected(StagingErrorInfo{StagingError::InvalidInput, "A staging gate runs exactly one request"});
    }
    if (!operation) return reject(StagingErrorInfo{StagingError::InvalidInput, "No operation supplied"});

    auto resolved = resolve(request);
    if (!resolved) return reject(resolved.error());
    path_ = std::move(*resolved);
    advance(GateState::PathResolved);

    auto acquired = acquire();
    if (!acquired) return reject(acquired.error());
    auto [canonical, size] = std::move(*acquired);
    advance(GateState::ContentAcquired);

    auto staged = store_.stage(canonical, config_.memory_threshold);
    if (!staged) return reject(staged.error());
    handle_ = StagedHandle(std::move(*staged));
    advance(GateState::SecretsScanned);

    if (auto allowed = policy_.check(path_, size); !allowed) return reject(allowed.error());
    advance(GateState::Staged);

    auto mode = mode_of(handle_.content());
    OperationResult outcome = std::unexpected(OperationError{"Operation did not run"});
    try {
        outcome = operation(path_, handle_.content());
    } catch (const std::exception& e) {
        outcome = std::unexpected(OperationError{e.what()});
    } catch (...) {
        outcome = std::unexpected(OperationError{"Operation threw a non-standard exception"});
    }

    handle_.release();
    ++cleanup_count_;
    advance(GateState::Completed);
    log::audit("STAGING_COMPLETED", display_name(),
               "Mode: " + std::string(to_string(mode)) + (outcome ? "" : " - Operation failed"));
    return Completion{path_, mode, std::move(outcome)};
}

} // namespace zipstage
