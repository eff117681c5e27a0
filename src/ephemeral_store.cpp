#include "ephemeral_store.hpp"
#include "compact_log.hpp"
#include <openssl/crypto.h>
#include <fstream>
#include <new>

namespace zipstage {

StagingMode mode_of(const StagedContent& staged) {
    return std::visit(overloaded{
        [](const MemoryContent&) { return StagingMode::Memory; },
        [](const DiskContent&) { return StagingMode::Disk; },
    }, staged);
}

const std::filesystem::path& source_path_of(const StagedContent& staged) {
    return std::visit([](const auto& content) -> const std::filesystem::path& {
        return content.source_path;
    }, staged);
}

std::string_view to_string(StagingMode mode) {
    return mode == StagingMode::Memory ? "memory" : "disk";
}

namespace {

void wipe(std::vector<char>& bytes) noexcept {
    if (!bytes.empty()) OPENSSL_cleanse(bytes.data(), bytes.size());
    std::vector<char>().swap(bytes);
}

// Wipes the buffer on scope exit unless disarmed
struct WipeGuard {
    std::vector<char>& bytes;
    bool armed = true;
    ~WipeGuard() { if (armed) wipe(bytes); }
};

StagingErrorInfo secrets_error(const std::vector<SecretFinding>& findings) {
    return StagingErrorInfo{StagingError::SecretsDetected, SecretScanner::describe(findings)};
}

} // namespace

EphemeralStore::EphemeralStore(const SecretScanner& scanner, BufferAllocator allocator)
    : scanner_(scanner), allocator_(std::move(allocator)) {
    if (!allocator_) {
        allocator_ = [](size_t n) { return std::vector<char>(n); };
    }
}

std::expected<StagedContent, StagingErrorInfo> EphemeralStore::stage(
    const std::filesystem::path& file_path,
    size_t threshold
) const {
    std::error_code ec;
    auto status = std::filesystem::status(file_path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "File not found"});
    }
    if (!std::filesystem::is_regular_file(status)) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Not a regular file"});
    }
    auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Unable to read file size"});
    }

    if (size < threshold) {
        try {
            return stage_in_memory(file_path, static_cast<size_t>(size));
        } catch (const std::bad_alloc&) {
            log::warn("Memory staging ran out of memory, scanning from disk instead");
        }
    }
    return stage_on_disk(file_path);
}

std::expected<StagedContent, StagingErrorInfo> EphemeralStore::stage_in_memory(
    const std::filesystem::path& file_path,
    size_t size
) const {
    std::vector<char> bytes = allocator_(size);
    WipeGuard guard{bytes};

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "File not found"});
    }
    file.read(bytes.data(), static_cast<std::streamsize>(size));
    if (static_cast<size_t>(file.gcount()) != size || file.peek() != std::char_traits<char>::eof()) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "File changed while it was being staged"});
    }

    auto findings = scanner_.scan(bytes, file_path);
    if (!findings.empty()) return std::unexpected(secrets_error(findings));

    guard.armed = false;
    return StagedContent{MemoryContent{std::move(bytes), file_path}};
}

std::expected<StagedContent, StagingErrorInfo> EphemeralStore::stage_on_disk(const std::filesystem::path& file_path) const {
    auto findings = scanner_.scan_file(file_path);
    if (!findings) return std::unexpected(findings.error());
    if (!findings->empty()) return std::unexpected(secrets_error(*findings));
    return StagedContent{DiskContent{file_path}};
}

void EphemeralStore::release(StagedContent& staged) noexcept {
    std::visit(overloaded{
        [](MemoryContent& memory) { wipe(memory.bytes); },
        [](DiskContent&) {},
    }, staged);
}

} // namespace zipstage
