#pragma once

#include "secret_scanner.hpp"
#include "staging_error.hpp"
#include <vector>
#include <variant>
#include <optional>
#include <expected>
#include <functional>
#include <filesystem>

namespace zipstage {

// Whole file content, byte length equal to the source file size
struct MemoryContent {
    std::vector<char> bytes;
    std::filesystem::path source_path;
};

// Content left on disk; lifetime owned by whoever requested staging
struct DiskContent {
    std::filesystem::path source_path;
};

using StagedContent = std::variant<MemoryContent, DiskContent>;

enum class StagingMode { Memory, Disk };

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

StagingMode mode_of(const StagedContent& staged);
const std::filesystem::path& source_path_of(const StagedContent& staged);
std::string_view to_string(StagingMode mode);

// Returns a zero-filled buffer of n bytes; may throw std::bad_alloc
using BufferAllocator = std::function<std::vector<char>(size_t)>;

class EphemeralStore {
public:
    explicit EphemeralStore(const SecretScanner& scanner, BufferAllocator allocator = nullptr);

    // Memory below threshold, disk at or above it. Content with findings is
    // never returned: SecretsDetected carries the describe() text instead.
    std::expected<StagedContent, StagingErrorInfo> stage(
        const std::filesystem::path& file_path,
        size_t threshold
    ) const;

    // Memory: wipe and drop the buffer. Disk: nothing to do.
    static void release(StagedContent& staged) noexcept;

private:
    const SecretScanner& scanner_;
    BufferAllocator allocator_;

    std::expected<StagedContent, StagingErrorInfo> stage_in_memory(const std::filesystem::path& file_path, size_t size) const;
    std::expected<StagedContent, StagingErrorInfo> stage_on_disk(const std::filesystem::path& file_path) const;
};

// Scoped ownership of one StagedContent. Released exactly once: by an
// explicit release() or by the destructor, whichever comes first.
class StagedHandle {
public:
    StagedHandle() = default;
    explicit StagedHandle(StagedContent content) : content_(std::move(content)) {}
    ~StagedHandle() { release(); }

    StagedHandle(const StagedHandle&) = delete;
    StagedHandle& operator=(const StagedHandle&) = delete;

    StagedHandle(StagedHandle&& other) noexcept : content_(std::move(other.content_)) {
        other.content_.reset();
    }
    StagedHandle& operator=(StagedHandle&& other) noexcept {
        if (this != &other) {
            release();
            content_ = std::move(other.content_);
            other.content_.reset();
        }
        return *this;
    }

    // True if this call performed the release
    bool release() noexcept {
        if (!content_) return false;
        EphemeralStore::release(*content_);
        content_.reset();
        return true;
    }

    bool active() const { return content_.has_value(); }
    const StagedContent& content() const { return *content_; }

private:
    std::optional<StagedContent> content_;
};

} // namespace zipstage
