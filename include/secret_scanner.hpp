#pragma once

#include "staging_error.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <expected>
#include <filesystem>
#include <regex>

namespace zipstage {

enum class SecretKind {
    ApiKey,
    Password,
    Secret,
    Token,
    PrivateKey,
    EnvFile
};

enum class Severity {
    Medium,
    High,
    Critical
};

struct SecretLocation {
    size_t line = 0;         // 1-based; 0 when the finding is about the file name
    size_t line_offset = 0;  // Byte offset of the line start
};

struct SecretFinding {
    std::string pattern_name;
    SecretKind kind;
    SecretLocation location;
    Severity severity;
};

struct SecretPattern {
    std::string name;
    SecretKind kind;
    Severity severity;
    std::regex pattern;
    std::string description;
};

class SecretScanner {
public:
    static constexpr int kPatternTableVersion = 2;
    static constexpr size_t kChunkSize = 64 * 1024;
    static constexpr size_t kMaxLineBytes = 8 * 1024;    // Longer lines are scanned in windows
    static constexpr size_t kWindowOverlap = 256;

    SecretScanner();

    // Scan an in-memory buffer. name_hint is the artifact's file name, if any.
    std::vector<SecretFinding> scan(
        std::span<const char> content,
        const std::filesystem::path& name_hint = {}
    ) const;

    // Scan a file in bounded chunks; the whole file is never resident.
    std::expected<std::vector<SecretFinding>, StagingErrorInfo> scan_file(
        const std::filesystem::path& file_path
    ) const;

    bool has_secrets(std::span<const char> content) const { return !scan(content).empty(); }

    // .env and .env.<suffix>
    static bool is_env_file(const std::filesystem::path& file_path);

    static std::string_view kind_name(SecretKind kind);
    static std::string_view severity_name(Severity severity);

    // Rejection text: pattern names and line numbers only, never matched bytes
    static std::string describe(const std::vector<SecretFinding>& findings);

    const std::vector<SecretPattern>& patterns() const { return patterns_; }

private:
    std::vector<SecretPattern> patterns_;

    class LineFeed;

    void init_patterns();
    void scan_name(const std::filesystem::path& name_hint, std::vector<SecretFinding>& out) const;
};

} // namespace zipstage
