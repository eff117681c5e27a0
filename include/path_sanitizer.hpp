#pragma once

#include "staging_error.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <expected>
#include <filesystem>

namespace zipstage {

// Absolute path guaranteed to lie inside the sandbox root
using NormalizedPath = std::filesystem::path;

class PathSanitizer {
public:
    explicit PathSanitizer(std::filesystem::path sandbox_root);

    // Confine an untrusted, sandbox-relative candidate to the root.
    // Lexical only: never touches the file system.
    std::expected<NormalizedPath, StagingErrorInfo> sanitize(std::string_view candidate) const;

    static std::expected<NormalizedPath, StagingErrorInfo> sanitize(
        std::string_view candidate,
        const std::filesystem::path& sandbox_root
    );

    // True when path equals root or descends from it on a separator boundary
    static bool is_within(const std::filesystem::path& root, const std::filesystem::path& path);

    // Bare filename policy for sandbox file management; returns the reason on violation
    static std::optional<std::string> validate_filename(std::string_view filename);

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

} // namespace zipstage
