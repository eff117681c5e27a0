#include "secret_scanner.hpp"
#include "compact_log.hpp"
#include <fstream>
#include <algorithm>

#if defined(__ARM_NEON) || defined(__ARM_NEON__)
#include <arm_neon.h>
#elif defined(__SSE2__)
#include <emmintrin.h>
#endif

namespace zipstage {

SecretScanner::SecretScanner() {
    init_patterns();
}

void SecretScanner::init_patterns() {
    using std::regex;
    constexpr auto icase = std::regex::ECMAScript | std::regex::icase;
    constexpr auto exact = std::regex::ECMAScript;

    // Order is precedence: the first match on a line is the one reported
    patterns_ = {
        {"private_key_block", SecretKind::PrivateKey, Severity::Critical,
         regex(R"(-----BEGIN [A-Z ]*PRIVATE KEY-----)", exact), "PEM private key header"},
        {"aws_access_key", SecretKind::ApiKey, Severity::Critical,
         regex(R"(AKIA[0-9A-Z]{16})", exact), "AWS access key id"},
        {"github_token", SecretKind::Token, Severity::Critical,
         regex(R"(gh[pousr]_[A-Za-z0-9]{36})", exact), "GitHub token"},
        {"huggingface_token", SecretKind::Token, Severity::High,
         regex(R"(hf_[A-Za-z0-9]{30})", exact), "HuggingFace token"},
        {"live_secret_key", SecretKind::ApiKey, Severity::Critical,
         regex(R"([sr]k_(live|test)_[A-Za-z0-9]{10})", exact), "Payment provider secret key"},
        {"bearer_token", SecretKind::Token, Severity::High,
         regex(R"(\bbearer[ \t]+[A-Za-z0-9\-._~+/]{20})", icase), "Bearer credential"},
        {"private_key_assign", SecretKind::PrivateKey, Severity::Critical,
         regex(R"((^|[^A-Za-z0-9])([A-Za-z0-9]{1,32}_){0,8}private_?key["']?[ \t]{0,8}=[ \t]{0,8}\S)", icase), "Private key assignment"},
        {"api_key_assign", SecretKind::ApiKey, Severity::High,
         regex(R"((^|[^A-Za-z0-9])([A-Za-z0-9]{1,32}_){0,8}(api_?key|access_?key(_?id)?)["']?[ \t]{0,8}[=:][ \t]{0,8}\S)", icase), "API key assignment"},
        {"secret_assign", SecretKind::Secret, Severity::High,
         regex(R"((^|[^A-Za-z0-9])([A-Za-z0-9]{1,32}_){0,8}secret(_?key)?["']?[ \t]{0,8}=[ \t]{0,8}\S)", icase), "Secret assignment"},
        {"token_assign", SecretKind::Token, Severity::High,
         regex(R"((^|[^A-Za-z0-9])([A-Za-z0-9]{1,32}_){0,8}token["']?[ \t]{0,8}=[ \t]{0,8}\S)", icase), "Token assignment"},
        {"password_assign", SecretKind::Password, Severity::High,
         regex(R"((^|[^A-Za-z0-9])([A-Za-z0-9]{1,32}_){0,8}(password|passwd|pass|pwd)["']?[ \t]{0,8}=[ \t]{0,8}\S)", icase), "Password assignment"},
    };
}

// SIMD pre-scan: every signature needs one of '=', ':', '-', '_', 'A', 'B', 'b'.
// Lines without any of them skip the regex pass entirely.
static inline bool simd_contains_trigger(const char* data, size_t len) {
    size_t i = 0;
#if defined(__ARM_NEON) || defined(__ARM_NEON__)
    const uint8x16_t v_eq = vdupq_n_u8('=');
    const uint8x16_t v_colon = vdupq_n_u8(':');
    const uint8x16_t v_dash = vdupq_n_u8('-');
    const uint8x16_t v_under = vdupq_n_u8('_');
    const uint8x16_t v_A = vdupq_n_u8('A');
    const uint8x16_t v_B = vdupq_n_u8('B');
    const uint8x16_t v_b = vdupq_n_u8('b');

    for (; i + 16 <= len; i += 16) {
        uint8x16_t chunk = vld1q_u8(reinterpret_cast<const uint8_t*>(data + i));
        uint8x16_t mask = vorrq_u8(vceqq_u8(chunk, v_eq), vceqq_u8(chunk, v_colon));
        mask = vorrq_u8(mask, vceqq_u8(chunk, v_dash));
        mask = vorrq_u8(mask, vceqq_u8(chunk, v_under));
        mask = vorrq_u8(mask, vceqq_u8(chunk, v_A));
        mask = vorrq_u8(mask, vceqq_u8(chunk, v_B));
        mask = vorrq_u8(mask, vceqq_u8(chunk, v_b));
        if (vmaxvq_u8(mask) != 0) return true;
    }
#elif defined(__SSE2__)
    const __m128i v_eq = _mm_set1_epi8('=');
    const __m128i v_colon = _mm_set1_epi8(':');
    const __m128i v_dash = _mm_set1_epi8('-');
    const __m128i v_under = _mm_set1_epi8('_');
    const __m128i v_A = _mm_set1_epi8('A');
    const __m128i v_B = _mm_set1_epi8('B');
    const __m128i v_b = _mm_set1_epi8('b');

    for (; i + 16 <= len; i += 16) {
        __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(data + i));
        __m128i mask = _mm_or_si128(_mm_cmpeq_epi8(chunk, v_eq), _mm_cmpeq_epi8(chunk, v_colon));
        mask = _mm_or_si128(mask, _mm_cmpeq_epi8(chunk, v_dash));
        mask = _mm_or_si128(mask, _mm_cmpeq_epi8(chunk, v_under));
        mask = _mm_or_si128(mask, _mm_cmpeq_epi8(chunk, v_A));
        mask = _mm_or_si128(mask, _mm_cmpeq_epi8(chunk, v_B));
        mask = _mm_or_si128(mask, _mm_cmpeq_epi8(chunk, v_b));
        if (_mm_movemask_epi8(mask) != 0) return true;
    }
#endif
    // Scalar tail
    for (; i < len; ++i) {
        char c = data[i];
        if (c == '=' || c == ':' || c == '-' || c == '_' || c == 'A' || c == 'B' || c == 'b') return true;
    }
    return false;
}

// Splits incoming bytes into lines and runs the pattern table over each.
// Memory use is bounded by kMaxLineBytes regardless of input shape.
class SecretScanner::LineFeed {
public:
    LineFeed(const std::vector<SecretPattern>& patterns, std::vector<SecretFinding>& out)
        : patterns_(patterns), out_(out) {
        carry_.reserve(std::min(kMaxLineBytes, size_t{4096}));
    }

    void feed(std::string_view chunk) {
        while (!chunk.empty()) {
            size_t nl = chunk.find('\n');
            size_t take = nl == std::string_view::npos ? chunk.size() : nl;
            size_t room = kMaxLineBytes - carry_.size();
            if (take > room) {
                carry_.append(chunk.substr(0, room));
                chunk.remove_prefix(room);
                position_ += room;
                flush_window();
                continue;
            }
            carry_.append(chunk.substr(0, take));
            chunk.remove_prefix(take);
            position_ += take;
            if (nl != std::string_view::npos) {
                chunk.remove_prefix(1);
                position_ += 1;
                end_line();
            }
        }
    }

    void finish() {
        if (!carry_.empty()) scan_line(carry_);
        carry_.clear();
        continued_ = false;
    }

private:
    const std::vector<SecretPattern>& patterns_;
    std::vector<SecretFinding>& out_;
    std::string carry_;
    size_t line_ = 1;
    size_t line_start_ = 0;
    size_t position_ = 0;
    bool reported_ = false;
    bool continued_ = false;    // carry_ holds the tail of the previous window

    void end_line() {
        if (!carry_.empty() && carry_.back() == '\r') carry_.pop_back();
        scan_line(carry_);
        carry_.clear();
        ++line_;
        line_start_ = position_;
        reported_ = false;
        continued_ = false;
    }

    // Overlong line: scan what we have, keep a tail so a signature split
    // across the window boundary is still seen whole. One extra leading
    // byte is kept so a separator before the tail can still be matched.
    void flush_window() {
        scan_line(carry_);
        carry_.erase(0, carry_.size() - kWindowOverlap - 1);
        continued_ = true;
    }

    void scan_line(std::string_view line) {
        if (reported_ || line.empty()) return;
        if (!simd_contains_trigger(line.data(), line.size())) return;

        // A continuation window starts mid-line, so its start is neither a
        // line start nor a known word boundary
        auto flags = continued_
            ? std::regex_constants::match_not_bol | std::regex_constants::match_not_bow
            : std::regex_constants::match_default;
        for (const auto& pattern : patterns_) {
            if (std::regex_search(line.begin(), line.end(), pattern.pattern, flags)) {
                out_.push_back(SecretFinding{
                    pattern.name, pattern.kind, SecretLocation{line_, line_start_}, pattern.severity
                });
                reported_ = true;
                return;
            }
        }
    }
};

bool SecretScanner::is_env_file(const std::filesystem::path& file_path) {
    auto name = file_path.filename().string();
    return name == ".env" || name.starts_with(".env.");
}

void SecretScanner::scan_name(const std::filesystem::path& name_hint, std::vector<SecretFinding>& out) const {
    if (!name_hint.empty() && is_env_file(name_hint)) {
        out.push_back(SecretFinding{"env_file", SecretKind::EnvFile, SecretLocation{}, Severity::Critical});
    }
}

std::vector<SecretFinding> SecretScanner::scan(
    std::span<const char> content,
    const std::filesystem::path& name_hint
) const {
    std::vector<SecretFinding> findings;
    scan_name(name_hint, findings);

    LineFeed feed(patterns_, findings);
    feed.feed(std::string_view(content.data(), content.size()));
    feed.finish();
    return findings;
}

std::expected<std::vector<SecretFinding>, StagingErrorInfo> SecretScanner::scan_file(
    const std::filesystem::path& file_path
) const {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Unable to open file for secret scanning"});
    }

    std::vector<SecretFinding> findings;
    scan_name(file_path, findings);

    LineFeed feed(patterns_, findings);
    std::vector<char> buffer(kChunkSize);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        feed.feed(std::string_view(buffer.data(), static_cast<size_t>(file.gcount())));
    }
    if (file.bad()) {
        return std::unexpected(StagingErrorInfo{StagingError::NotFound, "Read error while scanning file for secrets"});
    }
    feed.finish();
    return findings;
}

std::string_view SecretScanner::kind_name(SecretKind kind) {
    switch (kind) {
        case SecretKind::ApiKey:     return "api_key";
        case SecretKind::Password:   return "password";
        case SecretKind::Secret:     return "secret";
        case SecretKind::Token:      return "token";
        case SecretKind::PrivateKey: return "private_key";
        case SecretKind::EnvFile:    return "env_file";
    }
    return "unknown";
}

std::string_view SecretScanner::severity_name(Severity severity) {
    switch (severity) {
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

std::string SecretScanner::describe(const std::vector<SecretFinding>& findings) {
    std::string text = "File rejected: " + log::num(findings.size()) + " potential secret(s) detected";
    constexpr size_t kListed = 5;
    for (size_t i = 0; i < findings.size() && i < kListed; ++i) {
        const auto& f = findings[i];
        text += i == 0 ? " (" : ", ";
        text += kind_name(f.kind);
        if (f.location.line > 0) {
            text += " on line ";
            text += log::num(f.location.line);
        } else {
            text += " by file name";
        }
    }
    if (!findings.empty()) text += findings.size() > kListed ? ", ...)" : ")";
    text += ". Remove credentials from the file before uploading.";
    return text;
}

} // namespace zipstage
