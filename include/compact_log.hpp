#pragma once

#include <unistd.h>
#include <string>
#include <string_view>
#include <charconv>
#include <system_error>
#include <filesystem>
#include <chrono>
#include <mutex>

namespace zipstage::log {

// Lightweight buffer-based writer, no iostream formatting.
// stdout carries command output only; diagnostics go to stderr.
class Writer {
public:
    static void print(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDOUT_FILENO, s);
    }

    static void error(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDERR_FILENO, s);
    }

    static void nl() {
        print("\n");
    }

    // Credential and sandbox root are registered once at startup so every
    // diagnostic line can be masked before it leaves the process.
    static void configure(std::string credential, std::filesystem::path sandbox_root);
    static const std::string& credential();
    static const std::filesystem::path& sandbox_root();

private:
    static void write_all(int fd, std::string_view s) {
        while (!s.empty()) {
            ssize_t n = ::write(fd, s.data(), s.size());
            if (n <= 0) return;
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }
};

template<typename T>
std::string num(T val) {
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val);
    if (ec != std::errc()) return "?";
    return std::string(buf, ptr);
}

// Fixed-point with the given number of decimals
std::string num_fixed(double val, int precision);

// Replace each occurrence of token in text with [REDACTED]
std::string mask_token(std::string_view text, std::string_view token);

// Mask the registered credential
std::string mask_sensitive(std::string_view text);

// "[ts] SANDBOX_OPERATION: op - file - Path: <root with user hash as [HASH]> - details"
std::string format_audit_line(
    std::string_view operation,
    std::string_view filename,
    const std::filesystem::path& sandbox_root,
    std::string_view details,
    std::chrono::system_clock::time_point when
);

std::string iso_timestamp(std::chrono::system_clock::time_point when);

void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

void audit(std::string_view operation, std::string_view filename = {}, std::string_view details = {});

} // namespace zipstage::log
