#include "compact_log.hpp"
#include <ctime>

namespace zipstage::log {

namespace {

struct Context {
    std::string credential;
    std::filesystem::path sandbox_root;
};

Context& context() {
    static Context ctx;
    return ctx;
}

void emit(std::string_view level, std::string_view message) {
    std::string line;
    line.reserve(message.size() + 16);
    line += "[";
    line += level;
    line += "] ";
    line += mask_sensitive(message);
    line += "\n";
    Writer::error(line);
}

} // namespace

void Writer::configure(std::string credential, std::filesystem::path sandbox_root) {
    context().credential = std::move(credential);
    context().sandbox_root = std::move(sandbox_root);
}

const std::string& Writer::credential() { return context().credential; }
const std::filesystem::path& Writer::sandbox_root() { return context().sandbox_root; }

std::string num_fixed(double val, int precision) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val, std::chars_format::fixed, precision);
    if (ec != std::errc()) return "?";
    return std::string(buf, ptr);
}

std::string mask_token(std::string_view text, std::string_view token) {
    if (token.empty()) return std::string(text);
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (true) {
        size_t hit = text.find(token, pos);
        if (hit == std::string_view::npos) break;
        out.append(text.substr(pos, hit - pos));
        out += "[REDACTED]";
        pos = hit + token.size();
    }
    out.append(text.substr(pos));
    return out;
}

std::string mask_sensitive(std::string_view text) {
    return mask_token(text, context().credential);
}

std::string iso_timestamp(std::chrono::system_clock::time_point when) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buf, n);
    auto millis = num(ms % 1000);
    out += ".";
    out.append(3 - millis.size(), '0');
    out += millis;
    out += "Z";
    return out;
}

std::string format_audit_line(
    std::string_view operation,
    std::string_view filename,
    const std::filesystem::path& sandbox_root,
    std::string_view details,
    std::chrono::system_clock::time_point when
) {
    // Per-user sandboxes live at <tmp>/users/<hash>; never print the hash
    std::string root = sandbox_root.string();
    if (auto pos = root.rfind("/users/"); pos != std::string::npos &&
        root.find('/', pos + 7) == std::string::npos && pos + 7 < root.size()) {
        root = root.substr(0, pos + 7) + "[HASH]";
    }

    std::string line = "[" + iso_timestamp(when) + "] SANDBOX_OPERATION: ";
    line += operation;
    if (!filename.empty()) {
        line += " - ";
        line += filename;
    }
    line += " - Path: ";
    line += root;
    if (!details.empty()) {
        line += " - ";
        line += details;
    }
    return line;
}

void info(std::string_view message) { emit("info", message); }
void warn(std::string_view message) { emit("warn", message); }
void error(std::string_view message) { emit("error", message); }

void audit(std::string_view operation, std::string_view filename, std::string_view details) {
    auto line = format_audit_line(operation, filename, context().sandbox_root, details,
                                  std::chrono::system_clock::now());
    Writer::error(mask_sensitive(line) + "\n");
}

} // namespace zipstage::log
