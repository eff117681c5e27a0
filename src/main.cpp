#include "staging_config.hpp"
#include "staging_gate.hpp"
#include "sandbox_manager.hpp"
#include "secret_scanner.hpp"
#include "upload_policy.hpp"
#include "compact_log.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <chrono>
#include <charconv>
#include <optional>

using namespace zipstage;

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    std::string cmd;
    std::vector<std::string> args;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<size_t> max_bytes;
    int exit_code = 0;
    std::string error_message;
    std::optional<StagingConfig> config;
};

void print_usage(const char* program_name) {
    std::string usage;
    usage += "Secure file staging for hosted uploads (C++23)\n\n";
    usage += "Usage: "; usage += program_name; usage += " <command> [options]\n\n";
    usage += "Commands:\n";
    usage += "  stage <relative-path>        Validate and stage a sandbox file\n";
    usage += "  fetch <url>                  Download into the sandbox and stage it\n";
    usage += "  list                         List sandbox files\n";
    usage += "  path <name>                  Print the absolute path of a sandbox file\n";
    usage += "  create <name>                Create a sandbox file from stdin\n";
    usage += "  read <name>                  Print a sandbox file\n";
    usage += "  cleanup                      Remove stale per-user sandboxes\n\n";
    usage += "Options:\n";
    usage += "  --timeout-ms <n>             Download deadline (fetch)\n";
    usage += "  --max-bytes <n>              Download size limit (fetch)\n\n";
    usage += "Environment: ZIPLINE_TOKEN (required), ZIPLINE_TMP_DIR, ZIPLINE_DISABLE_SANDBOXING\n";
    log::Writer::error(usage);
}

static std::optional<size_t> parse_size(std::string_view s) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || value == 0) return std::nullopt;
    return value;
}

static void report_error(const StagingErrorInfo& info) {
    log::error(std::string(to_string(info.error)) + ": " + info.message);
}

// Consuming operation for `stage`: a validation report on stdout
static OperationResult validation_report(const NormalizedPath& path, const StagedContent& staged) {
    size_t size = std::visit(overloaded{
        [](const MemoryContent& memory) { return memory.bytes.size(); },
        [](const DiskContent& disk) {
            std::error_code ec;
            auto n = std::filesystem::file_size(disk.source_path, ec);
            return ec ? size_t{0} : static_cast<size_t>(n);
        },
    }, staged);

    std::string report;
    report += "File: " + path.filename().string() + "\n";
    report += "Path: " + path.string() + "\n";
    report += "Size: " + format_file_size(size) + "\n";
    report += "Type: " + UploadPolicy::detect_mime_type(path) + "\n";
    report += "Staged: " + std::string(to_string(mode_of(staged))) + "\n";
    report += "Secrets: none detected\n";
    log::Writer::print(report);
    return "validated";
}

static OperationResult print_location(const NormalizedPath& path, const StagedContent&) {
    log::Writer::print(path.string());
    log::Writer::nl();
    return path.string();
}

static int run_gate(const StagingConfig& config, const SandboxManager& sandbox,
                    const StagingRequest& request, const Operation& operation) {
    if (!sandbox.acquire_lock()) {
        log::error("Sandbox is locked by another operation");
        return 1;
    }
    SecretScanner scanner;
    StagingGate gate(config, scanner);
    auto result = gate.run(request, operation);
    if (!sandbox.release_lock()) log::warn("Sandbox lock could not be released");

    if (!result) {
        report_error(result.error());
        return 1;
    }
    if (!result->outcome) {
        log::error("Operation failed: " + result->outcome.error().message);
        return 1;
    }
    return 0;
}

int cmd_stage(const StagingConfig& config, const SandboxManager& sandbox, const std::string& candidate) {
    return run_gate(config, sandbox, LocalSource{candidate}, validation_report);
}

int cmd_fetch(const StagingConfig& config, const SandboxManager& sandbox, const std::string& url,
              std::optional<std::chrono::milliseconds> timeout, std::optional<size_t> max_bytes) {
    return run_gate(config, sandbox, RemoteSource{url, timeout, max_bytes}, print_location);
}

int cmd_list(const SandboxManager& sandbox) {
    auto files = sandbox.list_files();
    if (!files) { report_error(files.error()); return 1; }
    if (files->empty()) {
        log::Writer::print("No files in sandbox\n");
        return 0;
    }
    std::string out;
    for (const auto& f : *files) {
        out += f.name + "  " + format_file_size(f.size) + "\n";
    }
    log::Writer::print(out);
    return 0;
}

int cmd_path(const SandboxManager& sandbox, const std::string& name) {
    auto path = sandbox.path_of(name);
    if (!path) { report_error(path.error()); return 1; }
    log::Writer::print(path->string());
    log::Writer::nl();
    return 0;
}

int cmd_create(const StagingConfig& config, const SandboxManager& sandbox, const std::string& name) {
    std::ostringstream content;
    content << std::cin.rdbuf();
    auto data = content.str();
    if (data.size() > config.max_upload_bytes) {
        report_error(StagingErrorInfo{StagingError::SizeExceeded,
            "Content exceeds the limit of " + format_file_size(config.max_upload_bytes)});
        return 1;
    }
    auto written = sandbox.create_file(name, data);
    if (!written) { report_error(written.error()); return 1; }
    log::Writer::print("Created " + name + " (" + format_file_size(*written) + ")\n");
    return 0;
}

int cmd_read(const SandboxManager& sandbox, const std::string& name) {
    auto content = sandbox.read_file(name);
    if (!content) { report_error(content.error()); return 1; }
    log::Writer::print(*content);
    return 0;
}

int cmd_cleanup(const SandboxManager& sandbox) {
    auto removed = sandbox.cleanup_stale();
    log::Writer::print("Removed " + log::num(removed) + " stale sandbox(es)\n");
    return 0;
}

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                if (ctx.argc < 2) {
                    ctx.exit_code = 1;
                    state = FSMState::Error;
                } else {
                    ctx.cmd = ctx.argv[1];
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                state = FSMState::PreCommand;
                for (int i = 2; i < ctx.argc; ++i) {
                    std::string a = ctx.argv[i];
                    if (a == "--timeout-ms" && i + 1 < ctx.argc) {
                        auto ms = parse_size(ctx.argv[++i]);
                        if (!ms) { ctx.error_message = "--timeout-ms must be a positive integer"; state = FSMState::Error; break; }
                        ctx.timeout = std::chrono::milliseconds(*ms);
                    } else if (a == "--max-bytes" && i + 1 < ctx.argc) {
                        auto n = parse_size(ctx.argv[++i]);
                        if (!n) { ctx.error_message = "--max-bytes must be a positive integer"; state = FSMState::Error; break; }
                        ctx.max_bytes = *n;
                    } else {
                        ctx.args.push_back(a);
                    }
                }
                if (state == FSMState::Error) ctx.exit_code = 1;
                break;
            }
            case FSMState::PreCommand: {
                if (ctx.cmd == "--help" || ctx.cmd == "help") {
                    state = FSMState::Error;
                    break;
                }
                bool needs_arg = ctx.cmd == "stage" || ctx.cmd == "fetch" || ctx.cmd == "path" ||
                                 ctx.cmd == "create" || ctx.cmd == "read";
                bool known = needs_arg || ctx.cmd == "list" || ctx.cmd == "cleanup";
                if (!known) {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown command: " + ctx.cmd;
                    state = FSMState::Error;
                    break;
                }
                if (needs_arg && ctx.args.empty()) {
                    ctx.exit_code = 1;
                    ctx.error_message = ctx.cmd + " requires an argument.";
                    state = FSMState::Error;
                    break;
                }

                auto config = StagingConfig::from_environment();
                if (!config) {
                    ctx.exit_code = 1;
                    ctx.error_message = config.error().message;
                    state = FSMState::Error;
                    break;
                }
                ctx.config = std::move(*config);
                log::Writer::configure(ctx.config->credential, ctx.config->sandbox_root);
                state = FSMState::RunCommand;
                break;
            }
            case FSMState::RunCommand: {
                const auto& config = *ctx.config;
                SandboxManager sandbox(config);
                if (ctx.cmd != "cleanup") {
                    sandbox.cleanup_stale();
                    if (auto root = sandbox.ensure(); !root) {
                        report_error(root.error());
                        ctx.exit_code = 1;
                        state = FSMState::PostCommand;
                        break;
                    }
                }

                if (ctx.cmd == "stage") ctx.exit_code = cmd_stage(config, sandbox, ctx.args[0]);
                else if (ctx.cmd == "fetch") ctx.exit_code = cmd_fetch(config, sandbox, ctx.args[0], ctx.timeout, ctx.max_bytes);
                else if (ctx.cmd == "list") ctx.exit_code = cmd_list(sandbox);
                else if (ctx.cmd == "path") ctx.exit_code = cmd_path(sandbox, ctx.args[0]);
                else if (ctx.cmd == "create") ctx.exit_code = cmd_create(config, sandbox, ctx.args[0]);
                else if (ctx.cmd == "read") ctx.exit_code = cmd_read(sandbox, ctx.args[0]);
                else ctx.exit_code = cmd_cleanup(sandbox);
                state = FSMState::PostCommand;
                break;
            }
            case FSMState::PostCommand:
                state = FSMState::Done;
                break;
            case FSMState::Error:
                if (!ctx.error_message.empty()) log::error(ctx.error_message);
                print_usage(ctx.argv[0]);
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
