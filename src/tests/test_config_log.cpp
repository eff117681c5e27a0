#undef NDEBUG
#include "staging_config.hpp"
#include "sandbox_manager.hpp"
#include "compact_log.hpp"
#include <cstdlib>
#include <iostream>
#include <cassert>

using namespace zipstage;
using namespace std::chrono_literals;

static void clear_environment() {
    for (const char* name : {"ZIPLINE_TOKEN", "ZIPLINE_TMP_DIR", "ZIPLINE_DISABLE_SANDBOXING",
                             "ZIPSTAGE_MEMORY_THRESHOLD", "ZIPSTAGE_DOWNLOAD_TIMEOUT_MS",
                             "ZIPSTAGE_MAX_DOWNLOAD_BYTES", "ZIPSTAGE_MAX_UPLOAD_BYTES"}) {
        ::unsetenv(name);
    }
}

void test_configuration() {
    std::cout << "Testing configuration...\n\n";

    // Test 1: Credential is required
    {
        clear_environment();
        auto config = StagingConfig::from_environment();
        assert(!config.has_value());
        assert(config.error().error == StagingError::InvalidInput);
        std::cout << "✓ Test 1 passed: Missing credential rejected\n";
    }

    // Test 2: Defaults and per-user sandbox root
    {
        clear_environment();
        ::setenv("ZIPLINE_TOKEN", "abc", 1);
        ::setenv("ZIPLINE_TMP_DIR", "/tmp/zipstage_cfg", 1);
        auto config = StagingConfig::from_environment();
        assert(config.has_value());
        assert(config->credential == "abc");
        assert(config->tmp_dir == std::filesystem::path("/tmp/zipstage_cfg"));
        assert(config->sandboxing_enabled);
        assert(config->sandbox_root == std::filesystem::path("/tmp/zipstage_cfg/users") / SandboxManager::sha256_hex("abc"));
        assert(config->memory_threshold == 5 * 1024 * 1024);
        assert(config->download_timeout == 30'000ms);
        assert(config->max_download_bytes == 104'857'600);
        assert(config->max_upload_bytes == 104'857'600);
        assert(config->max_read_bytes == 1024 * 1024);
        assert(config->stale_sandbox_age == 24h);
        assert(config->lock_timeout == 30min);
        assert(config->allowed_extensions.size() == 26);
        std::cout << "✓ Test 2 passed: Defaults\n";
    }

    // Test 3: Overrides and disabled sandboxing
    {
        ::setenv("ZIPLINE_DISABLE_SANDBOXING", "true", 1);
        ::setenv("ZIPSTAGE_MEMORY_THRESHOLD", "2048", 1);
        ::setenv("ZIPSTAGE_DOWNLOAD_TIMEOUT_MS", "1500", 1);
        ::setenv("ZIPSTAGE_MAX_DOWNLOAD_BYTES", "4096", 1);
        auto config = StagingConfig::from_environment();
        assert(config.has_value());
        assert(!config->sandboxing_enabled);
        assert(config->sandbox_root == std::filesystem::path("/tmp/zipstage_cfg"));
        assert(config->memory_threshold == 2048);
        assert(config->download_timeout == 1500ms);
        assert(config->max_download_bytes == 4096);
        std::cout << "✓ Test 3 passed: Environment overrides\n";
    }

    // Test 4: Malformed values
    {
        ::setenv("ZIPSTAGE_MEMORY_THRESHOLD", "12abc", 1);
        auto bad_number = StagingConfig::from_environment();
        assert(!bad_number && bad_number.error().error == StagingError::InvalidInput);
        ::setenv("ZIPSTAGE_MEMORY_THRESHOLD", "0", 1);
        auto zero = StagingConfig::from_environment();
        assert(!zero && zero.error().error == StagingError::InvalidInput);
        ::unsetenv("ZIPSTAGE_MEMORY_THRESHOLD");

        ::setenv("ZIPLINE_TMP_DIR", "relative/dir", 1);
        auto relative = StagingConfig::from_environment();
        assert(!relative && relative.error().error == StagingError::InvalidInput);
        clear_environment();
        std::cout << "✓ Test 4 passed: Malformed values rejected\n";
    }

    // Test 5: Fixed sandbox root
    {
        auto config = StagingConfig::with_sandbox_root("/srv/stage/");
        assert(!config.sandboxing_enabled);
        assert(config.sandbox_root == config.tmp_dir);
        assert(config.credential.empty());
        std::cout << "✓ Test 5 passed: Fixed sandbox root\n";
    }
}

void test_logging() {
    std::cout << "\nTesting log formatting...\n\n";

    // Test 6: Every credential occurrence masked
    {
        assert(log::mask_token("token abc and abc", "abc") == "token [REDACTED] and [REDACTED]");
        assert(log::mask_token("nothing here", "abc") == "nothing here");
        assert(log::mask_token("abc", "") == "abc");
        std::cout << "✓ Test 6 passed: Token masking\n";
    }

    // Test 7: Registered credential masked in any line
    {
        log::Writer::configure("s3cr3t", "/tmp/z/users/deadbeef");
        assert(log::mask_sensitive("auth s3cr3t failed") == "auth [REDACTED] failed");
        assert(log::Writer::credential() == "s3cr3t");
        log::Writer::configure("", "");
        std::cout << "✓ Test 7 passed: Registered credential masking\n";
    }

    // Test 8: ISO timestamps
    {
        std::chrono::system_clock::time_point when{std::chrono::milliseconds(1234)};
        assert(log::iso_timestamp(when) == "1970-01-01T00:00:01.234Z");
        std::chrono::system_clock::time_point later{std::chrono::milliseconds(86'400'005)};
        assert(log::iso_timestamp(later) == "1970-01-02T00:00:00.005Z");
        std::cout << "✓ Test 8 passed: ISO timestamps\n";
    }

    // Test 9: Audit line hides the user hash
    {
        std::chrono::system_clock::time_point epoch{};
        auto line = log::format_audit_line("FILE_CREATED", "a.txt", "/home/u/.zipline_tmp/users/abcdef0123",
                                           "Size: 5 bytes", epoch);
        assert(line == "[1970-01-01T00:00:00.000Z] SANDBOX_OPERATION: FILE_CREATED - a.txt - "
                       "Path: /home/u/.zipline_tmp/users/[HASH] - Size: 5 bytes");

        auto bare = log::format_audit_line("FILE_LIST", "", "/srv/stage", "", epoch);
        assert(bare == "[1970-01-01T00:00:00.000Z] SANDBOX_OPERATION: FILE_LIST - Path: /srv/stage");
        std::cout << "✓ Test 9 passed: Audit line format\n";
    }

    // Test 10: Number formatting
    {
        assert(log::num(42) == "42");
        assert(log::num(size_t{0}) == "0");
        assert(log::num_fixed(1.5, 1) == "1.5");
        assert(log::num_fixed(2.0, 1) == "2.0");
        std::cout << "✓ Test 10 passed: Number formatting\n";
    }

    // Test 11: Error kind names
    {
        assert(to_string(StagingError::PathTraversal) == "PathTraversal");
        assert(to_string(StagingError::SecretsDetected) == "SecretsDetected");
        assert(to_string(StagingError::TooLarge) == "TooLarge");
        std::cout << "✓ Test 11 passed: Error kind names\n";
    }
}

int main() {
    test_configuration();
    test_logging();
    std::cout << "\nAll configuration and logging tests passed!\n";
    return 0;
}
