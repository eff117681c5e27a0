#undef NDEBUG
#include "upload_policy.hpp"
#include <iostream>
#include <cassert>

using namespace zipstage;

int main() {
    std::cout << "Testing upload policy...\n\n";
    StagingConfig config = StagingConfig::with_sandbox_root("/srv/stage");
    config.max_upload_bytes = 2048;
    UploadPolicy policy(config);

    // Test 1: Extension allow-list, case-insensitive
    {
        assert(policy.is_allowed_extension("notes.txt"));
        assert(policy.is_allowed_extension("CLIP.MP4"));
        assert(policy.is_allowed_extension("dir/route.gpx"));
        assert(!policy.is_allowed_extension("tool.exe"));
        assert(!policy.is_allowed_extension("Makefile"));
        std::cout << "✓ Test 1 passed: Extension allow-list\n";
    }

    // Test 2: Check reports the failing rule
    {
        assert(policy.check("notes.txt", 2048).has_value());

        auto type = policy.check("tool.exe", 10);
        assert(!type.has_value());
        assert(type.error().error == StagingError::UnsupportedType);
        assert(type.error().message.find(".exe") != std::string::npos);
        assert(type.error().message.find(".txt") != std::string::npos);

        auto size = policy.check("notes.txt", 2049);
        assert(!size.has_value());
        assert(size.error().error == StagingError::SizeExceeded);
        assert(size.error().message.find("by 1 bytes") != std::string::npos);
        std::cout << "✓ Test 2 passed: Policy check errors\n";
    }

    // Test 3: Custom extension list normalized
    {
        StagingConfig custom = config;
        custom.allowed_extensions = {"PDF", ".Log"};
        UploadPolicy narrow(custom);
        assert(narrow.is_allowed_extension("report.pdf"));
        assert(narrow.is_allowed_extension("trace.LOG"));
        assert(!narrow.is_allowed_extension("notes.txt"));
        std::cout << "✓ Test 3 passed: Custom extensions\n";
    }

    // Test 4: MIME detection
    {
        assert(UploadPolicy::detect_mime_type("clip.MKV") == "video/x-matroska");
        assert(UploadPolicy::detect_mime_type("photo.jpeg") == "image/jpeg");
        assert(UploadPolicy::detect_mime_type("data.json") == "application/json");
        assert(UploadPolicy::detect_mime_type("archive.tar") == "application/octet-stream");
        assert(UploadPolicy::detect_mime_type("README") == "application/octet-stream");
        std::cout << "✓ Test 4 passed: MIME detection\n";
    }

    // Test 5: Human-readable sizes
    {
        assert(format_file_size(512) == "512 bytes");
        assert(format_file_size(1536) == "1.5 KB");
        assert(format_file_size(5 * 1024 * 1024) == "5.0 MB");
        std::cout << "✓ Test 5 passed: Size formatting\n";
    }

    std::cout << "\nAll upload policy tests passed!\n";
    return 0;
}
