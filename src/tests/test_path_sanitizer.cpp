#undef NDEBUG
#include "path_sanitizer.hpp"
#include <iostream>
#include <cassert>
#include <string>

using namespace zipstage;

void test_sanitize() {
    std::cout << "Testing path sanitization...\n\n";
    const std::filesystem::path root = "/sandbox/user1";

    // Test 1: Traversal out of the root
    {
        auto result = PathSanitizer::sanitize("../../../etc/passwd", root);
        assert(!result.has_value());
        assert(result.error().error == StagingError::PathTraversal);
        std::cout << "✓ Test 1 passed: Parent traversal rejected\n";
    }

    // Test 2: Back and forward slashes normalize identically
    {
        auto back = PathSanitizer::sanitize("sub\\dir\\file.txt", root);
        auto forward = PathSanitizer::sanitize("sub/dir/file.txt", root);
        assert(back.has_value() && forward.has_value());
        assert(*back == *forward);
        assert(back->string() == "/sandbox/user1/sub/dir/file.txt");
        std::cout << "✓ Test 2 passed: Separator normalization\n";
    }

    // Test 3: Empty, whitespace and NUL input
    {
        auto empty = PathSanitizer::sanitize("", root);
        assert(!empty && empty.error().error == StagingError::InvalidInput);
        auto blank = PathSanitizer::sanitize("   \t ", root);
        assert(!blank && blank.error().error == StagingError::InvalidInput);
        auto nul = PathSanitizer::sanitize(std::string("a\0b.txt", 7), root);
        assert(!nul && nul.error().error == StagingError::InvalidInput);
        std::cout << "✓ Test 3 passed: Empty and NUL input rejected\n";
    }

    // Test 4: Absolute and drive-letter candidates
    {
        auto posix = PathSanitizer::sanitize("/etc/passwd", root);
        assert(!posix && posix.error().error == StagingError::PathTraversal);
        auto drive = PathSanitizer::sanitize("C:\\Windows\\system.ini", root);
        assert(!drive && drive.error().error == StagingError::PathTraversal);
        auto unc = PathSanitizer::sanitize("\\\\server\\share", root);
        assert(!unc && unc.error().error == StagingError::PathTraversal);
        std::cout << "✓ Test 4 passed: Absolute paths rejected\n";
    }

    // Test 5: Dot segments collapse inside the root
    {
        auto result = PathSanitizer::sanitize("a/./b/../c.txt", root);
        assert(result.has_value());
        assert(result->string() == "/sandbox/user1/a/c.txt");

        auto self = PathSanitizer::sanitize("a/..", root);
        assert(self.has_value());
        assert(self->string() == "/sandbox/user1");

        auto escape = PathSanitizer::sanitize("a/../../user1-evil/x", root);
        assert(!escape && escape.error().error == StagingError::PathTraversal);
        std::cout << "✓ Test 5 passed: Dot segment collapsing\n";
    }

    // Test 6: Surrounding whitespace trimmed, trailing slash on root ignored
    {
        auto result = PathSanitizer::sanitize("  notes.txt  ", "/sandbox/user1/");
        assert(result.has_value());
        assert(result->string() == "/sandbox/user1/notes.txt");
        std::cout << "✓ Test 6 passed: Whitespace trimming\n";
    }

    // Test 7: Relative root is a configuration error
    {
        auto result = PathSanitizer::sanitize("notes.txt", "sandbox/user1");
        assert(!result && result.error().error == StagingError::InvalidInput);
        std::cout << "✓ Test 7 passed: Relative root rejected\n";
    }

    // Test 8: Instance form uses the stored root
    {
        PathSanitizer sanitizer(root);
        auto result = sanitizer.sanitize("reports/q1.csv");
        assert(result.has_value());
        assert(result->string() == "/sandbox/user1/reports/q1.csv");
        assert(sanitizer.root() == root);
        std::cout << "✓ Test 8 passed: Instance sanitizer\n";
    }
}

void test_containment() {
    std::cout << "\nTesting containment checks...\n\n";

    // Test 9: Sibling prefix is not containment
    {
        assert(!PathSanitizer::is_within("/sandbox/user1", "/sandbox/user1-evil/x"));
        assert(!PathSanitizer::is_within("/sandbox/user1", "/sandbox/user10"));
        assert(PathSanitizer::is_within("/sandbox/user1", "/sandbox/user1"));
        assert(PathSanitizer::is_within("/sandbox/user1", "/sandbox/user1/a/b"));
        assert(PathSanitizer::is_within("/sandbox/user1/", "/sandbox/user1/a"));
        assert(PathSanitizer::is_within("/", "/anything"));
        std::cout << "✓ Test 9 passed: Separator-boundary containment\n";
    }

    // Test 10: Bare filename policy
    {
        assert(!PathSanitizer::validate_filename("report.txt").has_value());
        assert(PathSanitizer::validate_filename("").has_value());
        assert(PathSanitizer::validate_filename("../x").has_value());
        assert(PathSanitizer::validate_filename("a/b.txt").has_value());
        assert(PathSanitizer::validate_filename("a\\b.txt").has_value());
        assert(PathSanitizer::validate_filename(".hidden").has_value());
        assert(PathSanitizer::validate_filename("C:evil").has_value());
        std::cout << "✓ Test 10 passed: Bare filename validation\n";
    }
}

int main() {
    test_sanitize();
    test_containment();
    std::cout << "\nAll path sanitizer tests passed!\n";
    return 0;
}
