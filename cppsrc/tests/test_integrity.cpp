#include "integrity.hpp"
#include "errors.hpp"
#include "fake_runner.hpp"
#include <iostream>
#include <cassert>
#include <cstdlib>

// Simple test framework
#define TEST(name) \
    void test_##name(); \
    struct test_##name##_runner { \
        test_##name##_runner() { \
            std::cout << "Running " #name "... "; \
            try { \
                test_##name(); \
                std::cout << "PASS\n"; \
            } catch (const std::exception& e) { \
                std::cout << "FAIL: " << e.what() << "\n"; \
                exit(1); \
            } \
        } \
    } test_##name##_instance; \
    void test_##name()

static const char* const ABC_SHA256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

TEST(parse_digest_takes_first_token) {
    std::string output = std::string(ABC_SHA256) + "  /srv/in/abc.txt\n";
    assert(ncwire::parse_digest(output) == ABC_SHA256);

    assert(ncwire::parse_digest("  \tdeadbeef  name with spaces\n") == "deadbeef");

    // sha256sum flags an escaped file name with a leading backslash
    assert(ncwire::parse_digest("\\deadbeef  new\\nline\n") == "deadbeef");
}

TEST(parse_digest_normalises_case) {
    assert(ncwire::parse_digest("BA7816BF8F01CFEA  f\n") == "ba7816bf8f01cfea");
}

TEST(parse_digest_rejects_empty_output) {
    try {
        ncwire::parse_digest(" \n");
        assert(false); // Should not reach here
    } catch (const ncwire::TransferError& e) {
        assert(e.kind() == ncwire::ErrorKind::TransferFailure);
    }
}

TEST(matching_digests_pass) {
    ncwire::verify_digests(ABC_SHA256, ABC_SHA256);
}

TEST(single_byte_difference_is_fatal) {
    std::string other = ABC_SHA256;
    other.back() = 'c';
    try {
        ncwire::verify_digests(ABC_SHA256, other);
        assert(false); // Should not reach here
    } catch (const ncwire::TransferError& e) {
        assert(e.kind() == ncwire::ErrorKind::IntegrityMismatch);
        std::string message = e.what();
        assert(message.find(ABC_SHA256) != std::string::npos);
        assert(message.find(other) != std::string::npos);
    }
}

TEST(local_and_remote_digest_commands) {
    fs::path file = "test_integrity_payload.txt";
    write_file(file, "abc");

    FakeRunner runner;
    ncwire::RemoteShell remote(runner, "ssh", "nas");

    std::string local = ncwire::local_digest(runner, "sha256sum", file);
    std::string remote_value = ncwire::remote_digest(remote, "sha256sum", file.string());
    assert(local == fake_digest("abc"));
    assert(local == remote_value);

    ncwire::Argv local_cmd{"sha256sum", file.string()};
    ncwire::Argv remote_cmd{"ssh", "nas", "sha256sum " + file.string()};
    assert(runner.commands[0] == local_cmd);
    assert(runner.commands[1] == remote_cmd);

    fs::remove(file);
}

TEST(missing_remote_file_is_a_failure) {
    FakeRunner runner;
    ncwire::RemoteShell remote(runner, "ssh", "nas");
    try {
        ncwire::remote_digest(remote, "sha256sum", "/nonexistent/file.bin");
        assert(false); // Should not reach here
    } catch (const ncwire::TransferError& e) {
        assert(e.kind() == ncwire::ErrorKind::TransferFailure);
    }
}

int main() {
    std::cout << "Running integrity module tests...\n";
    // Tests run automatically via static constructors
    std::cout << "All tests passed!\n";
    return 0;
}
