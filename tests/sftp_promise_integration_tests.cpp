// Integration tests for SftpFilePromise against a test SFTP server.
// The test is skipped (exit code 77) unless required DROPSHELF_IT_* env vars
// exist.
#include "dropshelf/SftpFilePromise.hpp"
#include "dropshelf/TempResourceManager.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

} // namespace

int main() {
    const auto host = envValue("DROPSHELF_IT_SFTP_HOST");
    const auto user = envValue("DROPSHELF_IT_SFTP_USER");
    const auto pass = envValue("DROPSHELF_IT_SFTP_PASS");
    const auto keyPath = envValue("DROPSHELF_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("DROPSHELF_IT_SFTP_KEY_PASSPHRASE");
    const auto remoteFile = envValue("DROPSHELF_IT_REMOTE_FILE");

    if (!host.has_value() || !user.has_value() || !remoteFile.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] dropshelf_sftp_integration_tests requires env vars: "
                  << "DROPSHELF_IT_SFTP_HOST, DROPSHELF_IT_SFTP_USER, "
                     "DROPSHELF_IT_REMOTE_FILE and one auth method "
                  << "(DROPSHELF_IT_SFTP_PASS or DROPSHELF_IT_SFTP_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] DROPSHELF_IT_SFTP_KEY does not exist: " << *keyPath
                  << "\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("DROPSHELF_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] DROPSHELF_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    dropshelf::SftpOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    opt.password = pass;
    opt.private_key_path = keyPath;
    opt.private_key_passphrase = keyPassphrase;
    // Test servers are usually throwaway containers without a stable key.
    opt.known_hosts_policy = dropshelf::KnownHostsPolicy::Off;

    const fs::path root =
        fs::temp_directory_path() / ("dropshelf-it-" + uniqueToken());
    dropshelf::TempResourceManager staging(root.string());
    std::string err;
    const std::string dir = staging.allocateDirectory(std::nullopt, err);
    t.check(!dir.empty(), "staging directory should be created: " + err);

    // Download twice: the second copy must not overwrite the first.
    dropshelf::SftpFilePromise promise(opt, *remoteFile);
    std::string first;
    std::string second;
    err.clear();
    t.check(promise.materialize(dir, first, err),
            "download should succeed: " + err);
    err.clear();
    t.check(promise.materialize(dir, second, err),
            "second download should succeed: " + err);
    t.check(!first.empty() && fs::exists(first),
            "downloaded file should exist");
    t.check(first != second, "second download should get its own name");
    if (!first.empty() && !second.empty() && fs::exists(first) &&
        fs::exists(second)) {
        t.check(fs::path(first).filename() ==
                    dropshelf::remoteBaseName(*remoteFile),
                "download should keep the remote file name");
        t.check(fs::file_size(first) == fs::file_size(second),
                "both copies should have the same size");
    }

    // Missing remote file fails without leaving a partial file behind.
    dropshelf::SftpFilePromise missing(opt, *remoteFile + ".missing-" +
                                                uniqueToken());
    std::string missingPath;
    err.clear();
    t.check(!missing.materialize(dir, missingPath, err),
            "missing remote file should fail");
    t.check(!err.empty(), "missing remote file should report an error");
    t.check(missingPath.empty() || !fs::exists(missingPath),
            "failed download should leave nothing behind");

    // Canceled before the transfer starts.
    std::string canceledPath;
    err.clear();
    t.check(!promise.materialize(dir, canceledPath, err, [] { return true; }),
            "canceled download should fail");

    // Wrong password is reported, not retried forever.
    if (pass.has_value() && !keyPath.has_value()) {
        dropshelf::SftpOptions bad = opt;
        bad.password = *pass + "-wrong";
        dropshelf::SftpFilePromise denied(bad, *remoteFile);
        std::string deniedPath;
        err.clear();
        t.check(!denied.materialize(dir, deniedPath, err),
                "wrong password should fail");
    }

    std::string cleanupErr;
    if (!staging.cleanup(cleanupErr))
        std::cerr << "[WARN] staging cleanup failed: " << cleanupErr << "\n";
    std::error_code ec;
    fs::remove_all(root, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] dropshelf_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
