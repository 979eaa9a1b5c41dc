#pragma once

#include "upl/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace upl::scanner {

struct ScanResult {
    bool clean = false;
    std::string scanner;          ///< Identity of the engine, e.g. "clamav"
    std::string virus_name;       ///< Set when not clean
    std::chrono::milliseconds duration{0};
    std::uint64_t file_size = 0;
};

/**
 * @brief Malware-scanning capability
 *
 * scan() is synchronous. Failures use the shared taxonomy:
 * - FileNotFound: the file to scan is gone
 * - ScanTimeout: the engine did not answer before the deadline
 * - ScannerUnavailable: the engine cannot be reached at all
 * - anything else: unexpected scan error
 */
class Scanner {
public:
    virtual ~Scanner() = default;

    virtual upl::Result<ScanResult> scan(const std::filesystem::path& path) = 0;

    /// Cheap liveness check.
    [[nodiscard]] virtual bool available() = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/// Used when scanning is disabled: every scan reports ScannerUnavailable.
class NullScanner : public Scanner {
public:
    upl::Result<ScanResult> scan(const std::filesystem::path& path) override {
        return upl::Err<ScanResult>(ErrorKind::ScannerUnavailable,
                                    "Virus scanning disabled; skipped " + path.filename().string());
    }

    [[nodiscard]] bool available() override { return false; }

    [[nodiscard]] std::string name() const override { return "none"; }
};

} // namespace upl::scanner
