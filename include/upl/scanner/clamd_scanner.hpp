#pragma once

#include "upl/core/config.hpp"
#include "upl/scanner/scanner.hpp"

#include <optional>
#include <string>

namespace upl::scanner {

/**
 * @brief Scanner that streams files to a clamd daemon over TCP
 *
 * Speaks the null-terminated clamd commands `zINSTREAM` and `zPING`.
 * Each call opens its own connection and runs on a private io_context
 * bounded by the configured timeout, so no caller lock is held while
 * waiting on the network.
 *
 * REPLY MAPPING:
 * "stream: OK"               -> clean
 * "stream: <name> FOUND"     -> infected, virus_name = <name>
 * "... ERROR"                -> Internal
 * connect/resolve failure    -> ScannerUnavailable
 * deadline reached           -> ScanTimeout
 */
class ClamdScanner : public Scanner {
public:
    static constexpr const char* kScannerName = "clamav";

    explicit ClamdScanner(core::ScannerConfig config);

    upl::Result<ScanResult> scan(const std::filesystem::path& path) override;

    [[nodiscard]] bool available() override;

    [[nodiscard]] std::string name() const override { return kScannerName; }

    /// Interprets one clamd INSTREAM reply.
    static upl::Result<ScanResult> parse_reply(const std::string& reply);

private:
    upl::Result<std::string> exchange(const std::string& command, const std::optional<std::filesystem::path>& file);

    core::ScannerConfig config_;
};

} // namespace upl::scanner
