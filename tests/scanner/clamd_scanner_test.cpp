#include "upl/scanner/clamd_scanner.hpp"

#include <boost/asio.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using upl::ErrorKind;
using upl::scanner::ClamdScanner;

namespace {

fs::path write_temp_file(const std::string& name, const std::string& content) {
    static std::atomic<int> counter{0};
    const auto dir = fs::temp_directory_path() / ("upl_clamd_test_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    const auto path = dir / name;
    std::ofstream(path, std::ios::binary) << content;
    return path;
}

/**
 * Minimal clamd stand-in: serves `connections` requests on a loopback port.
 * INSTREAM payloads are reassembled into `received`. With an empty reply
 * the server reads until the client hangs up and never answers.
 */
class FakeClamd {
public:
    explicit FakeClamd(std::string reply, int connections = 1)
        : acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
          reply_(std::move(reply)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this, connections] {
            for (int i = 0; i < connections; ++i) {
                serve_one();
            }
        });
    }

    ~FakeClamd() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::uint16_t port() const { return port_; }

    std::string received() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return received_;
    }

    std::string command() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return command_;
    }

private:
    void serve_one() {
        boost::system::error_code ec;
        tcp::socket socket(io_);
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }

        asio::streambuf buffer;
        asio::read_until(socket, buffer, '\0', ec);
        if (ec) {
            return;
        }
        std::istream is(&buffer);
        std::getline(is, command_, '\0');

        if (command_ == "zINSTREAM") {
            while (true) {
                unsigned char header[4];
                if (!read_exact(socket, buffer, reinterpret_cast<char*>(header), 4)) {
                    return;
                }
                const std::uint32_t length = (std::uint32_t(header[0]) << 24) | (std::uint32_t(header[1]) << 16) |
                                             (std::uint32_t(header[2]) << 8) | std::uint32_t(header[3]);
                if (length == 0) {
                    break;
                }
                std::string frame(length, '\0');
                if (!read_exact(socket, buffer, frame.data(), length)) {
                    return;
                }
                received_ += frame;
            }
        }

        if (reply_.empty()) {
            char sink[256];
            while (!ec) {
                socket.read_some(asio::buffer(sink), ec);
            }
            return;
        }
        const std::string answer = command_ == "zPING" ? std::string("PONG") + '\0' : reply_ + '\0';
        asio::write(socket, asio::buffer(answer), ec);
    }

    /// Reads `size` bytes, draining what read_until already buffered first.
    static bool read_exact(tcp::socket& socket, asio::streambuf& buffer, char* out, std::size_t size) {
        const auto buffered = std::min(size, buffer.size());
        if (buffered > 0) {
            std::istream is(&buffer);
            is.read(out, static_cast<std::streamsize>(buffered));
        }
        if (buffered == size) {
            return true;
        }
        boost::system::error_code ec;
        asio::read(socket, asio::buffer(out + buffered, size - buffered), ec);
        return !ec;
    }

    asio::io_context io_;
    tcp::acceptor acceptor_;
    std::string reply_;
    std::uint16_t port_ = 0;
    std::thread thread_;
    std::string command_;
    std::string received_;
};

upl::core::ScannerConfig config_for(std::uint16_t port) {
    upl::core::ScannerConfig config;
    config.host = "127.0.0.1";
    config.port = port;
    config.timeout = std::chrono::seconds(1);
    config.stream_chunk_size = 7;
    return config;
}

std::uint16_t closed_port() {
    asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const auto port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

} // namespace

TEST(ClamdScannerTest, ParsesReplies) {
    auto clean = ClamdScanner::parse_reply(std::string("stream: OK") + '\0');
    ASSERT_TRUE(clean.is_ok());
    EXPECT_TRUE(clean.value().clean);
    EXPECT_EQ(clean.value().scanner, "clamav");

    auto infected = ClamdScanner::parse_reply("stream: Win.Test.EICAR_HDB-1 FOUND\n");
    ASSERT_TRUE(infected.is_ok());
    EXPECT_FALSE(infected.value().clean);
    EXPECT_EQ(infected.value().virus_name, "Win.Test.EICAR_HDB-1");

    auto error = ClamdScanner::parse_reply("INSTREAM size limit exceeded. ERROR");
    ASSERT_TRUE(error.is_error());
    EXPECT_EQ(error.error().kind, ErrorKind::Internal);

    auto garbage = ClamdScanner::parse_reply("hello");
    ASSERT_TRUE(garbage.is_error());
    EXPECT_EQ(garbage.error().kind, ErrorKind::Internal);
}

TEST(ClamdScannerTest, StreamsFileAndReportsClean) {
    FakeClamd server("stream: OK");
    ClamdScanner scanner(config_for(server.port()));
    const std::string content = "a file longer than one seven byte frame";
    const auto path = write_temp_file("clean.bin", content);

    auto result = scanner.scan(path);
    ASSERT_TRUE(result.is_ok()) << upl::describe(result.error());
    EXPECT_TRUE(result.value().clean);
    EXPECT_EQ(result.value().file_size, content.size());
    EXPECT_EQ(server.command(), "zINSTREAM");
    EXPECT_EQ(server.received(), content);

    fs::remove_all(path.parent_path());
}

TEST(ClamdScannerTest, ReportsInfectedFile) {
    FakeClamd server("stream: Eicar-Test-Signature FOUND");
    ClamdScanner scanner(config_for(server.port()));
    const auto path = write_temp_file("eicar.com", "X5O!P%@AP[4\\PZX54(P^)7CC)7}$EICAR");

    auto result = scanner.scan(path);
    ASSERT_TRUE(result.is_ok()) << upl::describe(result.error());
    EXPECT_FALSE(result.value().clean);
    EXPECT_EQ(result.value().virus_name, "Eicar-Test-Signature");

    fs::remove_all(path.parent_path());
}

TEST(ClamdScannerTest, PingChecksForPong) {
    FakeClamd server("unused");
    ClamdScanner scanner(config_for(server.port()));
    EXPECT_TRUE(scanner.available());
    EXPECT_EQ(server.command(), "zPING");
}

TEST(ClamdScannerTest, RefusedConnectionIsUnavailable) {
    ClamdScanner scanner(config_for(closed_port()));
    const auto path = write_temp_file("refused.bin", "bytes");

    auto result = scanner.scan(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::ScannerUnavailable);
    EXPECT_FALSE(scanner.available());

    fs::remove_all(path.parent_path());
}

TEST(ClamdScannerTest, SilentDaemonTimesOut) {
    FakeClamd server("");
    ClamdScanner scanner(config_for(server.port()));
    const auto path = write_temp_file("slow.bin", "bytes to scan");

    auto result = scanner.scan(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::ScanTimeout);
    EXPECT_TRUE(upl::is_retryable(result.error()));

    fs::remove_all(path.parent_path());
}

TEST(ClamdScannerTest, MissingFileIsNotSent) {
    ClamdScanner scanner(config_for(closed_port()));
    auto result = scanner.scan(fs::temp_directory_path() / "upl_clamd_no_such_file.bin");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::FileNotFound);
}
