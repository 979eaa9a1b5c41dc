#include "upl/scanner/clamd_scanner.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <istream>
#include <memory>
#include <vector>

namespace upl::scanner {
namespace fs = std::filesystem;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

enum class Stage { Resolving, Connecting, Sending, Receiving };

const char* to_string(Stage stage) {
    switch (stage) {
        case Stage::Resolving: return "resolve";
        case Stage::Connecting: return "connect";
        case Stage::Sending: return "send";
        case Stage::Receiving: return "receive";
    }
    return "unknown";
}

void write_be32(char* out, std::uint32_t value) {
    out[0] = static_cast<char>((value >> 24) & 0xff);
    out[1] = static_cast<char>((value >> 16) & 0xff);
    out[2] = static_cast<char>((value >> 8) & 0xff);
    out[3] = static_cast<char>(value & 0xff);
}

/**
 * @brief One request/reply round trip with clamd
 *
 * Kept alive by shared_from_this while operations are pending, the same
 * way a per-connection handler is. Sends the command, then (for
 * INSTREAM) the file as <be32 length><bytes> frames ending with a zero
 * length frame, then reads the reply up to the terminating NUL.
 */
class ClamdExchange : public std::enable_shared_from_this<ClamdExchange> {
public:
    ClamdExchange(asio::io_context& io,
                  std::string command,
                  std::unique_ptr<std::ifstream> file,
                  std::size_t chunk_size)
        : resolver_(io),
          socket_(io),
          command_(std::move(command)),
          file_(std::move(file)),
          chunk_size_(chunk_size == 0 ? 64 * 1024 : chunk_size) {}

    void start(const std::string& host, std::uint16_t port) {
        auto self = shared_from_this();
        resolver_.async_resolve(host, std::to_string(port),
            [this, self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) {
                    fail(ec);
                    return;
                }
                stage_ = Stage::Connecting;
                asio::async_connect(socket_, results,
                    [this, self](const boost::system::error_code& ec, const tcp::endpoint&) {
                        if (ec) {
                            fail(ec);
                            return;
                        }
                        stage_ = Stage::Sending;
                        asio::async_write(socket_, asio::buffer(command_),
                            [this, self](const boost::system::error_code& ec, std::size_t) {
                                if (ec) {
                                    fail(ec);
                                    return;
                                }
                                if (file_) {
                                    send_next_frame();
                                } else {
                                    read_reply();
                                }
                            });
                    });
            });
    }

    void cancel() {
        boost::system::error_code ignored;
        resolver_.cancel();
        socket_.close(ignored);
    }

    [[nodiscard]] bool done() const noexcept { return done_; }
    [[nodiscard]] Stage stage() const noexcept { return stage_; }
    [[nodiscard]] const boost::system::error_code& error() const noexcept { return error_; }
    [[nodiscard]] const std::string& local_error() const noexcept { return local_error_; }
    [[nodiscard]] const std::string& reply() const noexcept { return reply_text_; }

private:
    void send_next_frame() {
        auto self = shared_from_this();
        frame_.resize(4 + chunk_size_);
        file_->read(frame_.data() + 4, static_cast<std::streamsize>(chunk_size_));
        const auto count = static_cast<std::size_t>(file_->gcount());
        if (file_->bad()) {
            local_error_ = "Failed to read file while streaming to clamd";
            finish();
            return;
        }
        write_be32(frame_.data(), static_cast<std::uint32_t>(count));
        frame_.resize(4 + count);
        const bool last = count == 0;

        asio::async_write(socket_, asio::buffer(frame_),
            [this, self, last](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    fail(ec);
                    return;
                }
                if (last) {
                    read_reply();
                } else {
                    send_next_frame();
                }
            });
    }

    void read_reply() {
        auto self = shared_from_this();
        stage_ = Stage::Receiving;
        asio::async_read_until(socket_, reply_, '\0',
            [this, self](const boost::system::error_code& ec, std::size_t) {
                if (ec && !(ec == asio::error::eof && reply_.size() > 0)) {
                    fail(ec);
                    return;
                }
                std::istream is(&reply_);
                std::getline(is, reply_text_, '\0');
                finish();
            });
    }

    void fail(const boost::system::error_code& ec) {
        error_ = ec;
        finish();
    }

    void finish() {
        done_ = true;
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

    tcp::resolver resolver_;
    tcp::socket socket_;
    std::string command_;
    std::unique_ptr<std::ifstream> file_;
    std::size_t chunk_size_;
    std::vector<char> frame_;
    asio::streambuf reply_;
    std::string reply_text_;
    std::string local_error_;
    boost::system::error_code error_;
    Stage stage_ = Stage::Resolving;
    bool done_ = false;
};

std::string trim_reply(std::string reply) {
    while (!reply.empty() && (reply.back() == '\0' || reply.back() == '\n' ||
                              reply.back() == '\r' || reply.back() == ' ')) {
        reply.pop_back();
    }
    return reply;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ClamdScanner::ClamdScanner(core::ScannerConfig config) : config_(std::move(config)) {}

upl::Result<std::string> ClamdScanner::exchange(const std::string& command,
                                                const std::optional<fs::path>& file) {
    std::unique_ptr<std::ifstream> stream;
    if (file) {
        stream = std::make_unique<std::ifstream>(*file, std::ios::binary);
        if (!*stream) {
            return upl::Err<std::string>(ErrorKind::FileNotFound, "Cannot open file for scanning: " + file->string());
        }
    }

    asio::io_context io;
    auto exchange = std::make_shared<ClamdExchange>(io, command, std::move(stream), config_.stream_chunk_size);
    exchange->start(config_.host, config_.port);
    io.run_for(config_.timeout);

    if (!exchange->done()) {
        const auto stage = exchange->stage();
        exchange->cancel();
        io.restart();
        io.run();
        if (stage == Stage::Resolving || stage == Stage::Connecting) {
            return upl::Err<std::string>(ErrorKind::ScannerUnavailable,
                "clamd at " + config_.host + ":" + std::to_string(config_.port) + " did not accept a connection");
        }
        return upl::Err<std::string>(ErrorKind::ScanTimeout,
            "clamd did not answer within " + std::to_string(config_.timeout.count()) + "s");
    }

    if (!exchange->local_error().empty()) {
        return upl::Err<std::string>(ErrorKind::Storage, exchange->local_error());
    }

    if (exchange->error()) {
        const auto stage = exchange->stage();
        const auto detail = std::string("clamd ") + to_string(stage) + " failed: " + exchange->error().message();
        if (stage == Stage::Resolving || stage == Stage::Connecting) {
            return upl::Err<std::string>(ErrorKind::ScannerUnavailable, detail);
        }
        return upl::Err<std::string>(ErrorKind::Internal, detail);
    }

    return upl::Ok(exchange->reply());
}

upl::Result<ScanResult> ClamdScanner::scan(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return upl::Err<ScanResult>(ErrorKind::FileNotFound, "File to scan not found: " + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return upl::Err<ScanResult>(ErrorKind::FileNotFound, "Cannot stat file to scan: " + path.string());
    }

    const auto started = std::chrono::steady_clock::now();
    auto reply = exchange(std::string("zINSTREAM") + '\0', path);
    if (reply.is_error()) {
        return upl::Err<ScanResult>(reply.error());
    }

    auto result = parse_reply(reply.value());
    if (result.is_error()) {
        return result;
    }
    result.value().duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    result.value().file_size = static_cast<std::uint64_t>(size);

    spdlog::debug("[ClamdScanner] {} -> {} in {}ms", path.filename().string(),
                  result.value().clean ? "clean" : result.value().virus_name,
                  result.value().duration.count());
    return result;
}

bool ClamdScanner::available() {
    auto reply = exchange(std::string("zPING") + '\0', std::nullopt);
    if (reply.is_error()) {
        spdlog::debug("[ClamdScanner] ping failed: {}", reply.error().message);
        return false;
    }
    return trim_reply(reply.value()) == "PONG";
}

upl::Result<ScanResult> ClamdScanner::parse_reply(const std::string& raw) {
    const auto reply = trim_reply(raw);

    ScanResult result;
    result.scanner = kScannerName;

    if (ends_with(reply, " FOUND")) {
        auto body = reply.substr(0, reply.size() - std::string(" FOUND").size());
        const auto colon = body.find(": ");
        result.clean = false;
        result.virus_name = colon == std::string::npos ? body : body.substr(colon + 2);
        return upl::Ok(std::move(result));
    }
    if (ends_with(reply, "ERROR")) {
        return upl::Err<ScanResult>(ErrorKind::Internal, "clamd error: " + reply);
    }
    if (ends_with(reply, ": OK") || reply == "OK") {
        result.clean = true;
        return upl::Ok(std::move(result));
    }
    return upl::Err<ScanResult>(ErrorKind::Internal, "Unexpected clamd reply: " + reply);
}

} // namespace upl::scanner
