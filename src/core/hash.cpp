#include "upl/core/hash.hpp"

#include <fstream>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace upl::core {
namespace {

constexpr std::uint64_t kOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kPrime  = 0x100000001b3ULL;

std::string to_hex(std::uint64_t hash) {
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return oss.str();
}

} // namespace

std::string fnv1a_hex(const std::vector<std::uint8_t>& data) {
    std::uint64_t hash = kOffset;
    for (std::uint8_t byte : data) {
        hash ^= static_cast<std::uint64_t>(byte);
        hash *= kPrime;
    }
    return to_hex(hash);
}

std::string fnv1a_hex(const std::string& text) {
    std::uint64_t hash = kOffset;
    for (char c : text) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
        hash *= kPrime;
    }
    return to_hex(hash);
}

Result<std::string> fnv1a_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::FileNotFound, "Failed to open file: " + path.string());
    }
    std::uint64_t hash = kOffset;
    char buffer[4096];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const std::streamsize count = input.gcount();
        for (std::streamsize i = 0; i < count; ++i) {
            hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(buffer[i]));
            hash *= kPrime;
        }
    }
    if (input.bad()) {
        return Err<std::string>(ErrorKind::Storage, "Read error while hashing: " + path.string());
    }
    return Ok(to_hex(hash));
}

std::string generate_id(const std::string& prefix, std::size_t random_bytes) {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};
    static std::uniform_int_distribution<int> dist(0, 255);

    std::ostringstream oss;
    if (!prefix.empty()) {
        oss << prefix << "_";
    }
    std::lock_guard lock(mutex);
    for (std::size_t i = 0; i < random_bytes; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << dist(engine);
    }
    return oss.str();
}

} // namespace upl::core
