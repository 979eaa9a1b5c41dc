#include "upl/storage/chunk_store.hpp"

#include "upl/core/hash.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace upl::storage {
namespace fs = std::filesystem;

namespace {

bool is_safe_session_id(const std::string& session_id) {
    if (session_id.empty()) {
        return false;
    }
    return std::all_of(session_id.begin(), session_id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

} // namespace

FileChunkStore::FileChunkStore(fs::path root) : root_(std::move(root)) {}

std::string FileChunkStore::make_key(const std::string& session_id, std::uint32_t chunk_number) {
    return "session_" + session_id + "/chunk_" + std::to_string(chunk_number) + ".tmp";
}

fs::path FileChunkStore::session_dir(const std::string& session_id) const {
    return root_ / ("session_" + session_id);
}

upl::Result<void> FileChunkStore::ensure_directory(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec && !fs::exists(path)) {
        return upl::Err<void>(ErrorKind::Storage, "Failed to create directory: " + path.string() + ": " + ec.message());
    }
    return upl::Ok();
}

upl::Result<fs::path> FileChunkStore::resolve(const std::string& storage_key) const {
    const fs::path relative(storage_key);
    if (storage_key.empty() || relative.is_absolute()) {
        return upl::Err<fs::path>(ErrorKind::InvalidArgument, "Invalid chunk storage key: " + storage_key);
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return upl::Err<fs::path>(ErrorKind::InvalidArgument, "Invalid chunk storage key: " + storage_key);
        }
    }
    return upl::Ok(root_ / relative);
}

upl::Result<std::string> FileChunkStore::store(const std::string& session_id,
                                               std::uint32_t chunk_number,
                                               const std::vector<std::uint8_t>& data) {
    auto staged = stage(session_id, chunk_number, data);
    if (staged.is_error()) {
        return upl::Err<std::string>(staged.error());
    }
    if (auto committed = commit(staged.value()); committed.is_error()) {
        return upl::Err<std::string>(committed.error());
    }
    return upl::Ok(staged.value().chunk_key);
}

upl::Result<StagedChunk> FileChunkStore::stage(const std::string& session_id,
                                               std::uint32_t chunk_number,
                                               const std::vector<std::uint8_t>& data) {
    if (!is_safe_session_id(session_id)) {
        return upl::Err<StagedChunk>(ErrorKind::InvalidArgument, "Invalid session id for chunk store: " + session_id);
    }
    if (chunk_number == 0) {
        return upl::Err<StagedChunk>(ErrorKind::InvalidArgument, "Chunk numbers start at 1");
    }

    StagedChunk staged;
    staged.chunk_key = make_key(session_id, chunk_number);
    // Concurrent retries of one chunk each get their own part file.
    staged.staged_key = staged.chunk_key + "." + core::generate_id("", 6) + ".part";

    const auto part_path = root_ / staged.staged_key;
    if (auto res = ensure_directory(part_path.parent_path()); res.is_error()) {
        return upl::Err<StagedChunk>(res.error());
    }

    std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return upl::Err<StagedChunk>(ErrorKind::Storage, "Failed to open chunk file: " + part_path.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        out.close();
        std::error_code ignored;
        fs::remove(part_path, ignored);
        return upl::Err<StagedChunk>(ErrorKind::Storage, "Failed to write chunk file: " + part_path.string());
    }
    return upl::Ok(std::move(staged));
}

upl::Result<void> FileChunkStore::commit(const StagedChunk& staged) {
    auto part_path = resolve(staged.staged_key);
    if (part_path.is_error()) {
        return upl::Err<void>(part_path.error());
    }
    auto final_path = resolve(staged.chunk_key);
    if (final_path.is_error()) {
        return upl::Err<void>(final_path.error());
    }

    std::error_code ec;
    fs::rename(part_path.value(), final_path.value(), ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(part_path.value(), ignored);
        return upl::Err<void>(ErrorKind::Storage,
                              "Failed to move chunk into place: " + final_path.value().string() + ": " + ec.message());
    }

    spdlog::debug("[ChunkStore] stored key={}", staged.chunk_key);
    return upl::Ok();
}

upl::Result<void> FileChunkStore::discard(const StagedChunk& staged) {
    if (staged.staged_key == staged.chunk_key) {
        return upl::Err<void>(ErrorKind::InvalidArgument, "Refusing to discard committed chunk " + staged.chunk_key);
    }
    return remove(staged.staged_key);
}

bool FileChunkStore::exists(const std::string& storage_key) const {
    auto path = resolve(storage_key);
    if (path.is_error()) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(path.value(), ec);
}

upl::Result<std::uint64_t> FileChunkStore::size(const std::string& storage_key) const {
    auto path = resolve(storage_key);
    if (path.is_error()) {
        return upl::Err<std::uint64_t>(path.error());
    }
    std::error_code ec;
    const auto bytes = fs::file_size(path.value(), ec);
    if (ec) {
        return upl::Err<std::uint64_t>(ErrorKind::FileNotFound, "Chunk file missing: " + storage_key);
    }
    return upl::Ok(static_cast<std::uint64_t>(bytes));
}

upl::Result<std::vector<std::uint8_t>> FileChunkStore::read(const std::string& storage_key) const {
    auto path = resolve(storage_key);
    if (path.is_error()) {
        return upl::Err<std::vector<std::uint8_t>>(path.error());
    }
    std::ifstream input(path.value(), std::ios::binary);
    if (!input) {
        return upl::Err<std::vector<std::uint8_t>>(ErrorKind::FileNotFound, "Chunk file missing: " + storage_key);
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return upl::Err<std::vector<std::uint8_t>>(ErrorKind::Storage, "Failed to read chunk file: " + storage_key);
    }
    return upl::Ok(std::move(data));
}

upl::Result<std::uint64_t> FileChunkStore::read_into(const std::string& storage_key, std::ostream& out) const {
    auto path = resolve(storage_key);
    if (path.is_error()) {
        return upl::Err<std::uint64_t>(path.error());
    }
    std::ifstream input(path.value(), std::ios::binary);
    if (!input) {
        return upl::Err<std::uint64_t>(ErrorKind::FileNotFound, "Chunk file missing: " + storage_key);
    }

    std::uint64_t copied = 0;
    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const std::streamsize count = input.gcount();
        out.write(buffer, count);
        if (!out) {
            return upl::Err<std::uint64_t>(ErrorKind::Storage, "Failed to write while copying chunk: " + storage_key);
        }
        copied += static_cast<std::uint64_t>(count);
    }
    if (input.bad()) {
        return upl::Err<std::uint64_t>(ErrorKind::Storage, "Failed to read chunk file: " + storage_key);
    }
    return upl::Ok(copied);
}

upl::Result<void> FileChunkStore::remove(const std::string& storage_key) {
    auto path = resolve(storage_key);
    if (path.is_error()) {
        return upl::Err<void>(path.error());
    }
    std::error_code ec;
    fs::remove(path.value(), ec);
    if (ec) {
        return upl::Err<void>(ErrorKind::Storage, "Failed to delete chunk " + storage_key + ": " + ec.message());
    }
    return upl::Ok();
}

upl::Result<std::size_t> FileChunkStore::remove_session(const std::string& session_id) {
    if (!is_safe_session_id(session_id)) {
        return upl::Err<std::size_t>(ErrorKind::InvalidArgument, "Invalid session id for chunk store: " + session_id);
    }
    const auto dir = session_dir(session_id);
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return upl::Ok(std::size_t{0});
    }

    std::size_t removed = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code remove_ec;
        if (fs::remove(it->path(), remove_ec)) {
            ++removed;
        } else if (remove_ec) {
            return upl::Err<std::size_t>(ErrorKind::Storage,
                                         "Failed to delete " + it->path().string() + ": " + remove_ec.message());
        }
    }
    if (ec) {
        return upl::Err<std::size_t>(ErrorKind::Storage, "Failed to list " + dir.string() + ": " + ec.message());
    }

    fs::remove(dir, ec);
    if (ec) {
        spdlog::warn("[ChunkStore] could not remove directory {}: {}", dir.string(), ec.message());
    }
    return upl::Ok(removed);
}

upl::Result<ChunkStoreStats> FileChunkStore::storage_stats() const {
    ChunkStoreStats stats;
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        return upl::Ok(stats);
    }
    for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        const auto name = it->path().filename().string();
        if (name.rfind("chunk_", 0) != 0 || it->path().extension() != ".tmp") {
            continue;
        }
        const auto bytes = it->file_size(entry_ec);
        if (entry_ec) {
            continue;
        }
        ++stats.chunk_files;
        stats.total_bytes += bytes;
    }
    if (ec) {
        return upl::Err<ChunkStoreStats>(ErrorKind::Storage, "Failed to walk " + root_.string() + ": " + ec.message());
    }
    return upl::Ok(stats);
}

} // namespace upl::storage
