#pragma once

#include "upl/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace upl::storage {

struct ChunkStoreStats {
    std::size_t chunk_files = 0;
    std::uint64_t total_bytes = 0;
};

/// Bytes written beside a chunk's key but not yet visible under it.
struct StagedChunk {
    std::string staged_key;
    std::string chunk_key;
};

/**
 * @brief Temporary home for raw chunk bytes while a session is uploading
 *
 * Keys are derived deterministically from (session, chunk number), so a
 * retried upload of the same chunk lands on the same key. Implementations
 * must tolerate concurrent writes of different chunks of one session and
 * concurrent retries of the same chunk (last write wins).
 */
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    /// stage() followed by commit(); returns the chunk key.
    virtual upl::Result<std::string> store(const std::string& session_id,
                                           std::uint32_t chunk_number,
                                           const std::vector<std::uint8_t>& data) = 0;

    /// Writes the bytes without touching whatever the chunk key holds now.
    virtual upl::Result<StagedChunk> stage(const std::string& session_id,
                                           std::uint32_t chunk_number,
                                           const std::vector<std::uint8_t>& data) = 0;

    /// Replaces the chunk key's bytes with the staged ones.
    virtual upl::Result<void> commit(const StagedChunk& staged) = 0;

    /// Drops staged bytes; the chunk key is left alone. A staged write that
    /// was already committed or discarded is not an error.
    virtual upl::Result<void> discard(const StagedChunk& staged) = 0;

    [[nodiscard]] virtual bool exists(const std::string& storage_key) const = 0;

    virtual upl::Result<std::uint64_t> size(const std::string& storage_key) const = 0;

    virtual upl::Result<std::vector<std::uint8_t>> read(const std::string& storage_key) const = 0;

    /// Streams the chunk into `out`; returns the number of bytes copied.
    virtual upl::Result<std::uint64_t> read_into(const std::string& storage_key, std::ostream& out) const = 0;

    /// Removing a missing key is not an error.
    virtual upl::Result<void> remove(const std::string& storage_key) = 0;

    /// Removes every chunk of the session; returns how many were removed.
    virtual upl::Result<std::size_t> remove_session(const std::string& session_id) = 0;

    virtual upl::Result<ChunkStoreStats> storage_stats() const = 0;
};

/**
 * @brief ChunkStore on the local filesystem
 *
 * Layout: <root>/session_<id>/chunk_<n>.tmp. Writes go to a uniquely named
 * part file first and are renamed into place, so a crash never leaves a
 * short file under the final name.
 */
class FileChunkStore : public ChunkStore {
public:
    explicit FileChunkStore(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    upl::Result<std::string> store(const std::string& session_id,
                                   std::uint32_t chunk_number,
                                   const std::vector<std::uint8_t>& data) override;
    upl::Result<StagedChunk> stage(const std::string& session_id,
                                   std::uint32_t chunk_number,
                                   const std::vector<std::uint8_t>& data) override;
    upl::Result<void> commit(const StagedChunk& staged) override;
    upl::Result<void> discard(const StagedChunk& staged) override;

    [[nodiscard]] bool exists(const std::string& storage_key) const override;
    upl::Result<std::uint64_t> size(const std::string& storage_key) const override;
    upl::Result<std::vector<std::uint8_t>> read(const std::string& storage_key) const override;
    upl::Result<std::uint64_t> read_into(const std::string& storage_key, std::ostream& out) const override;
    upl::Result<void> remove(const std::string& storage_key) override;
    upl::Result<std::size_t> remove_session(const std::string& session_id) override;
    upl::Result<ChunkStoreStats> storage_stats() const override;

    static std::string make_key(const std::string& session_id, std::uint32_t chunk_number);

private:
    upl::Result<std::filesystem::path> resolve(const std::string& storage_key) const;
    std::filesystem::path session_dir(const std::string& session_id) const;

    static upl::Result<void> ensure_directory(const std::filesystem::path& path);

    std::filesystem::path root_;
};

} // namespace upl::storage
