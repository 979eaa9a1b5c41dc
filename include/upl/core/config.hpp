#pragma once

/**
 * @file config.hpp
 * @brief Runtime configuration for the upload pipeline
 *
 * Every field has a working default, so an empty JSON object (or no file at
 * all) yields a usable local setup. Durations are read from JSON as seconds.
 *
 * EXAMPLE FILE:
 * {
 *   "storage":  { "chunk_root": "/var/lib/upl/chunks", "repository": "sqlite" },
 *   "cleanup":  { "stuck_assembly_after": 3600, "batch_size": 50 },
 *   "retry":    { "max_attempts": 3, "initial_backoff": 1 },
 *   "scanner":  { "enabled": true, "host": "127.0.0.1", "port": 3310 },
 *   "logging":  { "level": "debug" }
 * }
 */

#include "upl/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace upl::core {

struct StorageConfig {
    std::filesystem::path chunk_root = "upl_data/chunks";
    std::filesystem::path assembly_root = "upl_data/assembly";
    std::filesystem::path asset_root = "upl_data/assets";
    std::filesystem::path database_path = "upl_data/uploads.db";
    std::string repository = "memory";   ///< "memory" or "sqlite"
};

struct LimitsConfig {
    std::uint64_t max_file_size = 5ULL * 1024 * 1024 * 1024;
    std::size_t max_filename_length = 255;
};

struct CleanupConfig {
    std::chrono::seconds stuck_assembly_after{3600};
    std::chrono::seconds pending_expiry_after{3600};
    std::chrono::seconds failed_retention{24 * 3600};
    std::chrono::seconds cancelled_retention{24 * 3600};
    std::chrono::seconds interval{15 * 60};
    std::size_t batch_size = 50;
};

struct RetryConfig {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{1000};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_backoff{60000};
};

struct ScannerConfig {
    bool enabled = true;
    std::string host = "127.0.0.1";
    std::uint16_t port = 3310;
    std::chrono::seconds timeout{30};
    std::size_t stream_chunk_size = 64 * 1024;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;   ///< Empty disables the rotating file sink
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
};

struct PipelineConfig {
    StorageConfig storage;
    LimitsConfig limits;
    CleanupConfig cleanup;
    RetryConfig retry;
    ScannerConfig scanner;
    LoggingConfig logging;
    std::size_t worker_threads = 2;
    bool auto_assemble = true;
};

Result<PipelineConfig> config_from_json(const nlohmann::json& document);

Result<PipelineConfig> load_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const PipelineConfig& config);

} // namespace upl::core
