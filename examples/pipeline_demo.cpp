/**
 * Runs one upload end to end against local directories.
 *
 * Usage: pipeline_demo [config.json]
 *
 * Without a config the demo uses a scratch directory under the system temp
 * path, the in-memory repository and no virus scanner (the scan is recorded
 * as skipped). Point "scanner" at a running clamd to get a real verdict.
 */

#include "upl/core/config.hpp"
#include "upl/core/hash.hpp"
#include "upl/core/logging.hpp"
#include "upl/pipeline/upload_pipeline.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::vector<std::uint8_t> make_chunk(const std::string& prefix, std::size_t size) {
    std::vector<std::uint8_t> data(prefix.begin(), prefix.end());
    data.resize(size, static_cast<std::uint8_t>('.'));
    return data;
}

upl::core::PipelineConfig scratch_config() {
    upl::core::PipelineConfig config;
    const auto root = fs::temp_directory_path() / ("upl_demo_" + upl::core::generate_id("", 4));
    config.storage.chunk_root = root / "chunks";
    config.storage.assembly_root = root / "assembly";
    config.storage.asset_root = root / "assets";
    config.storage.database_path = root / "uploads.db";
    config.scanner.enabled = false;
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    upl::core::PipelineConfig config = scratch_config();
    if (argc > 1) {
        auto loaded = upl::core::load_config(argv[1]);
        if (loaded.is_error()) {
            std::cerr << "Cannot load " << argv[1] << ": " << upl::describe(loaded.error()) << "\n";
            return 1;
        }
        config = loaded.value();
    }
    upl::core::init_logging(config.logging);

    spdlog::info("Upload pipeline demo");
    spdlog::info("Effective configuration:\n{}", upl::core::config_to_json(config).dump(2));

    auto created = upl::pipeline::UploadPipeline::create(config);
    if (created.is_error()) {
        spdlog::error("Pipeline setup failed: {}", upl::describe(created.error()));
        return 1;
    }
    auto& pipeline = *created.value();
    auto& service = pipeline.service();

    upl::pipeline::CreateSessionRequest request;
    request.workspace_id = "ws_demo";
    request.user_id = "user_demo";
    request.filename = "track.wav";
    request.total_size = 2044;
    request.chunks_count = 2;
    request.metadata = json{{"title", "Demo Track"}, {"bpm", 120}};

    auto session = service.create_session(request);
    if (session.is_error()) {
        spdlog::error("Create failed: {}", upl::describe(session.error()));
        return 1;
    }
    const auto session_id = session.value().id;

    // Second chunk first: arrival order does not matter.
    const std::vector<std::pair<std::uint32_t, std::string>> uploads = {{2, "chunk_2_data"}, {1, "chunk_1_data"}};
    for (const auto& [number, prefix] : uploads) {
        upl::pipeline::ChunkUpload upload;
        upload.session_id = session_id;
        upload.chunk_number = number;
        upload.data = make_chunk(prefix, 1022);
        upload.checksum = upl::core::fnv1a_hex(upload.data);
        auto stored = service.upload_chunk(upload);
        if (stored.is_error()) {
            spdlog::error("Chunk {} failed: {}", number, upl::describe(stored.error()));
            return 1;
        }
    }

    pipeline.runner().wait_idle();

    auto status = service.status(session_id);
    if (status.is_error()) {
        spdlog::error("Status failed: {}", upl::describe(status.error()));
        return 1;
    }
    std::cout << upl::pipeline::to_json(status.value()).dump(2) << std::endl;

    auto asset = service.asset_for_session(session_id);
    if (asset.is_ok()) {
        std::cout << upl::model::to_json(asset.value()).dump(2) << std::endl;
    } else {
        spdlog::warn("No asset: {}", upl::describe(asset.error()));
    }

    pipeline.metrics().print_stats();
    return asset.is_ok() ? 0 : 2;
}
