#include "upl/core/config.hpp"

#include <fstream>

namespace upl::core {
namespace {

using json = nlohmann::json;

template<typename T>
void read_value(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

template<typename Duration>
void read_seconds(const json& section, const char* key, Duration& target) {
    if (section.contains(key)) {
        const double seconds = section.at(key).get<double>();
        target = std::chrono::duration_cast<Duration>(std::chrono::duration<double>(seconds));
    }
}

void read_path(const json& section, const char* key, std::filesystem::path& target) {
    if (section.contains(key)) {
        target = section.at(key).get<std::string>();
    }
}

const json& section_or_empty(const json& document, const char* key) {
    static const json empty = json::object();
    if (document.contains(key) && document.at(key).is_object()) {
        return document.at(key);
    }
    return empty;
}

template<typename Duration>
double as_seconds(Duration value) {
    return std::chrono::duration<double>(value).count();
}

} // namespace

Result<PipelineConfig> config_from_json(const json& document) {
    if (!document.is_object()) {
        return Err<PipelineConfig>(ErrorKind::InvalidArgument, "Configuration root must be a JSON object");
    }

    PipelineConfig config;
    try {
        const auto& storage = section_or_empty(document, "storage");
        read_path(storage, "chunk_root", config.storage.chunk_root);
        read_path(storage, "assembly_root", config.storage.assembly_root);
        read_path(storage, "asset_root", config.storage.asset_root);
        read_path(storage, "database_path", config.storage.database_path);
        read_value(storage, "repository", config.storage.repository);

        const auto& limits = section_or_empty(document, "limits");
        read_value(limits, "max_file_size", config.limits.max_file_size);
        read_value(limits, "max_filename_length", config.limits.max_filename_length);

        const auto& cleanup = section_or_empty(document, "cleanup");
        read_seconds(cleanup, "stuck_assembly_after", config.cleanup.stuck_assembly_after);
        read_seconds(cleanup, "pending_expiry_after", config.cleanup.pending_expiry_after);
        read_seconds(cleanup, "failed_retention", config.cleanup.failed_retention);
        read_seconds(cleanup, "cancelled_retention", config.cleanup.cancelled_retention);
        read_seconds(cleanup, "interval", config.cleanup.interval);
        read_value(cleanup, "batch_size", config.cleanup.batch_size);

        const auto& retry = section_or_empty(document, "retry");
        read_value(retry, "max_attempts", config.retry.max_attempts);
        read_seconds(retry, "initial_backoff", config.retry.initial_backoff);
        read_value(retry, "backoff_multiplier", config.retry.backoff_multiplier);
        read_seconds(retry, "max_backoff", config.retry.max_backoff);

        const auto& scanner = section_or_empty(document, "scanner");
        read_value(scanner, "enabled", config.scanner.enabled);
        read_value(scanner, "host", config.scanner.host);
        read_value(scanner, "port", config.scanner.port);
        read_seconds(scanner, "timeout", config.scanner.timeout);
        read_value(scanner, "stream_chunk_size", config.scanner.stream_chunk_size);

        const auto& logging = section_or_empty(document, "logging");
        read_value(logging, "level", config.logging.level);
        read_value(logging, "file", config.logging.file);
        read_value(logging, "max_file_size", config.logging.max_file_size);
        read_value(logging, "max_files", config.logging.max_files);

        const auto& pipeline = section_or_empty(document, "pipeline");
        read_value(pipeline, "worker_threads", config.worker_threads);
        read_value(pipeline, "auto_assemble", config.auto_assemble);
    } catch (const json::exception& e) {
        return Err<PipelineConfig>(ErrorKind::InvalidArgument, std::string("Invalid configuration value: ") + e.what());
    }

    if (config.storage.repository != "memory" && config.storage.repository != "sqlite") {
        return Err<PipelineConfig>(ErrorKind::InvalidArgument,
                                   "storage.repository must be \"memory\" or \"sqlite\", got: " + config.storage.repository);
    }
    if (config.retry.max_attempts < 1) {
        return Err<PipelineConfig>(ErrorKind::InvalidArgument, "retry.max_attempts must be >= 1");
    }
    if (config.cleanup.batch_size == 0) {
        return Err<PipelineConfig>(ErrorKind::InvalidArgument, "cleanup.batch_size must be > 0");
    }
    if (config.worker_threads == 0) {
        config.worker_threads = 1;
    }

    return Ok(config);
}

Result<PipelineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<PipelineConfig>(ErrorKind::NotFound, "Cannot open configuration file: " + path.string());
    }

    json document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<PipelineConfig>(ErrorKind::InvalidArgument, "Malformed JSON in " + path.string());
    }
    return config_from_json(document);
}

json config_to_json(const PipelineConfig& config) {
    json j;
    j["storage"] = {
        {"chunk_root", config.storage.chunk_root.string()},
        {"assembly_root", config.storage.assembly_root.string()},
        {"asset_root", config.storage.asset_root.string()},
        {"database_path", config.storage.database_path.string()},
        {"repository", config.storage.repository},
    };
    j["limits"] = {
        {"max_file_size", config.limits.max_file_size},
        {"max_filename_length", config.limits.max_filename_length},
    };
    j["cleanup"] = {
        {"stuck_assembly_after", as_seconds(config.cleanup.stuck_assembly_after)},
        {"pending_expiry_after", as_seconds(config.cleanup.pending_expiry_after)},
        {"failed_retention", as_seconds(config.cleanup.failed_retention)},
        {"cancelled_retention", as_seconds(config.cleanup.cancelled_retention)},
        {"interval", as_seconds(config.cleanup.interval)},
        {"batch_size", config.cleanup.batch_size},
    };
    j["retry"] = {
        {"max_attempts", config.retry.max_attempts},
        {"initial_backoff", as_seconds(config.retry.initial_backoff)},
        {"backoff_multiplier", config.retry.backoff_multiplier},
        {"max_backoff", as_seconds(config.retry.max_backoff)},
    };
    j["scanner"] = {
        {"enabled", config.scanner.enabled},
        {"host", config.scanner.host},
        {"port", config.scanner.port},
        {"timeout", as_seconds(config.scanner.timeout)},
        {"stream_chunk_size", config.scanner.stream_chunk_size},
    };
    j["logging"] = {
        {"level", config.logging.level},
        {"file", config.logging.file},
        {"max_file_size", config.logging.max_file_size},
        {"max_files", config.logging.max_files},
    };
    j["pipeline"] = {
        {"worker_threads", config.worker_threads},
        {"auto_assemble", config.auto_assemble},
    };
    return j;
}

} // namespace upl::core
