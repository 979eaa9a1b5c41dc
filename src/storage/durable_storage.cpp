#include "upl/storage/durable_storage.hpp"

#include "upl/core/hash.hpp"

#include <spdlog/spdlog.h>

namespace upl::storage {
namespace fs = std::filesystem;

namespace {

bool is_plain_component(const std::string& value) {
    if (value.empty() || value == "." || value == "..") {
        return false;
    }
    return value.find('/') == std::string::npos && value.find('\\') == std::string::npos;
}

} // namespace

LocalDurableStorage::LocalDurableStorage(fs::path root) : root_(std::move(root)) {}

upl::Result<model::StorageReference> LocalDurableStorage::attach(const fs::path& source,
                                                                 const std::string& key,
                                                                 const std::string& filename,
                                                                 const std::string& content_type) {
    if (!is_plain_component(key) || !is_plain_component(filename)) {
        return upl::Err<model::StorageReference>(ErrorKind::InvalidArgument,
                                                 "Invalid storage key or filename: " + key + "/" + filename);
    }

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return upl::Err<model::StorageReference>(ErrorKind::FileNotFound, "Source file missing: " + source.string());
    }

    const auto directory = root_ / key;
    fs::create_directories(directory, ec);
    if (ec && !fs::exists(directory)) {
        return upl::Err<model::StorageReference>(ErrorKind::Storage,
                                                 "Failed to create directory: " + directory.string());
    }

    const auto destination = directory / filename;
    const fs::path staging = destination.string() + "." + core::generate_id("", 6) + ".part";
    ec = copy_bytes(source, staging);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        return upl::Err<model::StorageReference>(ErrorKind::Storage,
                                                 "Failed to copy into durable storage: " + ec.message());
    }
    fs::rename(staging, destination, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        return upl::Err<model::StorageReference>(ErrorKind::Storage,
                                                 "Failed to publish " + destination.string() + ": " + ec.message());
    }

    model::StorageReference reference;
    reference.backend = kBackendName;
    reference.key = key + "/" + filename;
    reference.filename = filename;
    reference.content_type = content_type;
    reference.size = static_cast<std::uint64_t>(fs::file_size(destination, ec));
    if (ec) {
        return upl::Err<model::StorageReference>(ErrorKind::Storage, "Failed to stat " + destination.string());
    }

    spdlog::debug("[DurableStorage] attached {} ({} bytes, {})", reference.key, reference.size, content_type);
    return upl::Ok(std::move(reference));
}

std::error_code LocalDurableStorage::copy_bytes(const fs::path& source, const fs::path& staging) {
    std::error_code ec;
    fs::copy_file(source, staging, fs::copy_options::overwrite_existing, ec);
    return ec;
}

upl::Result<fs::path> LocalDurableStorage::locate(const model::StorageReference& reference) const {
    if (reference.backend != kBackendName) {
        return upl::Err<fs::path>(ErrorKind::InvalidArgument, "Reference belongs to backend " + reference.backend);
    }
    const fs::path relative(reference.key);
    for (const auto& part : relative) {
        if (part == "..") {
            return upl::Err<fs::path>(ErrorKind::InvalidArgument, "Invalid storage key: " + reference.key);
        }
    }
    return upl::Ok(root_ / relative);
}

bool LocalDurableStorage::exists(const model::StorageReference& reference) const {
    auto path = locate(reference);
    if (path.is_error()) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(path.value(), ec);
}

upl::Result<void> LocalDurableStorage::remove(const model::StorageReference& reference) {
    auto path = locate(reference);
    if (path.is_error()) {
        return upl::Err<void>(path.error());
    }
    std::error_code ec;
    fs::remove(path.value(), ec);
    if (ec) {
        return upl::Err<void>(ErrorKind::Storage, "Failed to delete " + path.value().string() + ": " + ec.message());
    }
    return upl::Ok();
}

} // namespace upl::storage
