#pragma once

#include "upl/core/result.hpp"
#include "upl/model/types.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace upl::storage {

/**
 * @brief Permanent storage port used by the Finalizer
 *
 * The only contract: attach these bytes under this filename and content
 * type, and hand back a reference that can locate them again. Attaching
 * twice under the same key replaces the bytes, so a retried finalization
 * never leaves two copies.
 */
class DurableStorage {
public:
    virtual ~DurableStorage() = default;

    virtual upl::Result<model::StorageReference> attach(const std::filesystem::path& source,
                                                        const std::string& key,
                                                        const std::string& filename,
                                                        const std::string& content_type) = 0;

    [[nodiscard]] virtual bool exists(const model::StorageReference& reference) const = 0;

    virtual upl::Result<void> remove(const model::StorageReference& reference) = 0;
};

/// DurableStorage backed by a local directory: <root>/<key>/<filename>.
class LocalDurableStorage : public DurableStorage {
public:
    static constexpr const char* kBackendName = "local";

    explicit LocalDurableStorage(std::filesystem::path root);

    upl::Result<model::StorageReference> attach(const std::filesystem::path& source,
                                                const std::string& key,
                                                const std::string& filename,
                                                const std::string& content_type) override;

    [[nodiscard]] bool exists(const model::StorageReference& reference) const override;

    upl::Result<void> remove(const model::StorageReference& reference) override;

    /// Filesystem location of a reference produced by this backend.
    upl::Result<std::filesystem::path> locate(const model::StorageReference& reference) const;

protected:
    /// Copies source onto the staging path next to the final file.
    virtual std::error_code copy_bytes(const std::filesystem::path& source, const std::filesystem::path& staging);

private:
    std::filesystem::path root_;
};

} // namespace upl::storage
