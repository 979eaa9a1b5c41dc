#include "upl/storage/session_repository.hpp"

namespace upl::storage {

std::string container_slot(const std::optional<std::string>& container_id) {
    return container_id ? "c:" + *container_id : std::string("-");
}

std::string slot_key(const std::string& workspace_id,
                     const std::optional<std::string>& container_id,
                     const std::string& filename) {
    std::string key;
    key.reserve(workspace_id.size() + filename.size() + 16);
    key.append(workspace_id).push_back('\x1f');
    key.append(container_slot(container_id)).push_back('\x1f');
    key.append(filename);
    return key;
}

} // namespace upl::storage
