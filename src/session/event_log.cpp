#include "upl/session/event_log.hpp"

#include <algorithm>

namespace upl::session {

SessionEvent make_event(std::string type, std::string key, nlohmann::json payload, core::TimePoint at) {
    SessionEvent event;
    event.type = std::move(type);
    event.key = std::move(key);
    event.payload = payload.is_object() ? std::move(payload) : nlohmann::json::object();
    event.at = at;
    return event;
}

nlohmann::json fold_metadata(const std::vector<SessionEvent>& events) {
    std::vector<const SessionEvent*> ordered;
    ordered.reserve(events.size());
    for (const auto& event : events) {
        ordered.push_back(&event);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const SessionEvent* a, const SessionEvent* b) {
        return a->sequence < b->sequence;
    });

    nlohmann::json view = nlohmann::json::object();
    for (const auto* event : ordered) {
        if (event->key.empty()) {
            view.merge_patch(event->payload);
            continue;
        }
        auto& slot = view[event->key];
        if (!slot.is_object()) {
            slot = nlohmann::json::object();
        }
        slot.merge_patch(event->payload);
    }
    return view;
}

std::optional<std::string> finalized_asset_id(const nlohmann::json& metadata) {
    const auto it = metadata.find(keys::kFinalization);
    if (it == metadata.end() || !it->is_object()) {
        return std::nullopt;
    }
    const auto asset = it->find("asset_id");
    if (asset == it->end() || !asset->is_string()) {
        return std::nullopt;
    }
    return asset->get<std::string>();
}

std::string scan_status(const nlohmann::json& metadata) {
    const auto it = metadata.find(keys::kVirusScan);
    if (it == metadata.end() || !it->is_object()) {
        return {};
    }
    return it->value("status", std::string{});
}

nlohmann::json to_json(const SessionEvent& event) {
    return {
        {"sequence", event.sequence},
        {"type", event.type},
        {"key", event.key},
        {"payload", event.payload},
        {"status_after", event.status_after ? nlohmann::json(model::to_string(*event.status_after))
                                            : nlohmann::json(nullptr)},
        {"at", core::to_iso8601(event.at)},
    };
}

} // namespace upl::session
