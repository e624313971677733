#pragma once
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace OQ {

struct ChangeEvent {
    enum class Kind {
        PathChanged,
        PathAdded,
        PathRemoved
    };

    Kind           kind = Kind::PathChanged;
    std::string    path;
    nlohmann::json attributes; // PathChanged only: the node's full attribute view

    static auto changed(std::string path, nlohmann::json attributes) -> ChangeEvent {
        return ChangeEvent{Kind::PathChanged, std::move(path), std::move(attributes)};
    }
    static auto added(std::string path) -> ChangeEvent { return ChangeEvent{Kind::PathAdded, std::move(path), {}}; }
    static auto removed(std::string path) -> ChangeEvent { return ChangeEvent{Kind::PathRemoved, std::move(path), {}}; }
};

[[nodiscard]] inline auto eventKindToString(ChangeEvent::Kind kind) -> std::string_view {
    switch (kind) {
        case ChangeEvent::Kind::PathChanged:
            return "PATH_CHANGED";
        case ChangeEvent::Kind::PathAdded:
            return "PATH_ADDED";
        case ChangeEvent::Kind::PathRemoved:
            return "PATH_REMOVED";
    }
    return "PATH_CHANGED";
}

// {"COMMAND": ..., "DATA": path[, "ATTRIBUTES": {...}]}
[[nodiscard]] inline auto toJson(ChangeEvent const& event) -> nlohmann::json {
    nlohmann::json json;
    json["COMMAND"] = std::string{eventKindToString(event.kind)};
    json["DATA"]    = event.path;
    if (event.kind == ChangeEvent::Kind::PathChanged)
        json["ATTRIBUTES"] = event.attributes;
    return json;
}

/**
 * Delivery endpoint for one notifier client.
 *
 * deliver() runs on the notifier's dispatch thread and must not block; a
 * WebSocket session pushes into its outbox and returns. Returning false
 * drops the client and all of its subscriptions.
 */
struct Subscriber {
    virtual ~Subscriber() = default;

    virtual auto deliver(ChangeEvent const& event) -> bool = 0;
};

} // namespace OQ
