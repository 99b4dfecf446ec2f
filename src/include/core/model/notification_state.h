#pragma once

#include <core/constant/transfer.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace shuttle::core {

enum class NotificationIcon {
    kDownload,
    kDownloadDone,
    kUpload,
    kUploadDone,
};

NLOHMANN_JSON_SERIALIZE_ENUM(NotificationIcon,
                             {
                                 {NotificationIcon::kDownload, "download"},
                                 {NotificationIcon::kDownloadDone, "download_done"},
                                 {NotificationIcon::kUpload, "upload"},
                                 {NotificationIcon::kUploadDone, "upload_done"},
                             });

// A button shown on the notification, triggering an IPC operation when pressed
struct NotificationAction {
    std::string label;
    std::string operation;
    TransferId transfer_id = kInvalidTransferId;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(NotificationAction, label, operation, transfer_id);

    bool operator==(const NotificationAction&) const = default;
};

/**
 * @brief Snapshot of what the notification surface should display.
 *
 * @details Built from scratch for every publish and never mutated afterwards.
 * An empty progress means the progress bar is indeterminate.
 */
struct NotificationState {
    std::string title;
    std::string body;
    std::string category;
    NotificationIcon icon = NotificationIcon::kDownload;
    std::optional<int> progress;
    bool play_sound = false;
    std::vector<NotificationAction> actions;

    bool indeterminate() const { return !progress.has_value(); }

    bool operator==(const NotificationState&) const = default;
};

inline void to_json(nlohmann::json& j, const NotificationState& state) {
    j = nlohmann::json{
        {"title", state.title},
        {"body", state.body},
        {"category", state.category},
        {"icon", state.icon},
        {"indeterminate", state.indeterminate()},
        {"progress", state.progress.value_or(0)},
        {"play_sound", state.play_sound},
        {"actions", state.actions},
    };
}

inline void from_json(const nlohmann::json& j, NotificationState& state) {
    j.at("title").get_to(state.title);
    j.at("body").get_to(state.body);
    j.at("category").get_to(state.category);
    j.at("icon").get_to(state.icon);
    if (j.at("indeterminate").get<bool>()) {
        state.progress.reset();
    } else {
        state.progress = j.at("progress").get<int>();
    }
    j.at("play_sound").get_to(state.play_sound);
    j.at("actions").get_to(state.actions);
}

} // namespace shuttle::core
