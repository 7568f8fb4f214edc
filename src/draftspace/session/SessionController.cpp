#include <draftspace/session/SessionController.hpp>

#include <draftspace/path/PathGate.hpp>

#include "log/TaggedLogger.hpp"

#include <filesystem>
#include <utility>

namespace DS {

SessionController::SessionController(DraftRegistry& registry, DraftWriter& writer)
    : registry_(registry)
    , writer_(writer) {}

auto SessionController::register_folder(std::string const& folder_id, std::string_view raw_path)
    -> Expected<FolderHandle> {
    if (folder_id.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "folder_id must not be empty"});
    }
    auto resolved = ResolvePath(raw_path, PathKind::Directory);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    if (auto registered = registry_.register_folder(folder_id, *resolved); !registered) {
        return std::unexpected(registered.error());
    }
    return FolderHandle{folder_id, std::move(*resolved)};
}

auto SessionController::list_drafts(std::string_view folder_id) const -> Expected<std::vector<std::string>> {
    return registry_.list_drafts(folder_id);
}

auto SessionController::list_saved_drafts(std::string_view folder_id) const
    -> Expected<std::vector<std::string>> {
    auto handle = registry_.folder(folder_id);
    if (!handle) {
        return std::unexpected(handle.error());
    }
    return writer_.list_saved(handle->path);
}

auto SessionController::create_draft(CreateDraftParams params) -> Expected<DraftSummary> {
    auto handle = registry_.folder(params.folder_id);
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (auto valid = ValidateDraftName(params.name); !valid) {
        return std::unexpected(valid.error());
    }
    if (!params.allow_replace && writer_.exists(handle->path, params.name)) {
        return std::unexpected(Error{Error::Code::AlreadyExists,
                                     "Draft '" + params.name + "' already exists in folder '"
                                         + params.folder_id + "'"});
    }
    // A replace must not land between a save's write and its mark.
    auto                        lock = save_lock(params.name);
    std::lock_guard<std::mutex> serialized(*lock);
    return registry_.create_draft(std::move(params));
}

auto SessionController::add_track(std::string_view draft_name, TrackRequest const& request)
    -> Expected<TrackSummary> {
    auto type = parseTrackType(request.track_type);
    if (!type) {
        return std::unexpected(Error{Error::Code::InvalidParameter,
                                     "Invalid track type: " + request.track_type
                                         + " (expected audio, video, text, effect or filter)"});
    }
    TrackSpec spec{*type, request.track_name, request.relative_index};
    return registry_.with_draft(draft_name, [&](Draft& draft) { return draft.add_track(spec); });
}

auto SessionController::save_lock(std::string_view draft_name) -> std::shared_ptr<std::mutex> {
    std::lock_guard<std::mutex> lk(save_locks_mutex_);
    auto it = save_locks_.find(draft_name);
    if (it == save_locks_.end()) {
        it = save_locks_.emplace(std::string{draft_name}, std::make_shared<std::mutex>()).first;
    }
    return it->second;
}

auto SessionController::save_draft(std::string_view draft_name) -> Expected<SaveReceipt> {
    auto                        lock = save_lock(draft_name);
    std::lock_guard<std::mutex> serialized(*lock);

    struct Snapshot {
        std::filesystem::path folder;
        std::string           content;
        std::uint64_t         revision{0};
    };
    auto snapshot = registry_.with_draft(draft_name, [&](Draft& draft) -> Expected<Snapshot> {
        auto handle = registry_.folder(draft.folder_id());
        if (!handle) {
            return std::unexpected(handle.error());
        }
        return Snapshot{handle->path, writer_.render(draft), draft.revision()};
    });
    if (!snapshot) {
        return std::unexpected(snapshot.error());
    }

    // Disk I/O runs without the registry lock; other drafts stay reachable meanwhile.
    auto written = writer_.write_rendered(snapshot->folder, draft_name, snapshot->content);
    if (!written) {
        auto error = written.error();
        if (errorCategory(error.code) != Error::Category::Internal) {
            error = Error{Error::Code::SerializationFailed, describeError(error)};
        }
        ds_log("Saving draft " + std::string{draft_name} + " failed: " + describeError(error), "Session", "ERROR");
        return std::unexpected(std::move(error));
    }

    auto marked = registry_.with_draft(draft_name, [&](Draft& draft) -> Expected<void> {
        draft.mark_saved(snapshot->revision);
        return {};
    });
    if (!marked) {
        return std::unexpected(marked.error());
    }
    return SaveReceipt{std::string{draft_name}, std::move(*written), snapshot->revision};
}

auto SessionController::close_draft(std::string_view draft_name) -> Expected<void> {
    // Waits for an in-flight save so it never marks a draft closed under it.
    auto                        lock = save_lock(draft_name);
    std::lock_guard<std::mutex> serialized(*lock);
    return registry_.close_draft(draft_name);
}

auto SessionController::draft_summary(std::string_view draft_name) const -> Expected<DraftSummary> {
    return registry_.draft_summary(draft_name);
}

auto SessionController::draft_document(std::string_view draft_name) -> Expected<nlohmann::json> {
    return registry_.with_draft(draft_name, [](Draft& draft) -> Expected<nlohmann::json> {
        return DraftToJson(draft);
    });
}

} // namespace DS
