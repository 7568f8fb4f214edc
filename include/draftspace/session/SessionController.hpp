#pragma once

#include <draftspace/core/Error.hpp>
#include <draftspace/draft/Draft.hpp>
#include <draftspace/registry/DraftRegistry.hpp>
#include <draftspace/session/DraftWriter.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DS {

struct TrackRequest {
    std::string                track_type;
    std::optional<std::string> track_name;
    std::optional<int>         relative_index;
};

struct SaveReceipt {
    std::string           draft_name;
    std::filesystem::path path;
    std::uint64_t         revision{0};
};

/**
 * Orchestrates folder and draft lifecycle on top of DraftRegistry.
 *
 * Folder paths go through the path gate before registration. Saving renders
 * the draft while the registry lock is held, so the persisted artifact always
 * matches one consistent in-memory state, then writes it after releasing the
 * lock. Saves and closes of one draft name are serialized by a per-name mutex.
 */
class SessionController {
public:
    SessionController(DraftRegistry& registry, DraftWriter& writer);

    auto register_folder(std::string const& folder_id, std::string_view raw_path) -> Expected<FolderHandle>;
    auto list_drafts(std::string_view folder_id) const -> Expected<std::vector<std::string>>;
    auto list_saved_drafts(std::string_view folder_id) const -> Expected<std::vector<std::string>>;

    /**
     * Create a draft. Besides the registry checks, a draft already saved in the
     * folder under the same name counts as taken unless allow_replace is set.
     */
    auto create_draft(CreateDraftParams params) -> Expected<DraftSummary>;

    auto add_track(std::string_view draft_name, TrackRequest const& request) -> Expected<TrackSummary>;

    /**
     * Persist the draft's current state. Two saves with no mutation in between
     * produce identical artifacts. Writer failures are reported as
     * SerializationFailed.
     */
    auto save_draft(std::string_view draft_name) -> Expected<SaveReceipt>;

    auto close_draft(std::string_view draft_name) -> Expected<void>;
    auto draft_summary(std::string_view draft_name) const -> Expected<DraftSummary>;
    auto draft_document(std::string_view draft_name) -> Expected<nlohmann::json>;

private:
    auto save_lock(std::string_view draft_name) -> std::shared_ptr<std::mutex>;

    DraftRegistry& registry_;
    DraftWriter&   writer_;

    std::mutex                                                        save_locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>, std::less<>> save_locks_;
};

} // namespace DS
