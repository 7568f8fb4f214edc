#pragma once

#include <draftspace/core/Error.hpp>
#include <draftspace/draft/Draft.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace DS {

struct FolderHandle {
    std::string           id;
    std::filesystem::path path;
};

struct CreateDraftParams {
    std::string folder_id;
    std::string name;
    int         width{1920};
    int         height{1080};
    bool        allow_replace{false};
};

/**
 * @brief Volatile store of registered folders and live drafts.
 *
 * Purpose:
 * - Own every Folder Handle and Draft for the lifetime of the process. Nothing
 *   is persisted; DraftWriter does that on request.
 * - Serialize all access to the two maps through one registry-wide
 *   `std::recursive_mutex`, so concurrent requests never observe a half-built
 *   draft and never lose an update.
 *
 * Ownership:
 * - Live drafts never leave the registry. Readers get value copies
 *   (`folder`, `draft_summary`); writers run a callback under the lock
 *   (`with_draft`). The `Draft&` handed to the callback must not escape it.
 * - The lock is re-entrant so a callback may call back into the registry
 *   (for example `folder()` while saving).
 *
 * Usage:
 *
 *     DraftRegistry registry;
 *     registry.register_folder("main", "/srv/drafts");
 *     registry.create_draft({.folder_id = "main", .name = "d1"});
 *     registry.with_draft("d1", [](Draft& draft) { return draft.add_track({}); });
 */
class DraftRegistry {
public:
    DraftRegistry() = default;

    DraftRegistry(DraftRegistry const&)            = delete;
    DraftRegistry& operator=(DraftRegistry const&) = delete;

    /**
     * Insert a folder handle. Fails with DuplicateId if `id` is present; the
     * existing registration is left untouched.
     */
    auto register_folder(std::string id, std::filesystem::path path) -> Expected<void>;

    /**
     * Remove a folder handle. Drafts created against it stay live.
     */
    auto unregister_folder(std::string_view id) -> Expected<void>;

    auto folder(std::string_view id) const -> Expected<FolderHandle>;
    auto folder_ids() const -> std::vector<std::string>;

    /**
     * Create (or, with allow_replace, atomically replace) a draft with an empty
     * track list.
     *
     * Errors: UnknownFolder, InvalidParameter (name or canvas size),
     * AlreadyExists when the name is taken and replace is not allowed.
     */
    auto create_draft(CreateDraftParams params) -> Expected<DraftSummary>;

    /**
     * Remove a live draft. NotFound if absent. Never touches the filesystem.
     */
    auto close_draft(std::string_view name) -> Expected<void>;

    /**
     * Names of live drafts created against `folder_id`, sorted. UnknownFolder if
     * the folder is not registered.
     */
    auto list_drafts(std::string_view folder_id) const -> Expected<std::vector<std::string>>;

    auto draft_summary(std::string_view name) const -> Expected<DraftSummary>;
    auto contains_draft(std::string_view name) const -> bool;
    auto draft_count() const -> std::size_t;

    /**
     * Run `fn(Draft&)` with the registry lock held and return what it returns.
     *
     * `fn` must return an Expected<T>; when the draft is missing the result is
     * NotFound and `fn` is not called.
     */
    template <typename Fn>
    auto with_draft(std::string_view name, Fn&& fn) -> std::invoke_result_t<Fn, Draft&>;

private:
    auto missing_draft(std::string_view name) const -> Error;

    mutable std::recursive_mutex                     mutex_;
    std::map<std::string, FolderHandle, std::less<>> folders_;
    std::map<std::string, Draft, std::less<>>        drafts_;
};

template <typename Fn>
auto DraftRegistry::with_draft(std::string_view name, Fn&& fn) -> std::invoke_result_t<Fn, Draft&> {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    auto it = drafts_.find(name);
    if (it == drafts_.end()) {
        return std::unexpected(missing_draft(name));
    }
    return std::forward<Fn>(fn)(it->second);
}

} // namespace DS
