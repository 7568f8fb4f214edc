#include <draftspace/registry/DraftRegistry.hpp>

#include "log/TaggedLogger.hpp"

namespace DS {

auto DraftRegistry::register_folder(std::string id, std::filesystem::path path) -> Expected<void> {
    if (id.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "folder id must not be empty"});
    }
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (folders_.contains(id)) {
        return std::unexpected(Error{Error::Code::DuplicateId, "Folder '" + id + "' is already registered"});
    }
    ds_log("Registering folder " + id + " -> " + path.string(), "Registry");
    FolderHandle handle{id, std::move(path)};
    folders_.emplace(std::move(id), std::move(handle));
    return {};
}

auto DraftRegistry::unregister_folder(std::string_view id) -> Expected<void> {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    auto it = folders_.find(id);
    if (it == folders_.end()) {
        return std::unexpected(Error{Error::Code::UnknownFolder, "Folder '" + std::string{id} + "' not found"});
    }
    folders_.erase(it);
    return {};
}

auto DraftRegistry::folder(std::string_view id) const -> Expected<FolderHandle> {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    auto it = folders_.find(id);
    if (it == folders_.end()) {
        return std::unexpected(Error{Error::Code::UnknownFolder, "Folder '" + std::string{id} + "' not found"});
    }
    return it->second;
}

auto DraftRegistry::folder_ids() const -> std::vector<std::string> {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    std::vector<std::string> ids;
    ids.reserve(folders_.size());
    for (auto const& entry : folders_) {
        ids.push_back(entry.first);
    }
    return ids;
}

auto DraftRegistry::create_draft(CreateDraftParams params) -> Expected<DraftSummary> {
    if (auto valid = ValidateDraftName(params.name); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = ValidateCanvasSize(params.width, params.height); !valid) {
        return std::unexpected(valid.error());
    }

    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (!folders_.contains(params.folder_id)) {
        return std::unexpected(
            Error{Error::Code::UnknownFolder, "Folder '" + params.folder_id + "' not found"});
    }

    auto existing = drafts_.find(params.name);
    if (existing != drafts_.end()) {
        if (!params.allow_replace) {
            return std::unexpected(
                Error{Error::Code::AlreadyExists, "Draft '" + params.name + "' already exists"});
        }
        ds_log("Replacing draft " + params.name, "Registry");
        existing->second = Draft{params.name, params.folder_id, params.width, params.height};
        return SummarizeDraft(existing->second);
    }

    ds_log("Creating draft " + params.name, "Registry");
    auto name = params.name;
    auto it = drafts_.emplace(std::move(name), Draft{params.name, params.folder_id, params.width, params.height})
                .first;
    return SummarizeDraft(it->second);
}

auto DraftRegistry::close_draft(std::string_view name) -> Expected<void> {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    auto it = drafts_.find(name);
    if (it == drafts_.end()) {
        return std::unexpected(missing_draft(name));
    }
    ds_log("Closing draft " + it->first, "Registry");
    drafts_.erase(it);
    return {};
}

auto DraftRegistry::list_drafts(std::string_view folder_id) const -> Expected<std::vector<std::string>> {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    if (folders_.find(folder_id) == folders_.end()) {
        return std::unexpected(
            Error{Error::Code::UnknownFolder, "Folder '" + std::string{folder_id} + "' not found"});
    }
    std::vector<std::string> names;
    for (auto const& [name, draft] : drafts_) {
        if (draft.folder_id() == folder_id) {
            names.push_back(name);
        }
    }
    return names;
}

auto DraftRegistry::draft_summary(std::string_view name) const -> Expected<DraftSummary> {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    auto it = drafts_.find(name);
    if (it == drafts_.end()) {
        return std::unexpected(missing_draft(name));
    }
    return SummarizeDraft(it->second);
}

auto DraftRegistry::contains_draft(std::string_view name) const -> bool {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return drafts_.find(name) != drafts_.end();
}

auto DraftRegistry::draft_count() const -> std::size_t {
    std::lock_guard<std::recursive_mutex> lk(mutex_);
    return drafts_.size();
}

auto DraftRegistry::missing_draft(std::string_view name) const -> Error {
    return Error{Error::Code::NotFound, "Draft '" + std::string{name} + "' not found"};
}

} // namespace DS
