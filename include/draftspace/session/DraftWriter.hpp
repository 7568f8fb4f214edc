#pragma once

#include <draftspace/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace DS {

class Draft;

/**
 * Persists drafts into a registered folder.
 *
 * Implementations must make each write atomic: a reader either sees the
 * previous artifact or the new one, never a partial file.
 */
class DraftWriter {
public:
    virtual ~DraftWriter() = default;

    // Serializes the draft. Runs with the draft locked, so it must not touch disk.
    virtual auto render(Draft const& draft) const -> std::string = 0;

    // Persists text produced by render(). Returns the path of the written artifact.
    virtual auto write_rendered(std::filesystem::path const& folder,
                                std::string_view            draft_name,
                                std::string const&          content) -> Expected<std::filesystem::path> = 0;

    auto write(std::filesystem::path const& folder, Draft const& draft) -> Expected<std::filesystem::path>;

    // Names of drafts already persisted under `folder`, sorted.
    virtual auto list_saved(std::filesystem::path const& folder) const -> Expected<std::vector<std::string>> = 0;

    virtual auto exists(std::filesystem::path const& folder, std::string_view draft_name) const -> bool = 0;
};

/**
 * Writes `<folder>/<draft>/draft_content.json` through a temporary file and a
 * rename. Output is pretty-printed with sorted keys and no timestamps, so an
 * unchanged draft always produces identical bytes.
 */
class JsonDraftWriter final : public DraftWriter {
public:
    static constexpr std::string_view kContentFileName = "draft_content.json";

    auto render(Draft const& draft) const -> std::string override;
    auto write_rendered(std::filesystem::path const& folder,
                        std::string_view            draft_name,
                        std::string const&          content) -> Expected<std::filesystem::path> override;
    auto list_saved(std::filesystem::path const& folder) const -> Expected<std::vector<std::string>> override;
    auto exists(std::filesystem::path const& folder, std::string_view draft_name) const -> bool override;

    static auto Render(Draft const& draft) -> std::string;
};

} // namespace DS
