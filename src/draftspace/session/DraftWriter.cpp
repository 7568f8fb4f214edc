#include <draftspace/session/DraftWriter.hpp>

#include <draftspace/draft/Draft.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace DS {

namespace {

auto write_failure(std::string message) -> Error {
    return Error{Error::Code::SerializationFailed, std::move(message)};
}

auto fsync_directory(std::filesystem::path const& directory) -> Expected<void> {
    int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(write_failure("Failed to open directory for fsync"));
    }
    auto const rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        return std::unexpected(write_failure("Failed to fsync directory"));
    }
    return {};
}

auto write_text_file_atomic(std::filesystem::path const& path, std::string const& text) -> Expected<void> {
    std::error_code ec;
    auto            parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(write_failure("Failed to create directories for " + path.string()));
        }
    }

    auto tmpPath = path;
    tmpPath += ".tmp";

    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        return std::unexpected(write_failure("Failed to open temp file " + tmpPath.string()));
    }

    std::size_t totalWritten = 0;
    while (totalWritten < text.size()) {
        auto written = ::write(fd, text.data() + totalWritten, text.size() - totalWritten);
        if (written <= 0) {
            ::close(fd);
            std::filesystem::remove(tmpPath, ec);
            return std::unexpected(write_failure("Failed to write temp file " + tmpPath.string()));
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (::fsync(fd) != 0) {
        ::close(fd);
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(write_failure("Failed to fsync temp file " + tmpPath.string()));
    }
    if (::close(fd) != 0) {
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(write_failure("Failed to close temp file " + tmpPath.string()));
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(write_failure("Failed to rename temp file onto " + path.string()));
    }

    if (!parent.empty()) {
        return fsync_directory(parent);
    }
    return {};
}

} // namespace

auto JsonDraftWriter::Render(Draft const& draft) -> std::string {
    auto text = DraftToJson(draft).dump(2);
    text.push_back('\n');
    return text;
}

auto DraftWriter::write(std::filesystem::path const& folder, Draft const& draft) -> Expected<std::filesystem::path> {
    return write_rendered(folder, draft.name(), render(draft));
}

auto JsonDraftWriter::render(Draft const& draft) const -> std::string {
    return Render(draft);
}

auto JsonDraftWriter::write_rendered(std::filesystem::path const& folder,
                                     std::string_view            draft_name,
                                     std::string const&          content) -> Expected<std::filesystem::path> {
    auto target = folder / std::string{draft_name} / std::string{kContentFileName};
    if (auto written = write_text_file_atomic(target, content); !written) {
        return std::unexpected(written.error());
    }
    ds_log("Wrote " + target.string(), "Writer");
    return target;
}

auto JsonDraftWriter::list_saved(std::filesystem::path const& folder) const -> Expected<std::vector<std::string>> {
    std::error_code ec;
    std::filesystem::directory_iterator it(folder, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::NotFound, "Folder not found: " + folder.string()});
    }

    std::vector<std::string> names;
    for (auto end = std::filesystem::directory_iterator{}; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(write_failure("Failed to enumerate " + folder.string() + ": " + ec.message()));
        }
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec)) {
            continue;
        }
        if (std::filesystem::is_regular_file(it->path() / std::string{kContentFileName}, entry_ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        return std::unexpected(write_failure("Failed to enumerate " + folder.string() + ": " + ec.message()));
    }
    std::sort(names.begin(), names.end());
    return names;
}

auto JsonDraftWriter::exists(std::filesystem::path const& folder, std::string_view draft_name) const -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(folder / std::string{draft_name} / std::string{kContentFileName}, ec);
}

} // namespace DS
