#include <draftspace/path/PathGate.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <system_error>

namespace DS {

namespace {

auto kind_label(PathKind kind) -> char const* {
    return kind == PathKind::File ? "File" : "Folder";
}

} // namespace

auto ContainsTraversalToken(std::string_view raw) -> bool {
    return raw.find("..") != std::string_view::npos;
}

auto ResolvePath(std::string_view raw, PathKind kind) -> Expected<std::filesystem::path> {
    namespace fs = std::filesystem;

    if (raw.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "path must not be empty"});
    }
    if (raw.find('\0') != std::string_view::npos) {
        return std::unexpected(Error{Error::Code::MalformedInput, "path must not contain NUL"});
    }
    if (ContainsTraversalToken(raw)) {
        ds_log("Rejected traversal token in path: " + std::string{raw}, "PathSecurity", "WARN");
        return std::unexpected(
            Error{Error::Code::PathTraversal, "Invalid path: parent directory references are not allowed"});
    }

    std::error_code ec;
    fs::path        absolute = fs::absolute(fs::path{std::string{raw}}, ec);
    if (ec) {
        return std::unexpected(
            Error{Error::Code::InvalidParameter, "cannot resolve path '" + std::string{raw} + "': " + ec.message()});
    }
    auto resolved = absolute.lexically_normal();
    if (resolved.has_relative_path() && !resolved.has_filename()) {
        resolved = resolved.parent_path();
    }

    auto status = fs::status(resolved, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        return std::unexpected(Error{Error::Code::InvalidParameter,
                                     "cannot inspect path '" + resolved.string() + "': " + ec.message()});
    }
    bool const matches = kind == PathKind::File ? fs::is_regular_file(status) : fs::is_directory(status);
    if (!matches) {
        return std::unexpected(
            Error{Error::Code::NotFound, std::string{kind_label(kind)} + " not found: " + resolved.string()});
    }
    return resolved;
}

} // namespace DS
