#pragma once

#include <draftspace/core/Error.hpp>

#include <filesystem>
#include <string_view>

namespace DS {

enum class PathKind {
    File,
    Directory
};

/**
 * Syntactic phase of the path gate: true when `raw` contains the parent
 * directory token anywhere, including inside a longer name ("data/..archive").
 */
auto ContainsTraversalToken(std::string_view raw) -> bool;

/**
 * Resolve a caller supplied path before any file operation touches it.
 *
 * 1. Reject empty input or embedded NUL (MalformedInput).
 * 2. Reject any ".." token in the raw text (PathTraversal).
 * 3. Make absolute against the working directory and normalize lexically.
 * 4. Require the result to exist with the expected kind (NotFound).
 *
 * No side effects.
 */
auto ResolvePath(std::string_view raw, PathKind kind) -> Expected<std::filesystem::path>;

} // namespace DS
