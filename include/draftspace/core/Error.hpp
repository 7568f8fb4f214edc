#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace DS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        MalformedInput,
        InvalidParameter,
        InvalidTimeFormat,
        UnknownEffectName,
        PathTraversal,
        NotFound,
        UnknownFolder,
        TrackNotFound,
        NoCompatibleTrack,
        DuplicateId,
        AlreadyExists,
        SerializationFailed
    };

    // Coarse grouping surfaced to callers; several codes share one category.
    enum class Category {
        Validation,
        NotFound,
        PathSecurity,
        Conflict,
        Internal
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidParameter:
        return "invalid_parameter";
    case Error::Code::InvalidTimeFormat:
        return "invalid_time_format";
    case Error::Code::UnknownEffectName:
        return "unknown_effect_name";
    case Error::Code::PathTraversal:
        return "path_traversal";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::UnknownFolder:
        return "unknown_folder";
    case Error::Code::TrackNotFound:
        return "track_not_found";
    case Error::Code::NoCompatibleTrack:
        return "no_compatible_track";
    case Error::Code::DuplicateId:
        return "duplicate_id";
    case Error::Code::AlreadyExists:
        return "already_exists";
    case Error::Code::SerializationFailed:
        return "serialization_failed";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto errorCategory(Error::Code code) -> Error::Category {
    switch (code) {
    case Error::Code::MalformedInput:
    case Error::Code::InvalidParameter:
    case Error::Code::InvalidTimeFormat:
    case Error::Code::UnknownEffectName:
        return Error::Category::Validation;
    case Error::Code::NotFound:
    case Error::Code::UnknownFolder:
    case Error::Code::TrackNotFound:
    case Error::Code::NoCompatibleTrack:
        return Error::Category::NotFound;
    case Error::Code::PathTraversal:
        return Error::Category::PathSecurity;
    case Error::Code::DuplicateId:
    case Error::Code::AlreadyExists:
        return Error::Category::Conflict;
    case Error::Code::InvalidError:
    case Error::Code::UnknownError:
    case Error::Code::SerializationFailed:
        return Error::Category::Internal;
    }
    return Error::Category::Internal;
}

[[nodiscard]] inline auto errorCategoryToString(Error::Category category) -> std::string_view {
    switch (category) {
    case Error::Category::Validation:
        return "validation";
    case Error::Category::NotFound:
        return "not_found";
    case Error::Category::PathSecurity:
        return "path_security";
    case Error::Category::Conflict:
        return "conflict";
    case Error::Category::Internal:
        return "internal";
    }
    return "internal";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace DS
