#include <draftspace/draft/Draft.hpp>

#include <algorithm>
#include <array>
#include <type_traits>
#include <utility>

namespace DS {

using json = nlohmann::json;

namespace {

struct TrackTypeInfo {
    TrackType   type;
    char const* name;
    int         render_rank;
    int         render_base;
};

constexpr std::array<TrackTypeInfo, 5> kTrackTypes{{
    {TrackType::Audio, "audio", 1, 0},
    {TrackType::Video, "video", 0, 0},
    {TrackType::Text, "text", 4, 15000},
    {TrackType::Effect, "effect", 2, 10000},
    {TrackType::Filter, "filter", 3, 11000},
}};

auto info_for(TrackType type) -> TrackTypeInfo const& {
    for (auto const& info : kTrackTypes) {
        if (info.type == type) {
            return info;
        }
    }
    return kTrackTypes[1];
}

auto effect_json(EffectRef const& ref) -> json {
    return json{{"name", ref.name}, {"id", ref.id}};
}

auto micros(std::chrono::microseconds value) -> std::int64_t {
    return value.count();
}

auto out_of_index_range() -> Error {
    return Error{Error::Code::InvalidParameter,
                 "relative_index must be within 0-" + std::to_string(kMaxRelativeIndex)};
}

} // namespace

auto trackTypeName(TrackType type) -> std::string_view {
    return info_for(type).name;
}

auto parseTrackType(std::string_view name) -> std::optional<TrackType> {
    for (auto const& info : kTrackTypes) {
        if (name == info.name) {
            return info.type;
        }
    }
    return std::nullopt;
}

auto trackRenderBase(TrackType type) -> int {
    return info_for(type).render_base;
}

auto segmentKindName(SegmentKind kind) -> std::string_view {
    switch (kind) {
    case SegmentKind::Audio:
        return "audio";
    case SegmentKind::Video:
        return "video";
    case SegmentKind::Sticker:
        return "sticker";
    case SegmentKind::Text:
        return "text";
    }
    return "video";
}

auto trackTypeFor(SegmentKind kind) -> TrackType {
    switch (kind) {
    case SegmentKind::Audio:
        return TrackType::Audio;
    case SegmentKind::Video:
    case SegmentKind::Sticker:
        return TrackType::Video;
    case SegmentKind::Text:
        return TrackType::Text;
    }
    return TrackType::Video;
}

auto ValidateDraftName(std::string_view name) -> Expected<void> {
    if (name.empty()) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "draft name must not be empty"});
    }
    if (name.size() > 255) {
        return std::unexpected(Error{Error::Code::InvalidParameter, "draft name must be at most 255 bytes"});
    }
    if (name == "." || name.find("..") != std::string_view::npos
        || name.find_first_of(std::string_view{"/\\\0", 3}) != std::string_view::npos) {
        return std::unexpected(Error{Error::Code::InvalidParameter,
                                     "draft name '" + std::string{name}
                                         + "' must not contain path separators or '..'"});
    }
    return {};
}

auto ValidateCanvasSize(int width, int height) -> Expected<void> {
    if (width < 1 || width > kMaxCanvasDimension || height < 1 || height > kMaxCanvasDimension) {
        return std::unexpected(Error{Error::Code::InvalidParameter,
                                     "width and height must be within 1-"
                                         + std::to_string(kMaxCanvasDimension)});
    }
    return {};
}

Draft::Draft(std::string name, std::string folder_id, int width, int height)
    : name_(std::move(name))
    , folder_id_(std::move(folder_id))
    , width_(width)
    , height_(height) {}

auto Draft::add_track(TrackSpec spec) -> Expected<TrackSummary> {
    std::string track_name;
    if (spec.name) {
        if (spec.name->empty()) {
            return std::unexpected(Error{Error::Code::InvalidParameter, "track name must not be empty"});
        }
        if (find_track(*spec.name) != nullptr) {
            return std::unexpected(Error{Error::Code::AlreadyExists,
                                         "track '" + *spec.name + "' already exists in draft '" + name_ + "'"});
        }
        track_name = *spec.name;
    } else {
        track_name = default_track_name(spec.type);
    }

    int index = 0;
    if (spec.relative_index) {
        if (*spec.relative_index < 0 || *spec.relative_index > kMaxRelativeIndex) {
            return std::unexpected(out_of_index_range());
        }
        index = *spec.relative_index;
        if (auto shifted = shift_relative_indices(spec.type, index); !shifted) {
            return std::unexpected(shifted.error());
        }
    } else {
        for (auto const& track : tracks_) {
            if (track.type == spec.type) {
                index = std::max(index, track.relative_index + 1);
            }
        }
        if (index > kMaxRelativeIndex) {
            return std::unexpected(out_of_index_range());
        }
    }

    Track track;
    track.type           = spec.type;
    track.name           = std::move(track_name);
    track.relative_index = index;
    tracks_.push_back(std::move(track));
    ++revision_;

    auto const& added = tracks_.back();
    return TrackSummary{added.name, added.type, added.relative_index, added.render_index(), 0};
}

auto Draft::resolve_track(SegmentKind kind, std::optional<std::string_view> track_name) -> Expected<Track*> {
    auto const wanted = trackTypeFor(kind);
    if (track_name) {
        auto* track = find_track_mutable(*track_name);
        if (track == nullptr) {
            return std::unexpected(Error{Error::Code::TrackNotFound,
                                         "Track '" + std::string{*track_name} + "' not found in draft '"
                                             + name_ + "'"});
        }
        if (track->type != wanted) {
            return std::unexpected(Error{Error::Code::InvalidParameter,
                                         "track '" + track->name + "' is a "
                                             + std::string{trackTypeName(track->type)}
                                             + " track and cannot hold "
                                             + std::string{segmentKindName(kind)} + " segments"});
        }
        return track;
    }

    for (auto const* candidate : ordered_tracks()) {
        if (candidate->type == wanted) {
            return find_track_mutable(candidate->name);
        }
    }
    return std::unexpected(Error{Error::Code::NoCompatibleTrack,
                                 "draft '" + name_ + "' has no "
                                     + std::string{trackTypeName(wanted)} + " track for "
                                     + std::string{segmentKindName(kind)} + " segments"});
}

auto Draft::append_segment(Track& track, Segment segment) -> Segment const& {
    segment.id = next_segment_id_++;
    track.segments.push_back(std::move(segment));
    ++revision_;
    return track.segments.back();
}

auto Draft::find_track(std::string_view track_name) const -> Track const* {
    auto it = std::find_if(tracks_.begin(), tracks_.end(), [&](Track const& track) {
        return track.name == track_name;
    });
    return it == tracks_.end() ? nullptr : &*it;
}

auto Draft::find_track_mutable(std::string_view track_name) -> Track* {
    auto it = std::find_if(tracks_.begin(), tracks_.end(), [&](Track const& track) {
        return track.name == track_name;
    });
    return it == tracks_.end() ? nullptr : &*it;
}

auto Draft::ordered_tracks() const -> std::vector<Track const*> {
    std::vector<Track const*> ordered;
    ordered.reserve(tracks_.size());
    for (auto const& track : tracks_) {
        ordered.push_back(&track);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](Track const* lhs, Track const* rhs) {
        auto const lhs_rank = info_for(lhs->type).render_rank;
        auto const rhs_rank = info_for(rhs->type).render_rank;
        if (lhs_rank != rhs_rank) {
            return lhs_rank < rhs_rank;
        }
        return lhs->relative_index < rhs->relative_index;
    });
    return ordered;
}

auto Draft::segment_count() const -> std::size_t {
    std::size_t count = 0;
    for (auto const& track : tracks_) {
        count += track.segments.size();
    }
    return count;
}

auto Draft::default_track_name(TrackType type) const -> std::string {
    std::string base{trackTypeName(type)};
    if (find_track(base) == nullptr) {
        return base;
    }
    for (int suffix = 2;; ++suffix) {
        auto candidate = base + "_" + std::to_string(suffix);
        if (find_track(candidate) == nullptr) {
            return candidate;
        }
    }
}

auto Draft::shift_relative_indices(TrackType type, int from) -> Expected<void> {
    auto occupied = [&](int index) {
        return std::any_of(tracks_.begin(), tracks_.end(), [&](Track const& track) {
            return track.type == type && track.relative_index == index;
        });
    };
    int end = from;
    while (end <= kMaxRelativeIndex && occupied(end)) {
        ++end;
    }
    if (end > kMaxRelativeIndex) {
        return std::unexpected(out_of_index_range());
    }
    for (auto& track : tracks_) {
        if (track.type == type && track.relative_index >= from && track.relative_index < end) {
            ++track.relative_index;
        }
    }
    return {};
}

auto SummarizeDraft(Draft const& draft) -> DraftSummary {
    DraftSummary summary;
    summary.name           = draft.name();
    summary.folder_id      = draft.folder_id();
    summary.width          = draft.width();
    summary.height         = draft.height();
    summary.revision       = draft.revision();
    summary.saved_revision = draft.saved_revision();
    for (auto const* track : draft.ordered_tracks()) {
        summary.tracks.push_back(TrackSummary{track->name,
                                              track->type,
                                              track->relative_index,
                                              track->render_index(),
                                              track->segments.size()});
    }
    return summary;
}

auto SegmentToJson(Segment const& segment) -> json {
    json out{{"id", segment.id}, {"kind", segmentKindName(segment.kind)}};
    if (!segment.material_path.empty()) {
        out["material_path"] = segment.material_path;
    }
    json timerange{{"start", micros(segment.range.start)}};
    timerange["duration"] = segment.range.duration ? json(micros(*segment.range.duration)) : json(nullptr);
    out["target_timerange"] = std::move(timerange);

    std::visit(
        [&](auto const& payload) {
            using Payload = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<Payload, AudioPayload>) {
                out["volume"] = payload.volume;
                if (payload.fade_in) {
                    out["fade_in"] = micros(*payload.fade_in);
                }
                if (payload.fade_out) {
                    out["fade_out"] = micros(*payload.fade_out);
                }
            } else if constexpr (std::is_same_v<Payload, VideoPayload>) {
                if (payload.intro_animation) {
                    out["intro_animation"] = effect_json(*payload.intro_animation);
                }
                if (payload.transition) {
                    out["transition"] = effect_json(*payload.transition);
                }
                if (payload.alpha) {
                    out["alpha"] = *payload.alpha;
                }
                if (payload.scale) {
                    out["scale"] = *payload.scale;
                }
            } else if constexpr (std::is_same_v<Payload, StickerPayload>) {
                if (payload.background_blur) {
                    out["background_blur"] = *payload.background_blur;
                }
            } else {
                out["text"] = payload.text;
                if (payload.font) {
                    out["font"] = effect_json(*payload.font);
                }
                if (payload.size || payload.color) {
                    json style = json::object();
                    if (payload.size) {
                        style["size"] = *payload.size;
                    }
                    if (payload.color) {
                        style["color"] = *payload.color;
                    }
                    out["style"] = std::move(style);
                }
                if (payload.transform_y) {
                    out["transform_y"] = *payload.transform_y;
                }
                if (payload.animation) {
                    out["animation"] = effect_json(*payload.animation);
                }
                if (payload.bubble) {
                    out["bubble"] = json{{"category_id", payload.bubble->category_id},
                                         {"resource_id", payload.bubble->resource_id}};
                }
                if (payload.effect_resource_id) {
                    out["effect_resource_id"] = *payload.effect_resource_id;
                }
            }
        },
        segment.payload);
    return out;
}

auto DraftToJson(Draft const& draft) -> json {
    json tracks = json::array();
    for (auto const* track : draft.ordered_tracks()) {
        json segments = json::array();
        for (auto const& segment : track->segments) {
            segments.push_back(SegmentToJson(segment));
        }
        tracks.push_back(json{{"name", track->name},
                              {"type", trackTypeName(track->type)},
                              {"relative_index", track->relative_index},
                              {"render_index", track->render_index()},
                              {"segments", std::move(segments)}});
    }
    return json{{"name", draft.name()},
                {"folder_id", draft.folder_id()},
                {"canvas", json{{"width", draft.width()}, {"height", draft.height()}}},
                {"revision", draft.revision()},
                {"tracks", std::move(tracks)}};
}

auto SummaryToJson(DraftSummary const& summary) -> json {
    json tracks = json::array();
    for (auto const& track : summary.tracks) {
        tracks.push_back(json{{"name", track.name},
                              {"type", trackTypeName(track.type)},
                              {"relative_index", track.relative_index},
                              {"render_index", track.render_index},
                              {"segment_count", track.segment_count}});
    }
    return json{{"name", summary.name},
                {"folder_id", summary.folder_id},
                {"width", summary.width},
                {"height", summary.height},
                {"revision", summary.revision},
                {"saved_revision", summary.saved_revision},
                {"unsaved_changes", summary.revision != summary.saved_revision},
                {"tracks", std::move(tracks)}};
}

} // namespace DS
