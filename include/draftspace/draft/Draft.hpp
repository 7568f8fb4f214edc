#pragma once

#include <draftspace/catalog/EffectCatalog.hpp>
#include <draftspace/core/Error.hpp>
#include <draftspace/core/TimeRange.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace DS {

enum class TrackType {
    Audio,
    Video,
    Text,
    Effect,
    Filter
};

auto trackTypeName(TrackType type) -> std::string_view;
auto parseTrackType(std::string_view name) -> std::optional<TrackType>;
// Base added to relative_index when tracks are stacked for rendering.
auto trackRenderBase(TrackType type) -> int;

enum class SegmentKind {
    Audio,
    Video,
    Sticker,
    Text
};

auto segmentKindName(SegmentKind kind) -> std::string_view;
// Stickers are image/video material and live on video tracks.
auto trackTypeFor(SegmentKind kind) -> TrackType;

struct AudioPayload {
    double                                   volume{1.0};
    std::optional<std::chrono::microseconds> fade_in;
    std::optional<std::chrono::microseconds> fade_out;
};

struct VideoPayload {
    std::optional<EffectRef> intro_animation;
    std::optional<EffectRef> transition;
    std::optional<double>    alpha;
    std::optional<double>    scale;
};

struct StickerPayload {
    std::optional<double> background_blur;
};

struct TextBubble {
    std::string category_id;
    std::string resource_id;
};

struct TextPayload {
    std::string                          text;
    std::optional<EffectRef>             font;
    std::optional<double>                size;
    std::optional<std::array<double, 3>> color;
    std::optional<double>                transform_y;
    std::optional<EffectRef>             animation;
    std::optional<TextBubble>            bubble;
    std::optional<std::string>           effect_resource_id;
};

using SegmentPayload = std::variant<AudioPayload, VideoPayload, StickerPayload, TextPayload>;

struct Segment {
    std::uint64_t  id{0};
    SegmentKind    kind{SegmentKind::Audio};
    std::string    material_path;
    TimeRange      range;
    SegmentPayload payload;
};

struct Track {
    TrackType            type{TrackType::Video};
    std::string          name;
    int                  relative_index{0};
    std::vector<Segment> segments;

    auto render_index() const -> int { return trackRenderBase(type) + relative_index; }
};

struct TrackSpec {
    TrackType                  type{TrackType::Video};
    std::optional<std::string> name;
    std::optional<int>         relative_index;
};

struct TrackSummary {
    std::string name;
    TrackType   type{TrackType::Video};
    int         relative_index{0};
    int         render_index{0};
    std::size_t segment_count{0};
};

struct DraftSummary {
    std::string               name;
    std::string               folder_id;
    int                       width{0};
    int                       height{0};
    std::uint64_t             revision{0};
    std::uint64_t             saved_revision{0};
    std::vector<TrackSummary> tracks;
};

inline constexpr int kMaxCanvasDimension = 16384;
// Keeps every type's render indices below the next type's base (effect 10000, filter 11000).
inline constexpr int kMaxRelativeIndex = 999;

auto ValidateDraftName(std::string_view name) -> Expected<void>;
auto ValidateCanvasSize(int width, int height) -> Expected<void>;

/**
 * In-memory timeline: tracks in insertion order, each with its segments.
 *
 * A Draft is only ever touched through DraftRegistry::with_draft, which holds
 * the registry lock; the class itself does no locking. Every mutation bumps
 * revision(); mark_saved() records the revision that was last persisted.
 */
class Draft {
public:
    Draft(std::string name, std::string folder_id, int width, int height);

    auto name() const -> std::string const& { return name_; }
    auto folder_id() const -> std::string const& { return folder_id_; }
    auto width() const -> int { return width_; }
    auto height() const -> int { return height_; }
    auto revision() const -> std::uint64_t { return revision_; }
    auto saved_revision() const -> std::uint64_t { return saved_revision_; }
    auto has_unsaved_changes() const -> bool { return revision_ != saved_revision_; }
    auto tracks() const -> std::vector<Track> const& { return tracks_; }

    /**
     * Add a track.
     *
     * - Omitted name: the type name ("video"), then "video_2", "video_3", ...
     * - Explicit name already used in this draft: AlreadyExists.
     * - Omitted relative_index: one past the highest index of that type.
     * - Explicit relative_index already taken by a track of the same type: the
     *   new track takes it and the previous holder moves up by one, cascading
     *   until indices are unique again (last insert wins).
     * - Indices live in [0, kMaxRelativeIndex]; an explicit index outside it, or
     *   a default or cascade that would leave it, is InvalidParameter and the
     *   draft is unchanged.
     */
    auto add_track(TrackSpec spec) -> Expected<TrackSummary>;

    /**
     * Pick the track a segment of `kind` goes to.
     *
     * With a name: TrackNotFound if absent, InvalidParameter if the track type
     * cannot hold the segment. Without: the first compatible track in render
     * order, or NoCompatibleTrack.
     */
    auto resolve_track(SegmentKind kind, std::optional<std::string_view> track_name) -> Expected<Track*>;

    // Assigns the segment id; the track must belong to this draft.
    auto append_segment(Track& track, Segment segment) -> Segment const&;

    auto find_track(std::string_view track_name) const -> Track const*;
    auto ordered_tracks() const -> std::vector<Track const*>;
    auto segment_count() const -> std::size_t;

    void mark_saved() { saved_revision_ = revision_; }
    // Records a save of an earlier snapshot; never moves past the current revision.
    void mark_saved(std::uint64_t revision) { saved_revision_ = std::min(revision, revision_); }

private:
    auto find_track_mutable(std::string_view track_name) -> Track*;
    auto default_track_name(TrackType type) const -> std::string;
    auto shift_relative_indices(TrackType type, int from) -> Expected<void>;

    std::string        name_;
    std::string        folder_id_;
    int                width_{0};
    int                height_{0};
    std::vector<Track> tracks_;
    std::uint64_t      next_segment_id_{1};
    std::uint64_t      revision_{0};
    std::uint64_t      saved_revision_{0};
};

auto SummarizeDraft(Draft const& draft) -> DraftSummary;

// Deterministic document: same draft state always renders the same bytes.
auto DraftToJson(Draft const& draft) -> nlohmann::json;
auto SegmentToJson(Segment const& segment) -> nlohmann::json;
auto SummaryToJson(DraftSummary const& summary) -> nlohmann::json;

} // namespace DS
