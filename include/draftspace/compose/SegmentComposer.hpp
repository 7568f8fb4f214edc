#pragma once

#include <draftspace/catalog/EffectCatalog.hpp>
#include <draftspace/core/Error.hpp>
#include <draftspace/core/TimeRange.hpp>
#include <draftspace/draft/Draft.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DS {

class DraftRegistry;

// Every optional field is tri-state: absent, or present with a value (which may be zero).
struct AudioSegmentRequest {
    std::string                material_path;
    std::optional<std::string> start_time;
    std::optional<std::string> duration;
    std::optional<std::string> track_name;
    std::optional<double>      volume;
    std::optional<std::string> fade_in;
    std::optional<std::string> fade_out;
};

struct VideoSegmentRequest {
    std::string                material_path;
    std::optional<std::string> start_time;
    std::optional<std::string> duration;
    std::optional<std::string> track_name;
    std::optional<std::string> animation_type;
    std::optional<std::string> transition_type;
    std::optional<double>      alpha;
    std::optional<double>      scale;
};

struct StickerSegmentRequest {
    std::string                material_path;
    std::optional<std::string> start_time;
    std::optional<std::string> duration;
    std::optional<std::string> track_name;
    std::optional<double>      background_blur;
};

struct TextSegmentRequest {
    std::string                        text;
    std::optional<std::string>         start_time;
    std::optional<std::string>         duration;
    std::optional<std::string>         track_name;
    std::optional<std::string>         font;
    std::optional<double>              size;
    std::optional<std::vector<double>> color;
    std::optional<double>              transform_y;
    std::optional<std::string>         animation_type;
    std::optional<std::string>         bubble_category_id;
    std::optional<std::string>         bubble_resource_id;
    std::optional<std::string>         effect_resource_id;
};

struct SegmentReceipt {
    std::string   draft_name;
    std::string   track_name;
    std::uint64_t segment_id{0};
    TimeRange     range;
    std::uint64_t revision{0};
};

/**
 * Turns segment requests into committed segments.
 *
 * Each call validates the whole request first (material path, times, numeric
 * ranges, catalog names) without holding any lock, then takes the registry
 * lock once to resolve the track and append. A failed call leaves the draft
 * unchanged.
 */
class SegmentComposer {
public:
    SegmentComposer(DraftRegistry& registry, EffectCatalog const& catalog);

    auto add_audio(std::string_view draft_name, AudioSegmentRequest const& request) -> Expected<SegmentReceipt>;
    auto add_video(std::string_view draft_name, VideoSegmentRequest const& request) -> Expected<SegmentReceipt>;
    auto add_sticker(std::string_view draft_name, StickerSegmentRequest const& request) -> Expected<SegmentReceipt>;
    auto add_text(std::string_view draft_name, TextSegmentRequest const& request) -> Expected<SegmentReceipt>;

    // Validation halves, exposed so callers can check a request without committing it.
    auto prepare_audio(AudioSegmentRequest const& request) const -> Expected<Segment>;
    auto prepare_video(VideoSegmentRequest const& request) const -> Expected<Segment>;
    auto prepare_sticker(StickerSegmentRequest const& request) const -> Expected<Segment>;
    auto prepare_text(TextSegmentRequest const& request) const -> Expected<Segment>;

private:
    auto commit(std::string_view                draft_name,
                std::optional<std::string> const& track_name,
                Segment                         segment) -> Expected<SegmentReceipt>;

    DraftRegistry&       registry_;
    EffectCatalog const& catalog_;
};

} // namespace DS
