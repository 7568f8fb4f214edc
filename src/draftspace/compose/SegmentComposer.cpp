#include <draftspace/compose/SegmentComposer.hpp>

#include <draftspace/path/PathGate.hpp>
#include <draftspace/registry/DraftRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <cmath>
#include <utility>

namespace DS {

namespace {

enum class Bound {
    Inclusive,
    Exclusive
};

auto invalid(std::string message) -> Error {
    return Error{Error::Code::InvalidParameter, std::move(message)};
}

auto format_bound(double value) -> std::string {
    auto text = std::to_string(value);
    while (text.size() > 1 && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

auto check_range(std::string_view field, double value, double min, double max, Bound lower = Bound::Inclusive)
    -> Expected<void> {
    bool const above_min = lower == Bound::Inclusive ? value >= min : value > min;
    if (!std::isfinite(value) || !above_min || value > max) {
        return std::unexpected(invalid(std::string{field} + " must be within "
                                       + (lower == Bound::Inclusive ? "[" : "(") + format_bound(min) + ", "
                                       + format_bound(max) + "]"));
    }
    return {};
}

auto check_optional_range(std::string_view             field,
                          std::optional<double> const& value,
                          double                       min,
                          double                       max,
                          Bound                        lower = Bound::Inclusive) -> Expected<void> {
    if (!value) {
        return {};
    }
    return check_range(field, *value, min, max, lower);
}

auto resolve_material(std::string const& raw) -> Expected<std::string> {
    auto resolved = ResolvePath(raw, PathKind::File);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    return resolved->string();
}

auto parse_optional_duration(std::string_view field, std::optional<std::string> const& text)
    -> Expected<std::optional<std::chrono::microseconds>> {
    if (!text) {
        return std::optional<std::chrono::microseconds>{};
    }
    auto parsed = ParseDuration(*text);
    if (!parsed) {
        auto error = parsed.error();
        error.message = std::string{field} + ": " + error.message.value_or("invalid duration");
        return std::unexpected(std::move(error));
    }
    return std::optional<std::chrono::microseconds>{*parsed};
}

auto parse_range(std::optional<std::string> const& start, std::optional<std::string> const& duration)
    -> Expected<TimeRange> {
    std::optional<std::string_view> start_view;
    std::optional<std::string_view> duration_view;
    if (start) {
        start_view = *start;
    }
    if (duration) {
        duration_view = *duration;
    }
    return ParseTimeRange(start_view, duration_view);
}

auto lookup_optional(EffectCatalog const&               catalog,
                     CatalogKind                        kind,
                     std::optional<std::string> const& name) -> Expected<std::optional<EffectRef>> {
    if (!name) {
        return std::optional<EffectRef>{};
    }
    auto found = catalog.lookup(kind, *name);
    if (!found) {
        return std::unexpected(found.error());
    }
    return std::optional<EffectRef>{std::move(*found)};
}

// Text animations may come from either text catalog; outro names win on a clash.
auto lookup_text_animation(EffectCatalog const& catalog, std::string const& name) -> Expected<EffectRef> {
    if (auto outro = catalog.lookup(CatalogKind::TextOutroAnimation, name)) {
        return outro;
    }
    if (auto intro = catalog.lookup(CatalogKind::TextIntroAnimation, name)) {
        return intro;
    }
    return std::unexpected(
        Error{Error::Code::UnknownEffectName, "unknown text animation name '" + name + "'"});
}

} // namespace

SegmentComposer::SegmentComposer(DraftRegistry& registry, EffectCatalog const& catalog)
    : registry_(registry)
    , catalog_(catalog) {}

auto SegmentComposer::prepare_audio(AudioSegmentRequest const& request) const -> Expected<Segment> {
    auto material = resolve_material(request.material_path);
    if (!material) {
        return std::unexpected(material.error());
    }
    auto range = parse_range(request.start_time, request.duration);
    if (!range) {
        return std::unexpected(range.error());
    }
    auto fade_in = parse_optional_duration("fade_in", request.fade_in);
    if (!fade_in) {
        return std::unexpected(fade_in.error());
    }
    auto fade_out = parse_optional_duration("fade_out", request.fade_out);
    if (!fade_out) {
        return std::unexpected(fade_out.error());
    }
    if (auto ok = check_optional_range("volume", request.volume, 0.0, 1.0); !ok) {
        return std::unexpected(ok.error());
    }
    if (range->duration) {
        // Compared piecewise; both fades can be near the microsecond limit.
        auto const duration = *range->duration;
        auto const in       = fade_in->value_or(std::chrono::microseconds{0});
        auto const out      = fade_out->value_or(std::chrono::microseconds{0});
        if (in > duration || out > duration - in) {
            return std::unexpected(invalid("fade_in + fade_out must not exceed the segment duration"));
        }
    }

    AudioPayload payload;
    payload.volume   = request.volume.value_or(1.0);
    payload.fade_in  = *fade_in;
    payload.fade_out = *fade_out;
    return Segment{0, SegmentKind::Audio, std::move(*material), *range, std::move(payload)};
}

auto SegmentComposer::prepare_video(VideoSegmentRequest const& request) const -> Expected<Segment> {
    auto material = resolve_material(request.material_path);
    if (!material) {
        return std::unexpected(material.error());
    }
    auto range = parse_range(request.start_time, request.duration);
    if (!range) {
        return std::unexpected(range.error());
    }
    if (auto ok = check_optional_range("alpha", request.alpha, 0.0, 1.0); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_optional_range("scale", request.scale, 0.0, 10.0, Bound::Exclusive); !ok) {
        return std::unexpected(ok.error());
    }
    auto intro = lookup_optional(catalog_, CatalogKind::IntroAnimation, request.animation_type);
    if (!intro) {
        return std::unexpected(intro.error());
    }
    auto transition = lookup_optional(catalog_, CatalogKind::Transition, request.transition_type);
    if (!transition) {
        return std::unexpected(transition.error());
    }

    VideoPayload payload;
    payload.intro_animation = std::move(*intro);
    payload.transition      = std::move(*transition);
    payload.alpha           = request.alpha;
    payload.scale           = request.scale;
    return Segment{0, SegmentKind::Video, std::move(*material), *range, std::move(payload)};
}

auto SegmentComposer::prepare_sticker(StickerSegmentRequest const& request) const -> Expected<Segment> {
    auto material = resolve_material(request.material_path);
    if (!material) {
        return std::unexpected(material.error());
    }
    auto range = parse_range(request.start_time, request.duration);
    if (!range) {
        return std::unexpected(range.error());
    }
    if (auto ok = check_optional_range("background_blur", request.background_blur, 0.0, 1.0); !ok) {
        return std::unexpected(ok.error());
    }

    StickerPayload payload;
    payload.background_blur = request.background_blur;
    return Segment{0, SegmentKind::Sticker, std::move(*material), *range, std::move(payload)};
}

auto SegmentComposer::prepare_text(TextSegmentRequest const& request) const -> Expected<Segment> {
    if (request.text.empty()) {
        return std::unexpected(invalid("text must not be empty"));
    }
    if (!request.duration) {
        return std::unexpected(
            Error{Error::Code::MalformedInput, "duration is required for text segments"});
    }
    auto range = parse_range(request.start_time, request.duration);
    if (!range) {
        return std::unexpected(range.error());
    }

    if (auto ok = check_optional_range("size", request.size, 0.0, 200.0, Bound::Exclusive); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = check_optional_range("transform_y", request.transform_y, -1.0, 1.0); !ok) {
        return std::unexpected(ok.error());
    }
    std::optional<std::array<double, 3>> color;
    if (request.color) {
        if (request.color->size() != 3) {
            return std::unexpected(invalid("Color must be [r, g, b] with values 0.0-1.0"));
        }
        std::array<double, 3> rgb{};
        for (std::size_t i = 0; i < rgb.size(); ++i) {
            if (auto ok = check_range("color component", (*request.color)[i], 0.0, 1.0); !ok) {
                return std::unexpected(ok.error());
            }
            rgb[i] = (*request.color)[i];
        }
        color = rgb;
    }
    if (request.bubble_category_id.has_value() != request.bubble_resource_id.has_value()) {
        return std::unexpected(
            invalid("bubble_category_id and bubble_resource_id must be provided together"));
    }
    if (request.bubble_category_id && (request.bubble_category_id->empty() || request.bubble_resource_id->empty())) {
        return std::unexpected(invalid("bubble identifiers must not be empty"));
    }
    if (request.effect_resource_id && request.effect_resource_id->empty()) {
        return std::unexpected(invalid("effect_resource_id must not be empty"));
    }

    auto font = lookup_optional(catalog_, CatalogKind::Font, request.font);
    if (!font) {
        return std::unexpected(font.error());
    }
    std::optional<EffectRef> animation;
    if (request.animation_type) {
        auto found = lookup_text_animation(catalog_, *request.animation_type);
        if (!found) {
            return std::unexpected(found.error());
        }
        animation = std::move(*found);
    }

    TextPayload payload;
    payload.text        = request.text;
    payload.font        = std::move(*font);
    payload.size        = request.size;
    payload.color       = color;
    payload.transform_y = request.transform_y;
    payload.animation   = std::move(animation);
    if (request.bubble_category_id) {
        payload.bubble = TextBubble{*request.bubble_category_id, *request.bubble_resource_id};
    }
    payload.effect_resource_id = request.effect_resource_id;
    return Segment{0, SegmentKind::Text, std::string{}, *range, std::move(payload)};
}

auto SegmentComposer::add_audio(std::string_view draft_name, AudioSegmentRequest const& request)
    -> Expected<SegmentReceipt> {
    auto segment = prepare_audio(request);
    if (!segment) {
        return std::unexpected(segment.error());
    }
    return commit(draft_name, request.track_name, std::move(*segment));
}

auto SegmentComposer::add_video(std::string_view draft_name, VideoSegmentRequest const& request)
    -> Expected<SegmentReceipt> {
    auto segment = prepare_video(request);
    if (!segment) {
        return std::unexpected(segment.error());
    }
    return commit(draft_name, request.track_name, std::move(*segment));
}

auto SegmentComposer::add_sticker(std::string_view draft_name, StickerSegmentRequest const& request)
    -> Expected<SegmentReceipt> {
    auto segment = prepare_sticker(request);
    if (!segment) {
        return std::unexpected(segment.error());
    }
    return commit(draft_name, request.track_name, std::move(*segment));
}

auto SegmentComposer::add_text(std::string_view draft_name, TextSegmentRequest const& request)
    -> Expected<SegmentReceipt> {
    auto segment = prepare_text(request);
    if (!segment) {
        return std::unexpected(segment.error());
    }
    return commit(draft_name, request.track_name, std::move(*segment));
}

auto SegmentComposer::commit(std::string_view                  draft_name,
                             std::optional<std::string> const& track_name,
                             Segment                           segment) -> Expected<SegmentReceipt> {
    std::optional<std::string_view> selector;
    if (track_name) {
        selector = *track_name;
    }
    return registry_.with_draft(draft_name, [&](Draft& draft) -> Expected<SegmentReceipt> {
        auto track = draft.resolve_track(segment.kind, selector);
        if (!track) {
            return std::unexpected(track.error());
        }
        auto const& committed = draft.append_segment(**track, std::move(segment));
        ds_log("Appended " + std::string{segmentKindName(committed.kind)} + " segment "
                   + std::to_string(committed.id) + " to " + draft.name() + "/" + (*track)->name,
               "Composer");
        return SegmentReceipt{draft.name(), (*track)->name, committed.id, committed.range, draft.revision()};
    });
}

} // namespace DS
