#include <draftspace/draft/Draft.hpp>

#include <doctest/doctest.h>

#include <limits>
#include <string>

using namespace DS;

namespace {

auto makeSegment(SegmentKind kind) -> Segment {
    Segment segment;
    segment.kind          = kind;
    segment.material_path = "/media/clip";
    switch (kind) {
    case SegmentKind::Audio:
        segment.payload = AudioPayload{};
        break;
    case SegmentKind::Video:
        segment.payload = VideoPayload{};
        break;
    case SegmentKind::Sticker:
        segment.payload = StickerPayload{};
        break;
    case SegmentKind::Text:
        segment.material_path.clear();
        segment.payload = TextPayload{"hello"};
        break;
    }
    return segment;
}

auto indexOf(Draft const& draft, std::string_view name) -> int {
    auto const* track = draft.find_track(name);
    REQUIRE(track != nullptr);
    return track->relative_index;
}

} // namespace

TEST_SUITE("draft.model") {
    TEST_CASE("Track type names and render bases") {
        CHECK(trackTypeName(TrackType::Text) == "text");
        CHECK(parseTrackType("filter") == TrackType::Filter);
        CHECK_FALSE(parseTrackType("Video").has_value());
        CHECK_FALSE(parseTrackType("sticker").has_value());

        CHECK(trackRenderBase(TrackType::Video) == 0);
        CHECK(trackRenderBase(TrackType::Audio) == 0);
        CHECK(trackRenderBase(TrackType::Effect) == 10000);
        CHECK(trackRenderBase(TrackType::Filter) == 11000);
        CHECK(trackRenderBase(TrackType::Text) == 15000);

        CHECK(trackTypeFor(SegmentKind::Sticker) == TrackType::Video);
        CHECK(trackTypeFor(SegmentKind::Audio) == TrackType::Audio);
        CHECK(trackTypeFor(SegmentKind::Text) == TrackType::Text);
    }

    TEST_CASE("Draft names and canvas sizes are validated") {
        CHECK(ValidateDraftName("my_draft").has_value());
        CHECK(ValidateDraftName("剪辑 01").has_value());
        for (auto bad : {"", ".", "..", "a/b", "a\\b", "x..y"}) {
            CAPTURE(bad);
            auto result = ValidateDraftName(bad);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidParameter);
        }
        CHECK_FALSE(ValidateDraftName(std::string(256, 'a')).has_value());
        CHECK(ValidateDraftName(std::string(255, 'a')).has_value());

        CHECK(ValidateCanvasSize(1920, 1080).has_value());
        CHECK(ValidateCanvasSize(1, kMaxCanvasDimension).has_value());
        CHECK_FALSE(ValidateCanvasSize(0, 1080).has_value());
        CHECK_FALSE(ValidateCanvasSize(1920, -5).has_value());
        CHECK_FALSE(ValidateCanvasSize(kMaxCanvasDimension + 1, 1080).has_value());
    }

    TEST_CASE("Default track names and indices") {
        Draft draft{"d", "f", 1920, 1080};

        auto first = draft.add_track(TrackSpec{TrackType::Video, std::nullopt, std::nullopt});
        REQUIRE(first.has_value());
        CHECK(first->name == "video");
        CHECK(first->relative_index == 0);
        CHECK(first->render_index == 0);

        auto second = draft.add_track(TrackSpec{TrackType::Video, std::nullopt, std::nullopt});
        REQUIRE(second.has_value());
        CHECK(second->name == "video_2");
        CHECK(second->relative_index == 1);

        auto text = draft.add_track(TrackSpec{TrackType::Text, std::nullopt, 2});
        REQUIRE(text.has_value());
        CHECK(text->name == "text");
        CHECK(text->render_index == 15002);
        CHECK(draft.revision() == 3);
    }

    TEST_CASE("Explicit track names must be unique and non-empty") {
        Draft draft{"d", "f", 1920, 1080};
        REQUIRE(draft.add_track(TrackSpec{TrackType::Audio, std::string{"music"}, std::nullopt}).has_value());

        auto duplicate = draft.add_track(TrackSpec{TrackType::Video, std::string{"music"}, std::nullopt});
        REQUIRE_FALSE(duplicate.has_value());
        CHECK(duplicate.error().code == Error::Code::AlreadyExists);

        auto empty = draft.add_track(TrackSpec{TrackType::Video, std::string{}, std::nullopt});
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == Error::Code::InvalidParameter);

        auto negative = draft.add_track(TrackSpec{TrackType::Video, std::nullopt, -1});
        REQUIRE_FALSE(negative.has_value());
        CHECK(negative.error().code == Error::Code::InvalidParameter);

        CHECK(draft.tracks().size() == 1);
        CHECK(draft.revision() == 1);
    }

    TEST_CASE("Colliding relative index: last insert wins and holders cascade up") {
        Draft draft{"d", "f", 1920, 1080};
        REQUIRE(draft.add_track(TrackSpec{TrackType::Video, std::string{"a"}, 0}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Video, std::string{"b"}, 1}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Video, std::string{"c"}, 3}).has_value());
        // Same index on another type is unaffected.
        REQUIRE(draft.add_track(TrackSpec{TrackType::Audio, std::string{"music"}, 0}).has_value());

        auto inserted = draft.add_track(TrackSpec{TrackType::Video, std::string{"z"}, 0});
        REQUIRE(inserted.has_value());
        CHECK(inserted->relative_index == 0);

        CHECK(indexOf(draft, "z") == 0);
        CHECK(indexOf(draft, "a") == 1);
        CHECK(indexOf(draft, "b") == 2);
        // The gap at 2 absorbed the cascade; c keeps its index.
        CHECK(indexOf(draft, "c") == 3);
        CHECK(indexOf(draft, "music") == 0);
    }

    TEST_CASE("Relative index is bounded below the next render base") {
        Draft draft{"d", "f", 1920, 1080};

        auto huge = draft.add_track(TrackSpec{TrackType::Text, std::nullopt, std::numeric_limits<int>::max()});
        REQUIRE_FALSE(huge.has_value());
        CHECK(huge.error().code == Error::Code::InvalidParameter);
        auto justOver = draft.add_track(TrackSpec{TrackType::Video, std::nullopt, kMaxRelativeIndex + 1});
        REQUIRE_FALSE(justOver.has_value());
        CHECK(draft.tracks().empty());
        CHECK(draft.revision() == 0);

        auto top = draft.add_track(TrackSpec{TrackType::Effect, std::string{"top"}, kMaxRelativeIndex});
        REQUIRE(top.has_value());
        CHECK(top->render_index == trackRenderBase(TrackType::Effect) + kMaxRelativeIndex);
        CHECK(top->render_index < trackRenderBase(TrackType::Filter));

        // The next default index would leave the range.
        auto next = draft.add_track(TrackSpec{TrackType::Effect, std::nullopt, std::nullopt});
        REQUIRE_FALSE(next.has_value());
        CHECK(next.error().code == Error::Code::InvalidParameter);
        CHECK(draft.tracks().size() == 1);
    }

    TEST_CASE("A cascade that would push past the top index is rejected without changes") {
        Draft draft{"d", "f", 1920, 1080};
        REQUIRE(draft.add_track(TrackSpec{TrackType::Text, std::string{"t1"}, kMaxRelativeIndex - 1}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Text, std::string{"t2"}, kMaxRelativeIndex}).has_value());
        auto const revision = draft.revision();

        auto pushed = draft.add_track(TrackSpec{TrackType::Text, std::string{"t0"}, kMaxRelativeIndex - 1});
        REQUIRE_FALSE(pushed.has_value());
        CHECK(pushed.error().code == Error::Code::InvalidParameter);
        CHECK(indexOf(draft, "t1") == kMaxRelativeIndex - 1);
        CHECK(indexOf(draft, "t2") == kMaxRelativeIndex);
        CHECK(draft.find_track("t0") == nullptr);
        CHECK(draft.revision() == revision);

        // With a gap below the top the cascade fits.
        Draft roomy{"r", "f", 1920, 1080};
        REQUIRE(roomy.add_track(TrackSpec{TrackType::Text, std::string{"t1"}, kMaxRelativeIndex - 1}).has_value());
        REQUIRE(roomy.add_track(TrackSpec{TrackType::Text, std::string{"t0"}, kMaxRelativeIndex - 1}).has_value());
        CHECK(indexOf(roomy, "t0") == kMaxRelativeIndex - 1);
        CHECK(indexOf(roomy, "t1") == kMaxRelativeIndex);
    }

    TEST_CASE("Tracks are ordered by type rank then relative index") {
        Draft draft{"d", "f", 1920, 1080};
        REQUIRE(draft.add_track(TrackSpec{TrackType::Text, std::nullopt, std::nullopt}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Audio, std::nullopt, std::nullopt}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Video, std::string{"upper"}, 1}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Video, std::string{"lower"}, 0}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Filter, std::nullopt, std::nullopt}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Effect, std::nullopt, std::nullopt}).has_value());

        auto ordered = draft.ordered_tracks();
        REQUIRE(ordered.size() == 6);
        CHECK(ordered[0]->name == "lower");
        CHECK(ordered[1]->name == "upper");
        CHECK(ordered[2]->name == "audio");
        CHECK(ordered[3]->name == "effect");
        CHECK(ordered[4]->name == "filter");
        CHECK(ordered[5]->name == "text");
    }

    TEST_CASE("Segments resolve to compatible tracks") {
        Draft draft{"d", "f", 1920, 1080};

        auto none = draft.resolve_track(SegmentKind::Audio, std::nullopt);
        REQUIRE_FALSE(none.has_value());
        CHECK(none.error().code == Error::Code::NoCompatibleTrack);

        REQUIRE(draft.add_track(TrackSpec{TrackType::Video, std::string{"overlay"}, 1}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Video, std::string{"main"}, 0}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Audio, std::nullopt, std::nullopt}).has_value());

        auto implicitVideo = draft.resolve_track(SegmentKind::Sticker, std::nullopt);
        REQUIRE(implicitVideo.has_value());
        CHECK((*implicitVideo)->name == "main");

        auto named = draft.resolve_track(SegmentKind::Video, std::string_view{"overlay"});
        REQUIRE(named.has_value());
        CHECK((*named)->name == "overlay");

        auto missing = draft.resolve_track(SegmentKind::Video, std::string_view{"ghost"});
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::TrackNotFound);

        auto incompatible = draft.resolve_track(SegmentKind::Text, std::string_view{"audio"});
        REQUIRE_FALSE(incompatible.has_value());
        CHECK(incompatible.error().code == Error::Code::InvalidParameter);
    }

    TEST_CASE("Appending assigns increasing ids and bumps the revision") {
        Draft draft{"d", "f", 1920, 1080};
        REQUIRE(draft.add_track(TrackSpec{TrackType::Audio, std::nullopt, std::nullopt}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Text, std::nullopt, std::nullopt}).has_value());
        auto before = draft.revision();

        auto audio = draft.resolve_track(SegmentKind::Audio, std::nullopt);
        REQUIRE(audio.has_value());
        auto const& first = draft.append_segment(**audio, makeSegment(SegmentKind::Audio));
        CHECK(first.id == 1);

        auto text = draft.resolve_track(SegmentKind::Text, std::nullopt);
        REQUIRE(text.has_value());
        auto const& second = draft.append_segment(**text, makeSegment(SegmentKind::Text));
        CHECK(second.id == 2);

        CHECK(draft.segment_count() == 2);
        CHECK(draft.revision() == before + 2);
        CHECK(draft.has_unsaved_changes());
        draft.mark_saved(before + 1);
        CHECK(draft.saved_revision() == before + 1);
        CHECK(draft.has_unsaved_changes());
        draft.mark_saved(before + 10);
        CHECK(draft.saved_revision() == draft.revision());
        draft.mark_saved();
        CHECK_FALSE(draft.has_unsaved_changes());
        CHECK(draft.saved_revision() == draft.revision());
    }

    TEST_CASE("Summary and document reflect render order") {
        Draft draft{"promo", "main", 1280, 720};
        REQUIRE(draft.add_track(TrackSpec{TrackType::Text, std::nullopt, std::nullopt}).has_value());
        REQUIRE(draft.add_track(TrackSpec{TrackType::Video, std::nullopt, std::nullopt}).has_value());
        auto video = draft.resolve_track(SegmentKind::Video, std::nullopt);
        REQUIRE(video.has_value());
        draft.append_segment(**video, makeSegment(SegmentKind::Video));

        auto summary = SummarizeDraft(draft);
        CHECK(summary.name == "promo");
        CHECK(summary.width == 1280);
        REQUIRE(summary.tracks.size() == 2);
        CHECK(summary.tracks[0].name == "video");
        CHECK(summary.tracks[0].segment_count == 1);
        CHECK(summary.tracks[1].render_index == 15000);

        auto doc = DraftToJson(draft);
        CHECK(doc["name"] == "promo");
        CHECK(doc["canvas"]["height"] == 720);
        REQUIRE(doc["tracks"].size() == 2);
        CHECK(doc["tracks"][0]["type"] == "video");
        auto const& segment = doc["tracks"][0]["segments"][0];
        CHECK(segment["id"] == 1);
        CHECK(segment["kind"] == "video");
        CHECK(segment["target_timerange"]["start"] == 0);
        CHECK(segment["target_timerange"]["duration"].is_null());
        CHECK_FALSE(segment.contains("alpha"));

        auto summaryJson = SummaryToJson(summary);
        CHECK(summaryJson["unsaved_changes"] == true);
    }

    TEST_CASE("Segment JSON distinguishes absent fields from zero") {
        Segment segment;
        segment.kind          = SegmentKind::Audio;
        segment.material_path = "/media/a.mp3";
        segment.range         = TimeRange{std::chrono::microseconds{0}, std::chrono::microseconds{0}};
        AudioPayload payload;
        payload.volume  = 0.0;
        payload.fade_in = std::chrono::microseconds{0};
        segment.payload = payload;

        auto json = SegmentToJson(segment);
        CHECK(json["volume"] == 0.0);
        REQUIRE(json.contains("fade_in"));
        CHECK(json["fade_in"] == 0);
        CHECK_FALSE(json.contains("fade_out"));
        CHECK(json["target_timerange"]["duration"] == 0);
    }
}
