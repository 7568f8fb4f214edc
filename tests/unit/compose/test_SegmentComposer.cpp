#include <draftspace/compose/SegmentComposer.hpp>
#include <draftspace/registry/DraftRegistry.hpp>

#include "DraftSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <limits>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace DS;
using std::chrono::microseconds;

namespace {

struct ComposerFixture {
    ComposerFixture()
        : dir{"composer"}
        , catalog{EffectCatalog::Builtin()}
        , composer{registry, catalog} {
        audio = dir.touch("media/voice.mp3").string();
        video = dir.touch("media/clip.mp4").string();
        image = dir.touch("media/sticker.png").string();
        REQUIRE(registry.register_folder("main", dir.path()).has_value());
        CreateDraftParams params;
        params.folder_id = "main";
        params.name      = "promo";
        REQUIRE(registry.create_draft(params).has_value());
    }

    void addTrack(TrackType type, std::optional<std::string> name = std::nullopt) {
        auto added = registry.with_draft("promo", [&](Draft& draft) {
            return draft.add_track(TrackSpec{type, name, std::nullopt});
        });
        REQUIRE(added.has_value());
    }

    auto revision() -> std::uint64_t {
        auto summary = registry.draft_summary("promo");
        REQUIRE(summary.has_value());
        return summary->revision;
    }

    auto segmentCount() -> std::size_t {
        auto count = registry.with_draft("promo", [](Draft& draft) -> Expected<std::size_t> {
            return draft.segment_count();
        });
        REQUIRE(count.has_value());
        return *count;
    }

    TempDir         dir;
    EffectCatalog   catalog;
    DraftRegistry   registry;
    SegmentComposer composer;
    std::string     audio;
    std::string     video;
    std::string     image;
};

} // namespace

TEST_SUITE("compose.segments") {
    TEST_CASE_FIXTURE(ComposerFixture, "Audio segment lands on the first audio track") {
        addTrack(TrackType::Audio);

        AudioSegmentRequest request;
        request.material_path = audio;
        request.start_time    = "1s";
        request.duration      = "4.2s";
        request.volume        = 0.5;

        auto receipt = composer.add_audio("promo", request);
        REQUIRE(receipt.has_value());
        CHECK(receipt->draft_name == "promo");
        CHECK(receipt->track_name == "audio");
        CHECK(receipt->segment_id == 1);
        CHECK(receipt->range.start == microseconds{1'000'000});
        REQUIRE(receipt->range.duration.has_value());
        CHECK(*receipt->range.duration == microseconds{4'200'000});
        CHECK(segmentCount() == 1);
    }

    TEST_CASE_FIXTURE(ComposerFixture, "Absent fade differs from an explicit zero fade") {
        addTrack(TrackType::Audio);

        AudioSegmentRequest absent;
        absent.material_path = audio;
        auto prepared        = composer.prepare_audio(absent);
        REQUIRE(prepared.has_value());
        auto const& absentPayload = std::get<AudioPayload>(prepared->payload);
        CHECK_FALSE(absentPayload.fade_in.has_value());
        CHECK(absentPayload.volume == 1.0);

        AudioSegmentRequest zero = absent;
        zero.fade_in             = "0s";
        zero.volume              = 0.0;
        auto zeroPrepared        = composer.prepare_audio(zero);
        REQUIRE(zeroPrepared.has_value());
        auto const& zeroPayload = std::get<AudioPayload>(zeroPrepared->payload);
        REQUIRE(zeroPayload.fade_in.has_value());
        CHECK(zeroPayload.fade_in->count() == 0);
        CHECK(zeroPayload.volume == 0.0);
    }

    TEST_CASE_FIXTURE(ComposerFixture, "Audio validation failures") {
        addTrack(TrackType::Audio);
        auto before = revision();

        SUBCASE("Volume out of range") {
            AudioSegmentRequest request;
            request.material_path = audio;
            request.volume        = 1.5;
            auto result           = composer.add_audio("promo", request);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidParameter);
        }
        SUBCASE("Bad fade text names the field") {
            AudioSegmentRequest request;
            request.material_path = audio;
            request.fade_out      = "later";
            auto result           = composer.add_audio("promo", request);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidTimeFormat);
            CHECK(result.error().message->rfind("fade_out: ", 0) == 0);
        }
        SUBCASE("Fades longer than the segment") {
            AudioSegmentRequest request;
            request.material_path = audio;
            request.duration      = "2s";
            request.fade_in       = "1.5s";
            request.fade_out      = "1s";
            auto result           = composer.add_audio("promo", request);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidParameter);
        }
        SUBCASE("Fades near the microsecond limit do not wrap around") {
            AudioSegmentRequest request;
            request.material_path = audio;
            request.duration      = "1s";
            request.fade_in       = "2562047788h";
            request.fade_out      = "2562047788h";
            auto result           = composer.add_audio("promo", request);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidParameter);
        }
        SUBCASE("A single fade longer than the segment") {
            AudioSegmentRequest request;
            request.material_path = audio;
            request.duration      = "1s";
            request.fade_out      = "1.5s";
            auto result           = composer.add_audio("promo", request);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidParameter);
        }
        SUBCASE("Missing material") {
            AudioSegmentRequest request;
            request.material_path = dir.str() + "/media/missing.mp3";
            auto result           = composer.add_audio("promo", request);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::NotFound);
        }
        SUBCASE("Traversal in material path") {
            AudioSegmentRequest request;
            request.material_path = dir.str() + "/media/../media/voice.mp3";
            auto result           = composer.add_audio("promo", request);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::PathTraversal);
        }

        CHECK(revision() == before);
        CHECK(segmentCount() == 0);
    }

    TEST_CASE_FIXTURE(ComposerFixture, "Track resolution errors") {
        AudioSegmentRequest request;
        request.material_path = audio;

        auto noTrack = composer.add_audio("promo", request);
        REQUIRE_FALSE(noTrack.has_value());
        CHECK(noTrack.error().code == Error::Code::NoCompatibleTrack);

        addTrack(TrackType::Video, std::string{"main"});
        request.track_name = "main";
        auto wrongType     = composer.add_audio("promo", request);
        REQUIRE_FALSE(wrongType.has_value());
        CHECK(wrongType.error().code == Error::Code::InvalidParameter);

        request.track_name = "ghost";
        auto missing       = composer.add_audio("promo", request);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::TrackNotFound);

        auto noDraft = composer.add_audio("unknown", AudioSegmentRequest{audio});
        REQUIRE_FALSE(noDraft.has_value());
        CHECK(noDraft.error().code == Error::Code::NotFound);
    }

    TEST_CASE_FIXTURE(ComposerFixture, "Video segment resolves animation and transition") {
        addTrack(TrackType::Video);

        VideoSegmentRequest request;
        request.material_path   = video;
        request.animation_type  = "斜切";
        request.transition_type = "信号故障";
        request.alpha           = 0.0;
        request.scale           = 10.0;

        auto prepared = composer.prepare_video(request);
        REQUIRE(prepared.has_value());
        auto const& payload = std::get<VideoPayload>(prepared->payload);
        REQUIRE(payload.intro_animation.has_value());
        CHECK(payload.intro_animation->id == "builtin.intro.oblique_cut");
        REQUIRE(payload.transition.has_value());
        CHECK(payload.transition->name == "信号故障");
        CHECK(*payload.alpha == 0.0);

        auto receipt = composer.add_video("promo", request);
        REQUIRE(receipt.has_value());
        CHECK(receipt->track_name == "video");
        CHECK_FALSE(receipt->range.duration.has_value());
    }

    TEST_CASE_FIXTURE(ComposerFixture, "Unknown animation name leaves the draft unchanged") {
        addTrack(TrackType::Video);
        auto before = revision();

        VideoSegmentRequest request;
        request.material_path  = video;
        request.animation_type = "不存在";
        auto result            = composer.add_video("promo", request);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::UnknownEffectName);

        request.animation_type = "";
        auto empty             = composer.add_video("promo", request);
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == Error::Code::UnknownEffectName);

        CHECK(revision() == before);
        CHECK(segmentCount() == 0);
    }

    TEST_CASE_FIXTURE(ComposerFixture, "Video numeric bounds") {
        VideoSegmentRequest request;
        request.material_path = video;

        request.scale = 0.0;
        CHECK(composer.prepare_video(request).error().code == Error::Code::InvalidParameter);
        request.scale = 10.5;
        CHECK(composer.prepare_video(request).error().code == Error::Code::InvalidParameter);
        request.scale = 1.0;
        request.alpha = -0.1;
        CHECK(composer.prepare_video(request).error().code == Error::Code::InvalidParameter);
        request.alpha = std::numeric_limits<double>::quiet_NaN();
        CHECK(composer.prepare_video(request).error().code == Error::Code::InvalidParameter);
    }

    TEST_CASE_FIXTURE(ComposerFixture, "Sticker segments go to video tracks") {
        addTrack(TrackType::Video, std::string{"overlay"});

        StickerSegmentRequest request;
        request.material_path   = image;
        request.background_blur = 0.3;
        auto receipt            = composer.add_sticker("promo", request);
        REQUIRE(receipt.has_value());
        CHECK(receipt->track_name == "overlay");

        request.background_blur = 1.2;
        auto bad                = composer.add_sticker("promo", request);
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::InvalidParameter);
    }

    TEST_CASE_FIXTURE(ComposerFixture, "Text segment with style, bubble and animation") {
        addTrack(TrackType::Text);

        TextSegmentRequest request;
        request.text               = "你好";
        request.duration           = "3s";
        request.font               = "文轩体";
        request.size               = 12.0;
        request.color              = std::vector<double>{1.0, 0.5, 0.0};
        request.transform_y        = -0.8;
        request.animation_type     = "故障闪动";
        request.bubble_category_id = "cat";
        request.bubble_resource_id = "res";

        auto prepared = composer.prepare_text(request);
        REQUIRE(prepared.has_value());
        CHECK(prepared->material_path.empty());
        auto const& payload = std::get<TextPayload>(prepared->payload);
        CHECK(payload.text == "你好");
        REQUIRE(payload.color.has_value());
        CHECK((*payload.color)[1] == 0.5);
        REQUIRE(payload.animation.has_value());
        CHECK(payload.animation->kind == CatalogKind::TextOutroAnimation);
        REQUIRE(payload.bubble.has_value());
        CHECK(payload.bubble->resource_id == "res");

        // Intro-only names are still accepted for text.
        request.animation_type = "打字机";
        auto intro             = composer.prepare_text(request);
        REQUIRE(intro.has_value());
        CHECK(std::get<TextPayload>(intro->payload).animation->kind == CatalogKind::TextIntroAnimation);

        auto receipt = composer.add_text("promo", request);
        REQUIRE(receipt.has_value());
        CHECK(receipt->track_name == "text");
    }

    TEST_CASE_FIXTURE(ComposerFixture, "Text validation failures") {
        TextSegmentRequest base;
        base.text     = "hi";
        base.duration = "1s";

        SUBCASE("Empty text") {
            auto request = base;
            request.text.clear();
            CHECK(composer.prepare_text(request).error().code == Error::Code::InvalidParameter);
        }
        SUBCASE("Missing duration") {
            auto request = base;
            request.duration.reset();
            CHECK(composer.prepare_text(request).error().code == Error::Code::MalformedInput);
        }
        SUBCASE("Color with wrong arity") {
            auto request  = base;
            request.color = std::vector<double>{1.0, 0.0};
            auto result   = composer.prepare_text(request);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidParameter);
            CHECK(*result.error().message == "Color must be [r, g, b] with values 0.0-1.0");
        }
        SUBCASE("Color component out of range") {
            auto request  = base;
            request.color = std::vector<double>{1.0, 2.0, 0.0};
            CHECK(composer.prepare_text(request).error().code == Error::Code::InvalidParameter);
        }
        SUBCASE("Size bounds") {
            auto request = base;
            request.size = 0.0;
            CHECK(composer.prepare_text(request).error().code == Error::Code::InvalidParameter);
            request.size = 200.0;
            CHECK(composer.prepare_text(request).has_value());
            request.size = 200.5;
            CHECK(composer.prepare_text(request).error().code == Error::Code::InvalidParameter);
        }
        SUBCASE("Half a bubble") {
            auto request               = base;
            request.bubble_category_id = "cat";
            CHECK(composer.prepare_text(request).error().code == Error::Code::InvalidParameter);
        }
        SUBCASE("Unknown font") {
            auto request = base;
            request.font = "Comic Sans";
            CHECK(composer.prepare_text(request).error().code == Error::Code::UnknownEffectName);
        }
        SUBCASE("Intro animation name from the video catalog") {
            auto request           = base;
            request.animation_type = "斜切";
            CHECK(composer.prepare_text(request).error().code == Error::Code::UnknownEffectName);
        }
    }

    TEST_CASE_FIXTURE(ComposerFixture, "Concurrent appends to one draft all commit with unique ids") {
        addTrack(TrackType::Audio);

        constexpr int            kThreads   = 4;
        constexpr int            kPerThread = 25;
        std::atomic<int>         failures{0};
        std::vector<std::thread> threads;
        std::mutex               idsMutex;
        std::set<std::uint64_t>  ids;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&]() {
                AudioSegmentRequest request;
                request.material_path = audio;
                for (int n = 0; n < kPerThread; ++n) {
                    auto receipt = composer.add_audio("promo", request);
                    if (!receipt) {
                        failures.fetch_add(1);
                        continue;
                    }
                    std::lock_guard<std::mutex> lk(idsMutex);
                    ids.insert(receipt->segment_id);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        CHECK(failures.load() == 0);
        CHECK(ids.size() == static_cast<std::size_t>(kThreads * kPerThread));
        CHECK(segmentCount() == static_cast<std::size_t>(kThreads * kPerThread));
    }
}
