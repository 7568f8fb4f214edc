#include <draftspace/web/serve/routing/DraftController.hpp>

#include <draftspace/draft/Draft.hpp>
#include <draftspace/web/serve/DraftServices.hpp>
#include <draftspace/web/serve/Metrics.hpp>

#include "httplib.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace DS::Serve {

namespace {

using json = nlohmann::json;

// Pulls typed fields out of a request body; the first failure sticks and later reads are skipped.
class FieldReader {
public:
    explicit FieldReader(json const& body)
        : body_(body) {}

    void required_string(std::string_view key, std::string& out) {
        capture(read_required_string(body_, key), out);
    }
    void string(std::string_view key, std::optional<std::string>& out) {
        capture(read_optional_string(body_, key), out);
    }
    void number(std::string_view key, std::optional<double>& out) {
        capture(read_optional_number(body_, key), out);
    }
    void integer(std::string_view key, std::optional<int>& out) {
        capture(read_optional_int(body_, key), out);
    }
    void boolean(std::string_view key, std::optional<bool>& out) {
        capture(read_optional_bool(body_, key), out);
    }
    void numbers(std::string_view key, std::optional<std::vector<double>>& out) {
        capture(read_optional_number_array(body_, key), out);
    }

    auto error() const -> std::optional<DS::Error> const& { return error_; }

private:
    template <typename T>
    void capture(DS::Expected<T> value, T& out) {
        if (error_) {
            return;
        }
        if (!value) {
            error_ = std::move(value.error());
            return;
        }
        out = std::move(*value);
    }

    json const&              body_;
    std::optional<DS::Error> error_;
};

auto micros(std::chrono::microseconds value) -> std::int64_t {
    return static_cast<std::int64_t>(value.count());
}

void respond_segment(HttpRequestContext&                  ctx,
                     httplib::Response&                   res,
                     DS::Expected<DS::SegmentReceipt> const& receipt,
                     std::string_view                     label) {
    if (!receipt) {
        respond_error(ctx, res, receipt.error());
        return;
    }
    ctx.metrics.record_segment_committed();
    json data{{"track_name", receipt->track_name},
              {"segment_id", receipt->segment_id},
              {"start", micros(receipt->range.start)},
              {"duration", receipt->range.duration ? json(micros(*receipt->range.duration)) : json(nullptr)},
              {"revision", receipt->revision}};
    respond_success(res, std::string{label} + " segment added successfully", receipt->draft_name, std::move(data));
}

} // namespace

namespace detail {

void handle_draft_create(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::DraftCreate, res};

    auto body = read_json_body(ctx, req, res);
    if (!body) {
        return;
    }

    DS::CreateDraftParams params;
    std::optional<int>    width;
    std::optional<int>    height;
    std::optional<bool>   allow_replace;
    FieldReader           fields{*body};
    fields.required_string("folder_id", params.folder_id);
    fields.required_string("draft_name", params.name);
    fields.integer("width", width);
    fields.integer("height", height);
    fields.boolean("allow_replace", allow_replace);
    if (fields.error()) {
        respond_error(ctx, res, *fields.error());
        return;
    }
    params.width         = width.value_or(params.width);
    params.height        = height.value_or(params.height);
    params.allow_replace = allow_replace.value_or(false);

    auto summary = ctx.services.sessions.create_draft(std::move(params));
    if (!summary) {
        respond_error(ctx, res, summary.error());
        return;
    }

    respond_success(res,
                    "Draft '" + summary->name + "' created successfully",
                    summary->name,
                    json{{"width", summary->width},
                         {"height", summary->height},
                         {"folder_id", summary->folder_id}});
}

void handle_draft_get(HttpRequestContext& ctx, std::string const& draft_name, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::DraftGet, res};

    auto document = ctx.services.sessions.draft_document(draft_name);
    if (!document) {
        respond_error(ctx, res, document.error());
        return;
    }
    respond_success(res, "Draft '" + draft_name + "'", draft_name, std::move(*document));
}

void handle_track_add(HttpRequestContext&     ctx,
                      std::string const&      draft_name,
                      httplib::Request const& req,
                      httplib::Response&      res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::TrackAdd, res};

    auto body = read_json_body(ctx, req, res);
    if (!body) {
        return;
    }

    DS::TrackRequest request;
    FieldReader      fields{*body};
    fields.required_string("track_type", request.track_type);
    fields.string("track_name", request.track_name);
    fields.integer("relative_index", request.relative_index);
    if (fields.error()) {
        respond_error(ctx, res, *fields.error());
        return;
    }

    auto track = ctx.services.sessions.add_track(draft_name, request);
    if (!track) {
        respond_error(ctx, res, track.error());
        return;
    }

    respond_success(res,
                    "Track '" + track->name + "' added successfully",
                    draft_name,
                    json{{"track_name", track->name},
                         {"track_type", DS::trackTypeName(track->type)},
                         {"relative_index", track->relative_index},
                         {"render_index", track->render_index}});
}

void handle_segment_audio(HttpRequestContext&     ctx,
                          std::string const&      draft_name,
                          httplib::Request const& req,
                          httplib::Response&      res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::SegmentAudio, res};

    auto body = read_json_body(ctx, req, res);
    if (!body) {
        return;
    }

    DS::AudioSegmentRequest request;
    FieldReader             fields{*body};
    fields.required_string("material_path", request.material_path);
    fields.string("start_time", request.start_time);
    fields.string("duration", request.duration);
    fields.string("track_name", request.track_name);
    fields.number("volume", request.volume);
    fields.string("fade_in", request.fade_in);
    fields.string("fade_out", request.fade_out);
    if (fields.error()) {
        respond_error(ctx, res, *fields.error());
        return;
    }

    respond_segment(ctx, res, ctx.services.composer.add_audio(draft_name, request), "Audio");
}

void handle_segment_video(HttpRequestContext&     ctx,
                          std::string const&      draft_name,
                          httplib::Request const& req,
                          httplib::Response&      res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::SegmentVideo, res};

    auto body = read_json_body(ctx, req, res);
    if (!body) {
        return;
    }

    DS::VideoSegmentRequest request;
    FieldReader             fields{*body};
    fields.required_string("material_path", request.material_path);
    fields.string("start_time", request.start_time);
    fields.string("duration", request.duration);
    fields.string("track_name", request.track_name);
    fields.string("animation_type", request.animation_type);
    fields.string("transition_type", request.transition_type);
    fields.number("alpha", request.alpha);
    fields.number("scale", request.scale);
    if (fields.error()) {
        respond_error(ctx, res, *fields.error());
        return;
    }

    respond_segment(ctx, res, ctx.services.composer.add_video(draft_name, request), "Video");
}

void handle_segment_sticker(HttpRequestContext&     ctx,
                            std::string const&      draft_name,
                            httplib::Request const& req,
                            httplib::Response&      res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::SegmentSticker, res};

    auto body = read_json_body(ctx, req, res);
    if (!body) {
        return;
    }

    DS::StickerSegmentRequest request;
    FieldReader               fields{*body};
    fields.required_string("material_path", request.material_path);
    fields.string("start_time", request.start_time);
    fields.string("duration", request.duration);
    fields.string("track_name", request.track_name);
    fields.number("background_blur", request.background_blur);
    if (fields.error()) {
        respond_error(ctx, res, *fields.error());
        return;
    }

    respond_segment(ctx, res, ctx.services.composer.add_sticker(draft_name, request), "Sticker");
}

void handle_segment_text(HttpRequestContext&     ctx,
                         std::string const&      draft_name,
                         httplib::Request const& req,
                         httplib::Response&      res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::SegmentText, res};

    auto body = read_json_body(ctx, req, res);
    if (!body) {
        return;
    }

    DS::TextSegmentRequest request;
    FieldReader            fields{*body};
    fields.required_string("text", request.text);
    fields.string("start_time", request.start_time);
    fields.string("duration", request.duration);
    fields.string("track_name", request.track_name);
    fields.string("font", request.font);
    fields.number("size", request.size);
    fields.numbers("color", request.color);
    fields.number("transform_y", request.transform_y);
    fields.string("animation_type", request.animation_type);
    fields.string("bubble_category_id", request.bubble_category_id);
    fields.string("bubble_resource_id", request.bubble_resource_id);
    fields.string("effect_resource_id", request.effect_resource_id);
    if (fields.error()) {
        respond_error(ctx, res, *fields.error());
        return;
    }

    respond_segment(ctx, res, ctx.services.composer.add_text(draft_name, request), "Text");
}

void handle_draft_save(HttpRequestContext& ctx, std::string const& draft_name, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::DraftSave, res};

    auto receipt = ctx.services.sessions.save_draft(draft_name);
    if (!receipt) {
        respond_error(ctx, res, receipt.error());
        return;
    }
    ctx.metrics.record_draft_saved();
    respond_success(res,
                    "Draft '" + receipt->draft_name + "' saved successfully",
                    receipt->draft_name,
                    json{{"path", receipt->path.string()}, {"revision", receipt->revision}});
}

void handle_draft_close(HttpRequestContext& ctx, std::string const& draft_name, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::DraftClose, res};

    auto closed = ctx.services.sessions.close_draft(draft_name);
    if (!closed) {
        respond_error(ctx, res, closed.error());
        return;
    }
    respond_success(res, "Draft '" + draft_name + "' closed successfully", draft_name);
}

} // namespace detail

auto DraftController::Create(HttpRequestContext& ctx) -> std::unique_ptr<DraftController> {
    return std::unique_ptr<DraftController>(new DraftController(ctx));
}

DraftController::DraftController(HttpRequestContext& ctx)
    : ctx_(ctx) {}

DraftController::~DraftController() = default;

void DraftController::register_routes(httplib::Server& server) {
    server.Post("/draft/create", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_draft_create(ctx_, req, res);
    });
    server.Get(R"(/draft/([^/]+))", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_draft_get(ctx_, req.matches[1], res);
    });
    server.Delete(R"(/draft/([^/]+))", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_draft_close(ctx_, req.matches[1], res);
    });
    server.Post(R"(/draft/([^/]+)/track/add)", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_track_add(ctx_, req.matches[1], req, res);
    });
    server.Post(R"(/draft/([^/]+)/segment/audio)", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_segment_audio(ctx_, req.matches[1], req, res);
    });
    server.Post(R"(/draft/([^/]+)/segment/video)", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_segment_video(ctx_, req.matches[1], req, res);
    });
    server.Post(R"(/draft/([^/]+)/segment/sticker)", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_segment_sticker(ctx_, req.matches[1], req, res);
    });
    server.Post(R"(/draft/([^/]+)/segment/text)", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_segment_text(ctx_, req.matches[1], req, res);
    });
    server.Post(R"(/draft/([^/]+)/save)", [this](httplib::Request const& req, httplib::Response& res) {
        detail::handle_draft_save(ctx_, req.matches[1], res);
    });
}

} // namespace DS::Serve
