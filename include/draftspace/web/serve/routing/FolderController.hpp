#pragma once

#include <memory>

#include <draftspace/web/serve/DraftServices.hpp>
#include <draftspace/web/serve/Metrics.hpp>
#include <draftspace/web/serve/routing/HttpHelpers.hpp>

#include "httplib.h"

#include <nlohmann/json.hpp>

#include <string>

namespace DS::Serve {

namespace detail {

inline void handle_folder_register(HttpRequestContext&     ctx,
                                   httplib::Request const& req,
                                   httplib::Response&      res) {
    using json = nlohmann::json;

    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::FolderRegister, res};

    auto body = read_json_body(ctx, req, res);
    if (!body) {
        return;
    }

    auto folder_id = read_required_string(*body, "folder_id");
    if (!folder_id) {
        respond_error(ctx, res, folder_id.error());
        return;
    }
    auto folder_path = read_required_string(*body, "folder_path");
    if (!folder_path) {
        respond_error(ctx, res, folder_path.error());
        return;
    }

    auto handle = ctx.services.sessions.register_folder(*folder_id, *folder_path);
    if (!handle) {
        respond_error(ctx, res, handle.error());
        return;
    }

    respond_success(res,
                    "Draft folder registered successfully",
                    std::nullopt,
                    json{{"folder_id", handle->id}, {"path", handle->path.string()}});
}

inline void handle_folder_drafts(HttpRequestContext& ctx,
                                 std::string const&  folder_id,
                                 httplib::Response&  res) {
    using json = nlohmann::json;

    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::FolderDrafts, res};

    auto active = ctx.services.sessions.list_drafts(folder_id);
    if (!active) {
        respond_error(ctx, res, active.error());
        return;
    }
    auto saved = ctx.services.sessions.list_saved_drafts(folder_id);
    if (!saved) {
        respond_error(ctx, res, saved.error());
        return;
    }

    auto message = "Found " + std::to_string(active->size()) + " open and "
                   + std::to_string(saved->size()) + " saved drafts";
    respond_success(res, message, std::nullopt, json{{"drafts", *active}, {"saved", *saved}});
}

} // namespace detail

class FolderController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<FolderController> {
        return std::unique_ptr<FolderController>(new FolderController(ctx));
    }

    void register_routes(httplib::Server& server) {
        server.Post("/folder/register", [this](httplib::Request const& req, httplib::Response& res) {
            detail::handle_folder_register(ctx_, req, res);
        });
        server.Get(R"(/folder/([^/]+)/drafts)", [this](httplib::Request const& req, httplib::Response& res) {
            detail::handle_folder_drafts(ctx_, req.matches[1], res);
        });
    }

    ~FolderController() = default;

private:
    explicit FolderController(HttpRequestContext& ctx)
        : ctx_(ctx) {}

    HttpRequestContext& ctx_;
};

} // namespace DS::Serve
