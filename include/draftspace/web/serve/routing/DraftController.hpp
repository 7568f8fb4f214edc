#pragma once

#include <memory>
#include <string>

#include <draftspace/web/serve/routing/HttpHelpers.hpp>

namespace httplib {
class Server;
class Request;
class Response;
}

namespace DS::Serve {

namespace detail {

void handle_draft_create(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res);
void handle_draft_get(HttpRequestContext& ctx, std::string const& draft_name, httplib::Response& res);
void handle_track_add(HttpRequestContext&     ctx,
                      std::string const&      draft_name,
                      httplib::Request const& req,
                      httplib::Response&      res);
void handle_segment_audio(HttpRequestContext&     ctx,
                          std::string const&      draft_name,
                          httplib::Request const& req,
                          httplib::Response&      res);
void handle_segment_video(HttpRequestContext&     ctx,
                          std::string const&      draft_name,
                          httplib::Request const& req,
                          httplib::Response&      res);
void handle_segment_sticker(HttpRequestContext&     ctx,
                            std::string const&      draft_name,
                            httplib::Request const& req,
                            httplib::Response&      res);
void handle_segment_text(HttpRequestContext&     ctx,
                         std::string const&      draft_name,
                         httplib::Request const& req,
                         httplib::Response&      res);
void handle_draft_save(HttpRequestContext& ctx, std::string const& draft_name, httplib::Response& res);
void handle_draft_close(HttpRequestContext& ctx, std::string const& draft_name, httplib::Response& res);

} // namespace detail

class DraftController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<DraftController>;

    void register_routes(httplib::Server& server);

    ~DraftController();

private:
    explicit DraftController(HttpRequestContext& ctx);

    HttpRequestContext& ctx_;
};

} // namespace DS::Serve
