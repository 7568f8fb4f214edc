#pragma once

#include <memory>

#include <draftspace/catalog/EffectCatalog.hpp>
#include <draftspace/web/serve/DraftServices.hpp>
#include <draftspace/web/serve/Metrics.hpp>
#include <draftspace/web/serve/routing/HttpHelpers.hpp>

#include "httplib.h"

#include <nlohmann/json.hpp>

#include <string>

namespace DS::Serve {

namespace detail {

// list_key is the field the names are reported under: fonts, animations, transitions or filters.
inline void handle_metadata(HttpRequestContext& ctx,
                            DS::CatalogKind     kind,
                            char const*         list_key,
                            httplib::Response&  res) {
    using json = nlohmann::json;

    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::Metadata, res};

    auto names = ctx.services.catalog.names(kind);
    json payload{{"success", true}, {"count", names.size()}};
    payload[list_key] = std::move(names);
    write_json_response(res, payload, 200);
}

} // namespace detail

class MetadataController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<MetadataController> {
        return std::unique_ptr<MetadataController>(new MetadataController(ctx));
    }

    void register_routes(httplib::Server& server) {
        add(server, "/metadata/fonts", DS::CatalogKind::Font, "fonts");
        add(server, "/metadata/animations/intro", DS::CatalogKind::IntroAnimation, "animations");
        add(server, "/metadata/animations/outro", DS::CatalogKind::OutroAnimation, "animations");
        add(server, "/metadata/animations/text-intro", DS::CatalogKind::TextIntroAnimation, "animations");
        add(server, "/metadata/animations/text-outro", DS::CatalogKind::TextOutroAnimation, "animations");
        add(server, "/metadata/transitions", DS::CatalogKind::Transition, "transitions");
        add(server, "/metadata/filters", DS::CatalogKind::Filter, "filters");
    }

    ~MetadataController() = default;

private:
    explicit MetadataController(HttpRequestContext& ctx)
        : ctx_(ctx) {}

    void add(httplib::Server& server, char const* pattern, DS::CatalogKind kind, char const* list_key) {
        server.Get(pattern, [this, kind, list_key](httplib::Request const&, httplib::Response& res) {
            detail::handle_metadata(ctx_, kind, list_key, res);
        });
    }

    HttpRequestContext& ctx_;
};

} // namespace DS::Serve
