#include "httplib.h"

#include <draftspace/web/DraftServer.hpp>
#include <draftspace/catalog/EffectCatalog.hpp>
#include <draftspace/web/serve/Metrics.hpp>
#include <draftspace/web/serve/routing/DraftController.hpp>
#include <draftspace/web/serve/routing/FolderController.hpp>
#include <draftspace/web/serve/routing/HttpHelpers.hpp>
#include <draftspace/web/serve/routing/MetadataController.hpp>

#include "log/TaggedLogger.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace DS::Serve {

static std::atomic<bool> g_should_stop{false};

void RequestDraftServerStop() {
    g_should_stop.store(true);
}

void ResetDraftServerStopFlag() {
    g_should_stop.store(false);
}

auto CreateDraftServices(ServeOptions const& options) -> DS::Expected<std::unique_ptr<DraftServices>> {
    if (options.catalog_path.empty()) {
        return std::make_unique<DraftServices>(DS::EffectCatalog::Builtin());
    }
    auto catalog = DS::EffectCatalog::LoadFile(options.catalog_path);
    if (!catalog) {
        return std::unexpected(catalog.error());
    }
    return std::make_unique<DraftServices>(std::move(*catalog));
}

int RunDraftServerWithStopFlag(DraftServices&                          services,
                               ServeOptions const&                     options,
                               std::atomic<bool>&                      should_stop,
                               ServeLogHooks const&                    log_hooks,
                               std::function<void(DS::Expected<void>)> on_listen) {
    auto log_info = [&](std::string_view message) {
        if (log_hooks.info) {
            log_hooks.info(message);
            return;
        }
        std::cout << message << '\n';
    };

    auto log_error = [&](std::string_view message) {
        if (log_hooks.error) {
            log_hooks.error(message);
            return;
        }
        std::cerr << message << '\n';
    };

    std::atomic<bool> listen_reported{false};
    auto report_listen_status = [&](DS::Expected<void> status) {
        if (!on_listen) {
            return;
        }
        bool expected = false;
        if (!listen_reported.compare_exchange_strong(expected, true)) {
            return;
        }
        on_listen(std::move(status));
    };

    MetricsCollector   metrics;
    HttpRequestContext http_context{services, options, metrics};

    httplib::Server server;
    server.set_payload_max_length(static_cast<std::size_t>(options.max_body_bytes));

    server.Get("/", [&](httplib::Request const&, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{metrics, RouteMetric::Root, res};
        res.set_content(
            "DraftSpace draft server\n\nPOST /folder/register, then /draft/create, then add tracks and segments under /draft/<name>/ and POST /draft/<name>/save.\n",
            "text/plain; charset=utf-8");
    });

    server.Get("/healthz", [&](httplib::Request const&, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{metrics, RouteMetric::Healthz, res};
        res.status = 200;
        res.set_content("ok", "text/plain; charset=utf-8");
    });

    server.Get("/metrics", [&](httplib::Request const& req, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{metrics, RouteMetric::Metrics, res};
        auto snapshot = metrics.capture_snapshot();
        res.set_header("Cache-Control", "no-store");
        if (req.get_param_value("format") == "json") {
            res.set_content(metrics.snapshot_json(snapshot).dump(2), "application/json");
            return;
        }
        res.set_content(metrics.render_prometheus(snapshot), "text/plain; version=0.0.4");
    });

    auto folder_controller = FolderController::Create(http_context);
    folder_controller->register_routes(server);

    auto draft_controller = DraftController::Create(http_context);
    draft_controller->register_routes(server);

    auto metadata_controller = MetadataController::Create(http_context);
    metadata_controller->register_routes(server);

    std::atomic<bool> listen_failed{false};
    std::thread server_thread([&]() {
#ifdef DS_LOG_DEBUG
        DS::set_thread_name("http-listener");
#endif
        if (!server.listen(options.host.c_str(), options.port)) {
            if (!should_stop.load()) {
                listen_failed.store(true);
                should_stop.store(true);
                log_error(std::string{"[draftspace] Failed to bind "} + options.host + ":"
                          + std::to_string(options.port));
            }
        }
    });

    log_info(std::string{"[draftspace] Listening on http://"} + options.host + ":"
             + std::to_string(options.port));

    while (!should_stop.load(std::memory_order_acquire) && !listen_failed.load(std::memory_order_acquire)) {
        if (!listen_reported.load(std::memory_order_acquire) && server.is_running()) {
            report_listen_status({});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (!listen_reported.load(std::memory_order_acquire)) {
        if (listen_failed.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(DS::Error{DS::Error::Code::InvalidError,
                                                           "failed to bind draft server listener"}));
        } else if (should_stop.load(std::memory_order_acquire)) {
            report_listen_status(std::unexpected(DS::Error{DS::Error::Code::InvalidError,
                                                           "draft server stop requested"}));
        }
    }

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }

    auto open_drafts = services.registry.draft_count();
    if (open_drafts > 0) {
        log_info("[draftspace] Shutting down with " + std::to_string(open_drafts)
                 + " open draft(s); unsaved changes are discarded");
    }

    return listen_failed.load() ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunDraftServer(DraftServices& services, ServeOptions const& options) {
    return RunDraftServerWithStopFlag(services, options, g_should_stop, {}, {});
}

} // namespace DS::Serve
