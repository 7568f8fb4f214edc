#pragma once

#include <draftspace/core/Error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace httplib {
class Request;
class Response;
}

namespace DS::Serve {

struct DraftServices;
struct ServeOptions;
class MetricsCollector;

struct HttpRequestContext {
    DraftServices&       services;
    ServeOptions const&  options;
    MetricsCollector&    metrics;
};

void write_json_response(httplib::Response& res,
                         nlohmann::json const& payload,
                         int                  status,
                         bool                 no_store = false);

void respond_bad_request(httplib::Response& res, std::string_view message);
void respond_server_error(httplib::Response& res, std::string_view message);
void respond_payload_too_large(httplib::Response& res, std::int64_t limit);
void respond_unsupported_media_type(httplib::Response& res);

// Validation and path-security -> 400, conflict -> 400, not-found -> 404, internal -> 500.
auto status_for_error(DS::Error const& error) -> int;

// Writes {"success": false, "error", "code", "message"} and counts the category.
void respond_error(HttpRequestContext& ctx, httplib::Response& res, DS::Error const& error);

void respond_success(httplib::Response&                res,
                     std::string_view                  message,
                     std::optional<std::string> const& draft_name = std::nullopt,
                     std::optional<nlohmann::json>     data       = std::nullopt);

/**
 * Checks content type and size, then parses the body as a JSON object. On
 * failure the response is already written and nullopt is returned.
 */
auto read_json_body(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res)
    -> std::optional<nlohmann::json>;

// Field readers: a missing key and an explicit null both read as absent.
auto read_optional_string(nlohmann::json const& body, std::string_view key)
    -> DS::Expected<std::optional<std::string>>;
auto read_required_string(nlohmann::json const& body, std::string_view key) -> DS::Expected<std::string>;
auto read_optional_number(nlohmann::json const& body, std::string_view key) -> DS::Expected<std::optional<double>>;
auto read_optional_int(nlohmann::json const& body, std::string_view key) -> DS::Expected<std::optional<int>>;
auto read_optional_bool(nlohmann::json const& body, std::string_view key) -> DS::Expected<std::optional<bool>>;
auto read_optional_number_array(nlohmann::json const& body, std::string_view key)
    -> DS::Expected<std::optional<std::vector<double>>>;

} // namespace DS::Serve
