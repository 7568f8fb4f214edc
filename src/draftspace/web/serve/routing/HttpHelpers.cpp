#include <draftspace/web/serve/routing/HttpHelpers.hpp>

#include <draftspace/web/ServeOptions.hpp>
#include <draftspace/web/serve/Metrics.hpp>

#include "log/TaggedLogger.hpp"

#include "httplib.h"

#include <limits>
#include <utility>

namespace DS::Serve {

namespace {

using json = nlohmann::json;

auto wrong_type(std::string_view key, std::string_view expected) -> DS::Error {
    std::string message{"Field '"};
    message.append(key);
    message.append("' must be ");
    message.append(expected);
    return DS::Error{DS::Error::Code::MalformedInput, std::move(message)};
}

// Returns nullptr for a missing key or an explicit null.
auto find_present(json const& body, std::string_view key) -> json const* {
    if (!body.is_object()) {
        return nullptr;
    }
    auto it = body.find(std::string{key});
    if (it == body.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

} // namespace

void write_json_response(httplib::Response& res,
                         json const&        payload,
                         int                status,
                         bool               no_store) {
    res.status = status;
    res.set_content(payload.dump(), "application/json; charset=utf-8");
    if (no_store) {
        res.set_header("Cache-Control", "no-store");
    }
}

void respond_bad_request(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        json{{"success", false},
                             {"error", "bad_request"},
                             {"message", message}},
                        400,
                        true);
}

void respond_server_error(httplib::Response& res, std::string_view message) {
    write_json_response(res,
                        json{{"success", false},
                             {"error", "internal"},
                             {"message", message}},
                        500);
}

void respond_payload_too_large(httplib::Response& res, std::int64_t limit) {
    write_json_response(res,
                        json{{"success", false},
                             {"error", "payload_too_large"},
                             {"message", "Request body exceeds " + std::to_string(limit) + " bytes"}},
                        413,
                        true);
}

void respond_unsupported_media_type(httplib::Response& res) {
    write_json_response(res,
                        json{{"success", false},
                             {"error", "unsupported_media_type"},
                             {"message", "Expected Content-Type: application/json"}},
                        415,
                        true);
}

auto status_for_error(DS::Error const& error) -> int {
    switch (DS::errorCategory(error.code)) {
    case DS::Error::Category::Validation:
    case DS::Error::Category::PathSecurity:
    case DS::Error::Category::Conflict:
        return 400;
    case DS::Error::Category::NotFound:
        return 404;
    case DS::Error::Category::Internal:
        return 500;
    }
    return 500;
}

void respond_error(HttpRequestContext& ctx, httplib::Response& res, DS::Error const& error) {
    auto const category = DS::errorCategory(error.code);
    ctx.metrics.record_domain_error(category);
    if (category == DS::Error::Category::Internal) {
        ds_log("Request failed: " + DS::describeError(error), "Serve", "ERROR");
    }

    json payload{{"success", false},
                 {"error", DS::errorCategoryToString(category)},
                 {"code", DS::errorCodeToString(error.code)},
                 {"message", error.message.value_or(std::string{})}};
    write_json_response(res, payload, status_for_error(error), true);
}

void respond_success(httplib::Response&                res,
                     std::string_view                  message,
                     std::optional<std::string> const& draft_name,
                     std::optional<json>               data) {
    json payload{{"success", true}, {"message", message}};
    if (draft_name) {
        payload["draft_name"] = *draft_name;
    }
    if (data) {
        payload["data"] = std::move(*data);
    }
    write_json_response(res, payload, 200, true);
}

auto read_json_body(HttpRequestContext& ctx, httplib::Request const& req, httplib::Response& res)
    -> std::optional<json> {
    auto content_type = req.get_header_value("Content-Type");
    if (content_type.find("application/json") == std::string::npos) {
        respond_unsupported_media_type(res);
        return std::nullopt;
    }
    if (static_cast<std::int64_t>(req.body.size()) > ctx.options.max_body_bytes) {
        respond_payload_too_large(res, ctx.options.max_body_bytes);
        return std::nullopt;
    }
    if (req.body.empty()) {
        respond_error(ctx, res, DS::Error{DS::Error::Code::MalformedInput, "Request body must not be empty"});
        return std::nullopt;
    }

    auto payload = json::parse(req.body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        respond_error(ctx, res, DS::Error{DS::Error::Code::MalformedInput, "Request body must be a JSON object"});
        return std::nullopt;
    }
    return payload;
}

auto read_optional_string(json const& body, std::string_view key) -> DS::Expected<std::optional<std::string>> {
    auto const* value = find_present(body, key);
    if (value == nullptr) {
        return std::optional<std::string>{};
    }
    if (!value->is_string()) {
        return std::unexpected(wrong_type(key, "a string"));
    }
    return std::optional<std::string>{value->get<std::string>()};
}

auto read_required_string(json const& body, std::string_view key) -> DS::Expected<std::string> {
    auto value = read_optional_string(body, key);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (!value->has_value()) {
        std::string message{"Missing required field '"};
        message.append(key);
        message.push_back('\'');
        return std::unexpected(DS::Error{DS::Error::Code::MalformedInput, std::move(message)});
    }
    return std::move(**value);
}

auto read_optional_number(json const& body, std::string_view key) -> DS::Expected<std::optional<double>> {
    auto const* value = find_present(body, key);
    if (value == nullptr) {
        return std::optional<double>{};
    }
    if (!value->is_number()) {
        return std::unexpected(wrong_type(key, "a number"));
    }
    return std::optional<double>{value->get<double>()};
}

auto read_optional_int(json const& body, std::string_view key) -> DS::Expected<std::optional<int>> {
    auto const* value = find_present(body, key);
    if (value == nullptr) {
        return std::optional<int>{};
    }
    if (!value->is_number_integer()) {
        return std::unexpected(wrong_type(key, "an integer"));
    }
    if (value->is_number_unsigned()) {
        auto const raw = value->get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return std::unexpected(wrong_type(key, "an integer within range"));
        }
        return std::optional<int>{static_cast<int>(raw)};
    }
    auto const raw = value->get<std::int64_t>();
    if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
        return std::unexpected(wrong_type(key, "an integer within range"));
    }
    return std::optional<int>{static_cast<int>(raw)};
}

auto read_optional_bool(json const& body, std::string_view key) -> DS::Expected<std::optional<bool>> {
    auto const* value = find_present(body, key);
    if (value == nullptr) {
        return std::optional<bool>{};
    }
    if (!value->is_boolean()) {
        return std::unexpected(wrong_type(key, "a boolean"));
    }
    return std::optional<bool>{value->get<bool>()};
}

auto read_optional_number_array(json const& body, std::string_view key)
    -> DS::Expected<std::optional<std::vector<double>>> {
    auto const* value = find_present(body, key);
    if (value == nullptr) {
        return std::optional<std::vector<double>>{};
    }
    if (!value->is_array()) {
        return std::unexpected(wrong_type(key, "an array of numbers"));
    }
    std::vector<double> numbers;
    numbers.reserve(value->size());
    for (auto const& element : *value) {
        if (!element.is_number()) {
            return std::unexpected(wrong_type(key, "an array of numbers"));
        }
        numbers.push_back(element.get<double>());
    }
    return std::optional<std::vector<double>>{std::move(numbers)};
}

} // namespace DS::Serve
