#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace DS::Serve {

struct ServeOptions {
    std::string  host{"127.0.0.1"};
    int          port{8000};
    std::string  catalog_path;
    std::int64_t max_body_bytes{1024 * 1024};
    bool         show_help{false};
};

auto ParseServeArguments(int argc, char** argv) -> std::optional<ServeOptions>;

void PrintServeUsage();

bool ApplyServeEnvOverrides(ServeOptions& options);

auto ValidateServeOptions(ServeOptions const& options) -> std::optional<std::string>;

bool IsValidServePort(int port);

} // namespace DS::Serve
