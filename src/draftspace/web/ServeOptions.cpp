#include <draftspace/web/ServeOptions.hpp>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace DS::Serve {

namespace {

// Upper bound for --max-body-bytes; larger bodies are never legitimate here.
constexpr std::int64_t kMaxBodyLimit = 64LL * 1024 * 1024;

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidServePort(int port) {
    return port > 0 && port <= 65535;
}

auto ValidateServeOptions(ServeOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidServePort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    if (options.max_body_bytes < 1 || options.max_body_bytes > kMaxBodyLimit) {
        return std::string{"--max-body-bytes must be within 1-" + std::to_string(kMaxBodyLimit)};
    }
    return std::nullopt;
}

bool ApplyServeEnvOverrides(ServeOptions& options) {
    if (!apply_env("DRAFTSPACE_SERVE_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "DRAFTSPACE_SERVE_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("DRAFTSPACE_SERVE_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "DRAFTSPACE_SERVE_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("DRAFTSPACE_SERVE_CATALOG", [&](std::string_view value) {
            options.catalog_path = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("DRAFTSPACE_SERVE_MAX_BODY_BYTES", [&](std::string_view value) {
            std::int64_t parsed = options.max_body_bytes;
            if (!parse_integer_in_range<std::int64_t>(value, 1, kMaxBodyLimit, parsed)) {
                std::cerr << "DRAFTSPACE_SERVE_MAX_BODY_BYTES must be within 1-" << kMaxBodyLimit << "\n";
                return false;
            }
            options.max_body_bytes = parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintServeUsage() {
    std::cout << "Usage: draftspace_server [options]\n"
              << "  --host <host>             Bind address (default 127.0.0.1)\n"
              << "  --port <port>             Bind port (default 8000)\n"
              << "  --catalog <file>          Effect catalog JSON (default: built-in table)\n"
              << "  --max-body-bytes <n>      Largest accepted request body (default 1048576)\n"
              << "  --help                    Show this help\n"
              << "\n"
              << "Environment: DRAFTSPACE_SERVE_HOST, DRAFTSPACE_SERVE_PORT, DRAFTSPACE_SERVE_CATALOG,\n"
              << "             DRAFTSPACE_SERVE_MAX_BODY_BYTES (command line wins)\n";
}

std::optional<ServeOptions> ParseServeArguments(int argc, char** argv) {
    ServeOptions options{};
    if (!ApplyServeEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--catalog") {
            if (auto value = require_value(i, "--catalog")) {
                if (value->empty()) {
                    std::cerr << "--catalog must not be empty\n";
                    return std::nullopt;
                }
                options.catalog_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--max-body-bytes") {
            if (auto value = require_value(i, "--max-body-bytes")) {
                std::int64_t parsed = options.max_body_bytes;
                if (!parse_integer_in_range<std::int64_t>(*value, 1, kMaxBodyLimit, parsed)) {
                    std::cerr << "--max-body-bytes must be within 1-" << kMaxBodyLimit << "\n";
                    return std::nullopt;
                }
                options.max_body_bytes = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateServeOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

} // namespace DS::Serve
