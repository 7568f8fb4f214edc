#include <doctest/doctest.h>
#include <draftspace/web/ServeOptions.hpp>

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

// Clears every override so a developer's shell cannot leak into the defaults.
struct CleanServeEnv {
    EnvGuard host{"DRAFTSPACE_SERVE_HOST", nullptr};
    EnvGuard port{"DRAFTSPACE_SERVE_PORT", nullptr};
    EnvGuard catalog{"DRAFTSPACE_SERVE_CATALOG", nullptr};
    EnvGuard body{"DRAFTSPACE_SERVE_MAX_BODY_BYTES", nullptr};
};

} // namespace

TEST_SUITE("web.options") {
    TEST_CASE("Defaults bind to localhost:8000 with the built-in catalog") {
        CleanServeEnv env;
        ArgvBuilder   argv{"draftspace_server"};
        auto          parsed = DS::Serve::ParseServeArguments(argv.argc(), argv.argv());

        REQUIRE(parsed.has_value());
        CHECK(parsed->host == "127.0.0.1");
        CHECK(parsed->port == 8000);
        CHECK(parsed->catalog_path.empty());
        CHECK(parsed->max_body_bytes == 1024 * 1024);
        CHECK_FALSE(parsed->show_help);
    }

    TEST_CASE("Port validation guards the range") {
        CHECK(DS::Serve::IsValidServePort(80));
        CHECK(DS::Serve::IsValidServePort(65535));
        CHECK_FALSE(DS::Serve::IsValidServePort(0));
        CHECK_FALSE(DS::Serve::IsValidServePort(65536));
    }

    TEST_CASE("Validate names the offending flag") {
        DS::Serve::ServeOptions options{};
        CHECK_FALSE(DS::Serve::ValidateServeOptions(options).has_value());

        options.port = 70000;
        auto error   = DS::Serve::ValidateServeOptions(options);
        REQUIRE(error.has_value());
        CHECK(error->find("--port") != std::string::npos);

        options.port           = 8080;
        options.max_body_bytes = 0;
        error                  = DS::Serve::ValidateServeOptions(options);
        REQUIRE(error.has_value());
        CHECK(error->find("--max-body-bytes") != std::string::npos);

        options.max_body_bytes = 1024;
        options.host.clear();
        error = DS::Serve::ValidateServeOptions(options);
        REQUIRE(error.has_value());
        CHECK(error->find("--host") != std::string::npos);
    }

    TEST_CASE("Command line flags are parsed") {
        CleanServeEnv env;
        ArgvBuilder   argv{"draftspace_server", "--host", "0.0.0.0", "--port", "9001",
                         "--catalog", "/etc/draftspace/catalog.json", "--max-body-bytes", "4096"};
        auto          parsed = DS::Serve::ParseServeArguments(argv.argc(), argv.argv());

        REQUIRE(parsed.has_value());
        CHECK(parsed->host == "0.0.0.0");
        CHECK(parsed->port == 9001);
        CHECK(parsed->catalog_path == "/etc/draftspace/catalog.json");
        CHECK(parsed->max_body_bytes == 4096);
    }

    TEST_CASE("Help stops parsing") {
        CleanServeEnv env;
        ArgvBuilder   argv{"draftspace_server", "--help", "--bogus"};
        auto          parsed = DS::Serve::ParseServeArguments(argv.argc(), argv.argv());
        REQUIRE(parsed.has_value());
        CHECK(parsed->show_help);
    }

    TEST_CASE("Bad arguments are rejected") {
        CleanServeEnv env;
        {
            ArgvBuilder argv{"draftspace_server", "--port"};
            CHECK_FALSE(DS::Serve::ParseServeArguments(argv.argc(), argv.argv()).has_value());
        }
        {
            ArgvBuilder argv{"draftspace_server", "--port", "80a"};
            CHECK_FALSE(DS::Serve::ParseServeArguments(argv.argc(), argv.argv()).has_value());
        }
        {
            ArgvBuilder argv{"draftspace_server", "--verbose"};
            CHECK_FALSE(DS::Serve::ParseServeArguments(argv.argc(), argv.argv()).has_value());
        }
        {
            ArgvBuilder argv{"draftspace_server", "--max-body-bytes", "999999999999"};
            CHECK_FALSE(DS::Serve::ParseServeArguments(argv.argc(), argv.argv()).has_value());
        }
    }

    TEST_CASE("Environment overrides apply to CLI defaults") {
        CleanServeEnv env;
        EnvGuard      host{"DRAFTSPACE_SERVE_HOST", "0.0.0.0"};
        EnvGuard      port{"DRAFTSPACE_SERVE_PORT", "9090"};
        EnvGuard      catalog{"DRAFTSPACE_SERVE_CATALOG", "/tmp/catalog.json"};

        ArgvBuilder argv{"draftspace_server"};
        auto        parsed = DS::Serve::ParseServeArguments(argv.argc(), argv.argv());

        REQUIRE(parsed.has_value());
        CHECK(parsed->host == "0.0.0.0");
        CHECK(parsed->port == 9090);
        CHECK(parsed->catalog_path == "/tmp/catalog.json");
    }

    TEST_CASE("Command line wins over the environment") {
        CleanServeEnv env;
        EnvGuard      port{"DRAFTSPACE_SERVE_PORT", "9090"};

        ArgvBuilder argv{"draftspace_server", "--port", "7000"};
        auto        parsed = DS::Serve::ParseServeArguments(argv.argc(), argv.argv());

        REQUIRE(parsed.has_value());
        CHECK(parsed->port == 7000);
    }

    TEST_CASE("Invalid environment override fails early") {
        CleanServeEnv env;
        EnvGuard      port{"DRAFTSPACE_SERVE_PORT", "70000"};

        ArgvBuilder argv{"draftspace_server"};
        CHECK_FALSE(DS::Serve::ParseServeArguments(argv.argc(), argv.argv()).has_value());
    }
}
