#include <catch2/catch_test_macros.hpp>

#include <simplest_mcp/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace simplest_mcp;

namespace {

// Test data lives next to the test sources, not in the build directory.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));        // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));         // .../test
    return test_root + "/testdata/" + filename;
}

Result<AppConfig, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "simplest-mcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.host == "0.0.0.0");
    CHECK(config.server.port == 9100);
    CHECK(config.server.path == "/rpc");
    CHECK(config.server.transport == TransportKind::Http);
    CHECK(config.server.threads == 4);
    CHECK(config.log.level == LogLevel::Debug);
    CHECK(config.log.json);
    REQUIRE(config.log.color.has_value());
    CHECK_FALSE(*config.log.color);
}

TEST_CASE("LoadFromYaml: missing keys keep defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.port == 9001);
    CHECK(config.server.host == "localhost");
    CHECK(config.server.path == "/mcp");
    CHECK(config.log.level == LogLevel::Info);
    CHECK_FALSE(config.log.color.has_value());
}

TEST_CASE("LoadFromYaml: unknown transport is rejected", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_transport.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("websocket") != std::string::npos);
}

TEST_CASE("LoadFromYaml: port out of range is rejected", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_port.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("70000") != std::string::npos);
}

TEST_CASE("LoadFromYaml: malformed YAML is a config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadFromYaml: missing file is a config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no flags gives defaults", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.server.host == "localhost");
    CHECK(config.server.port == 9000);
    CHECK(config.server.path == "/mcp");
    CHECK(config.server.transport == TransportKind::Http);
    CHECK_FALSE(config.config_file.has_value());
    CHECK_FALSE(config.show_version);
}

TEST_CASE("LoadFromCli: server flags", "[config][cli]") {
    auto result = ParseArgs({"--host", "127.0.0.1", "--port", "8080",
                             "--path", "/api/mcp", "--threads", "2"});
    REQUIRE(result.IsOk());
    const auto& server = result.Value().server;
    CHECK(server.host == "127.0.0.1");
    CHECK(server.port == 8080);
    CHECK(server.path == "/api/mcp");
    CHECK(server.threads == 2);
}

TEST_CASE("LoadFromCli: --stdio selects the stdio transport", "[config][cli]") {
    auto result = ParseArgs({"--stdio"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().server.transport == TransportKind::Stdio);
}

TEST_CASE("LoadFromCli: verbosity and log flags", "[config][cli]") {
    auto verbose = ParseArgs({"-v"});
    REQUIRE(verbose.IsOk());
    CHECK(verbose.Value().log.level == LogLevel::Debug);

    auto quiet = ParseArgs({"-q", "--log-json", "--no-color"});
    REQUIRE(quiet.IsOk());
    CHECK(quiet.Value().log.level == LogLevel::Warn);
    CHECK(quiet.Value().log.json);
    REQUIRE(quiet.Value().log.color.has_value());
    CHECK_FALSE(*quiet.Value().log.color);

    auto explicit_level = ParseArgs({"-v", "--log-level", "error"});
    REQUIRE(explicit_level.IsOk());
    CHECK(explicit_level.Value().log.level == LogLevel::Error);
}

TEST_CASE("LoadFromCli: bad log level is an error", "[config][cli]") {
    auto result = ParseArgs({"--log-level", "chatty"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("chatty") != std::string::npos);
}

TEST_CASE("LoadFromCli: port out of range is an error", "[config][cli]") {
    auto result = ParseArgs({"--port", "65536"});
    REQUIRE(result.IsErr());
}

TEST_CASE("LoadFromCli: unknown flag is an error", "[config][cli]") {
    auto result = ParseArgs({"--listen-forever"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

TEST_CASE("LoadFromCli: --config and --version", "[config][cli]") {
    auto result = ParseArgs({"-c", "server.yaml", "--version"});
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().config_file.has_value());
    CHECK(*result.Value().config_file == "server.yaml");
    CHECK(result.Value().show_version);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI values override YAML", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());
    auto cli = ParseArgs({"--port", "9200", "--log-level", "warn"});
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());
    CHECK(merged.server.port == 9200);
    CHECK(merged.log.level == LogLevel::Warn);
    // Untouched by the CLI.
    CHECK(merged.server.host == "0.0.0.0");
    CHECK(merged.server.path == "/rpc");
    CHECK(merged.server.threads == 4);
    CHECK(merged.log.json);
}

TEST_CASE("MergeConfigs: default CLI keeps YAML values", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());
    auto cli = ParseArgs({});
    REQUIRE(cli.IsOk());

    auto merged = MergeConfigs(yaml.Value(), cli.Value());
    CHECK(merged.server.port == 9100);
    CHECK(merged.log.level == LogLevel::Debug);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: endpoint path must start with slash", "[config][validate]") {
    AppConfig config;
    config.server.path = "mcp";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("'/'") != std::string::npos);
}

TEST_CASE("ValidateConfig: empty host and zero threads are rejected", "[config][validate]") {
    AppConfig no_host;
    no_host.server.host.clear();
    CHECK(ValidateConfig(no_host).IsErr());

    AppConfig no_threads;
    no_threads.server.threads = 0;
    CHECK(ValidateConfig(no_threads).IsErr());
}

TEST_CASE("ValidateConfig: stdio transport ignores listener settings", "[config][validate]") {
    AppConfig config;
    config.server.transport = TransportKind::Stdio;
    config.server.path.clear();
    config.server.threads = 0;
    CHECK(ValidateConfig(config).IsOk());
}

// ===========================================================================
// ParseTransport
// ===========================================================================

TEST_CASE("ParseTransport: known names", "[config]") {
    REQUIRE(ParseTransport("HTTP").IsOk());
    CHECK(ParseTransport("HTTP").Value() == TransportKind::Http);
    CHECK(ParseTransport("stdio").Value() == TransportKind::Stdio);
    CHECK(ParseTransport("sse").IsErr());
}
