#include <simplest_mcp/config/config_loader.hpp>

#include <simplest_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <limits>

namespace simplest_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config};
}

std::string ToLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

Result<uint16_t, Error> CheckPort(int port) {
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
        return Result<uint16_t, Error>::Err(
            MakeConfigError("Port out of range: " + std::to_string(port)));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(port));
}

Result<LogLevel, Error> CheckLogLevel(const std::string& text) {
    LogLevel level = LogLevel::Info;
    if (!ParseLogLevel(text, level)) {
        return Result<LogLevel, Error>::Err(
            MakeConfigError("Unknown log level: " + text));
    }
    return Result<LogLevel, Error>::Ok(level);
}

Result<void, Error> ReadServerSection(const YAML::Node& node, ServerConfig& server) {
    if (node["host"]) {
        server.host = node["host"].as<std::string>();
    }
    if (node["port"]) {
        auto port = CheckPort(node["port"].as<int>());
        if (port.IsErr()) return Result<void, Error>::Err(port.Error());
        server.port = port.Value();
    }
    if (node["path"]) {
        server.path = node["path"].as<std::string>();
    }
    if (node["transport"]) {
        auto transport = ParseTransport(node["transport"].as<std::string>());
        if (transport.IsErr()) return Result<void, Error>::Err(transport.Error());
        server.transport = transport.Value();
    }
    if (node["threads"]) {
        server.threads = node["threads"].as<int>();
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ReadLogSection(const YAML::Node& node, LogConfig& log) {
    if (node["level"]) {
        auto level = CheckLogLevel(node["level"].as<std::string>());
        if (level.IsErr()) return Result<void, Error>::Err(level.Error());
        log.level = level.Value();
    }
    if (node["json"]) {
        log.json = node["json"].as<bool>();
    }
    if (node["color"]) {
        log.color = node["color"].as<bool>();
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseTransport
// ---------------------------------------------------------------------------
Result<TransportKind, Error> ParseTransport(std::string_view text) {
    const auto lower = ToLower(text);
    if (lower == "http") {
        return Result<TransportKind, Error>::Ok(TransportKind::Http);
    }
    if (lower == "stdio") {
        return Result<TransportKind, Error>::Ok(TransportKind::Stdio);
    }
    return Result<TransportKind, Error>::Err(
        MakeConfigError("Unknown transport: " + std::string(text)));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        const auto root = YAML::LoadFile(std::string(file_path));

        if (root["server"]) {
            auto read = ReadServerSection(root["server"], config.server);
            if (read.IsErr()) return Result<AppConfig, Error>::Err(read.Error());
        }
        if (root["log"]) {
            auto read = ReadLogSection(root["log"], config.log);
            if (read.IsErr()) return Result<AppConfig, Error>::Err(read.Error());
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("simplest-mcp", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--host")
        .help("Interface to listen on");
    program.add_argument("--port")
        .help("Port to listen on (0 picks a free port)")
        .scan<'i', int>();
    program.add_argument("--path")
        .help("MCP endpoint path");
    program.add_argument("--stdio")
        .help("Serve line-delimited JSON-RPC on stdin/stdout instead of HTTP")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--threads")
        .help("HTTP worker threads")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-json")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Only warnings and errors")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    config.show_version = program.get<bool>("--version");

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--host")) {
        config.server.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        auto port = CheckPort(*val);
        if (port.IsErr()) return Result<AppConfig, Error>::Err(port.Error());
        config.server.port = port.Value();
    }
    if (auto val = program.present("--path")) {
        config.server.path = *val;
    }
    if (program.get<bool>("--stdio")) {
        config.server.transport = TransportKind::Stdio;
    }
    if (auto val = program.present<int>("--threads")) {
        config.server.threads = *val;
    }

    if (program.get<bool>("--verbose")) {
        config.log.level = LogLevel::Debug;
    } else if (program.get<bool>("--quiet")) {
        config.log.level = LogLevel::Warn;
    }
    if (auto val = program.present("--log-level")) {
        auto level = CheckLogLevel(*val);
        if (level.IsErr()) return Result<AppConfig, Error>::Err(level.Error());
        config.log.level = level.Value();
    }
    if (program.get<bool>("--log-json")) {
        config.log.json = true;
    }
    if (program.get<bool>("--no-color")) {
        config.log.color = false;
    } else if (program.get<bool>("--color")) {
        config.log.color = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const ServerConfig server_defaults;
    const LogConfig log_defaults;
    AppConfig merged = yaml_base;

    const auto& cli = cli_overrides.server;
    if (cli.host != server_defaults.host) {
        merged.server.host = cli.host;
    }
    if (cli.port != server_defaults.port) {
        merged.server.port = cli.port;
    }
    if (cli.path != server_defaults.path) {
        merged.server.path = cli.path;
    }
    if (cli.transport != server_defaults.transport) {
        merged.server.transport = cli.transport;
    }
    if (cli.threads != server_defaults.threads) {
        merged.server.threads = cli.threads;
    }

    if (cli_overrides.log.level != log_defaults.level) {
        merged.log.level = cli_overrides.log.level;
    }
    if (cli_overrides.log.json) {
        merged.log.json = true;
    }
    if (cli_overrides.log.color.has_value()) {
        merged.log.color = cli_overrides.log.color;
    }

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    merged.show_version = yaml_base.show_version || cli_overrides.show_version;
    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto& server = config.server;
    if (server.transport == TransportKind::Stdio) {
        return Result<void, Error>::Ok();
    }
    if (server.host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: host"));
    }
    if (server.path.empty() || server.path.front() != '/') {
        return Result<void, Error>::Err(
            MakeConfigError("Endpoint path must start with '/', got '" +
                            server.path + "'"));
    }
    if (server.threads <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Thread count must be positive, got " +
                            std::to_string(server.threads)));
    }
    return Result<void, Error>::Ok();
}

} // namespace simplest_mcp
