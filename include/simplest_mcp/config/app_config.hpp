#pragma once

#include <simplest_mcp/core/log.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace simplest_mcp {

enum class TransportKind {
    Http,
    Stdio,
};

struct ServerConfig {
    std::string host = "localhost";
    uint16_t port = 9000;        // 0 lets the OS pick a free port
    std::string path = "/mcp";   // MCP endpoint path
    TransportKind transport = TransportKind::Http;
    int threads = 8;             // HTTP worker threads
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool json = false;
    std::optional<bool> color;   // unset: decide from the terminal
};

struct AppConfig {
    ServerConfig server;
    LogConfig log;
    std::optional<std::string> config_file;
    bool show_version = false;
};

} // namespace simplest_mcp
