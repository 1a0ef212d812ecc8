#include <simplest_mcp/config/config_loader.hpp>
#include <simplest_mcp/core/log.hpp>
#include <simplest_mcp/core/terminal.hpp>
#include <simplest_mcp/core/version.hpp>
#include <simplest_mcp/mcp/builtin_tools.hpp>
#include <simplest_mcp/mcp/mcp_handler.hpp>
#include <simplest_mcp/server/http_server.hpp>
#include <simplest_mcp/server/stdio_server.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr int kExitSuccess  = 0;
constexpr int kExitInternal = 99;

void PrintError(const simplest_mcp::Error& error) {
    std::cerr << "Error: " << error << "\n";
}

simplest_mcp::Result<simplest_mcp::AppConfig, simplest_mcp::Error> ResolveConfig(
    int argc, const char* const* argv) {
    using namespace simplest_mcp;
    using R = Result<AppConfig, Error>;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }
    auto config = std::move(cli).Value();

    if (config.config_file.has_value()) {
        auto yaml = LoadFromYaml(*config.config_file);
        if (yaml.IsErr()) {
            return yaml;
        }
        config = MergeConfigs(yaml.Value(), config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }
    return R::Ok(std::move(config));
}

void InitLogging(const simplest_mcp::LogConfig& log) {
    using namespace simplest_mcp;
    if (log.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), log.level);
        return;
    }
    const bool use_color = ResolveLogColor(log.color.value_or(false),
                                           log.color.has_value() && !*log.color);
    InitGlobalLogger(std::make_unique<ConsoleSink>(use_color), log.level);
}

// Serve HTTP until stopped. On an interactive terminal Enter stops the
// listener; otherwise the listener runs until the process is terminated.
int RunHttp(const simplest_mcp::McpHandler& handler,
            const simplest_mcp::ServerConfig& config) {
    using namespace simplest_mcp;

    HttpServer server(handler, config);
    auto bound = server.Bind();
    if (bound.IsErr()) {
        LogError("main", bound.Error().ToString());
        return bound.Error().ExitCode();
    }

    LogInfo("main", "MCP server running at " + server.Url());
    LogInfo("main", "Waiting for requests from an MCP client or inspector...");

    if (!IsStdinTty()) {
        auto listened = server.Listen();
        if (listened.IsErr()) {
            LogError("main", listened.Error().ToString());
            return listened.Error().ExitCode();
        }
        return kExitSuccess;
    }

    LogInfo("main", "Press [Enter] to stop.");
    Result<void, Error> listened = Result<void, Error>::Ok();
    std::thread listener([&server, &listened] { listened = server.Listen(); });
    server.WaitUntilReady();
    std::string line;
    std::getline(std::cin, line);
    server.Stop();
    listener.join();

    if (listened.IsErr()) {
        LogError("main", listened.Error().ToString());
        return listened.Error().ExitCode();
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace simplest_mcp;

    auto config_result = ResolveConfig(argc, argv);
    if (config_result.IsErr()) {
        PrintError(config_result.Error());
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    if (config.show_version) {
        std::cout << "simplest-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    InitLogging(config.log);

    try {
        McpHandler handler(MakeBuiltinRegistry());

        if (config.server.transport == TransportKind::Stdio) {
            StdioServer server(handler);
            server.Run();
            return kExitSuccess;
        }
        return RunHttp(handler, config.server);
    } catch (const std::exception& e) {
        LogError("main", std::string("Server start-up failed: ") + e.what());
        return kExitInternal;
    }
}
