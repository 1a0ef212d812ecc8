#pragma once

#include <simplest_mcp/config/app_config.hpp>
#include <simplest_mcp/core/result.hpp>
#include <simplest_mcp/mcp/mcp_handler.hpp>

#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace simplest_mcp {

// ---------------------------------------------------------------------------
// HttpServer: serves McpHandler over HTTP POST on config.path.
//
// Bind() then Listen(); Listen() blocks until Stop() is called from another
// thread. The handler must outlive the server.
// ---------------------------------------------------------------------------
class HttpServer {
public:
    HttpServer(const McpHandler& handler, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind host:port. With port 0 the OS picks one; Port() reports it.
    Result<void, Error> Bind();

    Result<void, Error> Listen();

    // Block until Listen() is accepting connections.
    void WaitUntilReady();

    void Stop();

    [[nodiscard]] int Port() const noexcept { return port_; }

    // http://host:port/path
    [[nodiscard]] std::string Url() const;

private:
    const McpHandler& handler_;
    ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
    int port_ = 0;
};

} // namespace simplest_mcp
