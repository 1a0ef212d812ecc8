#include <simplest_mcp/server/http_server.hpp>

#include <simplest_mcp/core/log.hpp>

#include <httplib.h>

namespace simplest_mcp {

namespace {

constexpr const char* kComponent = "http";

Error MakeTransportError(const std::string& message) {
    return Error{"HttpServer", message, ErrorCategory::Transport};
}

} // anonymous namespace

HttpServer::HttpServer(const McpHandler& handler, ServerConfig config)
    : handler_(handler),
      config_(std::move(config)),
      server_(std::make_unique<httplib::Server>()) {
    const auto threads = static_cast<size_t>(config_.threads > 0 ? config_.threads : 1);
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    server_->Post(config_.path, [this](const httplib::Request& req,
                                       httplib::Response& res) {
        LogDebug(kComponent, "POST " + req.path + " (" +
                                 std::to_string(req.body.size()) + " bytes)");
        auto reply = handler_.Process(req.body);
        res.status = reply.status;
        res.set_content(reply.body, reply.content_type.c_str());
    });
}

HttpServer::~HttpServer() {
    Stop();
}

Result<void, Error> HttpServer::Bind() {
    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.host);
        if (port_ < 0) {
            port_ = 0;
            return Result<void, Error>::Err(MakeTransportError(
                "Could not bind any port on " + config_.host));
        }
        return Result<void, Error>::Ok();
    }

    if (!server_->bind_to_port(config_.host, config_.port)) {
        return Result<void, Error>::Err(MakeTransportError(
            "Could not bind " + config_.host + ":" +
            std::to_string(config_.port) +
            ". Check that the port is free and that you may listen on it."));
    }
    port_ = config_.port;
    return Result<void, Error>::Ok();
}

Result<void, Error> HttpServer::Listen() {
    LogInfo(kComponent, "Listening on " + Url());
    if (!server_->listen_after_bind()) {
        return Result<void, Error>::Err(
            MakeTransportError("Listener on " + Url() + " failed"));
    }
    LogInfo(kComponent, "Listener stopped");
    return Result<void, Error>::Ok();
}

void HttpServer::WaitUntilReady() {
    server_->wait_until_ready();
}

void HttpServer::Stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
}

std::string HttpServer::Url() const {
    return "http://" + config_.host + ":" + std::to_string(port_) + config_.path;
}

} // namespace simplest_mcp
