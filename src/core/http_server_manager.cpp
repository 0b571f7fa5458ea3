#include "core/http_server_manager.hpp"

HttpServerManager::HttpServerManager(RouteSetupCallback route_setup)
    : route_setup_(std::move(route_setup))
{
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

bool HttpServerManager::start(const std::string &host, int port)
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (running_.load())
    {
        Logger::warn("HttpServerManager: Server is already running on " + current_host_ + ":" + std::to_string(current_port_));
        return false;
    }

    auto server = std::make_unique<httplib::Server>();
    try
    {
        if (route_setup_)
        {
            route_setup_(*server);
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Failed to setup routes: " + std::string(e.what()));
        return false;
    }

    if (!server->bind_to_port(host.c_str(), port))
    {
        Logger::error("HttpServerManager: Failed to bind server to " + host + ":" + std::to_string(port));
        return false;
    }

    current_host_ = host;
    current_port_ = port;
    server_ = std::move(server);
    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this);

    Logger::info("HttpServerManager: Server started on http://" + host + ":" + std::to_string(port));
    return true;
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (server_)
    {
        server_->stop();
    }
    if (server_thread_.joinable())
    {
        server_thread_.join();
    }
    if (server_)
    {
        server_.reset();
        Logger::info("HttpServerManager: Server stopped");
    }
    running_.store(false);
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

std::string HttpServerManager::getCurrentHost() const
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    return current_host_;
}

int HttpServerManager::getCurrentPort() const
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    return current_port_;
}

void HttpServerManager::serverThread()
{
    try
    {
        if (!server_->listen_after_bind())
        {
            Logger::error("HttpServerManager: Accept loop for " + current_host_ + ":" + std::to_string(current_port_) + " ended with an error");
        }
        Logger::info("HttpServerManager: Server thread completed");
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Server thread error: " + std::string(e.what()));
    }
    running_.store(false);
}
