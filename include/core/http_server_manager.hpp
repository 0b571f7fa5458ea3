#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "logging/logger.hpp"

/**
 * @brief Owns the HTTP server and the thread that runs its accept loop
 *
 * Routes are installed through the callback given at construction, once per start().
 */
class HttpServerManager
{
public:
    using RouteSetupCallback = std::function<void(httplib::Server &)>;

    explicit HttpServerManager(RouteSetupCallback route_setup);
    ~HttpServerManager();

    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    /**
     * @brief Bind to host:port and serve on a background thread
     * @return false if the port could not be bound or routes could not be installed
     */
    bool start(const std::string &host, int port);
    void stop();
    bool isRunning() const;

    std::string getCurrentHost() const;
    int getCurrentPort() const;

private:
    void serverThread();

    RouteSetupCallback route_setup_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    std::string current_host_;
    int current_port_ = 0;

    mutable std::mutex server_mutex_;
};
