#pragma once
#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "upload_handler.hpp"

class Logger;

// Accepts upload connections on the configured address until stopped.
class Server {
public:
    Server(std::shared_ptr<const UploadHandler> handler, std::shared_ptr<Logger> logger);
    ~Server();

    // Binds and listens; throws FtrError(IOError) when the port is unavailable.
    void start();
    void run();
    void start_background();
    void stop();

    uint16_t port() const { return port_; }
    asio::io_context& io() { return io_; }

private:
    void do_accept();

    std::shared_ptr<const UploadHandler> handler_;
    std::shared_ptr<Logger> logger_;
    asio::io_context io_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::thread io_thread_;
    std::atomic<bool> started_{false};
    uint16_t port_ = 0;
};
