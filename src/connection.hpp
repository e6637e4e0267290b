#pragma once
#include <asio.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include "upload_handler.hpp"

// One accepted HTTP connection carrying a single upload request.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    static std::shared_ptr<Connection> create_incoming(asio::ip::tcp::socket sock,
                                                       std::shared_ptr<const UploadHandler> handler);

    ~Connection();

    void start();

    const std::string& remote() const { return remote_; }

private:
    Connection(asio::ip::tcp::socket sock, std::shared_ptr<const UploadHandler> handler);

    void read_head();
    void handle_head(std::size_t head_size);
    void send_continue();
    void feed_buffered();
    void read_body();
    void respond(const UploadOutcome& outcome, bool drain_after);
    void drain();
    void discard_input();
    void close();

    asio::ip::tcp::socket socket_;
    std::shared_ptr<const UploadHandler> handler_;
    std::unique_ptr<UploadRequest> request_;
    asio::streambuf head_buf_;
    std::array<char, 64 * 1024> body_buf_{};
    uint64_t remaining_ = 0;
    uint64_t drained_ = 0;
    std::string response_;
    std::string remote_;
    asio::steady_timer drain_timer_;
    bool closed_ = false;
};
