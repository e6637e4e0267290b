#include "connection.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>

namespace {

// After an early rejection the client may still be sending its body; read and
// drop up to this much so the response is not lost to a connection reset.
constexpr uint64_t kMaxDrainBytes = 4 * 1024 * 1024;
constexpr auto kDrainTimeout = std::chrono::seconds(5);

const std::string kContinueResponse = "HTTP/1.1 100 Continue\r\n\r\n";

} // namespace

std::shared_ptr<Connection> Connection::create_incoming(asio::ip::tcp::socket sock,
                                                       std::shared_ptr<const UploadHandler> handler)
{
    auto c = std::shared_ptr<Connection>(new Connection(std::move(sock), std::move(handler)));
    c->start();
    return c;
}

Connection::Connection(asio::ip::tcp::socket sock, std::shared_ptr<const UploadHandler> handler)
: socket_(std::move(sock)),
  handler_(std::move(handler)),
  head_buf_(http::kMaxHeadSize),
  drain_timer_(socket_.get_executor())
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
    request_ = handler_->start_request(remote_);
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
}

void Connection::start(){
    read_head();
}

void Connection::read_head(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, head_buf_, "\r\n\r\n",
        [this, self](std::error_code ec, std::size_t bytes_transferred){
            if(ec){
                if(ec == asio::error::not_found){
                    log_warn(handler_->logger(), "Request head from {} exceeds {} bytes", remote_, http::kMaxHeadSize);
                    respond(UploadOutcome{http::kStatusBadRequest, "Request header too large", {}}, true);
                    return;
                }
                if(ec != asio::error::eof){
                    log_debug(handler_->logger(), "Connection read error from {}: {}", remote_, ec.message());
                }
                close();
                return;
            }
            handle_head(bytes_transferred);
        });
}

void Connection::handle_head(std::size_t head_size){
    auto begin = asio::buffers_begin(head_buf_.data());
    std::string text(begin, begin + static_cast<std::ptrdiff_t>(head_size));
    head_buf_.consume(head_size);

    http::RequestHead head;
    try {
        head = http::parse_request_head(text);
    } catch(const http::ParseError& e){
        log_debug(handler_->logger(), "Malformed request from {}: {}", remote_, e.what());
        respond(UploadOutcome{http::kStatusBadRequest, "Malformed request", {}}, true);
        return;
    }
    log_debug(handler_->logger(), "{} {} from {}", head.method, head.target, remote_);

    if(auto early = request_->begin(head)){
        respond(*early, true);
        return;
    }
    remaining_ = request_->body_length();
    if(request_->expects_continue()){
        send_continue();
        return;
    }
    feed_buffered();
}

void Connection::send_continue(){
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(kContinueResponse),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                log_debug(handler_->logger(), "Connection write error to {}: {}", remote_, ec.message());
                close();
                return;
            }
            feed_buffered();
        });
}

// Body bytes that arrived together with the head.
void Connection::feed_buffered(){
    auto available = std::min<uint64_t>(head_buf_.size(), remaining_);
    if(available > 0){
        auto begin = asio::buffers_begin(head_buf_.data());
        std::string chunk(begin, begin + static_cast<std::ptrdiff_t>(available));
        head_buf_.consume(available);
        remaining_ -= available;
        if(auto early = request_->consume(chunk.data(), chunk.size())){
            respond(*early, remaining_ > 0);
            return;
        }
    }
    if(remaining_ == 0){
        respond(request_->finish(), false);
        return;
    }
    read_body();
}

void Connection::read_body(){
    auto self = shared_from_this();
    auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining_, body_buf_.size()));
    socket_.async_read_some(asio::buffer(body_buf_.data(), want),
        [this, self](std::error_code ec, std::size_t bytes){
            if(ec){
                log_warn(handler_->logger(), "Upload from {} aborted with {} bytes outstanding: {}",
                         remote_, remaining_, ec.message());
                close();
                return;
            }
            remaining_ -= bytes;
            if(auto early = request_->consume(body_buf_.data(), bytes)){
                respond(*early, remaining_ > 0);
                return;
            }
            if(remaining_ == 0){
                respond(request_->finish(), false);
                return;
            }
            read_body();
        });
}

void Connection::respond(const UploadOutcome& outcome, bool drain_after){
    response_ = http::format_response(outcome.status, outcome.message);
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(response_),
        [this, self, drain_after](std::error_code ec, std::size_t){
            if(ec){
                log_debug(handler_->logger(), "Connection write error to {}: {}", remote_, ec.message());
                close();
                return;
            }
            if(drain_after){
                drain();
                return;
            }
            close();
        });
}

void Connection::drain(){
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
    auto self = shared_from_this();
    drain_timer_.expires_after(kDrainTimeout);
    drain_timer_.async_wait([this, self](const std::error_code& ec){
        if(!ec) close();
    });
    discard_input();
}

void Connection::discard_input(){
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(body_buf_),
        [this, self](std::error_code ec, std::size_t bytes){
            drained_ += bytes;
            if(ec || closed_ || drained_ >= kMaxDrainBytes){
                close();
                return;
            }
            discard_input();
        });
}

void Connection::close(){
    if(closed_) return;
    closed_ = true;
    std::error_code ec;
    drain_timer_.cancel(ec);
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    // Drops a half-written upload.
    request_.reset();
}
