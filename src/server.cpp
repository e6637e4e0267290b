#include "server.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <fmt/format.h>

using tcp = asio::ip::tcp;

Server::Server(std::shared_ptr<const UploadHandler> handler, std::shared_ptr<Logger> logger)
: handler_(std::move(handler)),
  logger_(std::move(logger))
{
}

Server::~Server(){
    stop();
    if(io_thread_.joinable()) io_thread_.join();
    std::error_code ec;
    if(acceptor_) acceptor_->close(ec);
}

void Server::start(){
    if(started_) return;
    const auto& config = handler_->config();

    std::error_code ec;
    auto address = asio::ip::make_address(config.listen_ip, ec);
    if(ec){
        throw FtrError(ErrorKind::IOError,
                       fmt::format("invalid listen address '{}': {}", config.listen_ip, ec.message()));
    }
    tcp::endpoint endpoint(address, config.port);
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    acceptor_->open(endpoint.protocol(), ec);
    if(!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    if(!ec) acceptor_->bind(endpoint, ec);
    if(!ec) acceptor_->listen(asio::socket_base::max_listen_connections, ec);
    if(ec){
        acceptor_.reset();
        throw FtrError(ErrorKind::IOError,
                       fmt::format("failed to listen on {}:{}: {}", config.listen_ip, config.port, ec.message()));
    }
    port_ = acceptor_->local_endpoint().port();
    started_ = true;
    log_debug(logger_.get(), "Receiver listening on {}:{}, dropping into {}",
              config.listen_ip, port_, config.drop_dir.string());
    do_accept();
}

void Server::do_accept(){
    if(!acceptor_) return;
    acceptor_->async_accept([this](std::error_code ec, tcp::socket sock){
        if(ec){
            if(ec == asio::error::operation_aborted) return;
            log_error(logger_.get(), "Accept error: {}", ec.message());
        } else {
            Connection::create_incoming(std::move(sock), handler_);
        }
        if(started_){
            do_accept();
        }
    });
}

void Server::run(){
    if(!started_) start();
    io_.run();
}

void Server::start_background(){
    if(!started_) start();
    if(io_thread_.joinable()) return;
    io_thread_ = std::thread([this](){
        io_.run();
    });
}

// Safe to call from any thread, including a handler running on io().
void Server::stop(){
    if(!started_.exchange(false)) return;
    io_.stop();
    if(io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id()){
        io_thread_.join();
    }
}
