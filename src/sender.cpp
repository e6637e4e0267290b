#include "sender.hpp"

#include <asio.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <system_error>

#include "archiver.hpp"
#include "http_message.hpp"
#include "log.hpp"
#include "multipart.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using asio::ip::tcp;

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::size_t kMaxReplyBody = 64 * 1024;
constexpr const char* kUserAgent = "ftr/1.0";

struct Connected {
  std::string host;
  std::string endpoint;
};

Connected connect_any(asio::io_context& io,
                      tcp::socket& socket,
                      const std::vector<std::string>& hosts,
                      uint16_t port,
                      Logger* logger) {
  std::error_code last;
  for(const auto& host : hosts) {
    tcp::resolver resolver(io);
    std::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if(ec) {
      log_debug(logger, "Resolve failed for {}:{}  {}", host, port, ec.message());
      last = ec;
      continue;
    }
    auto ep = asio::connect(socket, endpoints, ec);
    if(ec) {
      log_debug(logger, "Connect failed for {}:{}  {}", host, port, ec.message());
      last = ec;
      continue;
    }
    return Connected{host, fmt::format("{}:{}", ep.address().to_string(), ep.port())};
  }
  throw FtrError(ErrorKind::IOError,
                 fmt::format("failed to connect to the peer on port {}: {}", port,
                             last ? last.message() : std::string("no address to try")));
}

std::string trim_reply(std::string body) {
  while(!body.empty() && (body.back() == '\n' || body.back() == '\r' || body.back() == ' ')) {
    body.pop_back();
  }
  return body;
}

} // namespace

const char* to_string(TransferKind kind) {
  return kind == TransferKind::Directory ? http::kFileTypeDir : http::kFileTypeFile;
}

TransferKind classify_source(const fs::path& source) {
  std::error_code ec;
  auto status = fs::status(source, ec);
  if(ec || !fs::exists(status)) {
    throw FtrError(ErrorKind::IOError,
                   fmt::format("failed to stat the source file {}: {}", source.string(),
                               ec ? ec.message() : std::string("no such file or directory")));
  }
  if(fs::is_directory(status)) return TransferKind::Directory;
  if(fs::is_regular_file(status)) return TransferKind::File;
  throw FtrError(ErrorKind::IOError,
                 fmt::format("{} is neither a regular file nor a directory", source.string()));
}

TransferRequest make_transfer_request(const fs::path& source,
                                      const std::string& pass_key,
                                      const PeerEntry& peer) {
  if(peer.addresses.empty()) {
    throw FtrError(ErrorKind::PeerNotFound,
                   fmt::format("peer '{}' advertised no address", peer.host_name));
  }
  TransferRequest request;
  request.source_path = source;
  request.kind = classify_source(source);
  request.pass_key = pass_key;
  request.target_host = peer.addresses.front();
  request.target_port = peer.port;
  request.fallback_hosts.assign(peer.addresses.begin() + 1, peer.addresses.end());
  return request;
}

ErrorKind error_kind_for_status(int status) {
  switch(status) {
    case http::kStatusUnauthorized:     return ErrorKind::AuthRejected;
    case http::kStatusBadRequest:
    case http::kStatusMethodNotAllowed: return ErrorKind::InvalidUpload;
    case http::kStatusConflict:         return ErrorKind::NameCollision;
    default:                            return ErrorKind::IOError;
  }
}

Sender::Sender(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

TransferResult Sender::send(const TransferRequest& request) {
  Logger* logger = logger_.get();

  std::optional<ScopedArchive> archive;
  fs::path upload_path = request.source_path;
  if(request.kind == TransferKind::Directory) {
    upload_path = pack_directory(request.source_path, logger);
    archive.emplace(upload_path);
  }

  std::error_code ec;
  uint64_t file_size = fs::file_size(upload_path, ec);
  if(ec) {
    throw FtrError(ErrorKind::IOError,
                   fmt::format("failed to stat {}: {}", upload_path.string(), ec.message()));
  }
  std::ifstream in(upload_path, std::ios::binary);
  if(!in) {
    throw FtrError(ErrorKind::IOError,
                   fmt::format("failed to open the source file {}", upload_path.string()));
  }

  TransferResult result;
  result.upload_name = upload_path.filename().string();

  MultipartWriter form(random_hex(16));
  auto preamble = form.file_part_header(http::kFormField, result.upload_name);
  auto closing = form.closing();
  uint64_t content_length = form.body_size(http::kFormField, result.upload_name, file_size);

  std::vector<std::string> hosts;
  hosts.push_back(request.target_host);
  hosts.insert(hosts.end(), request.fallback_hosts.begin(), request.fallback_hosts.end());

  asio::io_context io;
  tcp::socket socket(io);
  auto connected = connect_any(io, socket, hosts, request.target_port, logger);
  result.endpoint = connected.endpoint;

  http::Headers headers;
  headers.add("Host", fmt::format("{}:{}", connected.host, request.target_port));
  headers.add("User-Agent", kUserAgent);
  headers.add("Content-Type", form.content_type());
  headers.add("Content-Length", std::to_string(content_length));
  headers.add(http::kPassKeyHeader, request.pass_key);
  headers.add(http::kFileTypeHeader, to_string(request.kind));
  headers.add("Connection", "close");
  auto head = http::format_request_head("POST", http::kUploadTarget, headers);

  log_debug(logger, "Uploading {} ({} bytes) to {}", result.upload_name, file_size, result.endpoint);

  // A receiver that rejects early answers and stops reading; a failed write
  // is only reported if no reply can be read either.
  std::error_code write_ec;
  asio::write(socket, asio::buffer(head), write_ec);
  if(!write_ec) asio::write(socket, asio::buffer(preamble), write_ec);
  std::vector<char> chunk(kChunkSize);
  while(!write_ec) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    auto n = in.gcount();
    if(n <= 0) break;
    asio::write(socket, asio::buffer(chunk.data(), static_cast<std::size_t>(n)), write_ec);
    if(!write_ec) result.bytes_sent += static_cast<uint64_t>(n);
  }
  if(!write_ec) {
    if(in.bad()) {
      throw FtrError(ErrorKind::IOError, fmt::format("failed to read {}", upload_path.string()));
    }
    if(result.bytes_sent != file_size) {
      throw FtrError(ErrorKind::IOError,
                     fmt::format("{} changed size while it was being sent", upload_path.string()));
    }
    asio::write(socket, asio::buffer(closing), write_ec);
  }
  if(write_ec) {
    log_debug(logger, "Upload interrupted after {} bytes: {}", result.bytes_sent, write_ec.message());
  }

  asio::streambuf reply(http::kMaxHeadSize + kMaxReplyBody);
  std::error_code read_ec;
  auto head_size = asio::read_until(socket, reply, "\r\n\r\n", read_ec);
  if(read_ec) {
    const auto& cause = write_ec ? write_ec : read_ec;
    throw FtrError(ErrorKind::IOError,
                   fmt::format("failed to send the http request: {}", cause.message()));
  }
  auto begin = asio::buffers_begin(reply.data());
  std::string head_text(begin, begin + static_cast<std::ptrdiff_t>(head_size));
  reply.consume(head_size);

  http::ResponseHead response;
  std::optional<uint64_t> reply_length;
  try {
    response = http::parse_response_head(head_text);
    reply_length = response.content_length();
  } catch(const http::ParseError& e) {
    throw FtrError(ErrorKind::IOError, fmt::format("malformed reply from the peer: {}", e.what()));
  }

  uint64_t want = std::min<uint64_t>(reply_length.value_or(kMaxReplyBody), kMaxReplyBody);
  while(reply.size() < want) {
    std::error_code body_ec;
    asio::read(socket, reply, asio::transfer_at_least(1), body_ec);
    if(body_ec) break;
  }
  auto body_begin = asio::buffers_begin(reply.data());
  std::string body(body_begin, body_begin + static_cast<std::ptrdiff_t>(std::min<uint64_t>(reply.size(), want)));
  body = trim_reply(body);

  std::error_code close_ec;
  socket.shutdown(tcp::socket::shutdown_both, close_ec);
  socket.close(close_ec);

  if(response.status != http::kStatusOk) {
    throw FtrError(error_kind_for_status(response.status),
                   fmt::format("failed to send the file, server returned status: {} {}{}",
                               response.status, response.reason,
                               body.empty() ? std::string() : ": " + body));
  }
  log_info(logger, "Sent {} ({} bytes) to {}", result.upload_name, result.bytes_sent, result.endpoint);
  return result;
}
