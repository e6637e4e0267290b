#include "upload_handler.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <system_error>

#include "archiver.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

namespace {

constexpr const char* kMsgMethodNotAllowed = "Method not allowed";
constexpr const char* kMsgNoFile = "Failed to get the file from form";
constexpr const char* kMsgInvalidName = "Invalid file name";
constexpr const char* kMsgExists = "File already exists";
constexpr const char* kMsgCreateFailed = "Failed to create the file on server";
constexpr const char* kMsgSaveFailed = "Failed to save the file on server";
constexpr const char* kMsgExtractFailed = "Failed to unzip and untar the file on server";
constexpr const char* kMsgUnauthorized = "Unauthorized";

// Raised from inside the multipart callbacks to end the request.
class UploadRejected : public std::runtime_error {
public:
  UploadRejected(int status, const char* message)
    : std::runtime_error(message), status_(status) {}
  int status() const { return status_; }

private:
  int status_;
};

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ReceiverConfig prepare_receiver_config(ReceiverConfig config) {
  if(config.drop_dir.empty()) {
    config.drop_dir = default_drop_dir();
  }
  std::error_code ec;
  auto absolute = fs::absolute(config.drop_dir, ec);
  if(ec) {
    throw FtrError(ErrorKind::IOError,
                   fmt::format("failed to resolve drop dir {}: {}", config.drop_dir.string(), ec.message()));
  }
  config.drop_dir = absolute.lexically_normal();
  fs::create_directories(config.drop_dir, ec);
  if(ec) {
    throw FtrError(ErrorKind::IOError,
                   fmt::format("failed to create the drop dir {}: {}", config.drop_dir.string(), ec.message()));
  }
  if(!fs::is_directory(config.drop_dir, ec)) {
    throw FtrError(ErrorKind::IOError,
                   fmt::format("drop dir {} is not a directory", config.drop_dir.string()));
  }
  return config;
}

const char* to_string(UploadState state) {
  switch(state) {
    case UploadState::Unauthenticated: return "Unauthenticated";
    case UploadState::MethodChecked:   return "MethodChecked";
    case UploadState::FormParsed:      return "FormParsed";
    case UploadState::NameValidated:   return "NameValidated";
    case UploadState::Written:         return "Written";
    case UploadState::Extracted:       return "Extracted";
    case UploadState::Done:            return "Done";
    case UploadState::Error:           return "Error";
  }
  return "Unknown";
}

std::optional<std::string> upload_base_name(const std::string& client_name) {
  std::string name = client_name;
  while(name.size() > 1 && name.back() == '/') name.pop_back();
  auto slash = name.find_last_of('/');
  if(slash != std::string::npos) name = name.substr(slash + 1);
  if(name.empty() || name == "." || name == ".." || name == "/") return std::nullopt;
  if(name.find('\0') != std::string::npos) return std::nullopt;
  return name;
}

bool is_archive_name(const std::string& file_name) {
  return ends_with(file_name, ".tar.gz") || ends_with(file_name, ".tgz");
}

UploadRequest::UploadRequest(const ReceiverConfig& config, Logger* logger, std::string peer)
  : config_(config), logger_(logger), peer_(std::move(peer)) {}

UploadOutcome UploadRequest::reject(int status, const std::string& message) {
  log_debug(logger_, "Upload from {} stopped in state {}", peer_.empty() ? "?" : peer_, to_string(state_));
  state_ = UploadState::Error;
  in_file_part_ = false;
  // Only a committed archive whose extraction failed stays in the drop dir.
  if(sink_) {
    sink_->discard();
    sink_.reset();
  }
  log_warn(logger_, "Rejected upload from {}: {} {}", peer_.empty() ? "?" : peer_, status, message);
  outcome_ = UploadOutcome{status, message, {}};
  return *outcome_;
}

std::optional<UploadOutcome> UploadRequest::begin(const http::RequestHead& head) {
  auto key = head.headers.get(http::kPassKeyHeader).value_or(std::string());
  if(!secure_equals(key, config_.pass_key)) {
    return reject(http::kStatusUnauthorized, kMsgUnauthorized);
  }
  if(head.method != "POST") {
    return reject(http::kStatusMethodNotAllowed, kMsgMethodNotAllowed);
  }
  state_ = UploadState::MethodChecked;

  auto content_type = head.headers.get("Content-Type");
  auto boundary = content_type ? multipart_boundary(*content_type) : std::nullopt;
  if(!boundary || head.headers.has("Transfer-Encoding")) {
    return reject(http::kStatusBadRequest, kMsgNoFile);
  }
  std::optional<uint64_t> length;
  try {
    length = head.content_length();
  } catch(const http::ParseError&) {
    return reject(http::kStatusBadRequest, kMsgNoFile);
  }
  if(!length) {
    return reject(http::kStatusBadRequest, kMsgNoFile);
  }
  body_length_ = *length;
  expect_continue_ = iequals(head.headers.get("Expect").value_or(std::string()), "100-continue");
  is_directory_ = head.headers.get(http::kFileTypeHeader).value_or(http::kFileTypeFile) == http::kFileTypeDir;

  MultipartParser::Callbacks callbacks;
  callbacks.on_part_begin = [this](const MultipartPart& part){ on_part_begin(part); };
  callbacks.on_data = [this](const char* data, std::size_t size){ on_data(data, size); };
  callbacks.on_part_end = [this](){ on_part_end(); };
  parser_ = std::make_unique<MultipartParser>(*boundary, std::move(callbacks));
  return std::nullopt;
}

void UploadRequest::on_part_begin(const MultipartPart& part) {
  if(file_seen_ || part.name != http::kFormField || !part.filename) {
    return;
  }
  file_seen_ = true;
  state_ = UploadState::FormParsed;

  auto name = upload_base_name(*part.filename);
  if(!name) {
    throw UploadRejected(http::kStatusBadRequest, kMsgInvalidName);
  }
  state_ = UploadState::NameValidated;

  auto destination = config_.drop_dir / *name;
  try {
    sink_.emplace(FileSink::create_exclusive(destination));
  } catch(const FtrError& e) {
    log_debug(logger_, "{}", e.what());
    if(e.kind() == ErrorKind::NameCollision) {
      throw UploadRejected(http::kStatusConflict, kMsgExists);
    }
    throw UploadRejected(http::kStatusInternalError, kMsgCreateFailed);
  }
  digest_ = std::make_unique<Sha256>();
  stored_path_ = destination;
  in_file_part_ = true;
}

void UploadRequest::on_data(const char* data, std::size_t size) {
  if(!in_file_part_) return;
  try {
    sink_->write(data, size);
  } catch(const FtrError& e) {
    log_error(logger_, "{}", e.what());
    throw UploadRejected(http::kStatusInternalError, kMsgSaveFailed);
  }
  digest_->update(data, size);
}

// The sink stays uncommitted until finish() has seen the whole form, so a
// request torn down before then leaves nothing behind.
void UploadRequest::on_part_end() {
  if(!in_file_part_) return;
  in_file_part_ = false;
  stored_bytes_ = sink_->bytes_written();
  stored_digest_ = digest_->hex_digest();
  file_done_ = true;
  state_ = UploadState::Written;
}

std::optional<UploadOutcome> UploadRequest::consume(const char* data, std::size_t size) {
  if(outcome_) return outcome_;
  if(!parser_) {
    throw std::logic_error("UploadRequest::consume called before begin");
  }
  try {
    parser_->feed(data, size);
  } catch(const UploadRejected& r) {
    return reject(r.status(), r.what());
  } catch(const http::ParseError& e) {
    log_debug(logger_, "Malformed multipart body from {}: {}", peer_, e.what());
    return reject(http::kStatusBadRequest, kMsgNoFile);
  }
  return std::nullopt;
}

UploadOutcome UploadRequest::finish() {
  if(outcome_) return *outcome_;
  if(!parser_) {
    throw std::logic_error("UploadRequest::finish called before begin");
  }
  try {
    parser_->finish();
  } catch(const http::ParseError& e) {
    log_debug(logger_, "Truncated multipart body from {}: {}", peer_, e.what());
    return reject(http::kStatusBadRequest, kMsgNoFile);
  }
  if(!file_done_) {
    return reject(http::kStatusBadRequest, kMsgNoFile);
  }
  try {
    sink_->commit();
  } catch(const FtrError& e) {
    log_error(logger_, "{}", e.what());
    sink_.reset();
    return reject(http::kStatusInternalError, kMsgSaveFailed);
  }
  sink_.reset();

  log_info(logger_, "Received {} ({} bytes, sha256 {}) from {}",
           stored_path_.filename().string(), stored_bytes_, stored_digest_,
           peer_.empty() ? "?" : peer_);

  if(is_directory_) {
    try {
      if(!is_archive_name(stored_path_.filename().string())) {
        throw FtrError(ErrorKind::InvalidUpload,
                       fmt::format("{} is not a .tar.gz archive", stored_path_.filename().string()));
      }
      auto stats = unpack_archive(stored_path_, config_.drop_dir, logger_);
      state_ = UploadState::Extracted;
      log_info(logger_, "Extracted {} file(s), {} dir(s) from {}",
               stats.files, stats.directories, stored_path_.filename().string());
    } catch(const FtrError& e) {
      log_error(logger_, "Extraction of {} failed ({}): {}",
                stored_path_.string(), to_string(e.kind()), e.what());
      return reject(http::kStatusInternalError, kMsgExtractFailed);
    }
  }

  state_ = UploadState::Done;
  outcome_ = UploadOutcome{http::kStatusOk, std::string(), stored_path_};
  return *outcome_;
}

UploadHandler::UploadHandler(ReceiverConfig config, std::shared_ptr<Logger> logger)
  : config_(std::move(config)), logger_(std::move(logger)) {
  if(config_.drop_dir.empty()) {
    throw std::invalid_argument("the drop dir is empty");
  }
  if(config_.pass_key.empty()) {
    throw std::invalid_argument("the passkey is empty");
  }
}

std::unique_ptr<UploadRequest> UploadHandler::start_request(std::string peer) const {
  return std::make_unique<UploadRequest>(config_, logger_.get(), std::move(peer));
}

UploadOutcome UploadHandler::handle(const http::RequestHead& head,
                                    const std::string& body,
                                    const std::string& peer) const {
  auto request = start_request(peer);
  if(auto early = request->begin(head)) return *early;
  if(auto early = request->consume(body.data(), body.size())) return *early;
  return request->finish();
}
