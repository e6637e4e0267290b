#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "file_sink.hpp"
#include "http_message.hpp"
#include "multipart.hpp"
#include "utils.hpp"

class Logger;

struct ReceiverConfig {
  std::filesystem::path drop_dir;
  std::string pass_key;
  uint16_t port = 8844;
  std::string listen_ip = "0.0.0.0";
};

// Makes drop_dir absolute and creates it when missing. Throws
// FtrError(IOError) if it cannot be created or is not a directory.
ReceiverConfig prepare_receiver_config(ReceiverConfig config);

enum class UploadState {
  Unauthenticated,
  MethodChecked,
  FormParsed,
  NameValidated,
  Written,
  Extracted,
  Done,
  Error
};

const char* to_string(UploadState state);

struct UploadOutcome {
  int status = http::kStatusOk;
  std::string message;
  std::filesystem::path stored_path;
};

// "photos/2024/" -> "2024". nullopt when the name reduces to "", "." or "..".
std::optional<std::string> upload_base_name(const std::string& client_name);

bool is_archive_name(const std::string& file_name);

// Pipeline for a single upload request. The head goes through begin(), body
// bytes through consume() as they arrive, and finish() runs once the declared
// body length has been read. Any step may return the terminal outcome early.
class UploadRequest {
public:
  UploadRequest(const ReceiverConfig& config, Logger* logger, std::string peer);

  std::optional<UploadOutcome> begin(const http::RequestHead& head);
  std::optional<UploadOutcome> consume(const char* data, std::size_t size);
  UploadOutcome finish();

  UploadState state() const { return state_; }
  bool expects_continue() const { return expect_continue_; }
  uint64_t body_length() const { return body_length_; }

private:
  void on_part_begin(const MultipartPart& part);
  void on_data(const char* data, std::size_t size);
  void on_part_end();
  UploadOutcome reject(int status, const std::string& message);

  const ReceiverConfig& config_;
  Logger* logger_;
  std::string peer_;
  UploadState state_ = UploadState::Unauthenticated;
  bool is_directory_ = false;
  bool expect_continue_ = false;
  uint64_t body_length_ = 0;
  std::unique_ptr<MultipartParser> parser_;
  bool in_file_part_ = false;
  bool file_seen_ = false;
  bool file_done_ = false;
  std::optional<FileSink> sink_;
  std::unique_ptr<Sha256> digest_;
  std::filesystem::path stored_path_;
  uint64_t stored_bytes_ = 0;
  std::string stored_digest_;
  std::optional<UploadOutcome> outcome_;
};

class UploadHandler {
public:
  // Throws std::invalid_argument when the drop dir or pass key is empty.
  UploadHandler(ReceiverConfig config, std::shared_ptr<Logger> logger);

  std::unique_ptr<UploadRequest> start_request(std::string peer) const;

  // Runs the whole pipeline over a body that is already in memory.
  UploadOutcome handle(const http::RequestHead& head,
                       const std::string& body,
                       const std::string& peer = std::string()) const;

  const ReceiverConfig& config() const { return config_; }
  Logger* logger() const { return logger_.get(); }

private:
  ReceiverConfig config_;
  std::shared_ptr<Logger> logger_;
};
