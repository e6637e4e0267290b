#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "discovery.hpp"
#include "errors.hpp"

class Logger;

enum class TransferKind { File, Directory };

const char* to_string(TransferKind kind);

struct TransferRequest {
  std::filesystem::path source_path;
  TransferKind kind = TransferKind::File;
  std::string pass_key;
  std::string target_host;
  uint16_t target_port = 0;
  // Tried in order when target_host refuses the connection.
  std::vector<std::string> fallback_hosts;
};

struct TransferResult {
  std::string upload_name;
  uint64_t bytes_sent = 0;
  std::string endpoint;
};

// Throws FtrError(IOError) when the path is missing or neither a regular file
// nor a directory.
TransferKind classify_source(const std::filesystem::path& source);

TransferRequest make_transfer_request(const std::filesystem::path& source,
                                      const std::string& pass_key,
                                      const PeerEntry& peer);

// Maps a non-200 reply to the error kind the sender reports.
ErrorKind error_kind_for_status(int status);

class Sender {
public:
  explicit Sender(std::shared_ptr<Logger> logger = nullptr);

  // Uploads the request's source. Directories are packed to a temporary
  // archive next to the source, removed again when the call returns.
  TransferResult send(const TransferRequest& request);

private:
  std::shared_ptr<Logger> logger_;
};
