#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "http_message.hpp"

struct MultipartPart {
  http::Headers headers;
  std::string name;
  std::optional<std::string> filename;
};

// Incremental multipart/form-data decoder. Bytes can be fed in chunks of any
// size; part bodies are streamed through on_data without being buffered.
// Malformed input throws http::ParseError.
class MultipartParser {
public:
  struct Callbacks {
    std::function<void(const MultipartPart&)> on_part_begin;
    std::function<void(const char*, std::size_t)> on_data;
    std::function<void()> on_part_end;
  };

  MultipartParser(const std::string& boundary, Callbacks callbacks);

  void feed(const char* data, std::size_t size);
  // Throws unless the closing delimiter has been seen.
  void finish();
  bool complete() const { return state_ == State::Epilogue; }

private:
  enum class State { Preamble, AfterBoundary, PartHeaders, PartBody, Epilogue };

  bool step();
  void begin_part(const std::string& header_block);

  std::string dash_boundary_;
  std::string delimiter_;
  Callbacks callbacks_;
  State state_ = State::Preamble;
  std::string buffer_;
};

// Boundary parameter of a multipart/form-data Content-Type, nullopt when the
// header names another media type or carries no usable boundary.
std::optional<std::string> multipart_boundary(const std::string& content_type);

// Sender side of a single-file form: opening and closing framing around the
// raw file bytes.
class MultipartWriter {
public:
  explicit MultipartWriter(std::string boundary);

  std::string content_type() const;
  std::string file_part_header(const std::string& field, const std::string& filename) const;
  std::string closing() const;
  // Body size for a file of `file_size` bytes.
  uint64_t body_size(const std::string& field, const std::string& filename, uint64_t file_size) const;

  const std::string& boundary() const { return boundary_; }

private:
  std::string boundary_;
};
