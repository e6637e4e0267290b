#include "multipart.hpp"

#include <fmt/format.h>

namespace {

constexpr std::size_t kMaxBoundary = 70;

std::string escape_quoted(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for(char c : value) {
    if(c == '\\' || c == '"') out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

} // namespace

MultipartParser::MultipartParser(const std::string& boundary, Callbacks callbacks)
  : dash_boundary_("--" + boundary),
    delimiter_("\r\n--" + boundary),
    callbacks_(std::move(callbacks)) {
  if(boundary.empty() || boundary.size() > kMaxBoundary) {
    throw http::ParseError("invalid multipart boundary");
  }
}

void MultipartParser::feed(const char* data, std::size_t size) {
  if(state_ == State::Epilogue) return;
  buffer_.append(data, size);
  while(step()) {}
}

void MultipartParser::finish() {
  if(state_ != State::Epilogue) {
    throw http::ParseError("multipart body ended before the closing boundary");
  }
}

bool MultipartParser::step() {
  switch(state_) {
    case State::Preamble: {
      auto pos = buffer_.find(dash_boundary_);
      if(pos == std::string::npos) {
        if(buffer_.size() >= dash_boundary_.size()) {
          buffer_.erase(0, buffer_.size() - dash_boundary_.size() + 1);
        }
        return false;
      }
      buffer_.erase(0, pos + dash_boundary_.size());
      state_ = State::AfterBoundary;
      return true;
    }
    case State::AfterBoundary: {
      std::size_t pad = 0;
      while(pad < buffer_.size() && (buffer_[pad] == ' ' || buffer_[pad] == '\t')) ++pad;
      buffer_.erase(0, pad);
      if(buffer_.size() < 2) return false;
      if(buffer_.compare(0, 2, "--") == 0) {
        buffer_.clear();
        state_ = State::Epilogue;
        return false;
      }
      if(buffer_.compare(0, 2, "\r\n") != 0) {
        throw http::ParseError("malformed multipart boundary line");
      }
      buffer_.erase(0, 2);
      state_ = State::PartHeaders;
      return true;
    }
    case State::PartHeaders: {
      if(buffer_.size() >= 2 && buffer_.compare(0, 2, "\r\n") == 0) {
        buffer_.erase(0, 2);
        begin_part(std::string());
        return true;
      }
      auto end = buffer_.find("\r\n\r\n");
      if(end == std::string::npos) {
        if(buffer_.size() > http::kMaxHeadSize) {
          throw http::ParseError("multipart part headers too large");
        }
        return false;
      }
      auto block = buffer_.substr(0, end + 2);
      buffer_.erase(0, end + 4);
      begin_part(block);
      return true;
    }
    case State::PartBody: {
      auto pos = buffer_.find(delimiter_);
      if(pos == std::string::npos) {
        std::size_t keep = delimiter_.size() - 1;
        if(buffer_.size() > keep) {
          std::size_t emit = buffer_.size() - keep;
          if(callbacks_.on_data) callbacks_.on_data(buffer_.data(), emit);
          buffer_.erase(0, emit);
        }
        return false;
      }
      if(pos > 0 && callbacks_.on_data) callbacks_.on_data(buffer_.data(), pos);
      buffer_.erase(0, pos + delimiter_.size());
      if(callbacks_.on_part_end) callbacks_.on_part_end();
      state_ = State::AfterBoundary;
      return true;
    }
    case State::Epilogue:
      buffer_.clear();
      return false;
  }
  return false;
}

void MultipartParser::begin_part(const std::string& header_block) {
  MultipartPart part;
  part.headers = http::parse_header_lines(header_block);
  if(auto disposition = part.headers.get("Content-Disposition")) {
    if(http::media_type(*disposition) != "form-data") {
      throw http::ParseError(fmt::format("unexpected Content-Disposition '{}'", *disposition));
    }
    part.name = http::header_parameter(*disposition, "name").value_or(std::string());
    part.filename = http::header_parameter(*disposition, "filename");
  }
  state_ = State::PartBody;
  if(callbacks_.on_part_begin) callbacks_.on_part_begin(part);
}

std::optional<std::string> multipart_boundary(const std::string& content_type) {
  if(http::media_type(content_type) != "multipart/form-data") return std::nullopt;
  std::optional<std::string> boundary;
  try {
    boundary = http::header_parameter(content_type, "boundary");
  } catch(const http::ParseError&) {
    return std::nullopt;
  }
  if(!boundary || boundary->empty() || boundary->size() > kMaxBoundary) return std::nullopt;
  return boundary;
}

MultipartWriter::MultipartWriter(std::string boundary) : boundary_(std::move(boundary)) {}

std::string MultipartWriter::content_type() const {
  return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartWriter::file_part_header(const std::string& field, const std::string& filename) const {
  return fmt::format("--{}\r\n"
                     "Content-Disposition: form-data; name=\"{}\"; filename=\"{}\"\r\n"
                     "Content-Type: application/octet-stream\r\n"
                     "\r\n",
                     boundary_, escape_quoted(field), escape_quoted(filename));
}

std::string MultipartWriter::closing() const {
  return fmt::format("\r\n--{}--\r\n", boundary_);
}

uint64_t MultipartWriter::body_size(const std::string& field,
                                    const std::string& filename,
                                    uint64_t file_size) const {
  return file_part_header(field, filename).size() + file_size + closing().size();
}
