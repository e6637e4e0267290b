#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Just enough HTTP/1.1 framing for one upload per connection.
namespace http {

constexpr const char* kPassKeyHeader = "X-Ftr-Passkey";
constexpr const char* kFileTypeHeader = "X-Ftr-File-Type";
constexpr const char* kFileTypeFile = "file";
constexpr const char* kFileTypeDir = "dir";
constexpr const char* kUploadTarget = "/upload";
constexpr const char* kFormField = "file";

constexpr int kStatusContinue = 100;
constexpr int kStatusOk = 200;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusUnauthorized = 401;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusConflict = 409;
constexpr int kStatusInternalError = 500;

constexpr std::size_t kMaxHeadSize = 16 * 1024;

class ParseError : public std::runtime_error {
public:
  explicit ParseError(const std::string& message) : std::runtime_error(message) {}
};

// Ordered header list with case-insensitive lookup.
class Headers {
public:
  void add(std::string name, std::string value);
  void set(const std::string& name, std::string value);
  std::optional<std::string> get(const std::string& name) const;
  bool has(const std::string& name) const { return get(name).has_value(); }

  const std::vector<std::pair<std::string, std::string>>& items() const { return items_; }

private:
  std::vector<std::pair<std::string, std::string>> items_;
};

struct RequestHead {
  std::string method;
  std::string target;
  std::string version;
  Headers headers;

  // Throws ParseError on a malformed value.
  std::optional<uint64_t> content_length() const;
};

struct ResponseHead {
  std::string version;
  int status = 0;
  std::string reason;
  Headers headers;

  std::optional<uint64_t> content_length() const;
};

// `text` is everything up to and including the blank line.
RequestHead parse_request_head(const std::string& text);
ResponseHead parse_response_head(const std::string& text);

// Parses "Name: value" lines separated by CRLF (bare LF tolerated).
Headers parse_header_lines(const std::string& text);

std::string reason_phrase(int status);

// Complete response with a text/plain body and Connection: close.
std::string format_response(int status, const std::string& body);

std::string format_request_head(const std::string& method,
                                const std::string& target,
                                const Headers& headers);

// Media type without parameters, lowercased ("multipart/form-data").
std::string media_type(const std::string& value);

// Value of parameter `name` in a header such as
// `form-data; name="file"; filename="a.txt"`. Quoted strings are unescaped.
std::optional<std::string> header_parameter(const std::string& value, const std::string& name);

} // namespace http
