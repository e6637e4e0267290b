#include "http_message.hpp"

#include <fmt/format.h>

#include <cctype>

#include "utils.hpp"

namespace http {
namespace {

std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while(b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
  while(e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
  return s.substr(b, e - b);
}

// Splits at the first line break; returns the first line and the remainder.
std::pair<std::string, std::string> split_first_line(const std::string& text) {
  auto nl = text.find('\n');
  if(nl == std::string::npos) return {trim(text), std::string()};
  return {trim(text.substr(0, nl)), text.substr(nl + 1)};
}

std::optional<uint64_t> parse_length(const std::optional<std::string>& value) {
  if(!value) return std::nullopt;
  auto text = trim(*value);
  if(text.empty() || text.size() > 19) throw ParseError("invalid Content-Length");
  uint64_t n = 0;
  for(char c : text) {
    if(!std::isdigit(static_cast<unsigned char>(c))) throw ParseError("invalid Content-Length");
    n = n * 10 + static_cast<uint64_t>(c - '0');
  }
  return n;
}

bool is_token_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) ||
         std::string("!#$%&'*+-.^_`|~").find(c) != std::string::npos;
}

} // namespace

void Headers::add(std::string name, std::string value) {
  items_.emplace_back(std::move(name), std::move(value));
}

void Headers::set(const std::string& name, std::string value) {
  for(auto& item : items_) {
    if(iequals(item.first, name)) {
      item.second = std::move(value);
      return;
    }
  }
  add(name, std::move(value));
}

std::optional<std::string> Headers::get(const std::string& name) const {
  for(const auto& item : items_) {
    if(iequals(item.first, name)) return item.second;
  }
  return std::nullopt;
}

std::optional<uint64_t> RequestHead::content_length() const {
  return parse_length(headers.get("Content-Length"));
}

std::optional<uint64_t> ResponseHead::content_length() const {
  return parse_length(headers.get("Content-Length"));
}

Headers parse_header_lines(const std::string& text) {
  Headers headers;
  std::size_t pos = 0;
  while(pos < text.size()) {
    auto nl = text.find('\n', pos);
    if(nl == std::string::npos) nl = text.size();
    auto line = text.substr(pos, nl - pos);
    pos = nl + 1;
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) continue;
    if(line.front() == ' ' || line.front() == '\t') {
      throw ParseError("obsolete header line folding");
    }
    auto colon = line.find(':');
    if(colon == std::string::npos || colon == 0) {
      throw ParseError(fmt::format("malformed header line '{}'", line));
    }
    auto name = line.substr(0, colon);
    for(char c : name) {
      if(!is_token_char(c)) throw ParseError(fmt::format("invalid header name '{}'", name));
    }
    headers.add(name, trim(line.substr(colon + 1)));
  }
  return headers;
}

RequestHead parse_request_head(const std::string& text) {
  auto [line, rest] = split_first_line(text);
  RequestHead head;
  auto sp1 = line.find(' ');
  auto sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
  if(sp1 == std::string::npos || sp2 == std::string::npos) {
    throw ParseError(fmt::format("malformed request line '{}'", line));
  }
  head.method = line.substr(0, sp1);
  head.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
  head.version = line.substr(sp2 + 1);
  if(head.method.empty() || head.target.empty() || head.version.rfind("HTTP/1.", 0) != 0) {
    throw ParseError(fmt::format("malformed request line '{}'", line));
  }
  head.headers = parse_header_lines(rest);
  return head;
}

ResponseHead parse_response_head(const std::string& text) {
  auto [line, rest] = split_first_line(text);
  ResponseHead head;
  auto sp1 = line.find(' ');
  if(sp1 == std::string::npos || line.rfind("HTTP/", 0) != 0) {
    throw ParseError(fmt::format("malformed status line '{}'", line));
  }
  head.version = line.substr(0, sp1);
  auto sp2 = line.find(' ', sp1 + 1);
  auto code = line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
  if(code.size() != 3 || !std::isdigit(static_cast<unsigned char>(code[0])) ||
     !std::isdigit(static_cast<unsigned char>(code[1])) ||
     !std::isdigit(static_cast<unsigned char>(code[2]))) {
    throw ParseError(fmt::format("malformed status line '{}'", line));
  }
  head.status = std::stoi(code);
  head.reason = sp2 == std::string::npos ? std::string() : line.substr(sp2 + 1);
  head.headers = parse_header_lines(rest);
  return head;
}

std::string reason_phrase(int status) {
  switch(status) {
    case kStatusContinue:         return "Continue";
    case kStatusOk:               return "OK";
    case kStatusBadRequest:       return "Bad Request";
    case kStatusUnauthorized:     return "Unauthorized";
    case kStatusMethodNotAllowed: return "Method Not Allowed";
    case kStatusConflict:         return "Conflict";
    case kStatusInternalError:    return "Internal Server Error";
    default:                      return "Unknown";
  }
}

std::string format_response(int status, const std::string& body) {
  std::string text = body;
  if(!text.empty() && text.back() != '\n') text.push_back('\n');
  std::string out = fmt::format("HTTP/1.1 {} {}\r\n", status, reason_phrase(status));
  out += "Content-Type: text/plain; charset=utf-8\r\n";
  out += "X-Content-Type-Options: nosniff\r\n";
  out += fmt::format("Content-Length: {}\r\n", text.size());
  out += "Connection: close\r\n\r\n";
  out += text;
  return out;
}

std::string format_request_head(const std::string& method,
                                const std::string& target,
                                const Headers& headers) {
  std::string out = fmt::format("{} {} HTTP/1.1\r\n", method, target);
  for(const auto& [name, value] : headers.items()) {
    out += fmt::format("{}: {}\r\n", name, value);
  }
  out += "\r\n";
  return out;
}

std::string media_type(const std::string& value) {
  auto semi = value.find(';');
  return to_lower_copy(trim(value.substr(0, semi)));
}

std::optional<std::string> header_parameter(const std::string& value, const std::string& name) {
  std::size_t pos = value.find(';');
  while(pos != std::string::npos && pos < value.size()) {
    ++pos;
    while(pos < value.size() && (value[pos] == ' ' || value[pos] == '\t')) ++pos;
    auto eq = value.find('=', pos);
    if(eq == std::string::npos) return std::nullopt;
    auto key = trim(value.substr(pos, eq - pos));
    pos = eq + 1;
    std::string parsed;
    if(pos < value.size() && value[pos] == '"') {
      ++pos;
      bool closed = false;
      while(pos < value.size()) {
        char c = value[pos++];
        if(c == '\\' && pos < value.size()) {
          parsed.push_back(value[pos++]);
        } else if(c == '"') {
          closed = true;
          break;
        } else {
          parsed.push_back(c);
        }
      }
      if(!closed) throw ParseError(fmt::format("unterminated quoted parameter in '{}'", value));
      pos = value.find(';', pos);
    } else {
      auto end = value.find(';', pos);
      parsed = trim(value.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
      pos = end;
    }
    if(iequals(key, name)) return parsed;
  }
  return std::nullopt;
}

} // namespace http
