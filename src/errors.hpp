#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  DiscoveryUnavailable,
  PeerNotFound,
  AuthRejected,
  InvalidUpload,
  NameCollision,
  IOError,
  UnsafeArchiveEntry,
  UnsupportedEntryType
};

inline const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::DiscoveryUnavailable: return "DiscoveryUnavailable";
    case ErrorKind::PeerNotFound:         return "PeerNotFound";
    case ErrorKind::AuthRejected:         return "AuthRejected";
    case ErrorKind::InvalidUpload:        return "InvalidUpload";
    case ErrorKind::NameCollision:        return "NameCollision";
    case ErrorKind::IOError:              return "IOError";
    case ErrorKind::UnsafeArchiveEntry:   return "UnsafeArchiveEntry";
    case ErrorKind::UnsupportedEntryType: return "UnsupportedEntryType";
  }
  return "Unknown";
}

// Every failure the transfer core reports carries one of the kinds above.
class FtrError : public std::runtime_error {
public:
  FtrError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};
