#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Minimal DNS wire codec covering what multicast service discovery needs:
// PTR, SRV, TXT and A records. Names are dotted and fully qualified
// ("alice._ftr._tcp.local.").
namespace dns {

enum RecordType : uint16_t {
  kTypeA = 1,
  kTypePtr = 12,
  kTypeTxt = 16,
  kTypeAaaa = 28,
  kTypeSrv = 33,
  kTypeAny = 255
};

constexpr uint16_t kClassIn = 1;
// Top bit of the class field: cache-flush in answers, unicast-response in
// questions.
constexpr uint16_t kClassTopBit = 0x8000;

constexpr uint16_t kFlagResponse = 0x8000;
constexpr uint16_t kFlagAuthoritative = 0x0400;

class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string& message) : std::runtime_error(message) {}
};

struct Question {
  std::string name;
  uint16_t type = kTypeAny;
  uint16_t klass = kClassIn;
  bool unicast_response = false;
};

struct SrvData {
  uint16_t priority = 0;
  uint16_t weight = 0;
  uint16_t port = 0;
  std::string target;
};

struct Record {
  std::string name;
  uint16_t type = kTypeA;
  uint16_t klass = kClassIn;
  bool cache_flush = false;
  uint32_t ttl = 0;

  std::string ptr;
  SrvData srv;
  std::vector<std::string> txt;
  std::array<uint8_t, 4> a{};
  // rdata of any other type, copied as-is
  std::vector<uint8_t> raw;
};

struct Message {
  uint16_t id = 0;
  uint16_t flags = 0;
  std::vector<Question> questions;
  std::vector<Record> answers;
  std::vector<Record> authorities;
  std::vector<Record> additionals;

  bool is_response() const { return (flags & kFlagResponse) != 0; }
};

std::vector<uint8_t> encode(const Message& message);

// Throws FormatError on truncated or malformed input.
Message decode(const uint8_t* data, std::size_t size);

Record make_ptr(const std::string& name, const std::string& target, uint32_t ttl);
Record make_srv(const std::string& name, const SrvData& srv, uint32_t ttl);
Record make_txt(const std::string& name, const std::vector<std::string>& strings, uint32_t ttl);
Record make_a(const std::string& name, const std::array<uint8_t, 4>& address, uint32_t ttl);

// Case-insensitive comparison that ignores a missing trailing dot.
bool name_equals(const std::string& a, const std::string& b);
std::string address_to_string(const std::array<uint8_t, 4>& address);

} // namespace dns
