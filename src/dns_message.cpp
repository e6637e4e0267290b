#include "dns_message.hpp"

#include <fmt/format.h>

#include <utility>

#include "utils.hpp"

namespace dns {
namespace {

constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kMaxLabel = 63;
constexpr std::size_t kMaxName = 255;
constexpr int kMaxPointerJumps = 32;

class Writer {
public:
  void u8(uint8_t v) { out_.push_back(v); }
  void u16(uint16_t v) {
    out_.push_back(static_cast<uint8_t>(v >> 8));
    out_.push_back(static_cast<uint8_t>(v & 0xff));
  }
  void u32(uint32_t v) {
    u16(static_cast<uint16_t>(v >> 16));
    u16(static_cast<uint16_t>(v & 0xffff));
  }
  void bytes(const uint8_t* data, std::size_t size) { out_.insert(out_.end(), data, data + size); }

  void name(const std::string& dotted) {
    std::size_t start = 0;
    if(dotted == ".") start = 1;
    while(start < dotted.size()) {
      auto dot = dotted.find('.', start);
      if(dot == std::string::npos) dot = dotted.size();
      std::size_t len = dot - start;
      if(len == 0) throw FormatError(fmt::format("empty label in '{}'", dotted));
      if(len > kMaxLabel) throw FormatError(fmt::format("label too long in '{}'", dotted));
      u8(static_cast<uint8_t>(len));
      bytes(reinterpret_cast<const uint8_t*>(dotted.data() + start), len);
      start = dot + 1;
    }
    u8(0);
  }

  std::size_t size() const { return out_.size(); }
  void patch_u16(std::size_t at, uint16_t v) {
    out_[at] = static_cast<uint8_t>(v >> 8);
    out_[at + 1] = static_cast<uint8_t>(v & 0xff);
  }
  std::vector<uint8_t> take() { return std::move(out_); }

private:
  std::vector<uint8_t> out_;
};

void write_record(Writer& w, const Record& r) {
  w.name(r.name);
  w.u16(r.type);
  w.u16(static_cast<uint16_t>((r.klass & 0x7fff) | (r.cache_flush ? kClassTopBit : 0)));
  w.u32(r.ttl);
  auto length_at = w.size();
  w.u16(0);
  auto rdata_start = w.size();
  switch(r.type) {
    case kTypeA:
      w.bytes(r.a.data(), r.a.size());
      break;
    case kTypePtr:
      w.name(r.ptr);
      break;
    case kTypeSrv:
      w.u16(r.srv.priority);
      w.u16(r.srv.weight);
      w.u16(r.srv.port);
      w.name(r.srv.target);
      break;
    case kTypeTxt:
      if(r.txt.empty()) {
        w.u8(0);
      }
      for(const auto& s : r.txt) {
        if(s.size() > 255) throw FormatError("TXT string longer than 255 bytes");
        w.u8(static_cast<uint8_t>(s.size()));
        w.bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
      }
      break;
    default:
      w.bytes(r.raw.data(), r.raw.size());
      break;
  }
  auto rdlength = w.size() - rdata_start;
  if(rdlength > 0xffff) throw FormatError("rdata too long");
  w.patch_u16(length_at, static_cast<uint16_t>(rdlength));
}

class Reader {
public:
  Reader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  void need(std::size_t n) const {
    if(pos_ + n > size_) throw FormatError("truncated message");
  }
  uint8_t u8() { need(1); return data_[pos_++]; }
  uint16_t u16() {
    need(2);
    uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return v;
  }
  uint32_t u32() {
    uint32_t hi = u16();
    return (hi << 16) | u16();
  }

  // Reads a possibly compressed name starting at the cursor.
  std::string name() {
    std::string out;
    std::size_t cursor = pos_;
    bool jumped = false;
    int jumps = 0;
    while(true) {
      if(cursor >= size_) throw FormatError("truncated name");
      uint8_t len = data_[cursor];
      if((len & 0xc0) == 0xc0) {
        if(cursor + 1 >= size_) throw FormatError("truncated name pointer");
        std::size_t target = (static_cast<std::size_t>(len & 0x3f) << 8) | data_[cursor + 1];
        if(!jumped) pos_ = cursor + 2;
        jumped = true;
        if(++jumps > kMaxPointerJumps) throw FormatError("name compression loop");
        if(target >= size_) throw FormatError("name pointer out of range");
        cursor = target;
        continue;
      }
      if(len & 0xc0) throw FormatError("unsupported label type");
      if(len == 0) {
        if(!jumped) pos_ = cursor + 1;
        break;
      }
      if(cursor + 1 + len > size_) throw FormatError("truncated label");
      out.append(reinterpret_cast<const char*>(data_ + cursor + 1), len);
      out.push_back('.');
      if(out.size() > kMaxName) throw FormatError("name too long");
      cursor += 1 + len;
    }
    if(out.empty()) out = ".";
    return out;
  }

  std::size_t pos() const { return pos_; }
  void seek(std::size_t pos) { pos_ = pos; }
  const uint8_t* at(std::size_t pos) const { return data_ + pos; }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};

Record read_record(Reader& r) {
  Record rec;
  rec.name = r.name();
  rec.type = r.u16();
  uint16_t klass = r.u16();
  rec.cache_flush = (klass & kClassTopBit) != 0;
  rec.klass = static_cast<uint16_t>(klass & 0x7fff);
  rec.ttl = r.u32();
  uint16_t rdlength = r.u16();
  r.need(rdlength);
  std::size_t start = r.pos();
  std::size_t end = start + rdlength;
  switch(rec.type) {
    case kTypeA:
      if(rdlength != 4) throw FormatError("A record with bad length");
      for(std::size_t i = 0; i < 4; ++i) rec.a[i] = r.u8();
      break;
    case kTypePtr:
      rec.ptr = r.name();
      break;
    case kTypeSrv:
      rec.srv.priority = r.u16();
      rec.srv.weight = r.u16();
      rec.srv.port = r.u16();
      rec.srv.target = r.name();
      break;
    case kTypeTxt:
      while(r.pos() < end) {
        uint8_t len = r.u8();
        if(r.pos() + len > end) throw FormatError("TXT string overruns rdata");
        if(len > 0) {
          rec.txt.emplace_back(reinterpret_cast<const char*>(r.at(r.pos())), len);
        }
        r.seek(r.pos() + len);
      }
      break;
    default:
      rec.raw.assign(r.at(start), r.at(end));
      break;
  }
  if(r.pos() > end) throw FormatError("record overruns rdata");
  r.seek(end);
  return rec;
}

std::string strip_trailing_dot(const std::string& name) {
  if(!name.empty() && name.back() == '.') return name.substr(0, name.size() - 1);
  return name;
}

} // namespace

std::vector<uint8_t> encode(const Message& message) {
  Writer w;
  w.u16(message.id);
  w.u16(message.flags);
  w.u16(static_cast<uint16_t>(message.questions.size()));
  w.u16(static_cast<uint16_t>(message.answers.size()));
  w.u16(static_cast<uint16_t>(message.authorities.size()));
  w.u16(static_cast<uint16_t>(message.additionals.size()));
  for(const auto& q : message.questions) {
    w.name(q.name);
    w.u16(q.type);
    w.u16(static_cast<uint16_t>((q.klass & 0x7fff) | (q.unicast_response ? kClassTopBit : 0)));
  }
  for(const auto& r : message.answers) write_record(w, r);
  for(const auto& r : message.authorities) write_record(w, r);
  for(const auto& r : message.additionals) write_record(w, r);
  return w.take();
}

Message decode(const uint8_t* data, std::size_t size) {
  if(size < kHeaderSize) throw FormatError("message shorter than header");
  Reader r(data, size);
  Message m;
  m.id = r.u16();
  m.flags = r.u16();
  uint16_t qd = r.u16();
  uint16_t an = r.u16();
  uint16_t ns = r.u16();
  uint16_t ar = r.u16();
  for(uint16_t i = 0; i < qd; ++i) {
    Question q;
    q.name = r.name();
    q.type = r.u16();
    uint16_t klass = r.u16();
    q.unicast_response = (klass & kClassTopBit) != 0;
    q.klass = static_cast<uint16_t>(klass & 0x7fff);
    m.questions.push_back(std::move(q));
  }
  for(uint16_t i = 0; i < an; ++i) m.answers.push_back(read_record(r));
  for(uint16_t i = 0; i < ns; ++i) m.authorities.push_back(read_record(r));
  for(uint16_t i = 0; i < ar; ++i) m.additionals.push_back(read_record(r));
  return m;
}

Record make_ptr(const std::string& name, const std::string& target, uint32_t ttl) {
  Record r;
  r.name = name;
  r.type = kTypePtr;
  r.ttl = ttl;
  r.ptr = target;
  return r;
}

Record make_srv(const std::string& name, const SrvData& srv, uint32_t ttl) {
  Record r;
  r.name = name;
  r.type = kTypeSrv;
  r.cache_flush = true;
  r.ttl = ttl;
  r.srv = srv;
  return r;
}

Record make_txt(const std::string& name, const std::vector<std::string>& strings, uint32_t ttl) {
  Record r;
  r.name = name;
  r.type = kTypeTxt;
  r.cache_flush = true;
  r.ttl = ttl;
  r.txt = strings;
  return r;
}

Record make_a(const std::string& name, const std::array<uint8_t, 4>& address, uint32_t ttl) {
  Record r;
  r.name = name;
  r.type = kTypeA;
  r.cache_flush = true;
  r.ttl = ttl;
  r.a = address;
  return r;
}

bool name_equals(const std::string& a, const std::string& b) {
  return iequals(strip_trailing_dot(a), strip_trailing_dot(b));
}

std::string address_to_string(const std::array<uint8_t, 4>& address) {
  return fmt::format("{}.{}.{}.{}", address[0], address[1], address[2], address[3]);
}

} // namespace dns
