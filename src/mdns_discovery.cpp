#include "mdns_discovery.hpp"

#include <asio.hpp>
#include <fmt/format.h>

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <algorithm>
#include <cstring>
#include <thread>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

using udp = asio::ip::udp;

constexpr const char* kServicesMeta = "_services._dns-sd._udp.local.";
constexpr uint32_t kLegacyUnicastTtl = 10;
constexpr std::size_t kMaxPacket = 9000;

// io_context first so the socket is torn down before it.
struct BrowseIo {
  asio::io_context io;
  udp::socket socket{io};
};

std::string with_trailing_dot(std::string name) {
  if(name.empty() || name.back() != '.') name.push_back('.');
  return name;
}

std::string record_key(const std::string& name) {
  return to_lower_copy(with_trailing_dot(name));
}

void open_multicast_socket(udp::socket& socket, const MdnsOptions& options) {
  std::error_code ec;
  auto group = asio::ip::make_address_v4(options.multicast_group, ec);
  if(ec) {
    throw FtrError(ErrorKind::DiscoveryUnavailable,
                   fmt::format("invalid multicast group '{}'", options.multicast_group));
  }
  udp::endpoint listen(asio::ip::address_v4::any(), options.port);
  auto fail = [&](const char* what) {
    throw FtrError(ErrorKind::DiscoveryUnavailable,
                   fmt::format("mDNS socket {} failed: {}", what, ec.message()));
  };
  socket.open(listen.protocol(), ec);
  if(ec) fail("open");
  socket.set_option(udp::socket::reuse_address(true), ec);
  if(ec) fail("reuse_address");
  socket.bind(listen, ec);
  if(ec) fail("bind");
  socket.set_option(asio::ip::multicast::join_group(group), ec);
  if(ec) fail("join_group");
  socket.set_option(asio::ip::multicast::enable_loopback(true), ec);
  if(ec) fail("enable_loopback");
  socket.set_option(asio::ip::multicast::hops(255), ec);
  if(ec) fail("hops");
}

udp::endpoint group_endpoint(const MdnsOptions& options) {
  return udp::endpoint(asio::ip::make_address_v4(options.multicast_group), options.port);
}

class MdnsAdvertisement : public Advertisement {
public:
  MdnsAdvertisement(ServiceRecordSet records, MdnsOptions options, std::shared_ptr<Logger> logger)
    : records_(std::move(records)),
      options_(std::move(options)),
      logger_(std::move(logger)),
      socket_(io_),
      timer_(io_) {
    open_multicast_socket(socket_, options_);
    group_ = group_endpoint(options_);
    do_receive();
    announce(2);
    thread_ = std::thread([this](){ io_.run(); });
  }

  ~MdnsAdvertisement() override {
    io_.stop();
    if(thread_.joinable()) thread_.join();
    std::error_code ec;
    auto goodbye = dns::encode(build_announcement(records_, options_, 0));
    socket_.send_to(asio::buffer(goodbye), group_, 0, ec);
    if(ec) {
      log_debug(logger_.get(), "mDNS goodbye for '{}' failed: {}", records_.instance, ec.message());
    }
    socket_.close(ec);
  }

private:
  void announce(int remaining) {
    send(build_announcement(records_, options_, options_.ttl), group_);
    if(--remaining <= 0) return;
    timer_.expires_after(options_.announce_interval);
    timer_.async_wait([this, remaining](const std::error_code& ec){
      if(ec) return;
      announce(remaining);
    });
  }

  void do_receive() {
    socket_.async_receive_from(asio::buffer(buffer_), sender_,
      [this](std::error_code ec, std::size_t bytes){
        if(ec) {
          if(ec == asio::error::operation_aborted) return;
          log_debug(logger_.get(), "mDNS receive failed: {}", ec.message());
          do_receive();
          return;
        }
        handle_packet(bytes);
        do_receive();
      });
  }

  void handle_packet(std::size_t bytes) {
    dns::Message query;
    try {
      query = dns::decode(buffer_.data(), bytes);
    } catch(const dns::FormatError& e) {
      log_debug(logger_.get(), "Ignoring malformed mDNS packet from {}: {}",
                sender_.address().to_string(), e.what());
      return;
    }
    bool legacy = sender_.port() != options_.port;
    auto reply = build_answer(query, records_, options_, legacy);
    if(!reply) return;
    bool unicast = legacy;
    if(!unicast && !query.questions.empty()) {
      unicast = std::all_of(query.questions.begin(), query.questions.end(),
                            [](const dns::Question& q){ return q.unicast_response; });
    }
    send(*reply, unicast ? sender_ : group_);
  }

  void send(const dns::Message& message, const udp::endpoint& to) {
    std::shared_ptr<std::vector<uint8_t>> payload;
    try {
      payload = std::make_shared<std::vector<uint8_t>>(dns::encode(message));
    } catch(const dns::FormatError& e) {
      log_warn(logger_.get(), "Unable to encode mDNS response: {}", e.what());
      return;
    }
    socket_.async_send_to(asio::buffer(*payload), to,
      [this, payload](std::error_code ec, std::size_t){
        if(ec && ec != asio::error::operation_aborted) {
          log_debug(logger_.get(), "mDNS send failed: {}", ec.message());
        }
      });
  }

  ServiceRecordSet records_;
  MdnsOptions options_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  udp::socket socket_;
  asio::steady_timer timer_;
  udp::endpoint group_;
  udp::endpoint sender_;
  std::array<uint8_t, kMaxPacket> buffer_{};
  std::thread thread_;
};

// Drives one browse on the producer thread of a PeerStream.
class BrowseSession {
public:
  BrowseSession(asio::io_context& io,
                udp::socket& socket,
                const MdnsOptions& options,
                Logger* logger,
                PeerStream& out)
    : socket_(socket),
      options_(options),
      logger_(logger),
      out_(out),
      assembler_(options),
      query_timer_(io),
      deadline_timer_(io),
      group_(group_endpoint(options)) {}

  void start(std::chrono::milliseconds timeout) {
    deadline_timer_.expires_after(timeout);
    deadline_timer_.async_wait([this](const std::error_code& ec){
      if(ec) return;
      finish();
    });
    send_query();
    do_receive();
  }

private:
  void send_query() {
    if(done_) return;
    auto payload = std::make_shared<std::vector<uint8_t>>(dns::encode(build_browse_query(options_)));
    socket_.async_send_to(asio::buffer(*payload), group_,
      [this, payload](std::error_code ec, std::size_t){
        if(ec && ec != asio::error::operation_aborted) {
          log_debug(logger_, "mDNS query failed: {}", ec.message());
        }
      });
    query_timer_.expires_after(options_.query_interval);
    query_timer_.async_wait([this](const std::error_code& ec){
      if(ec) return;
      send_query();
    });
  }

  void do_receive() {
    socket_.async_receive_from(asio::buffer(buffer_), sender_,
      [this](std::error_code ec, std::size_t bytes){
        if(ec) {
          if(ec == asio::error::operation_aborted || done_) return;
          log_debug(logger_, "mDNS receive failed: {}", ec.message());
          do_receive();
          return;
        }
        try {
          auto message = dns::decode(buffer_.data(), bytes);
          for(auto& entry : assembler_.ingest(message)) {
            log_debug(logger_, "Discovered {} at {}:{}",
                      entry.host_name,
                      entry.addresses.empty() ? std::string("?") : entry.addresses.front(),
                      entry.port);
            if(!out_.publish(std::move(entry))) {
              finish();
              return;
            }
          }
        } catch(const dns::FormatError& e) {
          log_debug(logger_, "Ignoring malformed mDNS packet from {}: {}",
                    sender_.address().to_string(), e.what());
        }
        do_receive();
      });
  }

  void finish() {
    if(done_) return;
    done_ = true;
    std::error_code ec;
    query_timer_.cancel(ec);
    deadline_timer_.cancel(ec);
    socket_.close(ec);
  }

  udp::socket& socket_;
  const MdnsOptions& options_;
  Logger* logger_;
  PeerStream& out_;
  BrowseAssembler assembler_;
  asio::steady_timer query_timer_;
  asio::steady_timer deadline_timer_;
  udp::endpoint group_;
  udp::endpoint sender_;
  std::array<uint8_t, kMaxPacket> buffer_{};
  bool done_ = false;
};

} // namespace

std::string service_fqdn(const MdnsOptions& options) {
  return with_trailing_dot(options.service_type + "." + options.domain);
}

std::string instance_fqdn(const std::string& instance, const MdnsOptions& options) {
  return instance + "." + service_fqdn(options);
}

std::string host_fqdn(const std::string& instance, const MdnsOptions& options) {
  return with_trailing_dot(instance + "." + options.domain);
}

dns::Message build_announcement(const ServiceRecordSet& records,
                                const MdnsOptions& options,
                                uint32_t ttl) {
  dns::Message message;
  message.flags = dns::kFlagResponse | dns::kFlagAuthoritative;
  auto instance = instance_fqdn(records.instance, options);
  auto host = host_fqdn(records.instance, options);
  message.answers.push_back(dns::make_ptr(service_fqdn(options), instance, ttl));
  message.answers.push_back(dns::make_srv(instance, {0, 0, records.port, host}, ttl));
  message.answers.push_back(dns::make_txt(instance, records.txt, ttl));
  for(const auto& address : records.addresses) {
    message.answers.push_back(dns::make_a(host, address, ttl));
  }
  return message;
}

std::optional<dns::Message> build_answer(const dns::Message& query,
                                         const ServiceRecordSet& records,
                                         const MdnsOptions& options,
                                         bool legacy_unicast) {
  if(query.is_response()) return std::nullopt;

  auto service = service_fqdn(options);
  auto instance = instance_fqdn(records.instance, options);
  auto host = host_fqdn(records.instance, options);

  bool want_meta = false, want_ptr = false, want_srv = false, want_txt = false, want_a = false;
  for(const auto& q : query.questions) {
    bool any = q.type == dns::kTypeAny;
    if(dns::name_equals(q.name, service)) {
      want_ptr |= any || q.type == dns::kTypePtr;
    } else if(dns::name_equals(q.name, kServicesMeta)) {
      want_meta |= any || q.type == dns::kTypePtr;
    } else if(dns::name_equals(q.name, instance)) {
      want_srv |= any || q.type == dns::kTypeSrv;
      want_txt |= any || q.type == dns::kTypeTxt;
    } else if(dns::name_equals(q.name, host)) {
      want_a |= any || q.type == dns::kTypeA;
    }
  }
  if(!(want_meta || want_ptr || want_srv || want_txt || want_a)) return std::nullopt;

  uint32_t ttl = legacy_unicast ? std::min(options.ttl, kLegacyUnicastTtl) : options.ttl;
  dns::Message reply;
  reply.flags = dns::kFlagResponse | dns::kFlagAuthoritative;
  if(legacy_unicast) {
    reply.id = query.id;
    reply.questions = query.questions;
  }

  auto srv = dns::make_srv(instance, {0, 0, records.port, host}, ttl);
  auto txt = dns::make_txt(instance, records.txt, ttl);
  auto add_addresses = [&](std::vector<dns::Record>& section) {
    for(const auto& address : records.addresses) {
      section.push_back(dns::make_a(host, address, ttl));
    }
  };

  if(want_meta) reply.answers.push_back(dns::make_ptr(kServicesMeta, service, ttl));
  if(want_ptr) reply.answers.push_back(dns::make_ptr(service, instance, ttl));
  if(want_srv) reply.answers.push_back(srv);
  if(want_txt) reply.answers.push_back(txt);
  if(want_a) add_addresses(reply.answers);

  if(want_ptr && !want_srv) reply.additionals.push_back(srv);
  if(want_ptr && !want_txt) reply.additionals.push_back(txt);
  if((want_ptr || want_srv) && !want_a) add_addresses(reply.additionals);

  if(legacy_unicast) {
    for(auto& r : reply.answers) r.cache_flush = false;
    for(auto& r : reply.additionals) r.cache_flush = false;
  }
  return reply;
}

dns::Message build_browse_query(const MdnsOptions& options) {
  dns::Message query;
  dns::Question question;
  question.name = service_fqdn(options);
  question.type = dns::kTypePtr;
  query.questions.push_back(question);
  return query;
}

BrowseAssembler::BrowseAssembler(MdnsOptions options)
  : options_(std::move(options)),
    service_(record_key(service_fqdn(options_))) {}

void BrowseAssembler::consider(const dns::Record& record) {
  if(record.ttl == 0) return;
  switch(record.type) {
    case dns::kTypePtr:
      if(record_key(record.name) == service_) {
        instances_[record_key(record.ptr)] = with_trailing_dot(record.ptr);
      }
      break;
    case dns::kTypeSrv:
      srv_[record_key(record.name)] = record.srv;
      break;
    case dns::kTypeTxt:
      txt_[record_key(record.name)] = record.txt;
      break;
    case dns::kTypeA: {
      auto& list = addresses_[record_key(record.name)];
      auto text = dns::address_to_string(record.a);
      if(std::find(list.begin(), list.end(), text) == list.end()) {
        list.push_back(text);
      }
      break;
    }
    default:
      break;
  }
}

std::string BrowseAssembler::instance_label(const std::string& fqdn) const {
  auto suffix = "." + service_;
  auto lowered = to_lower_copy(fqdn);
  if(lowered.size() > suffix.size() &&
     lowered.compare(lowered.size() - suffix.size(), suffix.size(), suffix) == 0) {
    return fqdn.substr(0, fqdn.size() - suffix.size());
  }
  return fqdn;
}

std::vector<PeerEntry> BrowseAssembler::ingest(const dns::Message& message) {
  std::vector<PeerEntry> ready;
  if(!message.is_response()) return ready;

  for(const auto& record : message.answers) consider(record);
  for(const auto& record : message.additionals) consider(record);

  for(const auto& [key, fqdn] : instances_) {
    if(emitted_.count(key)) continue;
    auto srv = srv_.find(key);
    if(srv == srv_.end()) continue;
    auto addresses = addresses_.find(record_key(srv->second.target));
    if(addresses == addresses_.end() || addresses->second.empty()) continue;

    PeerEntry entry;
    entry.host_name = instance_label(fqdn);
    entry.addresses = addresses->second;
    entry.port = srv->second.port;
    auto txt = txt_.find(key);
    if(txt != txt_.end()) entry.metadata = txt->second;
    emitted_.insert(key);
    ready.push_back(std::move(entry));
  }
  return ready;
}

std::vector<std::array<uint8_t, 4>> local_ipv4_addresses() {
  std::vector<std::array<uint8_t, 4>> out;
  ifaddrs* list = nullptr;
  if(getifaddrs(&list) != 0) return out;
  for(auto* it = list; it; it = it->ifa_next) {
    if(!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    if(!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) continue;
    auto* sin = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
    std::array<uint8_t, 4> bytes{};
    std::memcpy(bytes.data(), &sin->sin_addr.s_addr, bytes.size());
    if(std::find(out.begin(), out.end(), bytes) == out.end()) {
      out.push_back(bytes);
    }
  }
  freeifaddrs(list);
  return out;
}

MdnsDiscovery::MdnsDiscovery(MdnsOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(std::move(logger)) {}

std::unique_ptr<Advertisement> MdnsDiscovery::advertise(const std::string& instance_name,
                                                        uint16_t port,
                                                        const std::vector<std::string>& metadata) {
  if(instance_name.empty() || instance_name.size() > 63 ||
     instance_name.find('.') != std::string::npos) {
    throw FtrError(ErrorKind::DiscoveryUnavailable,
                   fmt::format("'{}' is not a valid instance name (1-63 characters, no dots)",
                               instance_name));
  }
  for(const auto& item : metadata) {
    if(item.size() > 255) {
      throw FtrError(ErrorKind::DiscoveryUnavailable,
                     "advertised metadata entries are limited to 255 bytes");
    }
  }

  ServiceRecordSet records;
  records.instance = instance_name;
  records.port = port;
  records.txt = metadata;
  records.addresses = local_ipv4_addresses();
  if(records.addresses.empty()) {
    records.addresses.push_back({127, 0, 0, 1});
  }
  log_debug(logger_.get(), "Advertising {} on port {} ({} address(es))",
            instance_fqdn(instance_name, options_), port, records.addresses.size());
  return std::make_unique<MdnsAdvertisement>(std::move(records), options_, logger_);
}

std::unique_ptr<PeerStream> MdnsDiscovery::browse(std::chrono::milliseconds timeout) {
  auto net = std::make_shared<BrowseIo>();
  open_multicast_socket(net->socket, options_);

  auto stream = std::make_unique<PeerStream>();
  auto options = options_;
  auto logger = logger_;
  stream->run_producer(
    [net, options, logger, timeout](PeerStream& out){
      BrowseSession session(net->io, net->socket, options, logger.get(), out);
      session.start(timeout);
      net->io.run();
    },
    [net](){ net->io.stop(); });
  return stream;
}
