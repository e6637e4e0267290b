#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "discovery.hpp"
#include "dns_message.hpp"

class Logger;

struct MdnsOptions {
  std::string service_type = "_ftr._tcp";
  std::string domain = "local.";
  std::string multicast_group = "224.0.0.251";
  uint16_t port = 5353;
  uint32_t ttl = 120;
  std::chrono::milliseconds query_interval{1000};
  std::chrono::milliseconds announce_interval{1000};
};

// Everything the responder publishes for one advertised instance.
struct ServiceRecordSet {
  std::string instance;
  uint16_t port = 0;
  std::vector<std::string> txt;
  std::vector<std::array<uint8_t, 4>> addresses;
};

std::string service_fqdn(const MdnsOptions& options);
std::string instance_fqdn(const std::string& instance, const MdnsOptions& options);
std::string host_fqdn(const std::string& instance, const MdnsOptions& options);

// Unsolicited announcement; ttl 0 turns it into a goodbye.
dns::Message build_announcement(const ServiceRecordSet& records,
                                const MdnsOptions& options,
                                uint32_t ttl);

// Reply to `query`, or nullopt when nothing in it concerns this instance.
// Legacy unicast replies echo the query id and questions and cap the TTL.
std::optional<dns::Message> build_answer(const dns::Message& query,
                                         const ServiceRecordSet& records,
                                         const MdnsOptions& options,
                                         bool legacy_unicast);

dns::Message build_browse_query(const MdnsOptions& options);

// Collects PTR/SRV/TXT/A records from responses and hands out a PeerEntry
// once an instance has a target port and at least one address.
class BrowseAssembler {
public:
  explicit BrowseAssembler(MdnsOptions options);

  std::vector<PeerEntry> ingest(const dns::Message& message);

private:
  void consider(const dns::Record& record);
  std::string instance_label(const std::string& fqdn) const;

  MdnsOptions options_;
  std::string service_;
  std::map<std::string, std::string> instances_;
  std::map<std::string, dns::SrvData> srv_;
  std::map<std::string, std::vector<std::string>> txt_;
  std::map<std::string, std::vector<std::string>> addresses_;
  std::set<std::string> emitted_;
};

// Non-loopback IPv4 addresses of interfaces that are up.
std::vector<std::array<uint8_t, 4>> local_ipv4_addresses();

class MdnsDiscovery : public DiscoveryAdapter {
public:
  explicit MdnsDiscovery(MdnsOptions options = {}, std::shared_ptr<Logger> logger = nullptr);

  std::unique_ptr<Advertisement> advertise(const std::string& instance_name,
                                           uint16_t port,
                                           const std::vector<std::string>& metadata) override;

  std::unique_ptr<PeerStream> browse(std::chrono::milliseconds timeout) override;

  const MdnsOptions& options() const { return options_; }

private:
  MdnsOptions options_;
  std::shared_ptr<Logger> logger_;
};
