#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "peer_channel.hpp"

// One responding peer as seen by a browse. `host_name` is the advertised
// instance name ("alice"), `metadata` the TXT strings in advertised order.
struct PeerEntry {
  std::string host_name;
  std::vector<std::string> addresses;
  uint16_t port = 0;
  std::vector<std::string> metadata;
};

// Stream of PeerEntry values produced while a browse is running. The stream
// owns its producer: destroying it cancels the browse and waits for it.
class PeerStream {
public:
  explicit PeerStream(std::size_t capacity = 16);
  ~PeerStream();
  PeerStream(const PeerStream&) = delete;
  PeerStream& operator=(const PeerStream&) = delete;

  std::optional<PeerEntry> next();
  std::optional<PeerEntry> next_until(std::chrono::steady_clock::time_point deadline);

  // Producer side. publish() drops repeats of a host name already published
  // and returns false once the stream is closed.
  bool publish(PeerEntry entry);
  void finish();
  bool finished() const { return channel_.closed(); }

  // Runs `body` on a dedicated thread and closes the stream when it returns.
  // `cancel` must make `body` return promptly.
  void run_producer(std::function<void(PeerStream&)> body, std::function<void()> cancel);
  void stop();

private:
  BoundedChannel<PeerEntry> channel_;
  std::mutex seen_mutex_;
  std::unordered_set<std::string> seen_;
  std::function<void()> cancel_;
  std::thread producer_;
};

// Releasing the handle withdraws the advertisement.
class Advertisement {
public:
  virtual ~Advertisement() = default;
};

class DiscoveryAdapter {
public:
  virtual ~DiscoveryAdapter() = default;

  // Announces `instance_name` for the transfer service on `port`. Throws
  // FtrError(DiscoveryUnavailable) when the announcement cannot be started.
  virtual std::unique_ptr<Advertisement> advertise(const std::string& instance_name,
                                                   uint16_t port,
                                                   const std::vector<std::string>& metadata) = 0;

  // Starts a browse that ends after `timeout`. Throws
  // FtrError(DiscoveryUnavailable) when the browse cannot be started.
  virtual std::unique_ptr<PeerStream> browse(std::chrono::milliseconds timeout) = 0;

  // First entry whose instance name matches `peer_name` (case-insensitive),
  // or FtrError(PeerNotFound) once `timeout` has elapsed.
  PeerEntry resolve(const std::string& peer_name, std::chrono::milliseconds timeout);

  static bool matches(const PeerEntry& entry, const std::string& peer_name);
};
