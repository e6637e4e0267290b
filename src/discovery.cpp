#include "discovery.hpp"

#include <fmt/format.h>

#include "errors.hpp"
#include "utils.hpp"

PeerStream::PeerStream(std::size_t capacity) : channel_(capacity) {}

PeerStream::~PeerStream() {
  stop();
}

std::optional<PeerEntry> PeerStream::next() {
  return channel_.receive();
}

std::optional<PeerEntry> PeerStream::next_until(std::chrono::steady_clock::time_point deadline) {
  return channel_.receive_until(deadline);
}

bool PeerStream::publish(PeerEntry entry) {
  {
    std::lock_guard lock(seen_mutex_);
    if(!seen_.insert(to_lower_copy(entry.host_name)).second) {
      return !channel_.closed();
    }
  }
  return channel_.send(std::move(entry));
}

void PeerStream::finish() {
  channel_.close();
}

void PeerStream::run_producer(std::function<void(PeerStream&)> body, std::function<void()> cancel) {
  cancel_ = std::move(cancel);
  producer_ = std::thread([this, body = std::move(body)](){
    body(*this);
    finish();
  });
}

void PeerStream::stop() {
  channel_.close();
  if(cancel_) cancel_();
  if(producer_.joinable()) producer_.join();
}

bool DiscoveryAdapter::matches(const PeerEntry& entry, const std::string& peer_name) {
  if(peer_name.empty()) return false;
  return iequals(entry.host_name, peer_name) ||
         iequals(trim_host_name(entry.host_name), peer_name);
}

PeerEntry DiscoveryAdapter::resolve(const std::string& peer_name, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  auto stream = browse(timeout);
  while(auto entry = stream->next_until(deadline)) {
    if(matches(*entry, peer_name)) {
      return *entry;
    }
  }
  throw FtrError(ErrorKind::PeerNotFound,
                 fmt::format("peer '{}' not found within {} ms", peer_name, timeout.count()));
}
