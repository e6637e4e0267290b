#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);

// Incremental SHA-256, used to fingerprint files while they stream to disk.
class Sha256 {
public:
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const char* data, std::size_t size);
  std::string hex_digest();

private:
  struct Context;
  std::unique_ptr<Context> ctx_;
};

// Random string over [a-zA-Z0-9] drawn from the OpenSSL CSPRNG.
std::string random_alphanumeric(std::size_t length);
std::string random_hex(std::size_t bytes);

// Length-checked, constant-time comparison of two secrets.
bool secure_equals(const std::string& a, const std::string& b);

// "alice.example.lan" -> "alice"
std::string trim_host_name(const std::string& full_name);
std::string local_host_name();
std::filesystem::path default_drop_dir();

std::string to_lower_copy(std::string value);
bool iequals(const std::string& a, const std::string& b);
