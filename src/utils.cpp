#include "utils.hpp"
#include "errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <pwd.h>
#include <sstream>
#include <unistd.h>

namespace {

constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr std::size_t kAlphabetSize = sizeof(kAlphabet) - 1;

void fill_random(unsigned char* out, std::size_t size) {
  if(RAND_bytes(out, static_cast<int>(size)) != 1) {
    throw FtrError(ErrorKind::IOError, "OpenSSL RAND_bytes failed");
  }
}

} // namespace

struct Sha256::Context {
  EVP_MD_CTX* md = nullptr;
};

Sha256::Sha256() : ctx_(std::make_unique<Context>()) {
  ctx_->md = EVP_MD_CTX_new();
  if(!ctx_->md || EVP_DigestInit_ex(ctx_->md, EVP_sha256(), nullptr) != 1) {
    throw FtrError(ErrorKind::IOError, "unable to initialise SHA-256 context");
  }
}

Sha256::~Sha256() {
  if(ctx_ && ctx_->md) EVP_MD_CTX_free(ctx_->md);
}

void Sha256::update(const char* data, std::size_t size) {
  if(size == 0) return;
  EVP_DigestUpdate(ctx_->md, data, size);
}

std::string Sha256::hex_digest() {
  std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  EVP_DigestFinal_ex(ctx_->md, out.data(), &len);
  out.resize(len);
  return hex_from_bytes(out);
}

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string random_alphanumeric(std::size_t length) {
  // Rejection sampling keeps the distribution uniform over the alphabet.
  constexpr unsigned limit = 256 - (256 % kAlphabetSize);
  std::string result;
  result.reserve(length);
  unsigned char buf[64];
  while(result.size() < length) {
    fill_random(buf, sizeof(buf));
    for(unsigned char c : buf) {
      if(c >= limit) continue;
      result.push_back(kAlphabet[c % kAlphabetSize]);
      if(result.size() == length) break;
    }
  }
  return result;
}

std::string random_hex(std::size_t bytes) {
  std::vector<unsigned char> buf(bytes);
  fill_random(buf.data(), buf.size());
  return hex_from_bytes(buf);
}

bool secure_equals(const std::string& a, const std::string& b) {
  if(a.size() != b.size()) return false;
  if(a.empty()) return true;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string trim_host_name(const std::string& full_name) {
  auto pos = full_name.find('.');
  if(pos != std::string::npos && pos > 0) {
    return full_name.substr(0, pos);
  }
  return full_name;
}

std::string local_host_name() {
  char hostname[256] = {0};
  if(gethostname(hostname, sizeof(hostname) - 1) != 0) {
    throw FtrError(ErrorKind::IOError, "failed to get the hostname");
  }
  return hostname;
}

std::filesystem::path default_drop_dir() {
  std::string home;
  if(const char* env = std::getenv("HOME"); env && *env) {
    home = env;
  } else if(const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
    home = pw->pw_dir;
  }
  if(home.empty()) {
    throw FtrError(ErrorKind::IOError, "home directory of the current user is empty");
  }
  return std::filesystem::path(home) / "Downloads";
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool iequals(const std::string& a, const std::string& b) {
  return a.size() == b.size() && to_lower_copy(a) == to_lower_copy(b);
}
