#include "archiver.hpp"
#include "errors.hpp"
#include "file_sink.hpp"
#include "log.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <optional>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;
constexpr uint64_t kMaxMetaRecordSize = 1024 * 1024;

uint64_t padded_size(uint64_t size) {
  return (size + tar::kBlockSize - 1) / tar::kBlockSize * tar::kBlockSize;
}

std::string errno_text(int err) {
  return std::strerror(err);
}

class GzipWriter {
public:
  explicit GzipWriter(const fs::path& path) : path_(path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if(fd < 0) {
      int err = errno;
      if(err == EEXIST) {
        throw FtrError(ErrorKind::IOError, "archive already exists: " + path.string());
      }
      throw FtrError(ErrorKind::IOError, "failed to create archive " + path.string() + ": " + errno_text(err));
    }
    gz_ = gzdopen(fd, "wb6");
    if(!gz_) {
      ::close(fd);
      remove_file();
      throw FtrError(ErrorKind::IOError, "failed to open gzip stream on " + path.string());
    }
  }

  GzipWriter(const GzipWriter&) = delete;
  GzipWriter& operator=(const GzipWriter&) = delete;

  ~GzipWriter() {
    if(gz_) {
      gzclose(gz_);
      remove_file();
    }
  }

  void write(const char* data, std::size_t size) {
    while(size > 0) {
      unsigned chunk = static_cast<unsigned>(std::min<std::size_t>(size, INT_MAX));
      int n = gzwrite(gz_, data, chunk);
      if(n <= 0) {
        int errnum = 0;
        const char* msg = gzerror(gz_, &errnum);
        throw FtrError(ErrorKind::IOError, "failed to write archive " + path_.string() + ": " + (msg ? msg : "unknown"));
      }
      data += n;
      size -= static_cast<std::size_t>(n);
    }
  }

  void close() {
    int rc = gzclose(gz_);
    gz_ = nullptr;
    if(rc != Z_OK) {
      remove_file();
      throw FtrError(ErrorKind::IOError, "failed to finish archive " + path_.string());
    }
  }

private:
  void remove_file() {
    std::error_code ec;
    fs::remove(path_, ec);
  }

  fs::path path_;
  gzFile gz_ = nullptr;
};

class GzipReader {
public:
  explicit GzipReader(const fs::path& path) : path_(path) {
    gz_ = gzopen(path.c_str(), "rb");
    if(!gz_) {
      throw FtrError(ErrorKind::IOError, "failed to open archive " + path.string());
    }
    gzbuffer(gz_, 128 * 1024);
    if(gzdirect(gz_)) {
      gzclose(gz_);
      gz_ = nullptr;
      throw FtrError(ErrorKind::IOError, path.string() + " is not a gzip stream");
    }
  }

  GzipReader(const GzipReader&) = delete;
  GzipReader& operator=(const GzipReader&) = delete;

  ~GzipReader() {
    if(gz_) gzclose(gz_);
  }

  // Returns false on a clean end of stream before any byte was read.
  bool read_exact(char* out, std::size_t size) {
    std::size_t total = 0;
    while(total < size) {
      int n = gzread(gz_, out + total, static_cast<unsigned>(std::min<std::size_t>(size - total, INT_MAX)));
      if(n < 0) {
        int errnum = 0;
        const char* msg = gzerror(gz_, &errnum);
        throw FtrError(ErrorKind::IOError, "failed to read archive " + path_.string() + ": " + (msg ? msg : "unknown"));
      }
      if(n == 0) {
        if(total == 0) return false;
        throw FtrError(ErrorKind::IOError, "unexpected end of archive " + path_.string());
      }
      total += static_cast<std::size_t>(n);
    }
    return true;
  }

  void require(char* out, std::size_t size) {
    if(size > 0 && !read_exact(out, size)) {
      throw FtrError(ErrorKind::IOError, "unexpected end of archive " + path_.string());
    }
  }

  void skip(uint64_t size) {
    std::array<char, kCopyBufferSize> buf;
    while(size > 0) {
      auto chunk = static_cast<std::size_t>(std::min<uint64_t>(size, buf.size()));
      require(buf.data(), chunk);
      size -= chunk;
    }
  }

private:
  fs::path path_;
  gzFile gz_ = nullptr;
};

bool is_zero_block(const TarHeader& hdr) {
  const auto* bytes = reinterpret_cast<const unsigned char*>(&hdr);
  return std::all_of(bytes, bytes + sizeof(TarHeader), [](unsigned char c){ return c == 0; });
}

std::string field_string(const char* field, std::size_t len) {
  return std::string(field, strnlen(field, len));
}

std::string header_name(const TarHeader& hdr) {
  std::string name = field_string(hdr.name, sizeof(hdr.name));
  if(std::memcmp(hdr.magic, "ustar", 5) == 0) {
    std::string prefix = field_string(hdr.prefix, sizeof(hdr.prefix));
    if(!prefix.empty()) name = prefix + "/" + name;
  }
  return name;
}

// Splits `name` across the ustar name/prefix fields. False when it cannot fit.
bool store_name(TarHeader& hdr, const std::string& name) {
  if(name.size() <= sizeof(hdr.name)) {
    std::memcpy(hdr.name, name.data(), name.size());
    return true;
  }
  for(std::size_t pos = name.find('/'); pos != std::string::npos; pos = name.find('/', pos + 1)) {
    std::size_t rest = name.size() - pos - 1;
    if(pos > sizeof(hdr.prefix)) break;
    if(rest == 0 || rest > sizeof(hdr.name)) continue;
    std::memcpy(hdr.prefix, name.data(), pos);
    std::memcpy(hdr.name, name.data() + pos + 1, rest);
    return true;
  }
  return false;
}

std::optional<std::string> pax_path(const std::string& records) {
  std::size_t pos = 0;
  std::optional<std::string> path;
  while(pos < records.size()) {
    std::size_t space = records.find(' ', pos);
    if(space == std::string::npos) break;
    std::size_t length = 0;
    try {
      length = std::stoul(records.substr(pos, space - pos));
    } catch(const std::exception&) {
      throw FtrError(ErrorKind::IOError, "malformed PAX record length");
    }
    if(length == 0 || pos + length > records.size()) {
      throw FtrError(ErrorKind::IOError, "malformed PAX record");
    }
    std::string record = records.substr(space + 1, pos + length - space - 1);
    if(!record.empty() && record.back() == '\n') record.pop_back();
    auto eq = record.find('=');
    if(eq != std::string::npos && record.compare(0, eq, "path") == 0) {
      path = record.substr(eq + 1);
    }
    pos += length;
  }
  return path;
}

bool is_within(const fs::path& root, const fs::path& candidate) {
  auto r = root.begin();
  auto c = candidate.begin();
  for(; r != root.end(); ++r, ++c) {
    if(c == candidate.end() || *r != *c) return false;
  }
  return true;
}

class TarWriter {
public:
  TarWriter(GzipWriter& out, Logger* logger, ArchiveStats& stats)
    : out_(out), logger_(logger), stats_(stats) {}

  void add_tree(const fs::path& dir, const std::string& rel_name) {
    std::vector<fs::path> children;
    std::error_code ec;
    for(fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      children.push_back(it->path());
    }
    if(ec) {
      throw FtrError(ErrorKind::IOError, "failed to read directory " + dir.string() + ": " + ec.message());
    }
    std::sort(children.begin(), children.end(),
              [](const fs::path& a, const fs::path& b){ return a.filename().string() < b.filename().string(); });

    for(const auto& child : children) {
      struct stat st{};
      if(::lstat(child.c_str(), &st) != 0) {
        throw FtrError(ErrorKind::IOError, "failed to stat " + child.string() + ": " + errno_text(errno));
      }
      std::string name = rel_name + "/" + child.filename().string();
      if(S_ISLNK(st.st_mode)) {
        log_debug(logger_, "skipping symbolic link {}", child.string());
        ++stats_.skipped;
        continue;
      }
      if(S_ISDIR(st.st_mode)) {
        // Receivers must always be able to descend into what they unpack.
        unsigned mode = (static_cast<unsigned>(st.st_mode) & 07777) | 0755;
        write_header(name + "/", tar::kTypeDirectory, mode, 0, st.st_mtime);
        ++stats_.directories;
        add_tree(child, name);
        continue;
      }
      if(S_ISREG(st.st_mode)) {
        write_header(name, tar::kTypeRegular, static_cast<unsigned>(st.st_mode) & 07777,
                     static_cast<uint64_t>(st.st_size), st.st_mtime);
        copy_body(child, static_cast<uint64_t>(st.st_size));
        ++stats_.files;
        stats_.bytes += static_cast<uint64_t>(st.st_size);
        continue;
      }
      log_warn(logger_, "skipping special file {}", child.string());
      ++stats_.skipped;
    }
  }

  void finish() {
    std::array<char, tar::kBlockSize * 2> trailer{};
    out_.write(trailer.data(), trailer.size());
  }

private:
  void write_header(const std::string& name, char type, unsigned mode, uint64_t size, time_t mtime) {
    TarHeader hdr;
    std::memset(&hdr, 0, sizeof(hdr));
    if(!store_name(hdr, name)) {
      write_long_name(name);
      std::memcpy(hdr.name, name.data(), sizeof(hdr.name) - 1);
    }
    tar::write_numeric(hdr.mode, sizeof(hdr.mode), mode);
    tar::write_numeric(hdr.uid, sizeof(hdr.uid), 0);
    tar::write_numeric(hdr.gid, sizeof(hdr.gid), 0);
    tar::write_numeric(hdr.size, sizeof(hdr.size), size);
    tar::write_numeric(hdr.mtime, sizeof(hdr.mtime), mtime > 0 ? static_cast<uint64_t>(mtime) : 0);
    hdr.typeflag = type;
    std::memcpy(hdr.magic, "ustar", 6);
    std::memcpy(hdr.version, "00", 2);
    tar::finalize_checksum(hdr);
    out_.write(reinterpret_cast<const char*>(&hdr), sizeof(hdr));
  }

  void write_long_name(const std::string& name) {
    TarHeader hdr;
    std::memset(&hdr, 0, sizeof(hdr));
    std::memcpy(hdr.name, tar::kGnuLongLinkName, std::strlen(tar::kGnuLongLinkName));
    tar::write_numeric(hdr.mode, sizeof(hdr.mode), 0);
    tar::write_numeric(hdr.uid, sizeof(hdr.uid), 0);
    tar::write_numeric(hdr.gid, sizeof(hdr.gid), 0);
    tar::write_numeric(hdr.size, sizeof(hdr.size), name.size() + 1);
    tar::write_numeric(hdr.mtime, sizeof(hdr.mtime), 0);
    hdr.typeflag = tar::kTypeGnuLongName;
    std::memcpy(hdr.magic, "ustar", 6);
    std::memcpy(hdr.version, "00", 2);
    tar::finalize_checksum(hdr);
    out_.write(reinterpret_cast<const char*>(&hdr), sizeof(hdr));

    std::vector<char> body(padded_size(name.size() + 1), '\0');
    std::memcpy(body.data(), name.data(), name.size());
    out_.write(body.data(), body.size());
  }

  void copy_body(const fs::path& path, uint64_t size) {
    std::ifstream in(path, std::ios::binary);
    if(!in) {
      throw FtrError(ErrorKind::IOError, "failed to open " + path.string());
    }
    std::vector<char> buf(kCopyBufferSize);
    uint64_t remaining = size;
    while(remaining > 0) {
      auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, buf.size()));
      in.read(buf.data(), static_cast<std::streamsize>(want));
      auto got = static_cast<std::size_t>(in.gcount());
      if(got != want) {
        throw FtrError(ErrorKind::IOError, "file changed while archiving: " + path.string());
      }
      out_.write(buf.data(), got);
      remaining -= got;
    }
    auto pad = padded_size(size) - size;
    if(pad > 0) {
      std::array<char, tar::kBlockSize> zeros{};
      out_.write(zeros.data(), static_cast<std::size_t>(pad));
    }
  }

  GzipWriter& out_;
  Logger* logger_;
  ArchiveStats& stats_;
};

std::string read_meta_body(GzipReader& in, uint64_t size) {
  if(size > kMaxMetaRecordSize) {
    throw FtrError(ErrorKind::IOError, "archive metadata record too large");
  }
  std::string body(static_cast<std::size_t>(size), '\0');
  in.require(body.data(), body.size());
  in.skip(padded_size(size) - size);
  return body;
}

fs::path normalized_dir(const fs::path& dir) {
  auto p = fs::absolute(dir).lexically_normal();
  while(!p.has_filename() && p != p.root_path()) {
    p = p.parent_path();
  }
  return p;
}

} // namespace

namespace tar {

void write_numeric(char* dest, std::size_t len, uint64_t value) {
  std::memset(dest, 0, len);
  const unsigned digits = static_cast<unsigned>(len - 1);
  if(digits * 3 >= 64 || value < (uint64_t{1} << (digits * 3))) {
    for(std::size_t i = 0; i < digits; ++i) {
      dest[digits - 1 - i] = static_cast<char>('0' + (value & 7));
      value >>= 3;
    }
    return;
  }
  // Base-256 for values that do not fit the octal field.
  for(std::size_t i = len; i-- > 1;) {
    dest[i] = static_cast<char>(value & 0xff);
    value >>= 8;
  }
  dest[0] = static_cast<char>(0x80);
}

uint64_t read_numeric(const char* src, std::size_t len) {
  const auto* bytes = reinterpret_cast<const unsigned char*>(src);
  uint64_t result = 0;
  if(len > 0 && (bytes[0] & 0x80)) {
    result = bytes[0] & 0x7f;
    for(std::size_t i = 1; i < len; ++i) {
      result = (result << 8) | bytes[i];
    }
    return result;
  }
  std::size_t i = 0;
  while(i < len && src[i] == ' ') ++i;
  for(; i < len && src[i] >= '0' && src[i] <= '7'; ++i) {
    result = (result << 3) | static_cast<uint64_t>(src[i] - '0');
  }
  return result;
}

void finalize_checksum(TarHeader& hdr) {
  std::memset(hdr.checksum, ' ', sizeof(hdr.checksum));
  const auto* bytes = reinterpret_cast<const unsigned char*>(&hdr);
  uint64_t sum = 0;
  for(std::size_t i = 0; i < sizeof(TarHeader); ++i) sum += bytes[i];
  write_numeric(hdr.checksum, 7, sum);
  hdr.checksum[7] = ' ';
}

bool verify_checksum(const TarHeader& hdr) {
  uint64_t expected = read_numeric(hdr.checksum, sizeof(hdr.checksum));
  TarHeader copy = hdr;
  std::memset(copy.checksum, ' ', sizeof(copy.checksum));
  const auto* ubytes = reinterpret_cast<const unsigned char*>(&copy);
  const auto* sbytes = reinterpret_cast<const signed char*>(&copy);
  uint64_t unsigned_sum = 0;
  int64_t signed_sum = 0;
  for(std::size_t i = 0; i < sizeof(TarHeader); ++i) {
    unsigned_sum += ubytes[i];
    signed_sum += sbytes[i];
  }
  return expected == unsigned_sum || static_cast<int64_t>(expected) == signed_sum;
}

} // namespace tar

fs::path archive_path_for(const fs::path& dir) {
  auto p = normalized_dir(dir);
  p += ".tar.gz";
  return p;
}

fs::path contained_entry_path(const fs::path& canonical_root, const std::string& entry_name) {
  if(entry_name.empty()) {
    throw FtrError(ErrorKind::UnsafeArchiveEntry, "archive entry has an empty name");
  }
  if(entry_name.front() == '/') {
    throw FtrError(ErrorKind::UnsafeArchiveEntry, "absolute archive entry '" + entry_name + "'");
  }
  std::string trimmed = entry_name;
  while(trimmed.size() > 1 && trimmed.back() == '/') trimmed.pop_back();
  fs::path relative(trimmed);
  for(const auto& part : relative) {
    if(part == "..") {
      throw FtrError(ErrorKind::UnsafeArchiveEntry, "archive entry '" + entry_name + "' escapes the destination");
    }
  }
  auto joined = (canonical_root / relative).lexically_normal();
  std::error_code ec;
  auto resolved = fs::weakly_canonical(joined, ec);
  if(ec) {
    throw FtrError(ErrorKind::IOError, "failed to resolve " + joined.string() + ": " + ec.message());
  }
  if(!is_within(canonical_root, resolved)) {
    throw FtrError(ErrorKind::UnsafeArchiveEntry, "archive entry '" + entry_name + "' resolves outside the destination");
  }
  return resolved;
}

fs::path pack_directory(const fs::path& dir, Logger* logger, ArchiveStats* stats) {
  auto root = normalized_dir(dir);
  struct stat st{};
  if(::stat(root.c_str(), &st) != 0) {
    throw FtrError(ErrorKind::IOError, "failed to stat " + root.string() + ": " + errno_text(errno));
  }
  if(!S_ISDIR(st.st_mode)) {
    throw FtrError(ErrorKind::IOError, root.string() + " is not a directory");
  }
  std::string base = root.filename().string();
  if(base.empty()) {
    throw FtrError(ErrorKind::IOError, "refusing to archive " + root.string());
  }

  auto archive = archive_path_for(root);
  ArchiveStats local;
  GzipWriter out(archive);
  TarWriter writer(out, logger, local);
  writer.add_tree(root, base);
  writer.finish();
  out.close();

  log_debug(logger, "packed {} into {} ({} files, {} directories, {} bytes, {} skipped)",
            root.string(), archive.string(), local.files, local.directories, local.bytes, local.skipped);
  if(stats) *stats = local;
  return archive;
}

ArchiveStats unpack_archive(const fs::path& archive, const fs::path& dest_root, Logger* logger) {
  std::error_code ec;
  auto root = fs::canonical(dest_root, ec);
  if(ec) {
    throw FtrError(ErrorKind::IOError, "invalid destination " + dest_root.string() + ": " + ec.message());
  }

  GzipReader in(archive);
  ArchiveStats stats;
  std::string pending_name;
  std::vector<char> buf(kCopyBufferSize);

  for(;;) {
    TarHeader hdr;
    if(!in.read_exact(reinterpret_cast<char*>(&hdr), sizeof(hdr))) break;
    if(is_zero_block(hdr)) break;
    if(!tar::verify_checksum(hdr)) {
      throw FtrError(ErrorKind::IOError, "corrupt tar header in " + archive.string());
    }
    uint64_t size = tar::read_numeric(hdr.size, sizeof(hdr.size));

    switch(hdr.typeflag) {
      case tar::kTypeGnuLongName: {
        pending_name = read_meta_body(in, size);
        while(!pending_name.empty() && pending_name.back() == '\0') pending_name.pop_back();
        continue;
      }
      case tar::kTypePaxLocal: {
        if(auto path = pax_path(read_meta_body(in, size))) pending_name = *path;
        continue;
      }
      case tar::kTypePaxGlobal:
        in.skip(padded_size(size));
        continue;
      default:
        break;
    }

    std::string name = pending_name.empty() ? header_name(hdr) : pending_name;
    pending_name.clear();

    switch(hdr.typeflag) {
      case tar::kTypeDirectory: {
        if(name == "./" || name == ".") {
          in.skip(padded_size(size));
          continue;
        }
        auto path = contained_entry_path(root, name);
        fs::create_directories(path, ec);
        if(ec || !fs::is_directory(path)) {
          throw FtrError(ErrorKind::IOError, "failed to create directory " + path.string());
        }
        in.skip(padded_size(size));
        ++stats.directories;
        break;
      }
      case tar::kTypeRegular:
      case tar::kTypeRegularOld:
      case tar::kTypeContiguous: {
        auto path = contained_entry_path(root, name);
        fs::create_directories(path.parent_path(), ec);
        if(ec) {
          throw FtrError(ErrorKind::IOError, "failed to create directory " + path.parent_path().string() + ": " + ec.message());
        }
        unsigned mode = (static_cast<unsigned>(tar::read_numeric(hdr.mode, sizeof(hdr.mode))) & 0777) | 0600;
        auto sink = FileSink::create_exclusive(path, mode);
        uint64_t remaining = size;
        while(remaining > 0) {
          auto chunk = static_cast<std::size_t>(std::min<uint64_t>(remaining, buf.size()));
          in.require(buf.data(), chunk);
          sink.write(buf.data(), chunk);
          remaining -= chunk;
        }
        sink.commit();
        in.skip(padded_size(size) - size);
        ++stats.files;
        stats.bytes += size;
        break;
      }
      case tar::kTypeSymlink:
      case tar::kTypeHardLink:
        throw FtrError(ErrorKind::UnsafeArchiveEntry, "link entry '" + name + "' is not allowed");
      default:
        throw FtrError(ErrorKind::UnsupportedEntryType,
                       "unsupported tar entry type '" + std::string(1, hdr.typeflag) + "' for " + name);
    }
  }

  log_debug(logger, "unpacked {} into {} ({} files, {} directories, {} bytes)",
            archive.string(), root.string(), stats.files, stats.directories, stats.bytes);
  return stats;
}

ScopedArchive::~ScopedArchive() {
  if(path_.empty()) return;
  std::error_code ec;
  fs::remove(path_, ec);
}
