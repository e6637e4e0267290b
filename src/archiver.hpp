#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

class Logger;

// POSIX ustar header block, laid out exactly as on disk.
struct TarHeader {
  char name[100];
  char mode[8];
  char uid[8];
  char gid[8];
  char size[12];
  char mtime[12];
  char checksum[8];
  char typeflag;
  char linkname[100];
  char magic[6];
  char version[2];
  char uname[32];
  char gname[32];
  char devmajor[8];
  char devminor[8];
  char prefix[155];
  char pad[12];
};

static_assert(sizeof(TarHeader) == 512, "TAR header must be 512 bytes");

namespace tar {
constexpr std::size_t kBlockSize = 512;
constexpr char kTypeRegular = '0';
constexpr char kTypeRegularOld = '\0';
constexpr char kTypeHardLink = '1';
constexpr char kTypeSymlink = '2';
constexpr char kTypeDirectory = '5';
constexpr char kTypeContiguous = '7';
constexpr char kTypePaxLocal = 'x';
constexpr char kTypePaxGlobal = 'g';
constexpr char kTypeGnuLongName = 'L';
constexpr const char* kGnuLongLinkName = "././@LongLink";

void write_numeric(char* dest, std::size_t len, uint64_t value);
uint64_t read_numeric(const char* src, std::size_t len);
void finalize_checksum(TarHeader& hdr);
bool verify_checksum(const TarHeader& hdr);
} // namespace tar

struct ArchiveStats {
  std::size_t files = 0;
  std::size_t directories = 0;
  std::size_t skipped = 0;
  uint64_t bytes = 0;
};

// "<dir>.tar.gz" next to the directory, trailing separators ignored.
std::filesystem::path archive_path_for(const std::filesystem::path& dir);

// Writes the tree under `dir` to archive_path_for(dir). Entry names are
// rooted at the directory's basename; the root entry itself is omitted and
// symbolic links are skipped. The archive is created exclusively and removed
// again if packing fails. Throws FtrError(IOError).
std::filesystem::path pack_directory(const std::filesystem::path& dir,
                                     Logger* logger = nullptr,
                                     ArchiveStats* stats = nullptr);

// Extracts a gzip-compressed tar stream under `dest_root`. Entries that would
// land outside `dest_root` raise UnsafeArchiveEntry, entry types other than
// regular files and directories raise UnsupportedEntryType. Existing files are
// never overwritten.
ArchiveStats unpack_archive(const std::filesystem::path& archive,
                            const std::filesystem::path& dest_root,
                            Logger* logger = nullptr);

// Joins a relative archive entry name under `canonical_root`, rejecting
// absolute names, ".." segments and anything that canonicalises outside the
// root. Throws FtrError(UnsafeArchiveEntry).
std::filesystem::path contained_entry_path(const std::filesystem::path& canonical_root,
                                           const std::string& entry_name);

// Removes the temporary archive when the transfer scope ends.
class ScopedArchive {
public:
  ScopedArchive() = default;
  explicit ScopedArchive(std::filesystem::path path) : path_(std::move(path)) {}
  ScopedArchive(const ScopedArchive&) = delete;
  ScopedArchive& operator=(const ScopedArchive&) = delete;
  ~ScopedArchive();

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};
