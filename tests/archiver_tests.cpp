#include "test_runner_utils.hpp"

#include "archiver.hpp"
#include "errors.hpp"
#include "file_sink.hpp"

#include <zlib.h>

#include <cstring>

namespace ftr::test {
namespace {

namespace fs = std::filesystem;

struct RawEntry {
  std::string name;
  char type = tar::kTypeRegular;
  std::string content;
  std::string link;
};

// Hand-built archive for entries pack_directory would never produce.
void write_raw_archive(const fs::path& path, const std::vector<RawEntry>& entries) {
  gzFile gz = gzopen(path.c_str(), "wb");
  if(!gz) throw std::runtime_error("cannot open " + path.string());
  for(const auto& entry : entries) {
    TarHeader hdr;
    std::memset(&hdr, 0, sizeof(hdr));
    std::strncpy(hdr.name, entry.name.c_str(), sizeof(hdr.name) - 1);
    tar::write_numeric(hdr.mode, sizeof(hdr.mode), entry.type == tar::kTypeDirectory ? 0755 : 0644);
    tar::write_numeric(hdr.uid, sizeof(hdr.uid), 0);
    tar::write_numeric(hdr.gid, sizeof(hdr.gid), 0);
    tar::write_numeric(hdr.size, sizeof(hdr.size), entry.content.size());
    tar::write_numeric(hdr.mtime, sizeof(hdr.mtime), 0);
    hdr.typeflag = entry.type;
    std::strncpy(hdr.linkname, entry.link.c_str(), sizeof(hdr.linkname) - 1);
    std::memcpy(hdr.magic, "ustar", 6);
    std::memcpy(hdr.version, "00", 2);
    tar::finalize_checksum(hdr);
    gzwrite(gz, &hdr, sizeof(hdr));
    if(!entry.content.empty()) {
      gzwrite(gz, entry.content.data(), static_cast<unsigned>(entry.content.size()));
      std::size_t pad = (tar::kBlockSize - entry.content.size() % tar::kBlockSize) % tar::kBlockSize;
      std::string zeros(pad, '\0');
      if(pad) gzwrite(gz, zeros.data(), static_cast<unsigned>(pad));
    }
  }
  std::string trailer(2 * tar::kBlockSize, '\0');
  gzwrite(gz, trailer.data(), static_cast<unsigned>(trailer.size()));
  gzclose(gz);
}

std::optional<ErrorKind> unpack_error(const fs::path& archive, const fs::path& dest) {
  try {
    unpack_archive(archive, dest);
  } catch(const FtrError& e) {
    return e.kind();
  }
  return std::nullopt;
}

bool test_archive_round_trip(TestContext&) {
  TempDir tmp("archive");
  auto src = tmp / "photos";
  write_file(src / "a.txt", "alpha");
  write_file(src / "nested" / "deeper" / "b.bin", std::string(70000, 'x'));
  fs::create_directories(src / "empty");

  ArchiveStats packed;
  auto archive = pack_directory(src, nullptr, &packed);
  expect(archive == tmp / "photos.tar.gz", "archive lands next to the directory");
  expect(packed.files == 2, "two files packed");

  auto dest = tmp / "dest";
  fs::create_directories(dest);
  auto stats = unpack_archive(archive, dest);
  expect(stats.files == 2, "two files extracted");
  expect(read_file(dest / "photos" / "a.txt") == "alpha", "a.txt content");
  expect(read_file(dest / "photos" / "nested" / "deeper" / "b.bin").size() == 70000, "b.bin size");
  expect(fs::is_directory(dest / "photos" / "empty"), "empty directory kept");
  return true;
}

bool test_archive_path_ignores_trailing_slash(TestContext&) {
  expect(archive_path_for("/tmp/photos/") == fs::path("/tmp/photos.tar.gz"), "trailing slash dropped");
  return true;
}

bool test_pack_skips_symlinks(TestContext&) {
  TempDir tmp("symlink");
  auto src = tmp / "docs";
  write_file(src / "real.txt", "real");
  fs::create_symlink(tmp / "outside.txt", src / "link.txt");

  ArchiveStats packed;
  auto archive = pack_directory(src, nullptr, &packed);
  expect(packed.skipped == 1, "symlink skipped");

  auto dest = tmp / "dest";
  fs::create_directories(dest);
  unpack_archive(archive, dest);
  expect(list_files(dest) == std::vector<std::string>{"docs/real.txt"}, "only the regular file arrives");
  return true;
}

bool test_pack_refuses_existing_archive(TestContext&) {
  TempDir tmp("pack_exists");
  write_file(tmp / "docs" / "a.txt", "a");
  write_file(tmp / "docs.tar.gz", "someone else's");
  bool threw = false;
  try {
    pack_directory(tmp / "docs");
  } catch(const FtrError&) {
    threw = true;
  }
  expect(threw, "existing archive is not overwritten");
  expect(read_file(tmp / "docs.tar.gz") == "someone else's", "existing archive untouched");
  return true;
}

bool test_unpack_rejects_traversal(TestContext&) {
  TempDir tmp("traversal");
  auto dest = tmp / "dest";
  fs::create_directories(dest);

  write_raw_archive(tmp / "up.tar.gz", {{"../escape.txt", tar::kTypeRegular, "x", ""}});
  expect(unpack_error(tmp / "up.tar.gz", dest) == ErrorKind::UnsafeArchiveEntry, "parent traversal rejected");
  expect(!fs::exists(tmp / "escape.txt"), "nothing written outside");

  write_raw_archive(tmp / "abs.tar.gz", {{"/tmp/ftr_abs.txt", tar::kTypeRegular, "x", ""}});
  expect(unpack_error(tmp / "abs.tar.gz", dest) == ErrorKind::UnsafeArchiveEntry, "absolute name rejected");

  write_raw_archive(tmp / "mid.tar.gz", {{"a/../../b.txt", tar::kTypeRegular, "x", ""}});
  expect(unpack_error(tmp / "mid.tar.gz", dest) == ErrorKind::UnsafeArchiveEntry, "embedded .. rejected");
  return true;
}

bool test_unpack_rejects_links(TestContext&) {
  TempDir tmp("links");
  auto dest = tmp / "dest";
  fs::create_directories(dest);
  write_raw_archive(tmp / "sym.tar.gz", {{"d/link", tar::kTypeSymlink, "", "/etc/passwd"}});
  expect(unpack_error(tmp / "sym.tar.gz", dest) == ErrorKind::UnsafeArchiveEntry, "symlink entry rejected");
  write_raw_archive(tmp / "hard.tar.gz", {{"d/hard", tar::kTypeHardLink, "", "d/other"}});
  expect(unpack_error(tmp / "hard.tar.gz", dest) == ErrorKind::UnsafeArchiveEntry, "hard link rejected");
  expect(!fs::exists(dest / "d" / "link"), "no link created");
  return true;
}

bool test_unpack_rejects_unsupported_types(TestContext&) {
  TempDir tmp("fifo");
  auto dest = tmp / "dest";
  fs::create_directories(dest);
  write_raw_archive(tmp / "fifo.tar.gz", {{"d/pipe", '6', "", ""}});
  expect(unpack_error(tmp / "fifo.tar.gz", dest) == ErrorKind::UnsupportedEntryType, "fifo rejected");
  return true;
}

bool test_unpack_never_overwrites(TestContext&) {
  TempDir tmp("collide");
  auto dest = tmp / "dest";
  write_file(dest / "d" / "a.txt", "original");
  write_raw_archive(tmp / "c.tar.gz", {{"d/", tar::kTypeDirectory, "", ""},
                                      {"d/a.txt", tar::kTypeRegular, "replacement", ""}});
  expect(unpack_error(tmp / "c.tar.gz", dest) == ErrorKind::NameCollision, "collision reported");
  expect(read_file(dest / "d" / "a.txt") == "original", "existing file untouched");
  return true;
}

bool test_unpack_rejects_plain_file(TestContext&) {
  TempDir tmp("notgz");
  write_file(tmp / "plain.tar.gz", "definitely not gzip");
  auto kind = unpack_error(tmp / "plain.tar.gz", tmp.path());
  expect(kind == ErrorKind::IOError, "non-gzip input is an IO error");
  return true;
}

bool test_file_sink_exclusive(TestContext&) {
  TempDir tmp("sink");
  {
    auto sink = FileSink::create_exclusive(tmp / "a.txt");
    sink.write("abc", 3);
    sink.commit();
  }
  expect(read_file(tmp / "a.txt") == "abc", "committed content");

  bool collided = false;
  try {
    FileSink::create_exclusive(tmp / "a.txt");
  } catch(const FtrError& e) {
    collided = e.kind() == ErrorKind::NameCollision;
  }
  expect(collided, "second create collides");

  {
    auto sink = FileSink::create_exclusive(tmp / "b.txt");
    sink.write("partial", 7);
  }
  expect(!fs::exists(tmp / "b.txt"), "uncommitted sink removed");
  return true;
}

} // namespace

void add_archiver_tests(std::vector<TestCase>& tests) {
  tests.push_back({"archive_round_trip", test_archive_round_trip});
  tests.push_back({"archive_path_ignores_trailing_slash", test_archive_path_ignores_trailing_slash});
  tests.push_back({"pack_skips_symlinks", test_pack_skips_symlinks});
  tests.push_back({"pack_refuses_existing_archive", test_pack_refuses_existing_archive});
  tests.push_back({"unpack_rejects_traversal", test_unpack_rejects_traversal});
  tests.push_back({"unpack_rejects_links", test_unpack_rejects_links});
  tests.push_back({"unpack_rejects_unsupported_types", test_unpack_rejects_unsupported_types});
  tests.push_back({"unpack_never_overwrites", test_unpack_never_overwrites});
  tests.push_back({"unpack_rejects_plain_file", test_unpack_rejects_plain_file});
  tests.push_back({"file_sink_exclusive", test_file_sink_exclusive});
}

} // namespace ftr::test
