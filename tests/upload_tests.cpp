#include "test_runner_utils.hpp"

#include "archiver.hpp"
#include "server.hpp"
#include "upload_handler.hpp"

namespace ftr::test {
namespace {

namespace fs = std::filesystem;

const std::string kKey = "Ab12Cd";
const std::string kBoundary = "test-boundary-42";

std::shared_ptr<UploadHandler> make_handler(const fs::path& drop_dir, TestContext& ctx) {
  ReceiverConfig config;
  config.drop_dir = drop_dir;
  config.pass_key = kKey;
  config.listen_ip = "127.0.0.1";
  config.port = 0;
  auto logger = std::make_shared<Logger>("receiver");
  ctx.logs.attach(logger);
  return std::make_shared<UploadHandler>(prepare_receiver_config(config), logger);
}

UploadOutcome upload(const UploadHandler& handler,
                     const std::string& key,
                     const std::string& type,
                     const std::string& filename,
                     const std::string& content,
                     const std::string& method = "POST") {
  auto body = make_form_body(kBoundary, filename, content);
  auto head = make_upload_head(key, type, kBoundary, body.size(), method);
  return handler.handle(head, body);
}

bool test_upload_stores_file(TestContext& ctx) {
  TempDir tmp("upload_ok");
  auto handler = make_handler(tmp / "drop", ctx);
  auto outcome = upload(*handler, kKey, "file", "notes.txt", "hello world");
  expect(outcome.status == 200, "status 200");
  expect(outcome.message.empty(), "empty success body");
  expect(read_file(tmp / "drop" / "notes.txt") == "hello world", "stored bytes");
  return true;
}

bool test_upload_wrong_key(TestContext& ctx) {
  TempDir tmp("upload_401");
  auto handler = make_handler(tmp / "drop", ctx);
  auto outcome = upload(*handler, "wrong1", "file", "notes.txt", "secret");
  expect(outcome.status == 401, "status 401");
  expect(outcome.message == "Unauthorized", "message");
  outcome = upload(*handler, "", "file", "notes.txt", "secret");
  expect(outcome.status == 401, "missing key is 401");
  expect(list_files(tmp / "drop").empty(), "nothing written");
  return true;
}

bool test_upload_wrong_method(TestContext& ctx) {
  TempDir tmp("upload_405");
  auto handler = make_handler(tmp / "drop", ctx);
  auto outcome = upload(*handler, kKey, "file", "notes.txt", "x", "PUT");
  expect(outcome.status == 405, "status 405");

  // The key is checked before the method.
  outcome = upload(*handler, "nope", "file", "notes.txt", "x", "GET");
  expect(outcome.status == 401, "bad key wins over bad method");
  return true;
}

bool test_upload_bad_names(TestContext& ctx) {
  TempDir tmp("upload_names");
  auto handler = make_handler(tmp / "drop", ctx);
  expect(upload(*handler, kKey, "file", "..", "x").status == 400, "dot-dot name");
  expect(upload(*handler, kKey, "file", ".", "x").status == 400, "dot name");
  expect(upload(*handler, kKey, "file", "", "x").status == 400, "empty name");
  expect(list_files(tmp / "drop").empty(), "nothing written");

  auto outcome = upload(*handler, kKey, "file", "../../etc/evil.txt", "x");
  expect(outcome.status == 200, "path components are stripped");
  expect(fs::exists(tmp / "drop" / "evil.txt"), "stored under its base name");
  expect(!fs::exists(tmp / "etc"), "nothing outside the drop dir");
  return true;
}

bool test_upload_base_name(TestContext&) {
  expect(upload_base_name("photos/2024/").value_or("") == "2024", "trailing slash");
  expect(upload_base_name("a.txt").value_or("") == "a.txt", "plain name");
  expect(!upload_base_name("/"), "root only");
  expect(!upload_base_name("dir/.."), "ends in ..");
  expect(is_archive_name("x.tar.gz") && is_archive_name("x.tgz") && !is_archive_name("x.zip"), "archive names");
  return true;
}

bool test_upload_collision(TestContext& ctx) {
  TempDir tmp("upload_409");
  auto handler = make_handler(tmp / "drop", ctx);
  write_file(tmp / "drop" / "report.pdf", "original");
  auto outcome = upload(*handler, kKey, "file", "report.pdf", "replacement");
  expect(outcome.status == 409, "status 409");
  expect(outcome.message == "File already exists", "message");
  expect(read_file(tmp / "drop" / "report.pdf") == "original", "existing file untouched");
  return true;
}

bool test_upload_missing_form(TestContext& ctx) {
  TempDir tmp("upload_400");
  auto handler = make_handler(tmp / "drop", ctx);

  std::string body = "--" + kBoundary + "\r\nContent-Disposition: form-data; name=\"other\"\r\n\r\nx\r\n--" + kBoundary + "--\r\n";
  auto outcome = handler->handle(make_upload_head(kKey, "file", kBoundary, body.size()), body);
  expect(outcome.status == 400, "no file field");
  expect(outcome.message == "Failed to get the file from form", "message");

  auto head = make_upload_head(kKey, "file", kBoundary, 10);
  head.headers.set("Content-Type", "application/json");
  expect(handler->handle(head, "{\"a\": 1} ").status == 400, "not multipart");

  auto full = make_form_body(kBoundary, "cut.txt", "abcdef");
  auto cut = full.substr(0, full.size() - 8);
  outcome = handler->handle(make_upload_head(kKey, "file", kBoundary, cut.size()), cut);
  expect(outcome.status == 400, "truncated body");
  expect(!fs::exists(tmp / "drop" / "cut.txt"), "partial file removed");
  return true;
}

bool test_upload_directory_extracts(TestContext& ctx) {
  TempDir tmp("upload_dir");
  write_file(tmp / "src" / "album" / "one.jpg", "1111");
  write_file(tmp / "src" / "album" / "sub" / "two.jpg", "2222");
  ScopedArchive archive(pack_directory(tmp / "src" / "album"));

  auto handler = make_handler(tmp / "drop", ctx);
  auto outcome = upload(*handler, kKey, "dir", "album.tar.gz", read_file(archive.path()));
  expect(outcome.status == 200, "status 200");
  expect(read_file(tmp / "drop" / "album" / "one.jpg") == "1111", "one.jpg extracted");
  expect(read_file(tmp / "drop" / "album" / "sub" / "two.jpg") == "2222", "two.jpg extracted");
  expect(fs::exists(tmp / "drop" / "album.tar.gz"), "archive kept beside the tree");
  return true;
}

bool test_upload_file_mode_never_extracts(TestContext& ctx) {
  TempDir tmp("upload_noextract");
  write_file(tmp / "src" / "album" / "one.jpg", "1111");
  ScopedArchive archive(pack_directory(tmp / "src" / "album"));

  auto handler = make_handler(tmp / "drop", ctx);
  auto outcome = upload(*handler, kKey, "file", "album.tar.gz", read_file(archive.path()));
  expect(outcome.status == 200, "status 200");
  expect(list_files(tmp / "drop") == std::vector<std::string>{"album.tar.gz"}, "stored as-is");
  return true;
}

bool test_upload_other_types_never_extract(TestContext& ctx) {
  TempDir tmp("upload_typedefault");
  write_file(tmp / "src" / "album" / "one.jpg", "1111");
  ScopedArchive archive(pack_directory(tmp / "src" / "album"));
  auto content = read_file(archive.path());
  auto body = make_form_body(kBoundary, "album.tar.gz", content);

  auto drop_dir = tmp / "drop";
  auto handler = make_handler(drop_dir, ctx);
  auto stored_only = [&](const std::string& label) {
    expect(list_files(drop_dir) == std::vector<std::string>{"album.tar.gz"}, label + ": stored as-is");
    expect(!fs::exists(drop_dir / "album"), label + ": no tree extracted");
    fs::remove(drop_dir / "album.tar.gz");
  };

  for(const std::string type : {"DIR", "directory"}) {
    auto outcome = handler->handle(make_upload_head(kKey, type, kBoundary, body.size()), body);
    expect(outcome.status == 200, type + ": status 200");
    stored_only(type);
  }

  auto typed = make_upload_head(kKey, "file", kBoundary, body.size());
  http::RequestHead untyped = typed;
  untyped.headers = http::Headers();
  for(const auto& [name, value] : typed.headers.items()) {
    if(name != http::kFileTypeHeader) untyped.headers.add(name, value);
  }
  expect(!untyped.headers.has(http::kFileTypeHeader), "type header dropped");
  auto outcome = handler->handle(untyped, body);
  expect(outcome.status == 200, "absent type: status 200");
  stored_only("absent type");
  return true;
}

bool test_upload_torn_down_mid_form(TestContext& ctx) {
  TempDir tmp("upload_teardown");
  auto handler = make_handler(tmp / "drop", ctx);
  auto body = make_form_body(kBoundary, "report.txt", "hello");
  auto head = make_upload_head(kKey, "file", kBoundary, body.size());

  // Everything up to the closing "--\r\n" of the last boundary.
  auto partial = body.substr(0, body.size() - 4);
  auto request = handler->start_request("10.0.0.9");
  expect(!request->begin(head), "head accepted");
  expect(!request->consume(partial.data(), partial.size()), "no outcome before the form ends");
  expect(request->state() == UploadState::Written, "file part fully read");
  expect(fs::exists(tmp / "drop" / "report.txt"), "bytes written while the form streams");
  request.reset();
  expect(list_files(tmp / "drop").empty(), "abandoned upload leaves nothing behind");

  auto outcome = handler->handle(head, body);
  expect(outcome.status == 200, "retry of the complete upload succeeds");
  expect(read_file(tmp / "drop" / "report.txt") == "hello", "retry stored");
  return true;
}

bool test_upload_states(TestContext& ctx) {
  TempDir tmp("upload_states");
  auto handler = make_handler(tmp / "drop", ctx);
  auto body = make_form_body(kBoundary, "state.txt", "s");
  auto head = make_upload_head(kKey, "file", kBoundary, body.size());

  auto request = handler->start_request("");
  expect(request->state() == UploadState::Unauthenticated, "starts unauthenticated");
  expect(!request->begin(head), "head accepted");
  expect(request->state() == UploadState::MethodChecked, "method checked");
  request->consume(body.data(), body.size());
  expect(request->finish().status == 200, "stored");
  expect(request->state() == UploadState::Done, "done after 200");

  request = handler->start_request("");
  request->begin(head);
  request->consume(body.data(), body.size());
  expect(request->finish().status == 409, "second copy collides");
  expect(request->state() == UploadState::Error, "error after 409");
  expect(std::string(to_string(UploadState::Error)) == "Error", "state name");
  return true;
}

bool test_upload_directory_bad_archive(TestContext& ctx) {
  TempDir tmp("upload_badarchive");
  auto handler = make_handler(tmp / "drop", ctx);
  auto outcome = upload(*handler, kKey, "dir", "junk.tar.gz", "this is not gzip");
  expect(outcome.status == 500, "status 500");
  expect(outcome.message == "Failed to unzip and untar the file on server", "message");
  expect(fs::exists(tmp / "drop" / "junk.tar.gz"), "archive kept after a failed extraction");
  return true;
}

bool test_server_over_loopback(TestContext& ctx) {
  TempDir tmp("server");
  auto handler = make_handler(tmp / "drop", ctx);
  auto logger = std::make_shared<Logger>("server");
  ctx.logs.attach(logger);
  Server server(handler, logger);
  server.start();
  server.start_background();
  expect(server.port() != 0, "bound an ephemeral port");

  auto body = make_form_body(kBoundary, "wire.txt", "over the wire");
  auto head = make_upload_head(kKey, "file", kBoundary, body.size());
  auto response = exchange(server.port(), http::format_request_head("POST", "/upload", head.headers) + body);
  expect(status_of(response) == 200, "upload accepted: " + response);
  expect(read_file(tmp / "drop" / "wire.txt") == "over the wire", "stored over the wire");

  auto bad_key = make_upload_head("zzzzzz", "file", kBoundary, body.size());
  response = exchange(server.port(), http::format_request_head("POST", "/upload", bad_key.headers) + body);
  expect(status_of(response) == 401, "rejected key over the wire");
  expect(response.find("Unauthorized") != std::string::npos, "reason in body");

  response = exchange(server.port(), "this is not http\r\n\r\n");
  expect(status_of(response) == 400, "garbage is a bad request");

  server.stop();
  return true;
}

bool test_server_expect_continue(TestContext& ctx) {
  TempDir tmp("server_continue");
  auto handler = make_handler(tmp / "drop", ctx);
  Server server(handler, std::make_shared<Logger>("server"));
  server.start();
  server.start_background();

  auto body = make_form_body(kBoundary, "slow.txt", "patience");
  auto head = make_upload_head(kKey, "file", kBoundary, body.size());
  head.headers.add("Expect", "100-continue");

  asio::io_context io;
  asio::ip::tcp::socket socket(io);
  socket.connect({asio::ip::make_address("127.0.0.1"), server.port()});
  asio::write(socket, asio::buffer(http::format_request_head("POST", "/upload", head.headers)));
  asio::streambuf interim;
  asio::read_until(socket, interim, "\r\n\r\n");
  std::string first(asio::buffers_begin(interim.data()), asio::buffers_end(interim.data()));
  expect(first.rfind("HTTP/1.1 100", 0) == 0, "interim 100 Continue");
  interim.consume(interim.size());

  asio::write(socket, asio::buffer(body));
  std::error_code ec;
  std::string rest;
  char buf[1024];
  for(;;) {
    std::size_t n = socket.read_some(asio::buffer(buf), ec);
    if(n > 0) rest.append(buf, n);
    if(ec) break;
  }
  expect(status_of(rest) == 200, "final status 200");
  expect(read_file(tmp / "drop" / "slow.txt") == "patience", "stored");
  server.stop();
  return true;
}

} // namespace

void add_upload_tests(std::vector<TestCase>& tests) {
  tests.push_back({"upload_stores_file", test_upload_stores_file});
  tests.push_back({"upload_wrong_key", test_upload_wrong_key});
  tests.push_back({"upload_wrong_method", test_upload_wrong_method});
  tests.push_back({"upload_bad_names", test_upload_bad_names});
  tests.push_back({"upload_base_name", test_upload_base_name});
  tests.push_back({"upload_collision", test_upload_collision});
  tests.push_back({"upload_missing_form", test_upload_missing_form});
  tests.push_back({"upload_directory_extracts", test_upload_directory_extracts});
  tests.push_back({"upload_file_mode_never_extracts", test_upload_file_mode_never_extracts});
  tests.push_back({"upload_other_types_never_extract", test_upload_other_types_never_extract});
  tests.push_back({"upload_directory_bad_archive", test_upload_directory_bad_archive});
  tests.push_back({"upload_torn_down_mid_form", test_upload_torn_down_mid_form});
  tests.push_back({"upload_states", test_upload_states});
  tests.push_back({"server_over_loopback", test_server_over_loopback});
  tests.push_back({"server_expect_continue", test_server_expect_continue});
}

} // namespace ftr::test
