#include "minitest.hpp"
#include "fakes.hpp"
#include "app/PeerTransferClient.hpp"
#include "app/SharingServer.hpp"
#include "app/TransferSessionManager.hpp"

using namespace lanlink;

namespace {

// A peer's sharing server reachable through the loopback client.
struct PeerFixture {
  explicit PeerFixture(const std::string& tag) : dir(tag) {
    app::SharingOptions o;
    o.upload_dir = dir.path() / "inbox";
    ASSERT_TRUE(server.configure(o));
    ASSERT_TRUE(server.start({}));
  }

  testing::TempDir dir;
  app::EventChannel ch;
  testing::EventRecorder rec{ch};
  util::ManualClock clock;
  testing::FakeHttpListener http;
  testing::LoopbackHttpClient client{http};
  app::TransferSessionManager transfers{ch, clock, 5};
  app::SharingServer server{ch, http, transfers, clock, [] { return std::string("192.168.1.30"); }};
  app::PeerTransferClient peers{ch, transfers, client};

  std::string share(const std::string& name, const std::string& content, std::optional<std::string> password = {}) {
    app::ShareRequest req;
    req.path = dir.write(name, content);
    if (password) {
      req.enable_password = true;
      req.password = password;
    }
    auto id = server.share_file(req);
    return id ? server.shared_files().back().url : std::string();
  }
};

} // namespace

TEST(peer_download_saves_complete_file) {
  PeerFixture f("peer_get");
  std::string payload(150000, 'd');
  payload[777] = '!';
  auto url = f.share("movie.bin", payload);
  auto save = f.dir.path() / "got" / "movie-copy.bin";
  std::filesystem::create_directories(save.parent_path());
  ASSERT_TRUE(f.peers.download(url, save));
  ASSERT_EQ(testing::read_all(save), payload);
  ASSERT_EQ(testing::count_part_files(save.parent_path()), 0u);
  // One session for the serving side, one for ours.
  ASSERT_EQ(f.rec.count("transfer_started"), 2u);
  ASSERT_EQ(f.rec.count("transfer_finished"), 2u);
  ASSERT_EQ(f.transfers.active_count(), 0u);
  ASSERT_EQ(f.server.shared_files()[0].download_count, 1u);
}

TEST(peer_download_sends_password) {
  PeerFixture f("peer_get_pw");
  auto url = f.share("locked.txt", "behind a door", std::string("sesame"));
  auto save = f.dir.path() / "locked-copy.txt";
  ASSERT_FALSE(f.peers.download(url, save));
  ASSERT_FALSE(std::filesystem::exists(save));
  ASSERT_EQ(f.rec.errors(model::ErrorKind::TransferFailed), 1u);
  ASSERT_TRUE(f.peers.download(url, save, std::string("sesame")));
  ASSERT_EQ(testing::read_all(save), "behind a door");
}

TEST(peer_download_failures_leave_nothing_behind) {
  PeerFixture f("peer_get_bad");
  auto save = f.dir.path() / "nothing.bin";
  ASSERT_FALSE(f.peers.download("ftp://192.168.1.30/x", save));
  ASSERT_FALSE(f.peers.download("http://192.168.1.30:8080/share/00000000-0000-4000-8000-000000000000", save));
  ASSERT_FALSE(f.peers.download("http://192.168.1.30:9999/share/x", save));
  ASSERT_FALSE(f.peers.download("http://192.168.1.30:8080/share/x", f.dir.path() / "missing" / "dir.bin"));
  ASSERT_FALSE(std::filesystem::exists(save));
  ASSERT_EQ(f.rec.errors(model::ErrorKind::TransferFailed), 4u);
  ASSERT_EQ(f.transfers.active_count(), 0u);
}

TEST(peer_download_respects_the_transfer_limit) {
  PeerFixture f("peer_get_limit");
  auto url = f.share("x.txt", "x");
  f.transfers.set_max_concurrent(1);
  auto held = f.transfers.open(model::TransferDirection::Upload, "busy", 1);
  ASSERT_TRUE(held.has_value());
  ASSERT_FALSE(f.peers.download(url, f.dir.path() / "x-copy.txt"));
  ASSERT_FALSE(std::filesystem::exists(f.dir.path() / "x-copy.txt"));
}

TEST(peer_upload_lands_in_the_peer_inbox) {
  PeerFixture f("peer_put");
  auto file = f.dir.write("out/report final.txt", "quarterly numbers");
  ASSERT_TRUE(f.peers.upload(file, "http://192.168.1.30:8080/upload"));
  ASSERT_EQ(f.client.last_target, "/upload?name=report%20final.txt");
  ASSERT_EQ(testing::read_all(f.dir.path() / "inbox" / "report final.txt"), "quarterly numbers");
  ASSERT_EQ(f.rec.count("transfer_started"), 2u);

  // An explicit name wins.
  ASSERT_TRUE(f.peers.upload(file, "http://192.168.1.30:8080/upload?name=renamed.txt"));
  ASSERT_EQ(testing::read_all(f.dir.path() / "inbox" / "renamed.txt"), "quarterly numbers");
}

TEST(peer_upload_refused_by_peer) {
  PeerFixture f("peer_put_refused");
  auto file = f.dir.write("big.bin", std::string(64, 'b'));
  app::SharingOptions o = f.server.options();
  o.max_file_size = 10;
  ASSERT_TRUE(f.server.configure(o));
  ASSERT_FALSE(f.peers.upload(file, "http://192.168.1.30:8080/upload"));
  ASSERT_EQ(f.rec.errors(model::ErrorKind::TransferFailed), 1u);
  ASSERT_FALSE(f.peers.upload(f.dir.path() / "absent.bin", "http://192.168.1.30:8080/upload"));
  ASSERT_EQ(f.rec.errors(model::ErrorKind::TransferFailed), 2u);
}

TEST(peer_url_parsing) {
  auto u = util::parse_url("http://192.168.1.30:8080/share/abc?password=x#frag");
  ASSERT_TRUE(u.has_value());
  ASSERT_EQ(u->host, "192.168.1.30");
  ASSERT_EQ(u->port, 8080);
  ASSERT_EQ(u->target, "/share/abc?password=x");
  auto bare = util::parse_url("HTTP://printer.local");
  ASSERT_TRUE(bare.has_value());
  ASSERT_EQ(bare->port, 80);
  ASSERT_EQ(bare->target, "/");
  ASSERT_FALSE(util::parse_url("https://host/").has_value());
  ASSERT_FALSE(util::parse_url("http://host:0/").has_value());
  ASSERT_FALSE(util::parse_url("http://user@host/").has_value());
  ASSERT_EQ(util::format_request_head("GET", *u, {{"Accept", "*/*"}}),
            "GET /share/abc?password=x HTTP/1.1\r\nHost: 192.168.1.30:8080\r\nAccept: */*\r\nConnection: close\r\n\r\n");
}

TEST(peer_response_head_parsing) {
  auto h = util::parse_response_head("HTTP/1.1 404 Not Found\r\nContent-Length: 12\r\nX-A: b\r\n");
  ASSERT_TRUE(h.has_value());
  ASSERT_EQ(h->status, 404);
  ASSERT_EQ(h->content_length().value_or(0), 12u);
  ASSERT_EQ(h->header("x-a").value_or(""), "b");
  ASSERT_FALSE(util::parse_response_head("SPDY 200 OK\r\n").has_value());
  ASSERT_FALSE(util::parse_response_head("HTTP/1.1 abc\r\n").has_value());
}
