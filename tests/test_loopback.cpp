#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include "pixsync_authority.h"
#include "pixsync_discovery.h"
#include "pixsync_mirror.h"
#include "test_helpers.h"

namespace {

// Authority on an ephemeral loopback port, replying to `reply_port`.
struct loopback_authority {
  explicit loopback_authority(uint16_t reply_port)
      : server(&state, &events, udp_link_factory(),
               [this](const std::vector<std::string> &line, const std::vector<uint8_t> *) {
                 std::lock_guard<std::mutex> lk(mtx);
                 operational.push_back(line);
               }) {
    authority_options opt;
    opt.listen_addr = "127.0.0.1";
    opt.port = 0;
    opt.reply_port = reply_port;
    started = server.start(opt, &err);
  }

  size_t operational_count() {
    std::lock_guard<std::mutex> lk(mtx);
    return operational.size();
  }

  fixed_state_source state;
  visual_state_events events;
  std::mutex mtx;
  std::vector<std::vector<std::string>> operational;
  authority_server server;
  sync_error err;
  bool started = false;
};

void send_raw(uint16_t port, const std::vector<uint8_t> &bytes) {
  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  ASSERT_GE(fd, 0);
  sockaddr_in to{};
  to.sin_family = AF_INET;
  to.sin_port = htons(port);
  to.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  EXPECT_EQ(::sendto(fd, bytes.data(), bytes.size(), 0, (const sockaddr*)&to, sizeof(to)), (ssize_t)bytes.size());
  ::close(fd);
}

mirror_options loopback_mirror_options(uint16_t authority_port, uint16_t local_port) {
  mirror_options opt;
  opt.skip_discovery = true;
  opt.fallback = {"127.0.0.1", authority_port};
  opt.listen_addr = "127.0.0.1";
  opt.local_port = local_port;
  opt.retry_interval_ms = 200;
  return opt;
}

}  // namespace

TEST(Loopback, BootstrapThenLivePush) {
  uint16_t reply_port = free_udp_port();
  ASSERT_NE(reply_port, 0);
  loopback_authority auth(reply_port);
  ASSERT_TRUE(auth.started) << auth.err.message;

  mirror_session mirror(loopback_mirror_options(auth.server.local_port(), reply_port),
                        std::unique_ptr<mirror_io>(new udp_mirror_io()), nullptr);
  ASSERT_TRUE(mirror.start());
  ASSERT_EQ(mirror.wait_settled(10000), bootstrap_state::LIVE) << mirror.last_error().message;
  EXPECT_TRUE(mirror.mirror().initialized());
  EXPECT_TRUE(*mirror.mirror().images() == auth.state.img);
  EXPECT_TRUE(*mirror.mirror().configuration() == auth.state.cfg);

  ASSERT_TRUE(wait_until([&]() { return auth.server.observer(nullptr); }, 5000));

  std::mutex seen_mtx;
  std::vector<gui_state> seen;
  mirror.subscribe_gui_state([&](const gui_state_changed &ev) {
    std::lock_guard<std::mutex> lk(seen_mtx);
    seen.push_back(ev.state);
  });
  gui_state g;
  g.entries = {"CHANGE_MIXER 1"};
  auth.events.publish(gui_state_changed{g});
  ASSERT_TRUE(wait_until([&]() {
    std::lock_guard<std::mutex> lk(seen_mtx);
    return !seen.empty();
  }, 5000));
  EXPECT_TRUE(*mirror.mirror().gui() == g);

  sync_error err;
  ASSERT_TRUE(mirror.send_command({"CHANGE_MIXER", "1"}, nullptr, &err)) << err.message;
  ASSERT_TRUE(wait_until([&]() { return auth.operational_count() == 1; }, 5000));

  mirror.stop();
  ASSERT_TRUE(wait_until([&]() { return !auth.server.observer(nullptr); }, 5000));
}

TEST(Loopback, StopWhileGuiHandlerSendsDoesNotHang) {
  uint16_t reply_port = free_udp_port();
  ASSERT_NE(reply_port, 0);
  loopback_authority auth(reply_port);
  ASSERT_TRUE(auth.started) << auth.err.message;

  mirror_session mirror(loopback_mirror_options(auth.server.local_port(), reply_port),
                        std::unique_ptr<mirror_io>(new udp_mirror_io()), nullptr);
  ASSERT_TRUE(mirror.start());
  ASSERT_EQ(mirror.wait_settled(10000), bootstrap_state::LIVE) << mirror.last_error().message;
  ASSERT_TRUE(wait_until([&]() { return auth.server.observer(nullptr); }, 5000));

  std::atomic<bool> entered{false};
  std::atomic<bool> refresh_done{false};
  std::atomic<int> refresh_code{-1};
  mirror.subscribe_gui_state([&](const gui_state_changed &) {
    if (entered.exchange(true)) return;
    // keeps sending until stop() has taken the link down
    sync_error err;
    auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (mirror.request_refresh(state_kind::STATISTICS, &err) && std::chrono::steady_clock::now() < until) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    refresh_code = (int)err.code;
    refresh_done = true;
  });

  gui_state g;
  g.entries = {"CHANGE_MIXER 2"};
  auth.events.publish(gui_state_changed{g});
  ASSERT_TRUE(wait_until([&]() { return entered.load(); }, 5000));

  std::future<void> stopping = std::async(std::launch::async, [&]() { mirror.stop(); });
  ASSERT_EQ(stopping.wait_for(std::chrono::seconds(8)), std::future_status::ready);
  EXPECT_TRUE(refresh_done.load());
  EXPECT_EQ(refresh_code.load(), (int)sync_errc::SEND_FAILURE);
}

TEST(Loopback, GarbageIsCountedAndSurvived) {
  loopback_authority auth(free_udp_port());
  ASSERT_TRUE(auth.started) << auth.err.message;
  uint16_t port = auth.server.local_port();

  send_raw(port, {0x01, 0x02, 0x03});                       // not OSC
  std::vector<uint8_t> unknown;
  ASSERT_TRUE(wire_encode("NO_SUCH_COMMAND", {}, nullptr, unknown, nullptr));
  send_raw(port, unknown);

  udp_client client;
  sync_error err;
  ASSERT_TRUE(client.open("127.0.0.1", port, &err)) << err.message;
  ASSERT_TRUE(client.send("CHANGE_MIXER", {"1"}, nullptr, &err)) << err.message;

  ASSERT_TRUE(wait_until([&]() { return auth.operational_count() == 1; }, 5000));
  ASSERT_TRUE(wait_until([&]() { return auth.server.merged_statistics().packets_received == 3; }, 5000));
  EXPECT_GT(auth.server.merged_statistics().bytes_received, 3u);
  EXPECT_TRUE(auth.server.is_running());
}

TEST(Loopback, DiscoveryFindsPublishedService) {
  discovery_responder responder;
  service_advert adv;
  adv.service_type = "_pixsync-test._udp";
  adv.instance = "pixsync test " + std::to_string(::getpid());
  adv.port = 4321;
  sync_error err;
  if (!responder.start(adv, &err)) GTEST_SKIP() << "mDNS daemon unavailable: " << err.message;
  if (!wait_until([&]() { return responder.established(); }, 5000)) GTEST_SKIP() << "mDNS daemon did not confirm the service";
  EXPECT_FALSE(responder.instance_name().empty());

  net_endpoint found;
  ASSERT_TRUE(discover("_pixsync-test._udp", 3000, &found, &err)) << err.message;
  EXPECT_FALSE(found.host.empty());
  EXPECT_EQ(found.port, 4321);

  responder.stop();
  EXPECT_FALSE(responder.is_running());
}

TEST(Loopback, UnbindableListenAddressFails) {
  mirror_options opt = loopback_mirror_options(9, free_udp_port());
  opt.listen_addr = "203.0.113.7";
  mirror_session mirror(opt, std::unique_ptr<mirror_io>(new udp_mirror_io()), nullptr);
  ASSERT_TRUE(mirror.start());
  ASSERT_EQ(mirror.wait_settled(5000), bootstrap_state::FAILED);
  EXPECT_EQ(mirror.last_error().code, sync_errc::TRANSPORT_BIND_FAILURE);
}
