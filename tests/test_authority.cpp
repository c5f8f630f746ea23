#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include "pixsync_authority.h"
#include "pixsync_reassembler.h"
#include "test_helpers.h"

namespace {

struct authority_fixture : public ::testing::Test {
  authority_fixture()
      : server(&state, &events, net.factory(),
               [this](const std::vector<std::string> &msg, const std::vector<uint8_t> *blob) {
                 operational.push_back(msg);
                 operational_blobs.push_back(blob != nullptr);
               }) {}

  fixed_state_source state;
  visual_state_events events;
  recording_network net;
  std::vector<std::vector<std::string>> operational;
  std::vector<bool> operational_blobs;
  authority_server server;
};

}  // namespace

TEST_F(authority_fixture, EveryGetCommandYieldsExactlyOneReplyWithSamePattern) {
  for (command_id id : required_bootstrap_commands()) {
    net.clear();
    server.handle_message(make_message(command_symbol(id), {}, "10.0.0.5", 40000));
    auto sent = net.sent();
    ASSERT_EQ(sent.size(), 1u) << command_symbol(id);
    EXPECT_EQ(sent[0].pattern, command_symbol(id));
    EXPECT_TRUE(sent[0].has_blob);
    EXPECT_TRUE(sent[0].args.empty());
    EXPECT_EQ(sent[0].to.host, "10.0.0.5");
    EXPECT_EQ(sent[0].to.port, 9875);

    state_kind k;
    ASSERT_TRUE(state_kind_for_command(id, &k));
    state_kind got;
    ASSERT_TRUE(reassembler_peek_kind(sent[0].blob, &got));
    EXPECT_EQ(got, k);
  }
  EXPECT_EQ(server.replies_sent(), (uint64_t)STATE_KIND_COUNT);
}

TEST_F(authority_fixture, ConfigurationReplyCarriesTheLiveObject) {
  state.cfg.device_x = 32;
  state.cfg.output_device = "ARTNET";
  server.handle_message(make_message("GET_CONFIGURATION"));
  auto sent = net.sent();
  ASSERT_EQ(sent.size(), 1u);
  app_config c;
  sync_error err;
  ASSERT_TRUE(reassembler_deserialize(sent[0].blob, c, &err)) << err.message;
  EXPECT_TRUE(c == state.cfg);
}

TEST_F(authority_fixture, StatisticsReplyCarriesServerCounters) {
  server.handle_message(make_message("GET_JMXSTATISTICS"));
  auto sent = net.sent();
  ASSERT_EQ(sent.size(), 1u);
  runtime_stats s;
  sync_error err;
  ASSERT_TRUE(reassembler_deserialize(sent[0].blob, s, &err));
  EXPECT_EQ(s.frame_count, state.st.frame_count);
  // not started: no traffic counted yet
  EXPECT_EQ(s.packets_received, 0u);
  EXPECT_EQ(s.bytes_received, 0u);
}

TEST_F(authority_fixture, ReplyChannelIsReusedForTheSamePeer) {
  server.handle_message(make_message("GET_VERSION", {}, "10.0.0.5", 40000));
  server.handle_message(make_message("GET_MATRIXDATA", {}, "10.0.0.5", 40001));
  EXPECT_EQ(net.links_created(), 1u);

  server.handle_message(make_message("GET_VERSION", {}, "10.0.0.9", 40000));
  EXPECT_EQ(net.links_created(), 2u);
  net_endpoint peer;
  ASSERT_TRUE(server.reply_peer(&peer));
  EXPECT_EQ(peer.host, "10.0.0.9");
  auto sent = net.sent();
  ASSERT_EQ(sent.size(), 3u);
  EXPECT_EQ(sent[2].to.host, "10.0.0.9");
}

TEST_F(authority_fixture, NoObserverMeansNoPush) {
  events.publish(gui_state_changed{sample_gui()});
  EXPECT_EQ(net.sent_count(), 0u);
  EXPECT_EQ(server.pushes_sent(), 0u);
}

TEST_F(authority_fixture, RegisteredObserverGetsExactlyOnePush) {
  server.handle_message(make_message("REGISTER_VISUALOBSERVER", {}, "10.0.0.7"));
  EXPECT_EQ(net.sent_count(), 0u);
  net_endpoint obs;
  ASSERT_TRUE(server.observer(&obs));
  EXPECT_EQ(obs.host, "10.0.0.7");
  EXPECT_EQ(obs.port, 9875);

  gui_state g;
  g.entries = {"CHANGE_MIXER 1"};
  events.publish(gui_state_changed{g});
  auto sent = net.sent();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].pattern, "GET_GUISTATE");
  EXPECT_EQ(sent[0].to.host, "10.0.0.7");
  gui_state back;
  sync_error err;
  ASSERT_TRUE(reassembler_deserialize(sent[0].blob, back, &err));
  EXPECT_TRUE(back == g);
}

TEST_F(authority_fixture, ObserverChangeRedirectsPushes) {
  server.handle_message(make_message("REGISTER_VISUALOBSERVER", {}, "10.0.0.7"));
  events.publish(gui_state_changed{sample_gui()});
  server.handle_message(make_message("REGISTER_VISUALOBSERVER", {}, "10.0.0.8"));
  events.publish(gui_state_changed{sample_gui()});
  events.publish(gui_state_changed{sample_gui()});

  auto sent = net.sent();
  ASSERT_EQ(sent.size(), 3u);
  EXPECT_EQ(sent[0].to.host, "10.0.0.7");
  EXPECT_EQ(sent[1].to.host, "10.0.0.8");
  EXPECT_EQ(sent[2].to.host, "10.0.0.8");
}

TEST_F(authority_fixture, UnregisterOnlyFromTheObserverItself) {
  server.handle_message(make_message("REGISTER_VISUALOBSERVER", {}, "10.0.0.7"));
  server.handle_message(make_message("UNREGISTER_VISUALOBSERVER", {}, "10.0.0.99"));
  EXPECT_TRUE(server.observer(nullptr));

  server.handle_message(make_message("UNREGISTER_VISUALOBSERVER", {}, "10.0.0.7"));
  EXPECT_FALSE(server.observer(nullptr));
  events.publish(gui_state_changed{sample_gui()});
  EXPECT_EQ(net.sent_count(), 0u);
}

TEST_F(authority_fixture, UnknownAndMismatchedMessagesAreDropped) {
  log_capture logs;
  server.handle_message(make_message("NOT_A_COMMAND", {"1"}));
  server.handle_message(make_message("CHANGE_GENERATOR_A", {}));
  server.handle_message(make_message("GET_VERSION", {"unexpected"}));
  server.handle_message(make_message(""));
  EXPECT_EQ(net.sent_count(), 0u);
  EXPECT_TRUE(operational.empty());
  EXPECT_TRUE(logs.contains("unknown message: NOT_A_COMMAND"));
  EXPECT_TRUE(logs.contains("parameter count mismatch for CHANGE_GENERATOR_A"));
  EXPECT_TRUE(logs.contains("ignore empty OSC message"));
}

TEST_F(authority_fixture, OperationalCommandsAreForwarded) {
  server.handle_message(make_message("CHANGE_BRIGHTNESS", {"40"}));
  sync_message with_blob = make_message("CHANGE_GENERATOR_B");
  with_blob.has_blob = true;
  with_blob.blob = {1, 2, 3};
  server.handle_message(with_blob);
  server.handle_message(make_message("OSC_GENERATOR1", {"a", "b", "c"}));

  ASSERT_EQ(operational.size(), 3u);
  EXPECT_EQ(operational[0], (std::vector<std::string>{"CHANGE_BRIGHTNESS", "40"}));
  EXPECT_FALSE(operational_blobs[0]);
  EXPECT_EQ(operational[1], (std::vector<std::string>{"CHANGE_GENERATOR_B"}));
  EXPECT_TRUE(operational_blobs[1]);
  EXPECT_EQ(operational[2].size(), 4u);
  EXPECT_EQ(net.sent_count(), 0u);
}

TEST_F(authority_fixture, SendFailureIsLoggedAndDropped) {
  log_capture logs;
  net.fail_sends = true;
  server.handle_message(make_message("GET_VERSION"));
  EXPECT_EQ(server.replies_sent(), 0u);
  EXPECT_TRUE(logs.contains("failed to send OSC message GET_VERSION"));

  net.fail_sends = false;
  server.handle_message(make_message("GET_VERSION"));
  EXPECT_EQ(server.replies_sent(), 1u);
}

TEST_F(authority_fixture, MissingReturnChannelIsLogged) {
  log_capture logs;
  net.fail_links = true;
  server.handle_message(make_message("GET_VERSION"));
  server.handle_message(make_message("REGISTER_VISUALOBSERVER"));
  EXPECT_EQ(net.sent_count(), 0u);
  EXPECT_FALSE(server.observer(nullptr));
  EXPECT_TRUE(logs.contains("no return channel"));
}

TEST_F(authority_fixture, OversizedReplyIsDropped) {
  state.img.width = 128;
  state.img.height = 128;
  state.img.visual_buffers.assign(2, std::vector<uint32_t>(128 * 128, 0xFFFFFF));
  state.img.output_buffers.clear();
  log_capture logs;
  server.handle_message(make_message("GET_IMAGEBUFFER"));
  EXPECT_EQ(net.sent_count(), 0u);
  EXPECT_TRUE(logs.contains("failed to serialize reply for GET_IMAGEBUFFER"));
}

TEST(Authority, DestructionUnsubscribesFromEvents) {
  fixed_state_source state;
  visual_state_events events;
  recording_network net;
  {
    authority_server server(&state, &events, net.factory(), nullptr);
    EXPECT_EQ(events.subscriber_count(), 1u);
  }
  EXPECT_EQ(events.subscriber_count(), 0u);
  events.publish(gui_state_changed{sample_gui()});
}

TEST(Authority, SubscriberExceptionDoesNotStopOthers) {
  visual_state_events events;
  int calls = 0;
  events.subscribe([](const gui_state_changed &) { throw std::runtime_error("boom"); });
  events.subscribe([&calls](const gui_state_changed &) { calls++; });
  log_capture logs;
  events.publish(gui_state_changed{sample_gui()});
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(logs.contains("boom"));
}

TEST(Authority, UnsubscribeWaitsForRunningHandler) {
  visual_state_events events;
  std::atomic<bool> entered{false};
  std::atomic<bool> finished{false};
  auto id = events.subscribe([&](const gui_state_changed &) {
    entered = true;
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    finished = true;
  });
  std::thread publisher([&]() { events.publish(gui_state_changed{sample_gui()}); });
  ASSERT_TRUE(wait_until([&]() { return entered.load(); }, 5000));
  EXPECT_TRUE(events.unsubscribe(id));
  EXPECT_TRUE(finished.load());
  publisher.join();
  EXPECT_FALSE(events.unsubscribe(id));
}

TEST(Authority, HandlerMayUnsubscribeItself) {
  visual_state_events events;
  visual_state_events::subscription_id id = 0;
  int calls = 0;
  id = events.subscribe([&](const gui_state_changed &) {
    calls++;
    EXPECT_TRUE(events.unsubscribe(id));
  });
  std::future<void> done = std::async(std::launch::async, [&]() {
    events.publish(gui_state_changed{sample_gui()});
    events.publish(gui_state_changed{sample_gui()});
  });
  ASSERT_EQ(done.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(events.subscriber_count(), 0u);
}

TEST(Authority, HandlerRemovedDuringPublishIsSkipped) {
  visual_state_events events;
  visual_state_events::subscription_id second = 0;
  int second_calls = 0;
  events.subscribe([&](const gui_state_changed &) { events.unsubscribe(second); });
  second = events.subscribe([&](const gui_state_changed &) { second_calls++; });
  events.publish(gui_state_changed{sample_gui()});
  EXPECT_EQ(second_calls, 0);
  EXPECT_EQ(events.subscriber_count(), 1u);
}

TEST(Authority, StatusBoardFollowsAttachAndDetach) {
  fixed_state_source state;
  visual_state_events events;
  recording_network net;
  authority_server server(&state, &events, net.factory(), nullptr);
  authority_status board;
  EXPECT_FALSE(board.attached());
  EXPECT_EQ(board.status_json(), "{}");
  EXPECT_EQ(board.state_json(), "{}");

  board.attach(&server, &state);
  EXPECT_TRUE(board.attached());
  EXPECT_NE(board.status_json().find("\"packetsReceived\""), std::string::npos);
  std::string st = board.state_json();
  EXPECT_NE(st.find("\"version\""), std::string::npos);
  EXPECT_NE(st.find("\"imageBuffer\""), std::string::npos);

  board.detach();
  EXPECT_FALSE(board.attached());
  EXPECT_EQ(board.state_json(), "{}");
}

TEST(Authority, StatusBoardReadersSurviveTeardown) {
  fixed_state_source state;
  visual_state_events events;
  recording_network net;
  std::unique_ptr<authority_server> server(new authority_server(&state, &events, net.factory(), nullptr));
  authority_status board;
  board.attach(server.get(), &state);

  std::atomic<bool> quit{false};
  std::atomic<int> reads{0};
  std::thread reader([&]() {
    while (!quit.load()) {
      std::string a = board.status_json();
      std::string b = board.state_json();
      EXPECT_FALSE(a.empty());
      EXPECT_FALSE(b.empty());
      reads++;
    }
  });
  ASSERT_TRUE(wait_until([&]() { return reads.load() > 10; }, 5000));
  board.detach();
  server.reset();
  ASSERT_TRUE(wait_until([&]() { return reads.load() > 20; }, 5000));
  quit = true;
  reader.join();
  EXPECT_EQ(board.status_json(), "{}");
}
