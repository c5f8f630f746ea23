#include <gtest/gtest.h>
#include <algorithm>
#include "pixsync_demo_visuals.h"
#include "test_helpers.h"

TEST(DemoMixer, NegativeMultiply) {
  std::vector<uint8_t> a = {128, 0, 0, 255, 10};
  std::vector<uint8_t> b = {128, 77, 0, 3, 255};
  std::vector<uint8_t> out;
  mix_negative_multiply(a, b, out);
  ASSERT_EQ(out.size(), a.size());
  EXPECT_EQ(out[0], 192);
  EXPECT_EQ(out[1], 77);
  EXPECT_EQ(out[2], 0);
  EXPECT_EQ(out[3], 255);
  EXPECT_EQ(out[4], 255);
}

TEST(DemoColors, LookupInterpolates) {
  color_set grey{"Greyscale", {0x000000, 0xFFFFFF}};
  EXPECT_EQ(colorset_lookup(grey, 0), 0x000000u);
  EXPECT_EQ(colorset_lookup(grey, 128), 0x808080u);
  EXPECT_EQ(colorset_lookup(grey, 255), 0xFFFFFFu);

  color_set rgb{"RGB", {0xFF0000, 0x00FF00, 0x0000FF}};
  EXPECT_EQ(colorset_lookup(rgb, 0), 0xFF0000u);
  EXPECT_EQ(colorset_lookup(rgb, 255), 0x0000FFu);

  color_set empty{"none", {}};
  EXPECT_EQ(colorset_lookup(empty, 10), 0x0A0A0Au);
}

TEST(DemoGenerators, FrameSizes) {
  std::vector<uint8_t> g;
  gen_gradient(5, 2, 0, g);
  ASSERT_EQ(g.size(), 10u);
  EXPECT_EQ(g[0], 0);
  EXPECT_EQ(g[4], 255);
  EXPECT_EQ(g[5], 0);

  gen_checker(8, 8, 0, g);
  ASSERT_EQ(g.size(), 64u);
  EXPECT_EQ(g[0], 0);
  EXPECT_EQ(g[2], 255);
}

TEST(DemoVisuals, CommandsChangeGuiAndPublish) {
  visual_state_events events;
  std::vector<gui_state> seen;
  events.subscribe([&seen](const gui_state_changed &ev) { seen.push_back(ev.state); });
  demo_visuals demo(8, 4, &events);

  sync_error err;
  ASSERT_TRUE(demo.apply_command({"CHANGE_GENERATOR_A", "1"}, nullptr, &err)) << err.message;
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].entries[0], "CHANGE_GENERATOR_A 1");
  EXPECT_TRUE(demo.gui() == seen[0]);

  ASSERT_TRUE(demo.apply_command({"CURRENT_COLORSET", "Fire"}, nullptr, &err));
  const auto entries = demo.gui().entries;
  EXPECT_NE(std::find(entries.begin(), entries.end(), "CURRENT_COLORSET Fire"), entries.end());

  ASSERT_TRUE(demo.apply_command({"CURRENT_COLORSET", "0"}, nullptr, &err));
  const auto entries2 = demo.gui().entries;
  EXPECT_NE(std::find(entries2.begin(), entries2.end(), "CURRENT_COLORSET RGB"), entries2.end());
  EXPECT_EQ(seen.size(), 3u);

  demo.next_generator();
  EXPECT_EQ(demo.gui().entries[0], "CHANGE_GENERATOR_A 0");
  EXPECT_EQ(seen.size(), 4u);
}

TEST(DemoVisuals, BadArgumentsAreRejected) {
  demo_visuals demo(4, 4, nullptr);
  sync_error err;
  EXPECT_FALSE(demo.apply_command({"CHANGE_MIXER", "7"}, nullptr, &err));
  EXPECT_EQ(err.code, sync_errc::MALFORMED_MESSAGE);
  EXPECT_FALSE(demo.apply_command({"CHANGE_BRIGHTNESS", "abc"}, nullptr, &err));
  EXPECT_FALSE(demo.apply_command({"CURRENT_COLORSET", "Nope"}, nullptr, &err));
  EXPECT_FALSE(demo.apply_command({"NOT_A_COMMAND"}, nullptr, &err));
  EXPECT_EQ(err.code, sync_errc::UNKNOWN_COMMAND);
  EXPECT_FALSE(demo.apply_command({}, nullptr, &err));

  // Known but outside the demo pipeline: accepted, nothing changes.
  gui_state before = demo.gui();
  EXPECT_TRUE(demo.apply_command({"BLINKEN", "torus.bml"}, nullptr, &err));
  EXPECT_TRUE(demo.gui() == before);
}

TEST(DemoVisuals, PresetSaveAndLoad) {
  demo_visuals demo(4, 4, nullptr);
  sync_error err;
  ASSERT_TRUE(demo.apply_command({"CHANGE_PRESET", "3"}, nullptr, &err));
  ASSERT_TRUE(demo.apply_command({"CHANGE_BRIGHTNESS", "40"}, nullptr, &err));
  ASSERT_TRUE(demo.apply_command({"SAVE_PRESET"}, nullptr, &err));

  preset_settings p = demo.preset();
  EXPECT_EQ(p.slot, 3);
  EXPECT_NE(std::find(p.present.begin(), p.present.end(), "CHANGE_BRIGHTNESS 40"), p.present.end());
  for (const auto &line : p.present) EXPECT_EQ(line.find("CHANGE_PRESET"), std::string::npos);

  ASSERT_TRUE(demo.apply_command({"CHANGE_BRIGHTNESS", "90"}, nullptr, &err));
  EXPECT_EQ(demo.configuration().brightness, 90);
  ASSERT_TRUE(demo.apply_command({"LOAD_PRESET"}, nullptr, &err));
  EXPECT_EQ(demo.configuration().brightness, 40);

  ASSERT_TRUE(demo.apply_command({"CHANGE_PRESET", "4"}, nullptr, &err));
  EXPECT_TRUE(demo.preset().present.empty());
  EXPECT_FALSE(demo.apply_command({"CHANGE_PRESET", "16"}, nullptr, &err));
}

TEST(DemoVisuals, TickRendersUnlessFrozen) {
  demo_visuals demo(6, 3, nullptr);
  demo.tick();
  EXPECT_EQ(demo.statistics().frame_count, 1u);

  image_buffer img = demo.images();
  EXPECT_EQ(img.width, 6u);
  EXPECT_EQ(img.height, 3u);
  ASSERT_EQ(img.visual_buffers.size(), 2u);
  EXPECT_EQ(img.visual_buffers[0].size(), 18u);
  ASSERT_EQ(img.output_buffers.size(), 1u);

  sync_error err;
  ASSERT_TRUE(demo.apply_command({"FREEZE"}, nullptr, &err));
  demo.tick();
  EXPECT_EQ(demo.statistics().frame_count, 1u);
  ASSERT_TRUE(demo.apply_command({"FREEZE"}, nullptr, &err));
  demo.tick();
  EXPECT_EQ(demo.statistics().frame_count, 2u);
}

TEST(DemoVisuals, StateAccessorsDescribeTheMatrix) {
  demo_visuals demo(16, 8, nullptr);
  EXPECT_EQ(demo.version().version, "pixsync-demo 1.0");
  EXPECT_EQ(demo.configuration().device_x, 16u);
  EXPECT_EQ(demo.matrix().device_y, 8u);
  EXPECT_EQ(demo.colors().sets.size(), demo_color_sets().size());
}
