#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "pixsync_reassembler.h"
#include "test_helpers.h"

template <typename T>
static void expect_round_trip(const T &obj) {
  std::vector<uint8_t> blob;
  sync_error err;
  ASSERT_TRUE(reassembler_serialize(obj, blob, &err)) << err.message;
  EXPECT_LE(blob.size(), (size_t)PIXSYNC_MAX_PAYLOAD);
  T back;
  ASSERT_TRUE(reassembler_deserialize(blob, back, &err)) << err.message;
  EXPECT_TRUE(back == obj) << state_kind_name(state_traits<T>::kind);
}

TEST(Reassembler, PopulatedObjectsRoundTrip) {
  expect_round_trip(sample_version());
  expect_round_trip(sample_config());
  expect_round_trip(sample_matrix());
  expect_round_trip(sample_color_sets());
  expect_round_trip(sample_output());
  expect_round_trip(sample_gui());
  expect_round_trip(sample_mapping());
  expect_round_trip(sample_preset());
  expect_round_trip(sample_stats());
  expect_round_trip(sample_files());
  expect_round_trip(sample_images());
}

TEST(Reassembler, DefaultObjectsRoundTrip) {
  expect_round_trip(version_info());
  expect_round_trip(app_config());
  expect_round_trip(matrix_data());
  expect_round_trip(color_sets());
  expect_round_trip(output_snapshot());
  expect_round_trip(gui_state());
  expect_round_trip(output_mapping());
  expect_round_trip(preset_settings());
  expect_round_trip(runtime_stats());
  expect_round_trip(file_location());
  expect_round_trip(image_buffer());
}

TEST(Reassembler, KindMismatchIsDeserializationError) {
  std::vector<uint8_t> blob;
  sync_error err;
  ASSERT_TRUE(reassembler_serialize(sample_config(), blob, &err));

  version_info v;
  v.version = "untouched";
  EXPECT_FALSE(reassembler_deserialize(blob, v, &err));
  EXPECT_EQ(err.code, sync_errc::DESERIALIZATION_ERROR);
  EXPECT_EQ(v.version, "untouched");

  state_kind k;
  ASSERT_TRUE(reassembler_peek_kind(blob, &k));
  EXPECT_EQ(k, state_kind::CONFIGURATION);
}

TEST(Reassembler, GarbageIsDeserializationError) {
  std::vector<uint8_t> junk = {0xFF, 0x00, 0x13, 0x37};
  gui_state g;
  sync_error err;
  EXPECT_FALSE(reassembler_deserialize(junk, g, &err));
  EXPECT_EQ(err.code, sync_errc::DESERIALIZATION_ERROR);

  std::vector<uint8_t> empty;
  err.clear();
  EXPECT_FALSE(reassembler_deserialize(empty, g, &err));
  EXPECT_EQ(err.code, sync_errc::DESERIALIZATION_ERROR);
}

TEST(Reassembler, WrongShapeIsDeserializationError) {
  nlohmann::json data;
  data["version"] = 42;   // must be a string
  std::vector<uint8_t> blob;
  sync_error err;
  ASSERT_TRUE(reassembler_pack(state_kind::VERSION, data, blob, &err));
  version_info v;
  EXPECT_FALSE(reassembler_deserialize(blob, v, &err));
  EXPECT_EQ(err.code, sync_errc::DESERIALIZATION_ERROR);
}

TEST(Reassembler, ImageBufferSizeMustMatchDimensions) {
  image_buffer b = sample_images();
  b.visual_buffers[0].pop_back();
  std::vector<uint8_t> blob;
  sync_error err;
  ASSERT_TRUE(reassembler_serialize(b, blob, &err));
  image_buffer back;
  EXPECT_FALSE(reassembler_deserialize(blob, back, &err));
  EXPECT_EQ(err.code, sync_errc::DESERIALIZATION_ERROR);
}

TEST(Reassembler, OversizedObjectIsRejected) {
  image_buffer b;
  b.width = 128;
  b.height = 128;
  b.visual_buffers.push_back(std::vector<uint32_t>(128 * 128, 0xFFFFFF));
  b.visual_buffers.push_back(std::vector<uint32_t>(128 * 128, 0xFFFFFF));
  std::vector<uint8_t> blob;
  sync_error err;
  EXPECT_FALSE(reassembler_serialize(b, blob, &err));
  EXPECT_EQ(err.code, sync_errc::PAYLOAD_TOO_LARGE);
}
