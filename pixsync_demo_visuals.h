#pragma once
#include <stdint.h>
#include <mutex>
#include <string>
#include <vector>
#include "pixsync_authority.h"
#include "pixsync_errors.h"
#include "pixsync_events.h"
#include "pixsync_state.h"

// Small stand-in for a visual pipeline: two greyscale generators mixed into
// one visual, coloured with the active colour set.

enum demo_generator { GEN_GRADIENT = 0, GEN_CHECKER = 1, GEN_COUNT = 2 };
enum demo_mixer { MIX_PASSTHRU = 0, MIX_NEGATIVE_MULTIPLY = 1, MIX_COUNT = 2 };

const char *demo_generator_name(int gen);
const char *demo_mixer_name(int mix);

void gen_gradient(uint32_t w, uint32_t h, uint64_t frame, std::vector<uint8_t> &out);
void gen_checker(uint32_t w, uint32_t h, uint64_t frame, std::vector<uint8_t> &out);

// dst = 255 - (255-a)*(255-b)/255 per pixel; a and b must have equal size
void mix_negative_multiply(const std::vector<uint8_t> &a, const std::vector<uint8_t> &b, std::vector<uint8_t> &dst);

// Maps a grey value onto the colour set, interpolating between neighbours.
uint32_t colorset_lookup(const color_set &set, uint8_t grey);

std::vector<color_set> demo_color_sets();

class demo_visuals : public authority_state_source {
public:
  demo_visuals(uint32_t width, uint32_t height, visual_state_events *events);

  version_info version() const override;
  app_config configuration() const override;
  matrix_data matrix() const override;
  color_sets colors() const override;
  output_snapshot output() const override;
  gui_state gui() const override;
  output_mapping mapping() const override;
  preset_settings preset() const override;
  runtime_stats statistics() const override;
  file_location files() const override;
  image_buffer images() const override;

  // Renders one frame (unless frozen).
  void tick();

  // Keyboard shortcuts of the authority console.
  void next_generator();
  void rotate_colorset();

  // Operational command [symbol, args...] from the wire.
  bool apply_command(const std::vector<std::string> &msg, const std::vector<uint8_t> *blob, sync_error *err);

  void set_fps(int fps);

private:
  gui_state gui_locked() const;
  void publish_gui();
  void render_generator(int gen, std::vector<uint8_t> &out) const;

  uint32_t w, h;
  visual_state_events *events;

  mutable std::mutex mtx;
  int gen_a = GEN_GRADIENT;
  int gen_b = GEN_CHECKER;
  int mixer = MIX_NEGATIVE_MULTIPLY;
  int brightness = 100;
  bool frozen = false;
  int fps = 20;
  size_t colorset_index = 0;
  std::vector<color_set> sets;
  int preset_slot = 0;
  std::vector<std::vector<std::string>> presets;   // per slot, empty = unused

  uint64_t frame = 0;
  uint64_t start_ms = 0;
  uint64_t fps_window_start_ms = 0;
  uint64_t fps_window_frames = 0;
  float current_fps = 0.f;
  std::vector<uint32_t> visual_mix;    // visual 0: mixed and coloured
  std::vector<uint32_t> visual_b;      // visual 1: generator B coloured
};
