#include "pixsync_demo_visuals.h"
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <sstream>
#include "pixsync_commands.h"
#include "pixsync_log.h"

static const int k_preset_slots = 16;

static uint64_t monotonic_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (uint64_t)ts.tv_sec * 1000ull + (uint64_t)ts.tv_nsec / 1000000ull;
}

static uint64_t wallclock_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return (uint64_t)ts.tv_sec * 1000ull + (uint64_t)ts.tv_nsec / 1000000ull;
}

static bool parse_int(const std::string &s, int *out) {
  if (s.empty()) return false;
  char *end = NULL;
  long v = strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  *out = (int)v;
  return true;
}

static std::vector<std::string> split_ws(const std::string &line) {
  std::vector<std::string> out;
  std::istringstream ss(line);
  std::string tok;
  while (ss >> tok) out.push_back(tok);
  return out;
}

const char *demo_generator_name(int gen) {
  switch (gen) {
    case GEN_GRADIENT: return "gradient";
    case GEN_CHECKER: return "checker";
    default: return "?";
  }
}

const char *demo_mixer_name(int mix) {
  switch (mix) {
    case MIX_PASSTHRU: return "passthru";
    case MIX_NEGATIVE_MULTIPLY: return "negativeMultiply";
    default: return "?";
  }
}

// ---------------- generators / mixer ----------------
void gen_gradient(uint32_t w, uint32_t h, uint64_t frame, std::vector<uint8_t> &out) {
  out.resize((size_t)w * h);
  uint32_t span = w > 1 ? w - 1 : 1;
  for (uint32_t y = 0; y < h; y++) {
    for (uint32_t x = 0; x < w; x++) {
      out[(size_t)y * w + x] = (uint8_t)((x * 255u / span + frame * 4u) & 255u);
    }
  }
}

void gen_checker(uint32_t w, uint32_t h, uint64_t frame, std::vector<uint8_t> &out) {
  out.resize((size_t)w * h);
  uint32_t cs = w / 4 ? w / 4 : 1;
  uint64_t phase = frame / 8;
  for (uint32_t y = 0; y < h; y++) {
    for (uint32_t x = 0; x < w; x++) {
      out[(size_t)y * w + x] = ((x / cs + y / cs + phase) & 1) ? 255 : 0;
    }
  }
}

void mix_negative_multiply(const std::vector<uint8_t> &a, const std::vector<uint8_t> &b, std::vector<uint8_t> &dst) {
  dst.resize(a.size());
  for (size_t i = 0; i < a.size(); i++) {
    int one = a[i];
    int two = i < b.size() ? b[i] : 0;
    dst[i] = (uint8_t)(255 - ((255 - one) * (255 - two) / 255));
  }
}

uint32_t colorset_lookup(const color_set &set, uint8_t grey) {
  size_t n = set.colors.size();
  if (n == 0) return (uint32_t)grey * 0x010101u;
  if (n == 1) {
    uint32_t c = set.colors[0];
    uint32_t r = ((c >> 16) & 255) * grey / 255, g = ((c >> 8) & 255) * grey / 255, b = (c & 255) * grey / 255;
    return (r << 16) | (g << 8) | b;
  }
  uint32_t pos = (uint32_t)grey * (uint32_t)(n - 1);
  size_t i = pos / 255;
  uint32_t f = pos % 255;
  if (i >= n - 1) return set.colors[n - 1] & 0xFFFFFFu;
  uint32_t c0 = set.colors[i], c1 = set.colors[i + 1];
  uint32_t out = 0;
  for (int sh = 16; sh >= 0; sh -= 8) {
    uint32_t v0 = (c0 >> sh) & 255, v1 = (c1 >> sh) & 255;
    uint32_t v = (v0 * (255 - f) + v1 * f) / 255;
    out |= v << sh;
  }
  return out;
}

std::vector<color_set> demo_color_sets() {
  return {
    {"RGB", {0xFF0000, 0x00FF00, 0x0000FF}},
    {"MiamiVice", {0x1BE3FF, 0xFF82DC, 0xFFFFFF}},
    {"Fire", {0x000000, 0xFF0000, 0xFFFF00, 0xFFFFFF}},
    {"Greyscale", {0x000000, 0xFFFFFF}},
  };
}

// ---------------- demo_visuals ----------------
demo_visuals::demo_visuals(uint32_t width, uint32_t height, visual_state_events *events_)
    : w(width ? width : 1), h(height ? height : 1), events(events_), sets(demo_color_sets()) {
  presets.resize(k_preset_slots);
  start_ms = wallclock_ms();
  fps_window_start_ms = monotonic_ms();
  visual_mix.assign((size_t)w * h, 0);
  visual_b.assign((size_t)w * h, 0);
}

void demo_visuals::set_fps(int f) {
  std::lock_guard<std::mutex> lk(mtx);
  fps = f > 0 ? f : 1;
}

void demo_visuals::render_generator(int gen, std::vector<uint8_t> &out) const {
  if (gen == GEN_CHECKER) gen_checker(w, h, frame, out);
  else gen_gradient(w, h, frame, out);
}

void demo_visuals::tick() {
  std::lock_guard<std::mutex> lk(mtx);
  uint64_t now = monotonic_ms();
  fps_window_frames++;
  if (now - fps_window_start_ms >= 1000) {
    current_fps = (float)fps_window_frames * 1000.f / (float)(now - fps_window_start_ms);
    fps_window_frames = 0;
    fps_window_start_ms = now;
  }
  if (frozen) return;

  std::vector<uint8_t> a, b, mixed;
  render_generator(gen_a, a);
  render_generator(gen_b, b);
  if (mixer == MIX_NEGATIVE_MULTIPLY) mix_negative_multiply(a, b, mixed);
  else mixed = a;

  const color_set &cs = sets[colorset_index];
  for (size_t i = 0; i < mixed.size(); i++) {
    uint8_t m = (uint8_t)(mixed[i] * brightness / 100);
    uint8_t g = (uint8_t)(b[i] * brightness / 100);
    visual_mix[i] = colorset_lookup(cs, m);
    visual_b[i] = colorset_lookup(cs, g);
  }
  frame++;
}

gui_state demo_visuals::gui_locked() const {
  gui_state g;
  g.entries.push_back(std::string(command_symbol(command_id::CHANGE_GENERATOR_A)) + " " + std::to_string(gen_a));
  g.entries.push_back(std::string(command_symbol(command_id::CHANGE_GENERATOR_B)) + " " + std::to_string(gen_b));
  g.entries.push_back(std::string(command_symbol(command_id::CHANGE_MIXER)) + " " + std::to_string(mixer));
  g.entries.push_back(std::string(command_symbol(command_id::CURRENT_COLORSET)) + " " + sets[colorset_index].name);
  g.entries.push_back(std::string(command_symbol(command_id::CHANGE_BRIGHTNESS)) + " " + std::to_string(brightness));
  g.entries.push_back(std::string(command_symbol(command_id::CHANGE_PRESET)) + " " + std::to_string(preset_slot));
  return g;
}

void demo_visuals::publish_gui() {
  if (!events) return;
  gui_state_changed ev;
  {
    std::lock_guard<std::mutex> lk(mtx);
    ev.state = gui_locked();
  }
  events->publish(ev);
}

void demo_visuals::next_generator() {
  {
    std::lock_guard<std::mutex> lk(mtx);
    gen_a = (gen_a + 1) % GEN_COUNT;
    sync_log(LOG_LVL_INFO, "demo", "generator A: %s", demo_generator_name(gen_a));
  }
  publish_gui();
}

void demo_visuals::rotate_colorset() {
  {
    std::lock_guard<std::mutex> lk(mtx);
    colorset_index = (colorset_index + 1) % sets.size();
    sync_log(LOG_LVL_INFO, "demo", "colour set: %s", sets[colorset_index].name.c_str());
  }
  publish_gui();
}

bool demo_visuals::apply_command(const std::vector<std::string> &msg, const std::vector<uint8_t> *blob,
                                 sync_error *err) {
  (void)blob;
  if (msg.empty()) return set_error(err, sync_errc::MALFORMED_MESSAGE, "empty command");
  command_def cmd;
  if (!command_resolve(msg[0], &cmd, err)) return false;
  const std::string arg = msg.size() > 1 ? msg[1] : std::string();

  // Lines of a loaded preset, replayed after the lock is dropped.
  std::vector<std::string> replay;
  bool changed = false;
  {
    std::lock_guard<std::mutex> lk(mtx);
    int v = 0;
    switch (cmd.id) {
      case command_id::CHANGE_GENERATOR_A:
      case command_id::CHANGE_GENERATOR_B:
        if (!parse_int(arg, &v) || v < 0 || v >= GEN_COUNT) {
          return set_error(err, sync_errc::MALFORMED_MESSAGE, "bad generator '" + arg + "'");
        }
        (cmd.id == command_id::CHANGE_GENERATOR_A ? gen_a : gen_b) = v;
        changed = true;
        break;
      case command_id::CHANGE_MIXER:
        if (!parse_int(arg, &v) || v < 0 || v >= MIX_COUNT) {
          return set_error(err, sync_errc::MALFORMED_MESSAGE, "bad mixer '" + arg + "'");
        }
        mixer = v;
        changed = true;
        break;
      case command_id::CURRENT_COLORSET: {
        bool found = false;
        for (size_t i = 0; i < sets.size(); i++) {
          if (sets[i].name == arg) {
            colorset_index = i;
            found = true;
          }
        }
        if (!found && parse_int(arg, &v) && v >= 0 && (size_t)v < sets.size()) {
          colorset_index = (size_t)v;
          found = true;
        }
        if (!found) return set_error(err, sync_errc::MALFORMED_MESSAGE, "unknown colour set '" + arg + "'");
        changed = true;
        break;
      }
      case command_id::ROTATE_COLORSET:
        colorset_index = (colorset_index + 1) % sets.size();
        changed = true;
        break;
      case command_id::CHANGE_BRIGHTNESS:
        if (!parse_int(arg, &v) || v < 0 || v > 100) {
          return set_error(err, sync_errc::MALFORMED_MESSAGE, "bad brightness '" + arg + "'");
        }
        brightness = v;
        changed = true;
        break;
      case command_id::FREEZE:
        frozen = !frozen;
        break;
      case command_id::CHANGE_PRESET:
        if (!parse_int(arg, &v) || v < 0 || v >= k_preset_slots) {
          return set_error(err, sync_errc::MALFORMED_MESSAGE, "bad preset slot '" + arg + "'");
        }
        preset_slot = v;
        changed = true;
        break;
      case command_id::SAVE_PRESET: {
        gui_state g = gui_locked();
        presets[preset_slot].clear();
        for (const auto &line : g.entries) {
          if (line.compare(0, strlen(command_symbol(command_id::CHANGE_PRESET)),
                           command_symbol(command_id::CHANGE_PRESET)) == 0) {
            continue;
          }
          presets[preset_slot].push_back(line);
        }
        sync_log(LOG_LVL_INFO, "demo", "saved preset %d", preset_slot);
        break;
      }
      case command_id::LOAD_PRESET:
        replay = presets[preset_slot];
        if (replay.empty()) sync_log(LOG_LVL_INFO, "demo", "preset %d is empty", preset_slot);
        break;
      default:
        sync_log(LOG_LVL_INFO, "demo", "%s not handled by the demo pipeline", cmd.symbol);
        return true;
    }
  }

  for (const auto &line : replay) {
    sync_error lerr;
    if (!apply_command(split_ws(line), nullptr, &lerr)) {
      sync_log(LOG_LVL_WARN, "demo", "preset line '%s': %s", line.c_str(), lerr.message.c_str());
    }
  }
  if (changed) publish_gui();
  return true;
}

// ---------------- state accessors ----------------
version_info demo_visuals::version() const {
  version_info v;
  v.version = "pixsync-demo 1.0";
  return v;
}

app_config demo_visuals::configuration() const {
  std::lock_guard<std::mutex> lk(mtx);
  app_config c;
  c.device_x = w;
  c.device_y = h;
  c.nr_of_screens = 1;
  c.nr_of_additional_visuals = 1;
  c.output_device = "NULL";
  c.fps = fps;
  c.brightness = brightness;
  c.properties["generator.count"] = std::to_string(GEN_COUNT);
  c.properties["mixer.count"] = std::to_string(MIX_COUNT);
  return c;
}

matrix_data demo_visuals::matrix() const {
  matrix_data m;
  m.device_x = w;
  m.device_y = h;
  m.buffer_x = w;
  m.buffer_y = h;
  return m;
}

color_sets demo_visuals::colors() const {
  std::lock_guard<std::mutex> lk(mtx);
  color_sets c;
  c.sets = sets;
  return c;
}

output_snapshot demo_visuals::output() const {
  std::lock_guard<std::mutex> lk(mtx);
  output_snapshot o;
  o.name = "demo";
  o.type = "NULL";
  o.connected = true;
  o.frames_sent = frame;
  o.last_update_ms = wallclock_ms();
  return o;
}

gui_state demo_visuals::gui() const {
  std::lock_guard<std::mutex> lk(mtx);
  return gui_locked();
}

output_mapping demo_visuals::mapping() const {
  output_mapping m;
  output_mapping_entry e;
  e.visual_id = 0;
  e.fader_id = 0;
  e.fader_active = false;
  m.entries.push_back(e);
  return m;
}

preset_settings demo_visuals::preset() const {
  std::lock_guard<std::mutex> lk(mtx);
  preset_settings p;
  p.slot = preset_slot;
  p.name = "preset " + std::to_string(preset_slot);
  p.present = presets[preset_slot];
  return p;
}

runtime_stats demo_visuals::statistics() const {
  std::lock_guard<std::mutex> lk(mtx);
  runtime_stats s;
  s.current_fps = current_fps;
  s.frame_count = frame;
  s.start_time_ms = start_ms;
  return s;
}

file_location demo_visuals::files() const {
  file_location f;
  f.root_dir = ".";
  f.data_dir = "./data";
  f.preset_file = "./data/presets.led";
  return f;
}

image_buffer demo_visuals::images() const {
  std::lock_guard<std::mutex> lk(mtx);
  image_buffer b;
  b.width = w;
  b.height = h;
  b.visual_buffers.push_back(visual_mix);
  b.visual_buffers.push_back(visual_b);
  b.output_buffers.push_back(visual_mix);
  return b;
}
