#include "pixsync_state.h"
#include <stdexcept>

using nlohmann::json;

struct kind_binding {
  state_kind kind;
  const char *name;
  command_id cmd;
};

static const kind_binding k_kinds[STATE_KIND_COUNT] = {
  { state_kind::VERSION,         "version",        command_id::GET_VERSION },
  { state_kind::CONFIGURATION,   "configuration",  command_id::GET_CONFIGURATION },
  { state_kind::MATRIX_DATA,     "matrixData",     command_id::GET_MATRIXDATA },
  { state_kind::COLOR_SETS,      "colorSets",      command_id::GET_COLORSETS },
  { state_kind::OUTPUT,          "output",         command_id::GET_OUTPUT },
  { state_kind::GUI_STATE,       "guiState",       command_id::GET_GUISTATE },
  { state_kind::OUTPUT_MAPPING,  "outputMapping",  command_id::GET_OUTPUTMAPPING },
  { state_kind::PRESET_SETTINGS, "presetSettings", command_id::GET_PRESETSETTINGS },
  { state_kind::STATISTICS,      "statistics",     command_id::GET_JMXSTATISTICS },
  { state_kind::FILE_LOCATION,   "fileLocation",   command_id::GET_FILELOCATION },
  { state_kind::IMAGE_BUFFER,    "imageBuffer",    command_id::GET_IMAGEBUFFER },
};

const char *state_kind_name(state_kind k) {
  int i = (int)k;
  if (i < 0 || i >= STATE_KIND_COUNT) return "unknown";
  return k_kinds[i].name;
}

bool state_kind_from_name(const std::string &s, state_kind *out) {
  for (const auto &b : k_kinds) {
    if (s == b.name) {
      if (out) *out = b.kind;
      return true;
    }
  }
  return false;
}

command_id command_for_state_kind(state_kind k) { return k_kinds[(int)k].cmd; }

bool state_kind_for_command(command_id id, state_kind *out) {
  for (const auto &b : k_kinds) {
    if (b.cmd == id) {
      if (out) *out = b.kind;
      return true;
    }
  }
  return false;
}

// ---------------- equality ----------------
bool operator==(const version_info &a, const version_info &b) { return a.version == b.version; }
bool operator==(const app_config &a, const app_config &b) {
  return a.device_x == b.device_x && a.device_y == b.device_y &&
         a.nr_of_screens == b.nr_of_screens && a.nr_of_additional_visuals == b.nr_of_additional_visuals &&
         a.output_device == b.output_device && a.fps == b.fps && a.brightness == b.brightness &&
         a.osc_listening_port == b.osc_listening_port && a.properties == b.properties;
}
bool operator==(const matrix_data &a, const matrix_data &b) {
  return a.device_x == b.device_x && a.device_y == b.device_y &&
         a.buffer_x == b.buffer_x && a.buffer_y == b.buffer_y;
}
bool operator==(const color_set &a, const color_set &b) { return a.name == b.name && a.colors == b.colors; }
bool operator==(const color_sets &a, const color_sets &b) { return a.sets == b.sets; }
bool operator==(const output_snapshot &a, const output_snapshot &b) {
  return a.name == b.name && a.type == b.type && a.connected == b.connected &&
         a.error_counter == b.error_counter && a.frames_sent == b.frames_sent &&
         a.last_update_ms == b.last_update_ms;
}
bool operator==(const gui_state &a, const gui_state &b) { return a.entries == b.entries; }
bool operator==(const output_mapping_entry &a, const output_mapping_entry &b) {
  return a.visual_id == b.visual_id && a.fader_id == b.fader_id && a.fader_active == b.fader_active;
}
bool operator==(const output_mapping &a, const output_mapping &b) { return a.entries == b.entries; }
bool operator==(const preset_settings &a, const preset_settings &b) {
  return a.slot == b.slot && a.name == b.name && a.present == b.present;
}
bool operator==(const runtime_stats &a, const runtime_stats &b) {
  return a.current_fps == b.current_fps && a.frame_count == b.frame_count &&
         a.start_time_ms == b.start_time_ms && a.packets_received == b.packets_received &&
         a.bytes_received == b.bytes_received;
}
bool operator==(const file_location &a, const file_location &b) {
  return a.root_dir == b.root_dir && a.data_dir == b.data_dir && a.preset_file == b.preset_file &&
         a.image_files == b.image_files && a.blinken_files == b.blinken_files;
}
bool operator==(const image_buffer &a, const image_buffer &b) {
  return a.width == b.width && a.height == b.height &&
         a.visual_buffers == b.visual_buffers && a.output_buffers == b.output_buffers;
}

// ---------------- JSON mapping ----------------
void to_json(json &j, const version_info &v) { j = json{{"version", v.version}}; }
void from_json(const json &j, version_info &v) { j.at("version").get_to(v.version); }

void to_json(json &j, const app_config &c) {
  j = json::object();
  j["deviceX"] = c.device_x;
  j["deviceY"] = c.device_y;
  j["nrOfScreens"] = c.nr_of_screens;
  j["nrOfAdditionalVisuals"] = c.nr_of_additional_visuals;
  j["outputDevice"] = c.output_device;
  j["fps"] = c.fps;
  j["brightness"] = c.brightness;
  j["oscListeningPort"] = c.osc_listening_port;
  j["properties"] = c.properties;
}
void from_json(const json &j, app_config &c) {
  j.at("deviceX").get_to(c.device_x);
  j.at("deviceY").get_to(c.device_y);
  j.at("nrOfScreens").get_to(c.nr_of_screens);
  j.at("nrOfAdditionalVisuals").get_to(c.nr_of_additional_visuals);
  j.at("outputDevice").get_to(c.output_device);
  j.at("fps").get_to(c.fps);
  j.at("brightness").get_to(c.brightness);
  j.at("oscListeningPort").get_to(c.osc_listening_port);
  j.at("properties").get_to(c.properties);
}

void to_json(json &j, const matrix_data &m) {
  j = json{{"deviceX", m.device_x}, {"deviceY", m.device_y}, {"bufferX", m.buffer_x}, {"bufferY", m.buffer_y}};
}
void from_json(const json &j, matrix_data &m) {
  j.at("deviceX").get_to(m.device_x);
  j.at("deviceY").get_to(m.device_y);
  j.at("bufferX").get_to(m.buffer_x);
  j.at("bufferY").get_to(m.buffer_y);
}

void to_json(json &j, const color_set &c) { j = json{{"name", c.name}, {"colors", c.colors}}; }
void from_json(const json &j, color_set &c) {
  j.at("name").get_to(c.name);
  j.at("colors").get_to(c.colors);
}
void to_json(json &j, const color_sets &c) { j = json{{"sets", c.sets}}; }
void from_json(const json &j, color_sets &c) { j.at("sets").get_to(c.sets); }

void to_json(json &j, const output_snapshot &o) {
  j = json::object();
  j["name"] = o.name;
  j["type"] = o.type;
  j["connected"] = o.connected;
  j["errorCounter"] = o.error_counter;
  j["framesSent"] = o.frames_sent;
  j["lastUpdateMs"] = o.last_update_ms;
}
void from_json(const json &j, output_snapshot &o) {
  j.at("name").get_to(o.name);
  j.at("type").get_to(o.type);
  j.at("connected").get_to(o.connected);
  j.at("errorCounter").get_to(o.error_counter);
  j.at("framesSent").get_to(o.frames_sent);
  j.at("lastUpdateMs").get_to(o.last_update_ms);
}

void to_json(json &j, const gui_state &g) { j = json{{"entries", g.entries}}; }
void from_json(const json &j, gui_state &g) { j.at("entries").get_to(g.entries); }

void to_json(json &j, const output_mapping_entry &e) {
  j = json{{"visual", e.visual_id}, {"fader", e.fader_id}, {"faderActive", e.fader_active}};
}
void from_json(const json &j, output_mapping_entry &e) {
  j.at("visual").get_to(e.visual_id);
  j.at("fader").get_to(e.fader_id);
  j.at("faderActive").get_to(e.fader_active);
}
void to_json(json &j, const output_mapping &m) { j = json{{"entries", m.entries}}; }
void from_json(const json &j, output_mapping &m) { j.at("entries").get_to(m.entries); }

void to_json(json &j, const preset_settings &p) {
  j = json{{"slot", p.slot}, {"name", p.name}, {"present", p.present}};
}
void from_json(const json &j, preset_settings &p) {
  j.at("slot").get_to(p.slot);
  j.at("name").get_to(p.name);
  j.at("present").get_to(p.present);
}

void to_json(json &j, const runtime_stats &s) {
  j = json::object();
  j["fps"] = s.current_fps;
  j["frameCount"] = s.frame_count;
  j["startTimeMs"] = s.start_time_ms;
  j["packetsReceived"] = s.packets_received;
  j["bytesReceived"] = s.bytes_received;
}
void from_json(const json &j, runtime_stats &s) {
  j.at("fps").get_to(s.current_fps);
  j.at("frameCount").get_to(s.frame_count);
  j.at("startTimeMs").get_to(s.start_time_ms);
  j.at("packetsReceived").get_to(s.packets_received);
  j.at("bytesReceived").get_to(s.bytes_received);
}

void to_json(json &j, const file_location &f) {
  j = json::object();
  j["rootDir"] = f.root_dir;
  j["dataDir"] = f.data_dir;
  j["presetFile"] = f.preset_file;
  j["imageFiles"] = f.image_files;
  j["blinkenFiles"] = f.blinken_files;
}
void from_json(const json &j, file_location &f) {
  j.at("rootDir").get_to(f.root_dir);
  j.at("dataDir").get_to(f.data_dir);
  j.at("presetFile").get_to(f.preset_file);
  j.at("imageFiles").get_to(f.image_files);
  j.at("blinkenFiles").get_to(f.blinken_files);
}

void to_json(json &j, const image_buffer &b) {
  j = json::object();
  j["w"] = b.width;
  j["h"] = b.height;
  j["visual"] = b.visual_buffers;
  j["output"] = b.output_buffers;
}
void from_json(const json &j, image_buffer &b) {
  j.at("w").get_to(b.width);
  j.at("h").get_to(b.height);
  j.at("visual").get_to(b.visual_buffers);
  j.at("output").get_to(b.output_buffers);
  size_t px = (size_t)b.width * (size_t)b.height;
  for (const auto &v : b.visual_buffers) {
    if (v.size() != px) throw std::invalid_argument("visual buffer size does not match w*h");
  }
  for (const auto &v : b.output_buffers) {
    if (v.size() != px) throw std::invalid_argument("output buffer size does not match w*h");
  }
}
