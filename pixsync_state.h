#pragma once
#include <stdint.h>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pixsync_commands.h"

// The 11 pieces of authority state a mirror bootstraps. Every kind is bound
// one-to-one to a GET_* command.
enum class state_kind {
  VERSION = 0,
  CONFIGURATION,
  MATRIX_DATA,
  COLOR_SETS,
  OUTPUT,
  GUI_STATE,
  OUTPUT_MAPPING,
  PRESET_SETTINGS,
  STATISTICS,
  FILE_LOCATION,
  IMAGE_BUFFER,
};
static const int STATE_KIND_COUNT = 11;

const char *state_kind_name(state_kind k);
bool state_kind_from_name(const std::string &s, state_kind *out);
command_id command_for_state_kind(state_kind k);
bool state_kind_for_command(command_id id, state_kind *out);

struct version_info {
  std::string version;
};

// Application configuration as loaded by the authority.
struct app_config {
  uint32_t device_x = 8;
  uint32_t device_y = 8;
  int nr_of_screens = 1;
  int nr_of_additional_visuals = 0;
  std::string output_device = "NULL";
  int fps = 20;
  int brightness = 100;
  int osc_listening_port = 9876;
  std::map<std::string, std::string> properties;  // raw key/values from the config file
};

struct matrix_data {
  uint32_t device_x = 8;     // output device resolution
  uint32_t device_y = 8;
  uint32_t buffer_x = 8;     // internal render resolution
  uint32_t buffer_y = 8;
};

struct color_set {
  std::string name;
  std::vector<uint32_t> colors;  // 0xRRGGBB
};

struct color_sets {
  std::vector<color_set> sets;
};

struct output_snapshot {
  std::string name;
  std::string type = "NULL";
  bool connected = false;
  uint64_t error_counter = 0;
  uint64_t frames_sent = 0;
  uint64_t last_update_ms = 0;
};

struct gui_state {
  std::vector<std::string> entries;  // command lines describing the current visual state
};

struct output_mapping_entry {
  int visual_id = 0;
  int fader_id = 0;
  bool fader_active = false;
};

struct output_mapping {
  std::vector<output_mapping_entry> entries;
};

struct preset_settings {
  int slot = 0;
  std::string name;
  std::vector<std::string> present;   // empty when the slot is unused
};

struct runtime_stats {
  float current_fps = 0.f;
  uint64_t frame_count = 0;
  uint64_t start_time_ms = 0;
  uint64_t packets_received = 0;
  uint64_t bytes_received = 0;
};

struct file_location {
  std::string root_dir;
  std::string data_dir;
  std::string preset_file;
  std::vector<std::string> image_files;
  std::vector<std::string> blinken_files;
};

struct image_buffer {
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<std::vector<uint32_t>> visual_buffers;   // one per visual, width*height 0xRRGGBB
  std::vector<std::vector<uint32_t>> output_buffers;   // one per output screen
};

bool operator==(const version_info &a, const version_info &b);
bool operator==(const app_config &a, const app_config &b);
bool operator==(const matrix_data &a, const matrix_data &b);
bool operator==(const color_set &a, const color_set &b);
bool operator==(const color_sets &a, const color_sets &b);
bool operator==(const output_snapshot &a, const output_snapshot &b);
bool operator==(const gui_state &a, const gui_state &b);
bool operator==(const output_mapping_entry &a, const output_mapping_entry &b);
bool operator==(const output_mapping &a, const output_mapping &b);
bool operator==(const preset_settings &a, const preset_settings &b);
bool operator==(const runtime_stats &a, const runtime_stats &b);
bool operator==(const file_location &a, const file_location &b);
bool operator==(const image_buffer &a, const image_buffer &b);

// Compile-time binding of state structs to their kind.
template <typename T> struct state_traits;
template <> struct state_traits<version_info>    { static constexpr state_kind kind = state_kind::VERSION; };
template <> struct state_traits<app_config>      { static constexpr state_kind kind = state_kind::CONFIGURATION; };
template <> struct state_traits<matrix_data>     { static constexpr state_kind kind = state_kind::MATRIX_DATA; };
template <> struct state_traits<color_sets>      { static constexpr state_kind kind = state_kind::COLOR_SETS; };
template <> struct state_traits<output_snapshot> { static constexpr state_kind kind = state_kind::OUTPUT; };
template <> struct state_traits<gui_state>       { static constexpr state_kind kind = state_kind::GUI_STATE; };
template <> struct state_traits<output_mapping>  { static constexpr state_kind kind = state_kind::OUTPUT_MAPPING; };
template <> struct state_traits<preset_settings> { static constexpr state_kind kind = state_kind::PRESET_SETTINGS; };
template <> struct state_traits<runtime_stats>   { static constexpr state_kind kind = state_kind::STATISTICS; };
template <> struct state_traits<file_location>   { static constexpr state_kind kind = state_kind::FILE_LOCATION; };
template <> struct state_traits<image_buffer>    { static constexpr state_kind kind = state_kind::IMAGE_BUFFER; };

// JSON mapping (nlohmann ADL hooks). from_json throws on missing keys or
// wrong types; the reassembler turns that into DESERIALIZATION_ERROR.
void to_json(nlohmann::json &j, const version_info &v);
void from_json(const nlohmann::json &j, version_info &v);
void to_json(nlohmann::json &j, const app_config &c);
void from_json(const nlohmann::json &j, app_config &c);
void to_json(nlohmann::json &j, const matrix_data &m);
void from_json(const nlohmann::json &j, matrix_data &m);
void to_json(nlohmann::json &j, const color_set &c);
void from_json(const nlohmann::json &j, color_set &c);
void to_json(nlohmann::json &j, const color_sets &c);
void from_json(const nlohmann::json &j, color_sets &c);
void to_json(nlohmann::json &j, const output_snapshot &o);
void from_json(const nlohmann::json &j, output_snapshot &o);
void to_json(nlohmann::json &j, const gui_state &g);
void from_json(const nlohmann::json &j, gui_state &g);
void to_json(nlohmann::json &j, const output_mapping_entry &e);
void from_json(const nlohmann::json &j, output_mapping_entry &e);
void to_json(nlohmann::json &j, const output_mapping &m);
void from_json(const nlohmann::json &j, output_mapping &m);
void to_json(nlohmann::json &j, const preset_settings &p);
void from_json(const nlohmann::json &j, preset_settings &p);
void to_json(nlohmann::json &j, const runtime_stats &s);
void from_json(const nlohmann::json &j, runtime_stats &s);
void to_json(nlohmann::json &j, const file_location &f);
void from_json(const nlohmann::json &j, file_location &f);
void to_json(nlohmann::json &j, const image_buffer &b);
void from_json(const nlohmann::json &j, image_buffer &b);
