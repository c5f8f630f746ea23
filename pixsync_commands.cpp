#include "pixsync_commands.h"
#include <unordered_map>

#define CG_OP command_group::OPERATIONAL
#define CG_INT command_group::INTERNAL

static const std::vector<command_def> k_commands = {
  { command_id::CHANGE_GENERATOR_A,      "CHANGE_GENERATOR_A",      1, CG_OP, "<INT> change first generator of the current visual" },
  { command_id::CHANGE_GENERATOR_B,      "CHANGE_GENERATOR_B",      1, CG_OP, "<INT> change second generator of the current visual" },
  { command_id::CHANGE_EFFECT_A,         "CHANGE_EFFECT_A",         1, CG_OP, "<INT> change first effect of the current visual" },
  { command_id::CHANGE_EFFECT_B,         "CHANGE_EFFECT_B",         1, CG_OP, "<INT> change second effect of the current visual" },
  { command_id::CHANGE_MIXER,            "CHANGE_MIXER",            1, CG_OP, "<INT> change mixer of the current visual" },
  { command_id::CURRENT_VISUAL,          "CURRENT_VISUAL",          1, CG_OP, "<INT> select the visual to edit" },
  { command_id::CHANGE_OUTPUT_VISUAL,    "CHANGE_OUTPUT_VISUAL",    1, CG_OP, "<INT> assign a visual to the current output" },
  { command_id::CHANGE_OUTPUT_FADER,     "CHANGE_OUTPUT_FADER",     1, CG_OP, "<INT> change fader of the current output" },
  { command_id::CHANGE_ALL_OUTPUT_VISUAL,"CHANGE_ALL_OUTPUT_VISUAL",1, CG_OP, "<INT> assign a visual to all outputs" },
  { command_id::CHANGE_ALL_OUTPUT_FADER, "CHANGE_ALL_OUTPUT_FADER", 1, CG_OP, "<INT> change fader of all outputs" },
  { command_id::CURRENT_OUTPUT,          "CURRENT_OUTPUT",          1, CG_OP, "<INT> select the output to edit" },
  { command_id::BLINKEN,                 "BLINKEN",                 1, CG_OP, "<STRING> load a blinkenlights movie" },
  { command_id::IMAGE,                   "IMAGE",                   1, CG_OP, "<STRING> load an image" },
  { command_id::COLOR_SCROLL_OPT,        "COLOR_SCROLL_OPT",        1, CG_OP, "<INT> colour scroll direction" },
  { command_id::TEXTWR,                  "TEXTWR",                  1, CG_OP, "<STRING> text for the text generator" },
  { command_id::TEXTWR_OPTION,           "TEXTWR_OPTION",           1, CG_OP, "<INT> text generator scroll mode" },
  { command_id::CHANGE_THRESHOLD_VALUE,  "CHANGE_THRESHOLD_VALUE",  1, CG_OP, "<INT> threshold effect value 0..255" },
  { command_id::CHANGE_ROTOZOOM,         "CHANGE_ROTOZOOM",         1, CG_OP, "<INT> rotozoom angle -127..127" },
  { command_id::GENERATOR_SPEED,         "GENERATOR_SPEED",         1, CG_OP, "<INT> generator speed in percent" },
  { command_id::BEAT_WORKMODE,           "BEAT_WORKMODE",           1, CG_OP, "<INT> beat detection mode" },
  { command_id::CURRENT_COLORSET,        "CURRENT_COLORSET",        1, CG_OP, "<INT> colour set of the current visual" },
  { command_id::ROTATE_COLORSET,         "ROTATE_COLORSET",         0, CG_OP, "select the next colour set" },
  { command_id::CHANGE_PRESET,           "CHANGE_PRESET",           1, CG_OP, "<INT> select preset slot" },
  { command_id::SAVE_PRESET,             "SAVE_PRESET",             0, CG_OP, "save the current state to the selected slot" },
  { command_id::LOAD_PRESET,             "LOAD_PRESET",             0, CG_OP, "load the selected preset slot" },
  { command_id::PRESET_RANDOM,           "PRESET_RANDOM",           0, CG_OP, "load a random preset" },
  { command_id::RANDOMIZE,               "RANDOMIZE",               0, CG_OP, "randomize the current visual once" },
  { command_id::RANDOM,                  "RANDOM",                  1, CG_OP, "<ON|OFF> random mode" },
  { command_id::CHANGE_BRIGHTNESS,       "CHANGE_BRIGHTNESS",       1, CG_OP, "<INT> output brightness 0..100" },
  { command_id::FREEZE,                  "FREEZE",                  0, CG_OP, "toggle pause mode" },
  { command_id::TOGGLE_INTERNAL_VISUAL,  "TOGGLE_INTERNAL_VISUAL",  0, CG_OP, "toggle the internal preview visual" },
  { command_id::SCREENSHOT,              "SCREENSHOT",              0, CG_OP, "save a screenshot of all visuals" },
  { command_id::OSC_GENERATOR1,          "OSC_GENERATOR1",          1, CG_OP, "<BLOB> raw frame for OSC generator 1" },
  { command_id::OSC_GENERATOR2,          "OSC_GENERATOR2",          1, CG_OP, "<BLOB> raw frame for OSC generator 2" },
  { command_id::GET_VERSION,             "GET_VERSION",             0, CG_INT, "version of the remote controller" },
  { command_id::GET_CONFIGURATION,       "GET_CONFIGURATION",       0, CG_INT, "application configuration" },
  { command_id::GET_MATRIXDATA,          "GET_MATRIXDATA",          0, CG_INT, "matrix layout" },
  { command_id::GET_COLORSETS,           "GET_COLORSETS",           0, CG_INT, "all colour sets" },
  { command_id::GET_OUTPUTMAPPING,       "GET_OUTPUTMAPPING",       0, CG_INT, "output to visual mapping" },
  { command_id::GET_OUTPUT,              "GET_OUTPUT",              0, CG_INT, "output device snapshot" },
  { command_id::GET_GUISTATE,            "GET_GUISTATE",            0, CG_INT, "current visual state" },
  { command_id::GET_PRESETSETTINGS,      "GET_PRESETSETTINGS",      0, CG_INT, "current preset settings" },
  { command_id::GET_JMXSTATISTICS,       "GET_JMXSTATISTICS",       0, CG_INT, "runtime statistics" },
  { command_id::GET_FILELOCATION,        "GET_FILELOCATION",        0, CG_INT, "remote file locations" },
  { command_id::GET_IMAGEBUFFER,         "GET_IMAGEBUFFER",         0, CG_INT, "visual and output buffers" },
  { command_id::REGISTER_VISUALOBSERVER, "REGISTER_VISUALOBSERVER", 0, CG_INT, "receive visual state pushes" },
  { command_id::UNREGISTER_VISUALOBSERVER,"UNREGISTER_VISUALOBSERVER",0, CG_INT, "stop visual state pushes" },
};

#undef CG_OP
#undef CG_INT

static const std::unordered_map<std::string, size_t> &symbol_index() {
  static const std::unordered_map<std::string, size_t> idx = []() {
    std::unordered_map<std::string, size_t> m;
    for (size_t i = 0; i < k_commands.size(); i++) m[k_commands[i].symbol] = i;
    return m;
  }();
  return idx;
}

const std::vector<command_def> &command_table() { return k_commands; }

bool command_resolve(const std::string &symbol, command_def *out, sync_error *err) {
  const auto &idx = symbol_index();
  auto it = idx.find(symbol);
  if (it == idx.end()) return set_error(err, sync_errc::UNKNOWN_COMMAND, "unknown command: " + symbol);
  if (out) *out = k_commands[it->second];
  return true;
}

const command_def &command_get(command_id id) {
  // Table is declared in enum order.
  return k_commands[(size_t)id];
}

const char *command_symbol(command_id id) { return command_get(id).symbol; }

bool command_is_arg_count_exempt(command_id id) {
  return id == command_id::OSC_GENERATOR1 || id == command_id::OSC_GENERATOR2;
}

bool command_validate(const command_def &cmd, size_t provided_args, bool has_blob, sync_error *err) {
  if (command_is_arg_count_exempt(cmd.id)) return true;
  if (has_blob) return true;
  if (provided_args != (size_t)cmd.nr_params) {
    return set_error(err, sync_errc::ARGUMENT_COUNT_MISMATCH,
                     std::string("parameter count mismatch for ") + cmd.symbol +
                     ", expected: " + std::to_string(cmd.nr_params) +
                     " available: " + std::to_string(provided_args));
  }
  return true;
}

const std::vector<command_id> &required_bootstrap_commands() {
  static const std::vector<command_id> req = {
    command_id::GET_VERSION,
    command_id::GET_CONFIGURATION,
    command_id::GET_MATRIXDATA,
    command_id::GET_COLORSETS,
    command_id::GET_OUTPUT,
    command_id::GET_GUISTATE,
    command_id::GET_OUTPUTMAPPING,
    command_id::GET_PRESETSETTINGS,
    command_id::GET_JMXSTATISTICS,
    command_id::GET_FILELOCATION,
    command_id::GET_IMAGEBUFFER,
  };
  return req;
}
