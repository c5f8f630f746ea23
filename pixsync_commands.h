#pragma once
#include <stddef.h>
#include <string>
#include <vector>
#include "pixsync_errors.h"

enum class command_group { INTERNAL = 0, OPERATIONAL = 1 };

// Closed set of commands understood by both endpoints.
enum class command_id {
  // operational: visual
  CHANGE_GENERATOR_A,
  CHANGE_GENERATOR_B,
  CHANGE_EFFECT_A,
  CHANGE_EFFECT_B,
  CHANGE_MIXER,
  CURRENT_VISUAL,
  // operational: output
  CHANGE_OUTPUT_VISUAL,
  CHANGE_OUTPUT_FADER,
  CHANGE_ALL_OUTPUT_VISUAL,
  CHANGE_ALL_OUTPUT_FADER,
  CURRENT_OUTPUT,
  // operational: generator / effect options
  BLINKEN,
  IMAGE,
  COLOR_SCROLL_OPT,
  TEXTWR,
  TEXTWR_OPTION,
  CHANGE_THRESHOLD_VALUE,
  CHANGE_ROTOZOOM,
  GENERATOR_SPEED,
  BEAT_WORKMODE,
  // operational: colour
  CURRENT_COLORSET,
  ROTATE_COLORSET,
  // operational: presets / misc
  CHANGE_PRESET,
  SAVE_PRESET,
  LOAD_PRESET,
  PRESET_RANDOM,
  RANDOMIZE,
  RANDOM,
  CHANGE_BRIGHTNESS,
  FREEZE,
  TOGGLE_INTERNAL_VISUAL,
  SCREENSHOT,
  // real-time parameter generators; argument shape varies
  OSC_GENERATOR1,
  OSC_GENERATOR2,
  // internal / bootstrap
  GET_VERSION,
  GET_CONFIGURATION,
  GET_MATRIXDATA,
  GET_COLORSETS,
  GET_OUTPUTMAPPING,
  GET_OUTPUT,
  GET_GUISTATE,
  GET_PRESETSETTINGS,
  GET_JMXSTATISTICS,
  GET_FILELOCATION,
  GET_IMAGEBUFFER,
  REGISTER_VISUALOBSERVER,
  UNREGISTER_VISUALOBSERVER,
};

struct command_def {
  command_id id;
  const char *symbol;
  int nr_params;
  command_group group;
  const char *help;
};

// Full table, in declaration order.
const std::vector<command_def> &command_table();

bool command_resolve(const std::string &symbol, command_def *out, sync_error *err);
const command_def &command_get(command_id id);
const char *command_symbol(command_id id);

// Argument-count rule: a mismatch is only reported when no blob is attached
// and provided != expected. OSC_GENERATOR1/2 are never checked.
bool command_validate(const command_def &cmd, size_t provided_args, bool has_blob, sync_error *err);

bool command_is_arg_count_exempt(command_id id);

// The 11 GET_* commands a mirror must have answered before it is initialized.
const std::vector<command_id> &required_bootstrap_commands();
