#pragma once
#include <stdint.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "pixsync_authority.h"
#include "pixsync_log.h"
#include "pixsync_state.h"
#include "pixsync_transport.h"

// One message handed to a recording link.
struct sent_message {
  net_endpoint to;
  std::string pattern;
  std::vector<std::string> args;
  bool has_blob = false;
  std::vector<uint8_t> blob;
};

// Collects everything sent through links it created.
class recording_network {
public:
  link_factory factory();

  std::vector<sent_message> sent() const;
  size_t sent_count() const;
  size_t links_created() const { return n_links.load(); }
  void clear();

  std::atomic<bool> fail_sends{false};
  std::atomic<bool> fail_links{false};

private:
  friend class recording_link;
  void record(const sent_message &m);

  mutable std::mutex mtx;
  std::vector<sent_message> log;
  std::atomic<size_t> n_links{0};
};

// Captures log lines while in scope.
class log_capture {
public:
  log_capture();
  ~log_capture();

  std::vector<std::string> lines() const;
  bool contains(const std::string &needle) const;

private:
  static void sink(void *user, log_level lvl, const char *tag, const char *msg);

  log_level saved_level;
  mutable std::mutex mtx;
  std::vector<std::string> captured;
};

// Populated objects of every state kind.
version_info sample_version();
app_config sample_config();
matrix_data sample_matrix();
color_sets sample_color_sets();
output_snapshot sample_output();
gui_state sample_gui();
output_mapping sample_mapping();
preset_settings sample_preset();
runtime_stats sample_stats();
file_location sample_files();
image_buffer sample_images();

// authority_state_source returning whatever the test put in its fields.
class fixed_state_source : public authority_state_source {
public:
  fixed_state_source();

  version_info version() const override { return v; }
  app_config configuration() const override { return cfg; }
  matrix_data matrix() const override { return mat; }
  color_sets colors() const override { return cs; }
  output_snapshot output() const override { return out; }
  gui_state gui() const override { return g; }
  output_mapping mapping() const override { return map; }
  preset_settings preset() const override { return pre; }
  runtime_stats statistics() const override { return st; }
  file_location files() const override { return fl; }
  image_buffer images() const override { return img; }

  version_info v;
  app_config cfg;
  matrix_data mat;
  color_sets cs;
  output_snapshot out;
  gui_state g;
  output_mapping map;
  preset_settings pre;
  runtime_stats st;
  file_location fl;
  image_buffer img;
};

sync_message make_message(const std::string &pattern,
                          const std::vector<std::string> &args = std::vector<std::string>(),
                          const std::string &from_host = "10.0.0.5",
                          uint16_t from_port = 40000);

// A UDP port that was free a moment ago.
uint16_t free_udp_port();

// Polls `pred` every 10 ms until it holds or timeout_ms passed.
bool wait_until(const std::function<bool()> &pred, int timeout_ms);
