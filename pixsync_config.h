#pragma once
#include <stdint.h>
#include <string>

// Settings shared by both executables. Loaded from a JSON file, then
// overridden by command line flags; missing or mistyped keys keep defaults.
struct sync_config {
  std::string service_type = "_pixelcontroller-osc._udp";
  std::string default_host = "pixelcontroller.local";
  int default_port = 9876;          // authority OSC port
  int local_port = 9875;            // mirror reply/push port
  std::string listen_addr = "0.0.0.0";
  int discovery_timeout_ms = 6000;
  int retry_interval_ms = 2000;
  int max_retries = 5;

  // authority only
  bool status_http_enable = true;
  int status_http_port = 8080;
  std::string advertise_host;       // mDNS host name of the announced service, empty = this machine
  bool discovery_enable = true;

  std::string log_level = "info";
};

void sync_config_normalize(sync_config &c);
std::string sync_config_to_json(const sync_config &c_in);
bool sync_config_from_json_text(const std::string &text, sync_config &c);

// Reads `path` into `c` (defaults when missing or unparsable) and normalizes.
// Never writes the file. Returns true when the file was read and parsed.
bool sync_config_load_file(const std::string &path, sync_config &c);

std::string slurp_file(const std::string &path);
bool write_file_atomic(const std::string &path, const std::string &data);
