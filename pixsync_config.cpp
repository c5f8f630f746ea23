#include "pixsync_config.h"
#include <stdio.h>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "pixsync_log.h"

using nlohmann::json;

static bool port_valid(int p) { return p > 0 && p <= 65535; }

void sync_config_normalize(sync_config &c) {
  sync_config d;
  if (c.service_type.empty()) c.service_type = d.service_type;
  if (c.default_host.empty()) c.default_host = d.default_host;
  if (!port_valid(c.default_port)) c.default_port = d.default_port;
  if (!port_valid(c.local_port)) c.local_port = d.local_port;
  if (c.local_port == c.default_port) {
    sync_log(LOG_LVL_WARN, "config", "localPort equals defaultPort (%d), using %d", c.local_port, d.local_port);
    c.local_port = (c.default_port == d.local_port) ? d.default_port : d.local_port;
  }
  if (c.listen_addr.empty()) c.listen_addr = "0.0.0.0";
  if (c.discovery_timeout_ms < 0) c.discovery_timeout_ms = 0;
  if (c.retry_interval_ms < 10) c.retry_interval_ms = 10;
  if (c.max_retries < 1) c.max_retries = 1;
  if (!port_valid(c.status_http_port)) c.status_http_port = d.status_http_port;
  log_level lvl;
  if (!log_level_from_string(c.log_level.c_str(), &lvl)) c.log_level = d.log_level;
}

std::string sync_config_to_json(const sync_config &c_in) {
  sync_config c = c_in;
  sync_config_normalize(c);

  json j;
  j["serviceType"] = c.service_type;
  j["defaultHost"] = c.default_host;
  j["defaultPort"] = c.default_port;
  j["localPort"] = c.local_port;
  j["listenAddr"] = c.listen_addr;
  j["discoveryTimeoutMs"] = c.discovery_timeout_ms;
  j["retryIntervalMs"] = c.retry_interval_ms;
  j["maxRetries"] = c.max_retries;
  j["statusHttpEnable"] = c.status_http_enable;
  j["statusHttpPort"] = c.status_http_port;
  j["advertiseHost"] = c.advertise_host;
  j["discoveryEnable"] = c.discovery_enable;
  j["logLevel"] = c.log_level;
  return j.dump(2);
}

bool sync_config_from_json_text(const std::string &text, sync_config &c) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return false;

  auto get_str = [&](const char *k, std::string &out) {
    if (j.contains(k) && j[k].is_string()) out = j[k].get<std::string>();
  };
  auto get_bool = [&](const char *k, bool &out) {
    if (j.contains(k) && j[k].is_boolean()) out = j[k].get<bool>();
  };
  auto get_int = [&](const char *k, int &out) {
    if (j.contains(k) && j[k].is_number_integer()) out = j[k].get<int>();
  };

  get_str("serviceType", c.service_type);
  get_str("defaultHost", c.default_host);
  get_int("defaultPort", c.default_port);
  get_int("localPort", c.local_port);
  get_str("listenAddr", c.listen_addr);
  get_int("discoveryTimeoutMs", c.discovery_timeout_ms);
  get_int("retryIntervalMs", c.retry_interval_ms);
  get_int("maxRetries", c.max_retries);
  get_bool("statusHttpEnable", c.status_http_enable);
  get_int("statusHttpPort", c.status_http_port);
  get_str("advertiseHost", c.advertise_host);
  get_bool("discoveryEnable", c.discovery_enable);
  get_str("logLevel", c.log_level);
  return true;
}

bool sync_config_load_file(const std::string &path, sync_config &c) {
  bool ok = false;
  std::string txt = slurp_file(path);
  if (txt.empty()) {
    sync_log(LOG_LVL_INFO, "config", "no config found; using defaults");
  } else if (sync_config_from_json_text(txt, c)) {
    sync_log(LOG_LVL_INFO, "config", "loaded %s", path.c_str());
    ok = true;
  } else {
    sync_log(LOG_LVL_WARN, "config", "config parse failed; using defaults");
  }
  sync_config_normalize(c);
  return ok;
}

std::string slurp_file(const std::string &path) {
  std::ifstream f(path);
  if (!f.is_open()) return {};
  std::stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

bool write_file_atomic(const std::string &path, const std::string &data) {
  std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f.is_open()) return false;
    f << data;
    f.flush();
    if (!f.good()) return false;
  }
  if (rename(tmp.c_str(), path.c_str()) != 0) return false;
  return true;
}
