#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "pixsync_commands.h"
#include "pixsync_config.h"
#include "pixsync_discovery.h"
#include "pixsync_log.h"
#include "pixsync_mirror.h"

static std::atomic<bool> g_quit{false};
static void on_signal(int) { g_quit.store(true); }

static uint64_t monotonic_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (uint64_t)ts.tv_sec * 1000ull + (uint64_t)ts.tv_nsec / 1000000ull;
}

static std::vector<std::string> split_ws(const std::string &line) {
  std::vector<std::string> out;
  std::istringstream ss(line);
  std::string tok;
  while (ss >> tok) out.push_back(tok);
  return out;
}

static void print_help() {
  printf("commands: help | state | refresh <kind> | quit | <COMMAND> [args...]\n");
  for (const auto &c : command_table()) {
    if (c.group != command_group::OPERATIONAL) continue;
    printf("  %-26s %2d  %s\n", c.symbol, c.nr_params, c.help);
  }
}

static void print_state(const mirror_session &s) {
  const mirror_state &m = s.mirror();
  printf("remote %s, %d/%d kinds\n", s.remote().to_string().c_str(), m.count(), STATE_KIND_COUNT);
  if (auto v = m.version()) printf("  version      %s\n", v->version.c_str());
  if (auto c = m.configuration()) printf("  matrix       %ux%u, %d screens, output %s\n",
                                          c->device_x, c->device_y, c->nr_of_screens, c->output_device.c_str());
  if (auto st = m.statistics()) printf("  fps          %.1f, frames %llu, packets %llu, bytes %llu\n",
                                       st->current_fps, (unsigned long long)st->frame_count,
                                       (unsigned long long)st->packets_received, (unsigned long long)st->bytes_received);
  if (auto o = m.output()) printf("  output       %s (%s) %s\n", o->name.c_str(), o->type.c_str(),
                                  o->connected ? "connected" : "disconnected");
  if (auto cs = m.colors()) printf("  colour sets  %zu\n", cs->sets.size());
  if (auto g = m.gui()) {
    for (const auto &e : g->entries) printf("  gui          %s\n", e.c_str());
  }
  if (auto img = m.images()) printf("  image buffer %ux%u, %zu visuals\n", img->width, img->height, img->visual_buffers.size());
  fflush(stdout);
}

// ---------------- Main ----------------
static void usage(const char *argv0) {
  fprintf(stderr,
    "Usage: %s [--config PATH] [--host HOST] [--port N] [--local-port N] [--listen ADDR]\n"
    "          [--service TYPE] [--discovery-timeout MS] [--refresh-ms N]\n"
    "          [--log-level debug|info|warn|error]\n"
    "--host skips discovery and connects to HOST directly.\n",
    argv0
  );
}

int main(int argc, char **argv) {
  std::string cfg_path = "./pixsync_config.json";
  std::string host;
  int refresh_ms = 2000;

  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0 && i+1<argc) cfg_path=argv[++i];
  }

  sync_config cfg;
  sync_config_load_file(cfg_path, cfg);

  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0) { i++; continue; }
    if (strcmp(argv[i],"--host")==0 && i+1<argc) host=argv[++i];
    else if (strcmp(argv[i],"--port")==0 && i+1<argc) cfg.default_port=atoi(argv[++i]);
    else if (strcmp(argv[i],"--local-port")==0 && i+1<argc) cfg.local_port=atoi(argv[++i]);
    else if (strcmp(argv[i],"--listen")==0 && i+1<argc) cfg.listen_addr=argv[++i];
    else if (strcmp(argv[i],"--service")==0 && i+1<argc) cfg.service_type=argv[++i];
    else if (strcmp(argv[i],"--discovery-timeout")==0 && i+1<argc) cfg.discovery_timeout_ms=atoi(argv[++i]);
    else if (strcmp(argv[i],"--refresh-ms")==0 && i+1<argc) refresh_ms=atoi(argv[++i]);
    else if (strcmp(argv[i],"--log-level")==0 && i+1<argc) cfg.log_level=argv[++i];
    else if (strcmp(argv[i],"-h")==0 || strcmp(argv[i],"--help")==0) { usage(argv[0]); return 0; }
    else {
      fprintf(stderr, "Unknown argument: %s\n", argv[i]);
      usage(argv[0]); return 1;
    }
  }
  sync_config_normalize(cfg);
  log_level lvl;
  if (log_level_from_string(cfg.log_level.c_str(), &lvl)) sync_log_set_level(lvl);

  signal(SIGINT, on_signal);
  signal(SIGTERM, on_signal);
  signal(SIGPIPE, SIG_IGN);

  mirror_options opt;
  opt.service_type = cfg.service_type;
  opt.fallback.host = host.empty() ? cfg.default_host : host;
  opt.fallback.port = (uint16_t)cfg.default_port;
  opt.skip_discovery = !host.empty();
  opt.listen_addr = cfg.listen_addr;
  opt.local_port = (uint16_t)cfg.local_port;
  opt.discovery_timeout_ms = cfg.discovery_timeout_ms;
  opt.retry_interval_ms = cfg.retry_interval_ms;
  opt.max_retries = cfg.max_retries;

  mirror_session session(opt, std::unique_ptr<mirror_io>(new udp_mirror_io()), &discover);
  session.set_status_callback([&session](const std::string &msg) {
    printf("[setup %3d%%] %s\n", (int)(session.progress() * 100.f + 0.5f), msg.c_str());
    fflush(stdout);
  });
  session.subscribe_gui_state([](const gui_state_changed &ev) {
    printf("[gui] %zu entries\n", ev.state.entries.size());
    for (const auto &e : ev.state.entries) printf("[gui]   %s\n", e.c_str());
    fflush(stdout);
  });
  session.start();

  bootstrap_state st = bootstrap_state::IDLE;
  while (!g_quit.load()) {
    st = session.wait_settled(200);
    if (st == bootstrap_state::LIVE || st == bootstrap_state::FAILED || st == bootstrap_state::CANCELLED) break;
  }
  if (st == bootstrap_state::FAILED) {
    sync_error e = session.last_error();
    fprintf(stderr, "[mirror] %s: %s\n", sync_errc_name(e.code), e.message.c_str());
    return 1;
  }
  if (st != bootstrap_state::LIVE) return 0;

  print_state(session);
  printf("type 'help' for commands\n");
  fflush(stdout);

  std::string line_buf;
  bool stdin_open = true;
  uint64_t last_refresh = monotonic_ms();
  while (!g_quit.load()) {
    if (refresh_ms > 0 && monotonic_ms() - last_refresh >= (uint64_t)refresh_ms) {
      sync_error err;
      if (!session.request_refresh(state_kind::STATISTICS, &err) ||
          !session.request_refresh(state_kind::IMAGE_BUFFER, &err)) {
        sync_log(LOG_LVL_WARN, "mirror", "refresh failed: %s", err.message.c_str());
      }
      last_refresh = monotonic_ms();
    }

    if (!stdin_open) {
      usleep(200 * 1000);
      continue;
    }
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    if (poll(&pfd, 1, 200) <= 0) continue;
    char buf[256];
    ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
      stdin_open = false;
      continue;
    }
    line_buf.append(buf, (size_t)n);

    size_t nl;
    while ((nl = line_buf.find('\n')) != std::string::npos) {
      std::vector<std::string> tok = split_ws(line_buf.substr(0, nl));
      line_buf.erase(0, nl + 1);
      if (tok.empty()) continue;

      if (tok[0] == "quit" || tok[0] == "q") { g_quit.store(true); break; }
      if (tok[0] == "help") { print_help(); continue; }
      if (tok[0] == "state") { print_state(session); continue; }
      if (tok[0] == "refresh") {
        state_kind k;
        if (tok.size() < 2 || !state_kind_from_name(tok[1], &k)) {
          printf("usage: refresh <version|configuration|matrixData|colorSets|output|guiState|"
                 "outputMapping|presetSettings|statistics|fileLocation|imageBuffer>\n");
          continue;
        }
        sync_error err;
        if (!session.request_refresh(k, &err)) printf("refresh failed: %s\n", err.message.c_str());
        continue;
      }
      sync_error err;
      if (!session.send_command(tok, nullptr, &err)) {
        printf("%s: %s\n", sync_errc_name(err.code), err.message.c_str());
      }
    }
    fflush(stdout);
  }

  session.stop();
  return 0;
}
