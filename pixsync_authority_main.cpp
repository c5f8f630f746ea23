#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include "pixsync_authority.h"
#include "pixsync_config.h"
#include "pixsync_demo_visuals.h"
#include "pixsync_discovery.h"
#include "pixsync_log.h"
#include "pixsync_status_http.h"

// ---------------- raw terminal (n/c/q keys) ----------------
static struct termios orig_termios;
static bool g_raw_mode = false;
static void disableRawMode(void) {
  if (g_raw_mode) tcsetattr(STDIN_FILENO, TCSAFLUSH, &orig_termios);
}
static void enableRawModeStdin(void) {
  if (!isatty(STDIN_FILENO)) return;
  if (tcgetattr(STDIN_FILENO, &orig_termios) != 0) return;
  g_raw_mode = true;
  atexit(disableRawMode);
  struct termios raw = orig_termios;
  raw.c_lflag &= ~(ECHO | ICANON);
  tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

// ---------------- Global state ----------------
static std::mutex g_cfg_mtx;
static sync_config g_cfg;
static std::string g_cfg_path = "./pixsync_config.json";
static std::atomic<bool> g_quit{false};
static authority_status g_status;

static sync_config cfg_snapshot() {
  std::lock_guard<std::mutex> lk(g_cfg_mtx);
  sync_config c = g_cfg;
  sync_config_normalize(c);
  return c;
}
static bool save_config_locked() {
  return write_file_atomic(g_cfg_path, sync_config_to_json(g_cfg));
}

static std::string config_json_provider() { return sync_config_to_json(cfg_snapshot()); }

static std::string status_json_provider() { return g_status.status_json(); }
static std::string state_json_provider() { return g_status.state_json(); }

static void on_signal(int) { g_quit.store(true); }

// ---------------- Main ----------------
static void usage(const char *argv0) {
  fprintf(stderr,
    "Usage: %s [--config PATH] [--save-config] [--port N] [--reply-port N] [--listen ADDR]\n"
    "          [--no-http] [--http-port N] [--no-discovery] [--advertise HOST]\n"
    "          [--service TYPE] [--size WxH] [--fps N] [--log-level debug|info|warn|error]\n"
    "Keys: n = next generator, c = next colour set, q = quit\n",
    argv0
  );
}

int main(int argc, char **argv) {
  uint32_t mat_w = 8, mat_h = 8;
  int fps = 20;
  bool save_config = false;

  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0 && i+1<argc) g_cfg_path=argv[++i];
  }

  // load config
  {
    sync_config loaded;
    sync_config_load_file(g_cfg_path, loaded);
    std::lock_guard<std::mutex> lk(g_cfg_mtx);
    g_cfg = loaded;
  }

  // CLI overrides
  for (int i=1;i<argc;i++) {
    std::lock_guard<std::mutex> lk(g_cfg_mtx);
    if (strcmp(argv[i],"--config")==0) { i++; continue; }
    if (strcmp(argv[i],"--save-config")==0) { save_config = true; continue; }
    if (strcmp(argv[i],"--port")==0 && i+1<argc) g_cfg.default_port=atoi(argv[++i]);
    else if (strcmp(argv[i],"--reply-port")==0 && i+1<argc) g_cfg.local_port=atoi(argv[++i]);
    else if (strcmp(argv[i],"--listen")==0 && i+1<argc) g_cfg.listen_addr=argv[++i];
    else if (strcmp(argv[i],"--no-http")==0) g_cfg.status_http_enable=false;
    else if (strcmp(argv[i],"--http-port")==0 && i+1<argc) g_cfg.status_http_port=atoi(argv[++i]);
    else if (strcmp(argv[i],"--no-discovery")==0) g_cfg.discovery_enable=false;
    else if (strcmp(argv[i],"--advertise")==0 && i+1<argc) g_cfg.advertise_host=argv[++i];
    else if (strcmp(argv[i],"--service")==0 && i+1<argc) g_cfg.service_type=argv[++i];
    else if (strcmp(argv[i],"--log-level")==0 && i+1<argc) g_cfg.log_level=argv[++i];
    else if (strcmp(argv[i],"--fps")==0 && i+1<argc) fps=atoi(argv[++i]);
    else if (strcmp(argv[i],"--size")==0 && i+1<argc) {
      const char *v = argv[++i];
      if (sscanf(v, "%ux%u", &mat_w, &mat_h) != 2 || !mat_w || !mat_h) { fprintf(stderr, "Bad --size\n"); return 1; }
    } else if (strcmp(argv[i],"-h")==0 || strcmp(argv[i],"--help")==0) {
      usage(argv[0]); return 0;
    } else {
      fprintf(stderr, "Unknown argument: %s\n", argv[i]);
      usage(argv[0]); return 1;
    }
  }

  {
    std::lock_guard<std::mutex> lk(g_cfg_mtx);
    sync_config_normalize(g_cfg);
    if (save_config) {
      if (save_config_locked()) sync_log(LOG_LVL_INFO, "config", "saved %s", g_cfg_path.c_str());
      else sync_log(LOG_LVL_WARN, "config", "cannot write %s", g_cfg_path.c_str());
    }
  }
  sync_config cfg = cfg_snapshot();
  log_level lvl;
  if (log_level_from_string(cfg.log_level.c_str(), &lvl)) sync_log_set_level(lvl);
  if (fps <= 0) fps = 20;

  signal(SIGINT, on_signal);
  signal(SIGTERM, on_signal);
  signal(SIGPIPE, SIG_IGN);

  visual_state_events events;
  demo_visuals demo(mat_w, mat_h, &events);
  demo.set_fps(fps);
  demo.tick();

  authority_server server(&demo, &events, udp_link_factory(),
    [&demo](const std::vector<std::string> &msg, const std::vector<uint8_t> *blob) {
      sync_error err;
      if (!demo.apply_command(msg, blob, &err)) {
        sync_log(LOG_LVL_WARN, "demo", "%s rejected: %s", msg.empty() ? "" : msg[0].c_str(), err.message.c_str());
      }
    });

  authority_options opt;
  opt.listen_addr = cfg.listen_addr;
  opt.port = (uint16_t)cfg.default_port;
  opt.reply_port = (uint16_t)cfg.local_port;
  sync_error err;
  if (!server.start(opt, &err)) {
    fprintf(stderr, "[authority] %s: %s\n", sync_errc_name(err.code), err.message.c_str());
    return 1;
  }
  g_status.attach(&server, &demo);

  discovery_responder responder;
  if (cfg.discovery_enable) {
    service_advert adv;
    adv.service_type = cfg.service_type;
    adv.port = (uint16_t)cfg.default_port;
    adv.host = cfg.advertise_host;
    sync_error derr;
    if (!responder.start(adv, &derr)) {
      sync_log(LOG_LVL_WARN, "discovery", "not announced (Avahi may not be available): %s", derr.message.c_str());
    }
  }

  if (cfg.status_http_enable) {
    status_http_set_config_json_provider(&config_json_provider);
    status_http_set_status_provider(&status_json_provider);
    status_http_set_state_provider(&state_json_provider);
    status_http_set_quit_flag(&g_quit);
    status_http_set_listen_address(cfg.listen_addr);
    status_http_start_detached(cfg.status_http_port);
    sync_log(LOG_LVL_INFO, "http", "open http://<device-ip>:%d/", cfg.status_http_port);
  }

  enableRawModeStdin();
  const int frame_ms = 1000 / fps > 0 ? 1000 / fps : 1;
  auto next_frame = std::chrono::steady_clock::now();
  bool stdin_open = true;
  while (!g_quit.load()) {
    int left = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
                 next_frame - std::chrono::steady_clock::now()).count();
    if (stdin_open) {
      pollfd pfd{STDIN_FILENO, POLLIN, 0};
      int pr = poll(&pfd, 1, left > 0 ? left : 0);
      if (pr > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
        char ch = 0;
        ssize_t n = read(STDIN_FILENO, &ch, 1);
        if (n <= 0) stdin_open = false;   // keep serving until a signal or /api/quit
        else if (ch == 'q') { g_quit.store(true); break; }
        else if (ch == 'n') demo.next_generator();
        else if (ch == 'c') demo.rotate_colorset();
        continue;
      }
    } else if (left > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(left));
    }
    if (std::chrono::steady_clock::now() >= next_frame) {
      demo.tick();
      next_frame += std::chrono::milliseconds(frame_ms);
    }
  }

  sync_log(LOG_LVL_INFO, "authority", "shutting down");
  g_status.detach();
  responder.stop();
  server.stop();
  return 0;
}
