#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include <httplib.h>
#include "pixsync_log.h"
#include "pixsync_status_http.h"

static std::mutex g_mtx;

static std::string (*g_cfg_json)() = nullptr;
static std::string (*g_status)() = nullptr;
static std::string (*g_state)() = nullptr;
static std::atomic<bool> *g_quit = nullptr;
static std::string g_listen_addr = "0.0.0.0";

void status_http_set_config_json_provider(std::string (*fn)()) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_cfg_json = fn;
}
void status_http_set_status_provider(std::string (*fn)()) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_status = fn;
}
void status_http_set_state_provider(std::string (*fn)()) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_state = fn;
}
void status_http_set_quit_flag(std::atomic<bool> *quit_flag) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_quit = quit_flag;
}
void status_http_set_listen_address(const std::string &addr) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_listen_addr = addr;
}

static const char *kIndexHtml = R"HTML(<!doctype html>
<html>
<head>
  <meta charset="utf-8"/>
  <title>pixsync authority</title>
  <style>
    body { margin:0; font-family:system-ui, sans-serif; background:#0b0f14; color:#e8eefc; }
    header { padding:12px 14px; border-bottom:1px solid #243047; font-weight:700; }
    pre { margin:14px; padding:10px; font-size:12px; background:#0f1626; border:1px solid #243047; border-radius:12px; overflow:auto; }
  </style>
</head>
<body>
  <header>pixsync authority</header>
  <pre id="status">loading...</pre>
  <pre id="state"></pre>
  <script>
    async function tick(){
      try {
        const s = await fetch('/api/status'); document.getElementById('status').textContent = JSON.stringify(await s.json(), null, 2);
        const g = await fetch('/api/state'); document.getElementById('state').textContent = JSON.stringify(await g.json(), null, 2);
      } catch(e) { document.getElementById('status').textContent = 'offline'; }
    }
    tick(); setInterval(tick, 1000);
  </script>
</body>
</html>
)HTML";

// GET route backed by one of the JSON providers.
static void serve_provider(httplib::Server &svr, const char *path, std::string (**slot)(), const char *what) {
  svr.Get(path, [slot, what](const httplib::Request&, httplib::Response &res) {
    std::string (*fn)() = nullptr;
    {
      std::lock_guard<std::mutex> lk(g_mtx);
      fn = *slot;
    }
    if (!fn) {
      res.status = 500;
      res.set_content(std::string("{\"error\":\"no ") + what + " provider\"}", "application/json");
      return;
    }
    res.set_content(fn(), "application/json");
  });
}

void status_http_start_detached(int port) {
  std::thread([port]() {
    httplib::Server svr;

    svr.Get("/", [](const httplib::Request&, httplib::Response &res) {
      res.set_content(kIndexHtml, "text/html; charset=utf-8");
    });

    serve_provider(svr, "/api/config", &g_cfg_json, "config");
    serve_provider(svr, "/api/status", &g_status, "status");
    serve_provider(svr, "/api/state", &g_state, "state");

    svr.Post("/api/quit", [](const httplib::Request&, httplib::Response &res) {
      std::atomic<bool> *q = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        q = g_quit;
      }
      if (q) q->store(true);
      res.set_content("{\"ok\":true}", "application/json");
    });

    std::string addr;
    {
      std::lock_guard<std::mutex> lk(g_mtx);
      addr = g_listen_addr;
    }
    sync_log(LOG_LVL_INFO, "http", "listening on %s:%d", addr.c_str(), port);
    if (!svr.listen(addr.c_str(), port)) {
      sync_log(LOG_LVL_ERROR, "http", "cannot listen on %s:%d", addr.c_str(), port);
    }
  }).detach();
}
