#include "pixsync_mirror.h"
#include <algorithm>
#include <chrono>
#include "pixsync_log.h"
#include "pixsync_reassembler.h"

static const int k_setup_steps = 1 + STATE_KIND_COUNT;   // connection + every kind

// ---------------- mirror_state ----------------
bool mirror_state::has(state_kind k) const {
  std::lock_guard<std::mutex> lk(mtx);
  return (bool)slots[(int)k];
}

int mirror_state::count() const {
  std::lock_guard<std::mutex> lk(mtx);
  int n = 0;
  for (const auto &s : slots) if (s) n++;
  return n;
}

void mirror_state::clear() {
  std::lock_guard<std::mutex> lk(mtx);
  for (auto &s : slots) s.reset();
}

// ---------------- steady_timer ----------------
bool steady_timer::wait_for(int ms) {
  std::unique_lock<std::mutex> lk(mtx);
  cv.wait_for(lk, std::chrono::milliseconds(ms), [this]() { return cancelled; });
  return !cancelled;
}

void steady_timer::cancel() {
  {
    std::lock_guard<std::mutex> lk(mtx);
    cancelled = true;
  }
  cv.notify_all();
}

// ---------------- udp_mirror_io ----------------
bool udp_mirror_io::open(const net_endpoint &remote, const std::string &listen_addr, uint16_t local_port,
                         message_handler on_message, sync_error *err) {
  if (!server.start(listen_addr, local_port, std::move(on_message), err)) return false;
  if (!client.open(remote.host, remote.port, err)) {
    server.stop();
    return false;
  }
  return true;
}

bool udp_mirror_io::send(const std::string &pattern,
                         const std::vector<std::string> &args,
                         const std::vector<uint8_t> *blob,
                         sync_error *err) {
  return client.send(pattern, args, blob, err);
}

void udp_mirror_io::close() {
  client.close();
  server.stop();
}

// ---------------- mirror_session ----------------
const char *bootstrap_state_name(bootstrap_state s) {
  switch (s) {
    case bootstrap_state::IDLE: return "IDLE";
    case bootstrap_state::DISCOVERING: return "DISCOVERING";
    case bootstrap_state::CONNECTING: return "CONNECTING";
    case bootstrap_state::FETCHING: return "FETCHING";
    case bootstrap_state::REGISTERING: return "REGISTERING";
    case bootstrap_state::LIVE: return "LIVE";
    case bootstrap_state::FAILED: return "FAILED";
    case bootstrap_state::CANCELLED: return "CANCELLED";
  }
  return "?";
}

static bool is_settled(bootstrap_state s) {
  return s == bootstrap_state::LIVE || s == bootstrap_state::FAILED || s == bootstrap_state::CANCELLED;
}

template <typename T>
void mirror_session::add_store() {
  stores[(int)state_traits<T>::kind] = [this](const std::vector<uint8_t> &blob, sync_error *err) {
    T obj;
    if (!reassembler_deserialize(blob, obj, err)) return false;
    store.set(std::move(obj));
    return true;
  };
}

mirror_session::mirror_session(const mirror_options &opt_,
                               std::unique_ptr<mirror_io> io_,
                               discover_fn discover_,
                               std::unique_ptr<sync_timer> timer_)
    : opt(opt_), io(std::move(io_)), discover(std::move(discover_)), timer(std::move(timer_)) {
  if (!timer) timer.reset(new steady_timer());
  add_store<version_info>();
  add_store<app_config>();
  add_store<matrix_data>();
  add_store<color_sets>();
  add_store<output_snapshot>();
  add_store<gui_state>();
  add_store<output_mapping>();
  add_store<preset_settings>();
  add_store<runtime_stats>();
  add_store<file_location>();
  add_store<image_buffer>();
}

mirror_session::~mirror_session() { stop(); }

bool mirror_session::start() {
  std::lock_guard<std::mutex> lk(st_mtx);
  if (started || st != bootstrap_state::IDLE) return false;
  started = true;
  worker = std::thread([this]() { run(); });
  return true;
}

void mirror_session::stop() {
  stop_requested = true;
  timer->cancel();
  if (worker.joinable()) worker.join();

  {
    std::lock_guard<std::mutex> lk(io_mtx);
    if (!io_open) return;
    if (registered.exchange(false)) {
      sync_error err;
      if (!io->send(command_symbol(command_id::UNREGISTER_VISUALOBSERVER), std::vector<std::string>(), nullptr, &err)) {
        sync_log(LOG_LVL_DEBUG, "mirror", "unregister not sent: %s", err.message.c_str());
      }
    }
    io_open = false;
    connected = false;
  }
  // joins the receive thread, whose handlers may still call send_locked()
  io->close();
}

bootstrap_state mirror_session::wait_settled(int timeout_ms) {
  std::unique_lock<std::mutex> lk(st_mtx);
  st_cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), [this]() { return is_settled(st); });
  return st;
}

bootstrap_state mirror_session::state() const {
  std::lock_guard<std::mutex> lk(st_mtx);
  return st;
}

float mirror_session::progress() const {
  int done = (connected ? 1 : 0) + store.count();
  return (float)done / (float)k_setup_steps;
}

sync_error mirror_session::last_error() const {
  std::lock_guard<std::mutex> lk(st_mtx);
  return err_last;
}

net_endpoint mirror_session::remote() const {
  std::lock_guard<std::mutex> lk(st_mtx);
  return remote_ep;
}

void mirror_session::set_state(bootstrap_state s) {
  {
    std::lock_guard<std::mutex> lk(st_mtx);
    st = s;
  }
  sync_log(LOG_LVL_DEBUG, "mirror", "state %s", bootstrap_state_name(s));
  st_cv.notify_all();
}

void mirror_session::fail(const sync_error &err) {
  {
    std::lock_guard<std::mutex> lk(st_mtx);
    err_last = err;
  }
  sync_log(LOG_LVL_ERROR, "mirror", "bootstrap failed (%s): %s", sync_errc_name(err.code), err.message.c_str());
  set_state(bootstrap_state::FAILED);
}

void mirror_session::status(const std::string &msg) {
  sync_log(LOG_LVL_INFO, "mirror", "%s", msg.c_str());
  if (on_status) on_status(msg);
}

bool mirror_session::send_locked(const std::string &pattern, const std::vector<std::string> &args,
                                 const std::vector<uint8_t> *blob, sync_error *err) {
  std::lock_guard<std::mutex> lk(io_mtx);
  if (!io_open) return set_error(err, sync_errc::SEND_FAILURE, "not connected");
  return io->send(pattern, args, blob, err);
}

void mirror_session::run() {
  set_state(bootstrap_state::DISCOVERING);
  net_endpoint target = opt.fallback;
  if (opt.skip_discovery) {
    status("Connect to " + target.to_string());
  } else {
    status("Search PixelController (" + opt.service_type + ")...");
    net_endpoint found;
    sync_error derr;
    if (discover && discover(opt.service_type, opt.discovery_timeout_ms, &found, &derr)) {
      target = found;
      status("Found PixelController at " + target.to_string());
    } else {
      sync_log(LOG_LVL_INFO, "mirror", "discovery: %s", derr.message.c_str());
      status("No PixelController announced, try " + target.to_string());
    }
  }
  if (stop_requested) {
    set_state(bootstrap_state::CANCELLED);
    return;
  }
  {
    std::lock_guard<std::mutex> lk(st_mtx);
    remote_ep = target;
  }

  set_state(bootstrap_state::CONNECTING);
  sync_error err;
  bool opened = false;
  {
    std::lock_guard<std::mutex> lk(io_mtx);
    opened = io->open(target, opt.listen_addr, opt.local_port,
                      [this](const sync_message &m) { handle_message(m); }, &err);
    io_open = opened;
  }
  if (!opened) {
    if (err.ok()) set_error(&err, sync_errc::TRANSPORT_BIND_FAILURE, "cannot open transport");
    fail(err);
    return;
  }
  connected = true;
  status("Connected to " + target.to_string() + ", local port " + std::to_string(opt.local_port));

  set_state(bootstrap_state::FETCHING);
  std::vector<state_kind> pending;
  for (command_id id : required_bootstrap_commands()) {
    state_kind k;
    if (state_kind_for_command(id, &k)) pending.push_back(k);
  }

  int waits = 0;
  for (;;) {
    for (state_kind k : pending) {
      const char *sym = command_symbol(command_for_state_kind(k));
      sync_error serr;
      if (!send_locked(sym, std::vector<std::string>(), nullptr, &serr)) {
        sync_log(LOG_LVL_WARN, "mirror", "request %s not sent: %s", sym, serr.message.c_str());
      }
    }

    if (!timer->wait_for(opt.retry_interval_ms) || stop_requested) {
      set_state(bootstrap_state::CANCELLED);
      return;
    }
    waits++;

    pending.erase(std::remove_if(pending.begin(), pending.end(),
                                 [this](state_kind k) { return store.has(k); }),
                  pending.end());
    if (pending.empty()) break;

    std::string missing;
    for (state_kind k : pending) {
      if (!missing.empty()) missing += ", ";
      missing += state_kind_name(k);
    }
    if (waits >= opt.max_retries) {
      status("ERROR: No answer from PixelController received!");
      status("Start aborted, make sure PixelController is running and restart client");
      sync_error terr;
      set_error(&terr, sync_errc::BOOTSTRAP_TIMEOUT, "no answer for: " + missing);
      fail(terr);
      return;
    }
    sync_log(LOG_LVL_INFO, "mirror", "waiting for %zu replies (%d/%d): %s",
             pending.size(), waits, opt.max_retries, missing.c_str());
  }

  set_state(bootstrap_state::REGISTERING);
  sync_error rerr;
  if (!send_locked(command_symbol(command_id::REGISTER_VISUALOBSERVER), std::vector<std::string>(), nullptr, &rerr)) {
    sync_log(LOG_LVL_WARN, "mirror", "registration not sent: %s", rerr.message.c_str());
  }
  registered = true;
  set_state(bootstrap_state::LIVE);
  status("PixelController ready");
}

void mirror_session::on_stored(state_kind kind) {
  if (kind == state_kind::GUI_STATE) {
    std::shared_ptr<const gui_state> g = store.gui();
    if (g) gui_events.publish(gui_state_changed{*g});
  }
  if (state() == bootstrap_state::LIVE) return;

  if (kind == state_kind::VERSION) {
    std::shared_ptr<const version_info> v = store.version();
    status("Found PixelController Version " + (v ? v->version : std::string("?")));
  } else {
    status(std::string("Received ") + state_kind_name(kind));
  }
}

void mirror_session::handle_message(const sync_message &msg) {
  if (pattern_is_blank(msg.pattern)) return;

  command_def cmd;
  sync_error err;
  if (!command_resolve(msg.pattern, &cmd, &err)) {
    sync_log(LOG_LVL_WARN, "mirror", "ignore unknown message %s", msg.pattern.c_str());
    return;
  }
  state_kind kind;
  if (!state_kind_for_command(cmd.id, &kind)) {
    sync_log(LOG_LVL_DEBUG, "mirror", "ignore %s, not a state reply", cmd.symbol);
    return;
  }
  if (!msg.has_blob) {
    sync_log(LOG_LVL_WARN, "mirror", "reply %s without payload", cmd.symbol);
    return;
  }
  if (!stores[(int)kind](msg.blob, &err)) {
    sync_log(LOG_LVL_WARN, "mirror", "drop %s: %s", cmd.symbol, err.message.c_str());
    return;
  }
  on_stored(kind);
}

bool mirror_session::request_refresh(state_kind kind, sync_error *err) {
  return send_locked(command_symbol(command_for_state_kind(kind)), std::vector<std::string>(), nullptr, err);
}

bool mirror_session::send_command(const std::vector<std::string> &line, const std::vector<uint8_t> *blob,
                                  sync_error *err) {
  if (line.empty()) return set_error(err, sync_errc::MALFORMED_MESSAGE, "empty command");
  command_def cmd;
  if (!command_resolve(line[0], &cmd, err)) return false;
  if (cmd.group != command_group::OPERATIONAL) {
    return set_error(err, sync_errc::UNKNOWN_COMMAND, std::string(cmd.symbol) + " is not an operational command");
  }
  std::vector<std::string> args(line.begin() + 1, line.end());
  if (!command_validate(cmd, args.size(), blob != nullptr, err)) return false;
  return send_locked(cmd.symbol, args, blob, err);
}
