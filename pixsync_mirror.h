#pragma once
#include <stdint.h>
#include <array>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "pixsync_commands.h"
#include "pixsync_events.h"
#include "pixsync_state.h"
#include "pixsync_transport.h"

// Local copy of the authority state, one slot per kind. A slot holds an
// immutable object; writers swap the pointer, readers get a shared copy.
class mirror_state {
public:
  mirror_state() {}
  mirror_state(const mirror_state&) = delete;
  mirror_state& operator=(const mirror_state&) = delete;

  template <typename T>
  void set(T value) {
    std::shared_ptr<const void> p = std::make_shared<T>(std::move(value));
    std::lock_guard<std::mutex> lk(mtx);
    slots[(int)state_traits<T>::kind] = std::move(p);
  }

  // Empty pointer while the kind has not been received.
  template <typename T>
  std::shared_ptr<const T> get() const {
    std::lock_guard<std::mutex> lk(mtx);
    return std::static_pointer_cast<const T>(slots[(int)state_traits<T>::kind]);
  }

  bool has(state_kind k) const;
  int count() const;
  bool initialized() const { return count() == STATE_KIND_COUNT; }
  void clear();

  std::shared_ptr<const version_info> version() const { return get<version_info>(); }
  std::shared_ptr<const app_config> configuration() const { return get<app_config>(); }
  std::shared_ptr<const matrix_data> matrix() const { return get<matrix_data>(); }
  std::shared_ptr<const color_sets> colors() const { return get<color_sets>(); }
  std::shared_ptr<const output_snapshot> output() const { return get<output_snapshot>(); }
  std::shared_ptr<const gui_state> gui() const { return get<gui_state>(); }
  std::shared_ptr<const output_mapping> mapping() const { return get<output_mapping>(); }
  std::shared_ptr<const preset_settings> preset() const { return get<preset_settings>(); }
  std::shared_ptr<const runtime_stats> statistics() const { return get<runtime_stats>(); }
  std::shared_ptr<const file_location> files() const { return get<file_location>(); }
  std::shared_ptr<const image_buffer> images() const { return get<image_buffer>(); }

private:
  mutable std::mutex mtx;
  std::array<std::shared_ptr<const void>, STATE_KIND_COUNT> slots;
};

// Cancellable wait used by the fetch loop.
class sync_timer {
public:
  virtual ~sync_timer() {}
  // false when cancelled (before or during the wait)
  virtual bool wait_for(int ms) = 0;
  virtual void cancel() = 0;
};

class steady_timer : public sync_timer {
public:
  bool wait_for(int ms) override;
  void cancel() override;

private:
  std::mutex mtx;
  std::condition_variable cv;
  bool cancelled = false;
};

// Both directions of the mirror's channel: a client aimed at the authority
// and a server bound on the local port for replies and pushes.
class mirror_io {
public:
  virtual ~mirror_io() {}
  virtual bool open(const net_endpoint &remote, const std::string &listen_addr, uint16_t local_port,
                    message_handler on_message, sync_error *err) = 0;
  virtual bool send(const std::string &pattern,
                    const std::vector<std::string> &args,
                    const std::vector<uint8_t> *blob,
                    sync_error *err) = 0;
  virtual void close() = 0;
};

class udp_mirror_io : public mirror_io {
public:
  bool open(const net_endpoint &remote, const std::string &listen_addr, uint16_t local_port,
            message_handler on_message, sync_error *err) override;
  bool send(const std::string &pattern,
            const std::vector<std::string> &args,
            const std::vector<uint8_t> *blob,
            sync_error *err) override;
  void close() override;

  uint64_t packets_received() const { return server.packets_received(); }
  uint64_t bytes_received() const { return server.bytes_received(); }

private:
  udp_client client;
  udp_server server;
};

typedef std::function<bool(const std::string &service_type, int timeout_ms,
                           net_endpoint *out, sync_error *err)> discover_fn;

enum class bootstrap_state {
  IDLE = 0,
  DISCOVERING,
  CONNECTING,
  FETCHING,
  REGISTERING,
  LIVE,
  FAILED,
  CANCELLED,
};

const char *bootstrap_state_name(bootstrap_state s);

struct mirror_options {
  std::string service_type = "_pixelcontroller-osc._udp";
  net_endpoint fallback{"pixelcontroller.local", 9876};
  bool skip_discovery = false;     // connect straight to `fallback`
  std::string listen_addr = "0.0.0.0";
  uint16_t local_port = 9875;
  int discovery_timeout_ms = 6000;
  int retry_interval_ms = 2000;
  int max_retries = 5;
};

typedef std::function<void(const std::string &)> status_callback;

// One bootstrap session: discovery, connect, fetch of all 11 kinds,
// registration, then live mirroring. Runs on its own thread. Destruction
// (or stop) cancels a running fetch, unregisters if registration was sent
// and closes both sockets.
class mirror_session {
public:
  mirror_session(const mirror_options &opt,
                 std::unique_ptr<mirror_io> io,
                 discover_fn discover,
                 std::unique_ptr<sync_timer> timer = nullptr);
  ~mirror_session();

  mirror_session(const mirror_session&) = delete;
  mirror_session& operator=(const mirror_session&) = delete;

  // Must be set before start(). Called from the coordinator and receive threads.
  void set_status_callback(status_callback cb) { on_status = std::move(cb); }

  // Spawns the coordinator once; later calls return false.
  bool start();
  // Unregisters and closes the link. GUI handlers running at that moment may
  // still call send_command() or request_refresh(); those fail with
  // SEND_FAILURE.
  void stop();

  // Blocks until LIVE, FAILED or CANCELLED, or until timeout_ms passed.
  bootstrap_state wait_settled(int timeout_ms);

  bootstrap_state state() const;
  float progress() const;   // 0..1 over 12 setup steps
  sync_error last_error() const;
  net_endpoint remote() const;

  const mirror_state &mirror() const { return store; }

  visual_state_events::subscription_id subscribe_gui_state(visual_state_events::gui_state_handler h) {
    return gui_events.subscribe(std::move(h));
  }
  bool unsubscribe_gui_state(visual_state_events::subscription_id id) { return gui_events.unsubscribe(id); }

  // Re-requests one kind (any state after CONNECTING).
  bool request_refresh(state_kind kind, sync_error *err);
  // [symbol, args...] of an operational command, checked against the registry.
  bool send_command(const std::vector<std::string> &line, const std::vector<uint8_t> *blob, sync_error *err);

  // Inbound dispatch; the receive thread calls this for every message.
  void handle_message(const sync_message &msg);

private:
  typedef std::function<bool(const std::vector<uint8_t> &blob, sync_error *err)> reply_store;

  template <typename T>
  void add_store();

  void run();
  void set_state(bootstrap_state s);
  void fail(const sync_error &err);
  void status(const std::string &msg);
  bool send_locked(const std::string &pattern, const std::vector<std::string> &args,
                   const std::vector<uint8_t> *blob, sync_error *err);

  void on_stored(state_kind kind);

  mirror_options opt;
  std::unique_ptr<mirror_io> io;
  discover_fn discover;
  std::unique_ptr<sync_timer> timer;
  status_callback on_status;

  mirror_state store;
  visual_state_events gui_events;
  std::array<reply_store, STATE_KIND_COUNT> stores;

  std::thread worker;
  std::atomic<bool> stop_requested{false};
  std::atomic<bool> connected{false};
  std::atomic<bool> registered{false};

  std::mutex io_mtx;   // io open/send/close
  bool io_open = false;

  mutable std::mutex st_mtx;
  std::condition_variable st_cv;
  bootstrap_state st = bootstrap_state::IDLE;
  bool started = false;
  sync_error err_last;
  net_endpoint remote_ep;
};
