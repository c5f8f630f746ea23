#pragma once
#include <stdint.h>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "pixsync_commands.h"
#include "pixsync_events.h"
#include "pixsync_state.h"
#include "pixsync_transport.h"

// Read side of the visual pipeline, as seen by the protocol. Accessors are
// called from the receive thread and must return a consistent copy.
class authority_state_source {
public:
  virtual ~authority_state_source() {}

  virtual version_info version() const = 0;
  virtual app_config configuration() const = 0;
  virtual matrix_data matrix() const = 0;
  virtual color_sets colors() const = 0;
  virtual output_snapshot output() const = 0;
  virtual gui_state gui() const = 0;
  virtual output_mapping mapping() const = 0;
  virtual preset_settings preset() const = 0;
  virtual runtime_stats statistics() const = 0;
  virtual file_location files() const = 0;
  virtual image_buffer images() const = 0;
};

// Operational commands go to the pipeline's message processor as
// [symbol, args...] plus the optional blob.
typedef std::function<void(const std::vector<std::string> &msg, const std::vector<uint8_t> *blob)> operational_handler;

struct authority_options {
  std::string listen_addr = "0.0.0.0";
  uint16_t port = 9876;
  uint16_t reply_port = 9875;   // the mirror's well-known inbound port
};

// Authority endpoint: owns the UDP server, answers internal commands from
// the live state, tracks the single registered mirror and pushes gui state
// changes to it.
class authority_server {
public:
  authority_server(authority_state_source *state,
                   visual_state_events *events,
                   link_factory links,
                   operational_handler on_operational);
  ~authority_server();

  authority_server(const authority_server&) = delete;
  authority_server& operator=(const authority_server&) = delete;

  bool start(const authority_options &opt, sync_error *err);
  void stop();
  bool is_running() const { return server.is_running(); }
  uint16_t local_port() const { return server.local_port(); }

  // Dispatch of one decoded message (normally called on the receive thread).
  void handle_message(const sync_message &msg);

  // Live-update bridge entry point; also wired to `events` by the constructor.
  void on_gui_state_changed(const gui_state_changed &ev);

  bool observer(net_endpoint *out) const;
  bool reply_peer(net_endpoint *out) const;
  uint64_t replies_sent() const;
  uint64_t pushes_sent() const;

  // Statistics of the state source with this server's traffic counters merged in.
  runtime_stats merged_statistics() const;
  std::string status_json() const;

private:
  typedef std::function<bool(std::vector<uint8_t> &out, sync_error *err)> reply_producer;

  template <typename F>
  void add_reply(command_id id, F getter);

  void handle_internal(const command_def &cmd, const sync_message &msg);
  void register_observer(const net_endpoint &sender);
  void unregister_observer(const net_endpoint &sender);
  message_link *reply_channel_locked(const net_endpoint &sender, sync_error *err);
  net_endpoint reply_endpoint_for(const net_endpoint &sender) const;

  authority_state_source *state;
  visual_state_events *events;
  visual_state_events::subscription_id events_sub = 0;
  link_factory make_link;
  operational_handler on_operational;
  authority_options options;
  std::map<command_id, reply_producer> replies;

  udp_server server;

  // Guards the reply channel and the registered observer.
  mutable std::mutex peer_mtx;
  std::unique_ptr<message_link> reply_link;
  std::unique_ptr<message_link> observer_link;
  uint64_t n_replies = 0;
  uint64_t n_pushes = 0;
};

// JSON views of a running authority for threads that do not own it (the
// status page). detach() waits for a call in progress, so the server and
// the source may be destroyed right after it returns.
class authority_status {
public:
  authority_status() {}
  authority_status(const authority_status&) = delete;
  authority_status& operator=(const authority_status&) = delete;

  void attach(authority_server *server, authority_state_source *state);
  void detach();
  bool attached() const;

  // "{}" while detached.
  std::string status_json() const;
  std::string state_json() const;

private:
  mutable std::mutex mtx;
  authority_server *server = nullptr;
  authority_state_source *state = nullptr;
};
