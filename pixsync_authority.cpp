#include "pixsync_authority.h"
#include <nlohmann/json.hpp>
#include "pixsync_log.h"
#include "pixsync_reassembler.h"

using nlohmann::json;

template <typename F>
void authority_server::add_reply(command_id id, F getter) {
  replies[id] = [getter](std::vector<uint8_t> &out, sync_error *err) {
    return reassembler_serialize(getter(), out, err);
  };
}

authority_server::authority_server(authority_state_source *state_,
                                   visual_state_events *events_,
                                   link_factory links,
                                   operational_handler on_operational_)
    : state(state_), events(events_), make_link(std::move(links)), on_operational(std::move(on_operational_)) {
  // One handler per GET command; anything not listed here gets no reply.
  add_reply(command_id::GET_VERSION,        [this]() { return state->version(); });
  add_reply(command_id::GET_CONFIGURATION,  [this]() { return state->configuration(); });
  add_reply(command_id::GET_MATRIXDATA,     [this]() { return state->matrix(); });
  add_reply(command_id::GET_COLORSETS,      [this]() { return state->colors(); });
  add_reply(command_id::GET_OUTPUT,         [this]() { return state->output(); });
  add_reply(command_id::GET_GUISTATE,       [this]() { return state->gui(); });
  add_reply(command_id::GET_OUTPUTMAPPING,  [this]() { return state->mapping(); });
  add_reply(command_id::GET_PRESETSETTINGS, [this]() { return state->preset(); });
  add_reply(command_id::GET_JMXSTATISTICS,  [this]() { return merged_statistics(); });
  add_reply(command_id::GET_FILELOCATION,   [this]() { return state->files(); });
  add_reply(command_id::GET_IMAGEBUFFER,    [this]() { return state->images(); });

  if (events) {
    events_sub = events->subscribe([this](const gui_state_changed &ev) { on_gui_state_changed(ev); });
  }
}

authority_server::~authority_server() {
  if (events && events_sub) events->unsubscribe(events_sub);
  stop();
}

bool authority_server::start(const authority_options &opt, sync_error *err) {
  options = opt;
  if (!server.start(opt.listen_addr, opt.port,
                    [this](const sync_message &m) { handle_message(m); }, err)) {
    sync_log(LOG_LVL_ERROR, "authority", "failed to start OSC server on port %u: %s",
             (unsigned)opt.port, err ? err->message.c_str() : "");
    return false;
  }
  sync_log(LOG_LVL_INFO, "authority", "OSC server started at port %u, replies go to port %u",
           (unsigned)local_port(), (unsigned)opt.reply_port);
  return true;
}

void authority_server::stop() {
  server.stop();
  std::lock_guard<std::mutex> lk(peer_mtx);
  reply_link.reset();
  observer_link.reset();
}

void authority_server::handle_message(const sync_message &msg) {
  if (pattern_is_blank(msg.pattern)) {
    sync_log(LOG_LVL_INFO, "authority", "ignore empty OSC message...");
    return;
  }

  command_def cmd;
  sync_error err;
  if (!command_resolve(msg.pattern, &cmd, &err)) {
    sync_log(LOG_LVL_WARN, "authority", "unknown message: %s (from %s)",
             msg.pattern.c_str(), msg.source.host.c_str());
    return;
  }
  if (!command_validate(cmd, msg.args.size(), msg.has_blob, &err)) {
    sync_log(LOG_LVL_WARN, "authority", "%s", err.message.c_str());
    return;
  }

  if (cmd.group == command_group::INTERNAL) {
    sync_log(LOG_LVL_DEBUG, "authority", "received internal OSC message: %s", cmd.symbol);
    handle_internal(cmd, msg);
    return;
  }

  std::vector<std::string> line;
  line.reserve(1 + msg.args.size());
  line.push_back(msg.pattern);
  line.insert(line.end(), msg.args.begin(), msg.args.end());
  sync_log(LOG_LVL_INFO, "authority", "received OSC message: %s (%zu args%s)",
           cmd.symbol, msg.args.size(), msg.has_blob ? ", blob" : "");
  if (on_operational) on_operational(line, msg.has_blob ? &msg.blob : nullptr);
}

void authority_server::handle_internal(const command_def &cmd, const sync_message &msg) {
  if (cmd.id == command_id::REGISTER_VISUALOBSERVER) {
    register_observer(msg.source);
    return;
  }
  if (cmd.id == command_id::UNREGISTER_VISUALOBSERVER) {
    unregister_observer(msg.source);
    return;
  }

  auto it = replies.find(cmd.id);
  if (it == replies.end()) {
    sync_log(LOG_LVL_WARN, "authority", "no reply handler for %s", cmd.symbol);
    return;
  }

  std::vector<uint8_t> blob;
  sync_error err;
  if (!it->second(blob, &err)) {
    sync_log(LOG_LVL_WARN, "authority", "failed to serialize reply for %s: %s",
             cmd.symbol, err.message.c_str());
    return;
  }

  std::lock_guard<std::mutex> lk(peer_mtx);
  message_link *link = reply_channel_locked(msg.source, &err);
  if (!link) {
    sync_log(LOG_LVL_WARN, "authority", "no return channel to %s: %s",
             msg.source.host.c_str(), err.message.c_str());
    return;
  }
  if (!link->send(cmd.symbol, std::vector<std::string>(), &blob, &err)) {
    sync_log(LOG_LVL_WARN, "authority", "failed to send OSC message %s: %s", cmd.symbol, err.message.c_str());
    return;
  }
  n_replies++;
}

net_endpoint authority_server::reply_endpoint_for(const net_endpoint &sender) const {
  net_endpoint ep;
  ep.host = sender.host;
  ep.port = options.reply_port;
  return ep;
}

// Caller holds peer_mtx. The channel is rebuilt only when the sender's
// address differs from the cached one.
message_link *authority_server::reply_channel_locked(const net_endpoint &sender, sync_error *err) {
  net_endpoint want = reply_endpoint_for(sender);
  if (reply_link && reply_link->peer().host == want.host) return reply_link.get();

  if (!make_link) {
    set_error(err, sync_errc::SEND_FAILURE, "no link factory");
    return nullptr;
  }
  std::unique_ptr<message_link> link = make_link(want, err);
  if (!link) return nullptr;
  sync_log(LOG_LVL_INFO, "authority", "return channel now %s", want.to_string().c_str());
  reply_link = std::move(link);
  return reply_link.get();
}

void authority_server::register_observer(const net_endpoint &sender) {
  net_endpoint want = reply_endpoint_for(sender);
  std::lock_guard<std::mutex> lk(peer_mtx);
  if (observer_link && observer_link->peer().host == want.host) {
    sync_log(LOG_LVL_DEBUG, "authority", "observer %s already registered", want.host.c_str());
    return;
  }
  sync_error err;
  std::unique_ptr<message_link> link = make_link ? make_link(want, &err) : nullptr;
  if (!link) {
    sync_log(LOG_LVL_WARN, "authority", "cannot register observer %s: %s",
             want.to_string().c_str(), err.message.c_str());
    return;
  }
  if (observer_link) {
    sync_log(LOG_LVL_INFO, "authority", "observer %s replaced by %s",
             observer_link->peer().to_string().c_str(), want.to_string().c_str());
  } else {
    sync_log(LOG_LVL_INFO, "authority", "register observer %s", want.to_string().c_str());
  }
  observer_link = std::move(link);
}

void authority_server::unregister_observer(const net_endpoint &sender) {
  std::lock_guard<std::mutex> lk(peer_mtx);
  if (!observer_link) return;
  if (observer_link->peer().host != sender.host) {
    sync_log(LOG_LVL_WARN, "authority", "ignore unregister from %s, observer is %s",
             sender.host.c_str(), observer_link->peer().host.c_str());
    return;
  }
  sync_log(LOG_LVL_INFO, "authority", "unregister observer %s", observer_link->peer().to_string().c_str());
  observer_link.reset();
}

void authority_server::on_gui_state_changed(const gui_state_changed &ev) {
  std::lock_guard<std::mutex> lk(peer_mtx);
  if (!observer_link) return;

  std::vector<uint8_t> blob;
  sync_error err;
  if (!reassembler_serialize(ev.state, blob, &err)) {
    sync_log(LOG_LVL_ERROR, "authority", "failed to serialize observer message: %s", err.message.c_str());
    return;
  }
  if (!observer_link->send(command_symbol(command_id::GET_GUISTATE), std::vector<std::string>(), &blob, &err)) {
    sync_log(LOG_LVL_ERROR, "authority", "failed to send observer message: %s", err.message.c_str());
    return;
  }
  n_pushes++;
}

bool authority_server::observer(net_endpoint *out) const {
  std::lock_guard<std::mutex> lk(peer_mtx);
  if (!observer_link) return false;
  if (out) *out = observer_link->peer();
  return true;
}

bool authority_server::reply_peer(net_endpoint *out) const {
  std::lock_guard<std::mutex> lk(peer_mtx);
  if (!reply_link) return false;
  if (out) *out = reply_link->peer();
  return true;
}

uint64_t authority_server::replies_sent() const {
  std::lock_guard<std::mutex> lk(peer_mtx);
  return n_replies;
}

uint64_t authority_server::pushes_sent() const {
  std::lock_guard<std::mutex> lk(peer_mtx);
  return n_pushes;
}

runtime_stats authority_server::merged_statistics() const {
  runtime_stats s = state->statistics();
  s.packets_received = server.packets_received();
  s.bytes_received = server.bytes_received();
  return s;
}

std::string authority_server::status_json() const {
  runtime_stats s = merged_statistics();
  json j;
  j["running"] = is_running();
  j["port"] = local_port();
  j["packetsReceived"] = s.packets_received;
  j["bytesReceived"] = s.bytes_received;
  j["fps"] = s.current_fps;
  j["frameCount"] = s.frame_count;
  j["startTimeMs"] = s.start_time_ms;
  net_endpoint ep;
  j["observer"] = observer(&ep) ? ep.to_string() : "";
  j["replyPeer"] = reply_peer(&ep) ? ep.to_string() : "";
  j["repliesSent"] = replies_sent();
  j["pushesSent"] = pushes_sent();
  return j.dump();
}

// ---------------- authority_status ----------------
void authority_status::attach(authority_server *server_, authority_state_source *state_) {
  std::lock_guard<std::mutex> lk(mtx);
  server = server_;
  state = state_;
}

void authority_status::detach() {
  std::lock_guard<std::mutex> lk(mtx);
  server = nullptr;
  state = nullptr;
}

bool authority_status::attached() const {
  std::lock_guard<std::mutex> lk(mtx);
  return server != nullptr;
}

std::string authority_status::status_json() const {
  std::lock_guard<std::mutex> lk(mtx);
  if (!server) return "{}";
  return server->status_json();
}

std::string authority_status::state_json() const {
  std::lock_guard<std::mutex> lk(mtx);
  if (!state) return "{}";
  json j;
  j[state_kind_name(state_kind::VERSION)] = state->version();
  j[state_kind_name(state_kind::CONFIGURATION)] = state->configuration();
  j[state_kind_name(state_kind::MATRIX_DATA)] = state->matrix();
  j[state_kind_name(state_kind::COLOR_SETS)] = state->colors();
  j[state_kind_name(state_kind::OUTPUT)] = state->output();
  j[state_kind_name(state_kind::GUI_STATE)] = state->gui();
  j[state_kind_name(state_kind::OUTPUT_MAPPING)] = state->mapping();
  j[state_kind_name(state_kind::PRESET_SETTINGS)] = state->preset();
  j[state_kind_name(state_kind::STATISTICS)] = server ? server->merged_statistics() : state->statistics();
  j[state_kind_name(state_kind::FILE_LOCATION)] = state->files();
  j[state_kind_name(state_kind::IMAGE_BUFFER)] = state->images();
  return j.dump();
}
