#pragma once
#include <stdint.h>
#include <atomic>
#include <memory>
#include <string>
#include "pixsync_errors.h"
#include "pixsync_wire.h"

// DNS-SD lookup and announcement of the authority through the Avahi daemon.
// Absence of an announcement (or of the daemon) is a normal outcome.

// "_x._udp.local." -> "_x._udp", the form Avahi expects for a service type.
std::string discovery_service_type(const std::string &service_type);

// Endpoint for a resolved service: the address when the resolver returned
// one, else the host name.
net_endpoint discovery_endpoint(const std::string &host_name, const std::string &address, uint16_t port);

// Browses for service_type and resolves the first instance found, waiting
// up to timeout_ms. Any failure, a missing daemon included, is reported as
// DISCOVERY_TIMEOUT.
bool discover(const std::string &service_type, int timeout_ms, net_endpoint *out, sync_error *err);

// What the authority announces.
struct service_advert {
  std::string service_type = "_pixelcontroller-osc._udp";
  std::string instance = "PixelController";
  std::string host;       // empty = this machine
  uint16_t port = 9876;
};

struct responder_impl;

// Authority side: publishes one service entry group on Avahi's own thread.
// Renames the instance on a name collision.
class discovery_responder {
public:
  discovery_responder();
  ~discovery_responder();

  discovery_responder(const discovery_responder&) = delete;
  discovery_responder& operator=(const discovery_responder&) = delete;

  // Fails with TRANSPORT_BIND_FAILURE when the daemon cannot be reached.
  bool start(const service_advert &adv, sync_error *err);
  void stop();
  bool is_running() const { return impl != nullptr; }

  // True once the daemon confirmed the entry group.
  bool established() const;
  // Instance name as currently published (changes after a collision).
  std::string instance_name() const;

private:
  std::unique_ptr<responder_impl> impl;
};
