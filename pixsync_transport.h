#pragma once
#include <stdint.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <netinet/in.h>
#include "pixsync_errors.h"
#include "pixsync_wire.h"

typedef std::function<void(const sync_message &)> message_handler;

// A send path to one fixed peer.
class message_link {
public:
  virtual ~message_link() {}
  virtual bool send(const std::string &pattern,
                    const std::vector<std::string> &args,
                    const std::vector<uint8_t> *blob,
                    sync_error *err) = 0;
  virtual net_endpoint peer() const = 0;
};

typedef std::function<std::unique_ptr<message_link>(const net_endpoint &, sync_error *)> link_factory;

// Resolves host (dotted IPv4 or hostname) into a sockaddr.
bool resolve_ipv4(const std::string &host, uint16_t port, sockaddr_in *out, sync_error *err);
std::string ipv4_to_string(const in_addr &a);

// Unconnected UDP socket aimed at one remote endpoint.
class udp_client : public message_link {
public:
  udp_client();
  ~udp_client() override;

  udp_client(const udp_client&) = delete;
  udp_client& operator=(const udp_client&) = delete;

  bool open(const std::string &host, uint16_t port, sync_error *err);
  void close();
  bool is_open() const { return fd >= 0; }

  bool send(const std::string &pattern,
            const std::vector<std::string> &args,
            const std::vector<uint8_t> *blob,
            sync_error *err) override;
  net_endpoint peer() const override { return target; }

private:
  int fd = -1;
  sockaddr_in dest{};
  net_endpoint target;
  std::mutex send_mtx;
};

link_factory udp_link_factory();

// Bound UDP socket with its own receive thread. Every datagram bumps the
// packet/byte counters before decoding, so malformed traffic is counted too.
// Decoded messages with a non-blank pattern are handed to the handler on the
// receive thread; a handler exception is logged and the loop continues.
class udp_server {
public:
  udp_server();
  ~udp_server();

  udp_server(const udp_server&) = delete;
  udp_server& operator=(const udp_server&) = delete;

  bool start(const std::string &listen_addr, uint16_t port, message_handler handler, sync_error *err);
  void stop();
  bool is_running() const { return running.load(); }

  uint16_t local_port() const;
  uint64_t packets_received() const { return packets.load(std::memory_order_relaxed); }
  uint64_t bytes_received() const { return bytes.load(std::memory_order_relaxed); }

private:
  void run();
  void handle_datagram(const uint8_t *data, size_t len, const sockaddr_in &from);

  int fd = -1;
  message_handler on_message;
  std::thread rx_thread;
  std::atomic<bool> running{false};
  std::atomic<uint64_t> packets{0};
  std::atomic<uint64_t> bytes{0};
};
