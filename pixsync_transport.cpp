#include "pixsync_transport.h"
#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <exception>
#include "pixsync_log.h"

static const int k_poll_ms = 100;

bool resolve_ipv4(const std::string &host, uint16_t port, sockaddr_in *out, sync_error *err) {
  memset(out, 0, sizeof(*out));
  out->sin_family = AF_INET;
  out->sin_port = htons(port);
  if (host.empty() || host == "0.0.0.0") {
    out->sin_addr.s_addr = htonl(INADDR_ANY);
    return true;
  }
  if (inet_pton(AF_INET, host.c_str(), &out->sin_addr) == 1) return true;

  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  addrinfo *res = nullptr;
  int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || !res) {
    return set_error(err, sync_errc::TRANSPORT_BIND_FAILURE,
                     "cannot resolve " + host + ": " + gai_strerror(rc));
  }
  out->sin_addr = ((const sockaddr_in*)res->ai_addr)->sin_addr;
  freeaddrinfo(res);
  return true;
}

std::string ipv4_to_string(const in_addr &a) {
  char buf[INET_ADDRSTRLEN] = {0};
  if (!inet_ntop(AF_INET, &a, buf, sizeof(buf))) return std::string();
  return buf;
}

// ---------------- udp_client ----------------
udp_client::udp_client() {}
udp_client::~udp_client() { close(); }

bool udp_client::open(const std::string &host, uint16_t port, sync_error *err) {
  close();
  if (!resolve_ipv4(host, port, &dest, err)) return false;
  fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    return set_error(err, sync_errc::TRANSPORT_BIND_FAILURE, std::string("socket: ") + strerror(errno));
  }
  int sndbuf = 4 * PIXSYNC_MAX_PAYLOAD;
  if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &sndbuf, sizeof(sndbuf)) < 0) {
    sync_log(LOG_LVL_WARN, "udp", "setsockopt SO_SNDBUF: %s", strerror(errno)); /* non-fatal */
  }
  target.host = ipv4_to_string(dest.sin_addr);
  target.port = port;
  sync_log(LOG_LVL_DEBUG, "udp", "client ready for %s (%s)", host.c_str(), target.to_string().c_str());
  return true;
}

void udp_client::close() {
  if (fd >= 0) ::close(fd);
  fd = -1;
}

bool udp_client::send(const std::string &pattern,
                      const std::vector<std::string> &args,
                      const std::vector<uint8_t> *blob,
                      sync_error *err) {
  if (fd < 0) return set_error(err, sync_errc::SEND_FAILURE, "client not open");
  std::vector<uint8_t> pkt;
  if (!wire_encode(pattern, args, blob, pkt, err)) return false;

  std::lock_guard<std::mutex> lk(send_mtx);
  ssize_t n;
  do {
    n = sendto(fd, pkt.data(), pkt.size(), 0, (const sockaddr*)&dest, sizeof(dest));
  } while (n < 0 && errno == EINTR);
  if (n < 0) {
    return set_error(err, sync_errc::SEND_FAILURE,
                     "sendto " + target.to_string() + ": " + strerror(errno));
  }
  return true;
}

link_factory udp_link_factory() {
  return [](const net_endpoint &to, sync_error *err) -> std::unique_ptr<message_link> {
    std::unique_ptr<udp_client> c(new udp_client());
    if (!c->open(to.host, to.port, err)) return nullptr;
    return std::unique_ptr<message_link>(std::move(c));
  };
}

// ---------------- udp_server ----------------
udp_server::udp_server() {}
udp_server::~udp_server() { stop(); }

bool udp_server::start(const std::string &listen_addr, uint16_t port, message_handler handler, sync_error *err) {
  if (running.load()) return true;

  sockaddr_in local;
  if (!resolve_ipv4(listen_addr, port, &local, err)) return false;

  fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    return set_error(err, sync_errc::TRANSPORT_BIND_FAILURE, std::string("socket: ") + strerror(errno));
  }
  int yes = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
    sync_log(LOG_LVL_WARN, "udp", "setsockopt SO_REUSEADDR: %s", strerror(errno));
  }
  int rcvbuf = 16 * PIXSYNC_MAX_PAYLOAD;
  if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf)) < 0) {
    sync_log(LOG_LVL_WARN, "udp", "setsockopt SO_RCVBUF: %s", strerror(errno)); /* non-fatal */
  }
  if (bind(fd, (const sockaddr*)&local, sizeof(local)) < 0) {
    int e = errno;
    ::close(fd);
    fd = -1;
    return set_error(err, sync_errc::TRANSPORT_BIND_FAILURE,
                     "bind " + listen_addr + ":" + std::to_string(port) + ": " + strerror(e));
  }

  on_message = std::move(handler);
  running.store(true);
  rx_thread = std::thread(&udp_server::run, this);
  sync_log(LOG_LVL_INFO, "udp", "server listening on %s:%u", listen_addr.c_str(), (unsigned)local_port());
  return true;
}

void udp_server::stop() {
  running.store(false);
  if (rx_thread.joinable()) rx_thread.join();
  if (fd >= 0) ::close(fd);
  fd = -1;
}

uint16_t udp_server::local_port() const {
  if (fd < 0) return 0;
  sockaddr_in sa{};
  socklen_t sl = sizeof(sa);
  if (getsockname(fd, (sockaddr*)&sa, &sl) == 0) return ntohs(sa.sin_port);
  return 0;
}

void udp_server::run() {
  std::vector<uint8_t> buf(65536);
  while (running.load()) {
    pollfd pfd;
    memset(&pfd, 0, sizeof(pfd));
    pfd.fd = fd;
    pfd.events = POLLIN;
    int r = poll(&pfd, 1, k_poll_ms);
    if (r < 0) {
      if (errno == EINTR) continue;
      sync_log(LOG_LVL_ERROR, "udp", "poll: %s", strerror(errno));
      break;
    }
    if (r == 0) continue;

    sockaddr_in peer{};
    socklen_t alen = sizeof(peer);
    ssize_t n = recvfrom(fd, buf.data(), buf.size(), 0, (sockaddr*)&peer, &alen);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      sync_log(LOG_LVL_WARN, "udp", "recvfrom: %s", strerror(errno));
      continue;
    }
    handle_datagram(buf.data(), (size_t)n, peer);
  }
  running.store(false);
}

void udp_server::handle_datagram(const uint8_t *data, size_t len, const sockaddr_in &from) {
  packets.fetch_add(1, std::memory_order_relaxed);
  bytes.fetch_add(len, std::memory_order_relaxed);

  sync_message msg;
  sync_error err;
  if (!wire_decode(data, len, msg, &err)) {
    sync_log(LOG_LVL_WARN, "udp", "dropped %zu byte datagram from %s: %s",
             len, ipv4_to_string(from.sin_addr).c_str(), err.message.c_str());
    return;
  }
  msg.source.host = ipv4_to_string(from.sin_addr);
  msg.source.port = ntohs(from.sin_port);

  if (msg.pattern.empty()) {
    sync_log(LOG_LVL_INFO, "udp", "ignore empty OSC message from %s", msg.source.host.c_str());
    return;
  }
  if (!on_message) return;
  try {
    on_message(msg);
  } catch (const std::exception &e) {
    sync_log(LOG_LVL_ERROR, "udp", "handler failed for %s: %s", msg.pattern.c_str(), e.what());
  }
}
