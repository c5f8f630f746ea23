#include "pixsync_discovery.h"
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-client/publish.h>
#include <avahi-common/address.h>
#include <avahi-common/alternative.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/simple-watch.h>
#include <avahi-common/thread-watch.h>
#include <chrono>
#include "pixsync_log.h"

static const int k_poll_ms = 100;

static bool ends_with_nocase(const std::string &s, const std::string &suffix) {
  if (s.size() < suffix.size()) return false;
  for (size_t i = 0; i < suffix.size(); i++) {
    char a = s[s.size() - suffix.size() + i];
    if (a >= 'A' && a <= 'Z') a = (char)(a - 'A' + 'a');
    if (a != suffix[i]) return false;
  }
  return true;
}

std::string discovery_service_type(const std::string &service_type) {
  std::string s = service_type;
  while (!s.empty() && s.back() == '.') s.pop_back();
  if (ends_with_nocase(s, ".local")) s.resize(s.size() - 6);
  return s;
}

net_endpoint discovery_endpoint(const std::string &host_name, const std::string &address, uint16_t port) {
  net_endpoint ep;
  ep.host = address.empty() ? host_name : address;
  ep.port = port;
  return ep;
}

// ---------------- querier ----------------
namespace {

struct browse_ctx {
  AvahiSimplePoll *poll = nullptr;
  AvahiClient *client = nullptr;
  bool found = false;
  bool failed = false;
  std::string fail_msg;
  std::string instance;
  net_endpoint ep;
};

// Frees whatever the lookup created; the client owns browser and resolvers.
struct browse_cleanup {
  browse_ctx *ctx;
  ~browse_cleanup() {
    if (ctx->client) avahi_client_free(ctx->client);
    if (ctx->poll) avahi_simple_poll_free(ctx->poll);
  }
};

void on_browse_client(AvahiClient *c, AvahiClientState state, void *user) {
  browse_ctx *ctx = (browse_ctx*)user;
  if (state == AVAHI_CLIENT_FAILURE) {
    ctx->failed = true;
    ctx->fail_msg = std::string("avahi: ") + avahi_strerror(avahi_client_errno(c));
    avahi_simple_poll_quit(ctx->poll);
  }
}

void on_resolved(AvahiServiceResolver *r, AvahiIfIndex, AvahiProtocol, AvahiResolverEvent event,
                 const char *name, const char *, const char *, const char *host_name,
                 const AvahiAddress *a, uint16_t port, AvahiStringList *, AvahiLookupResultFlags,
                 void *user) {
  browse_ctx *ctx = (browse_ctx*)user;
  if (event == AVAHI_RESOLVER_FOUND && !ctx->found) {
    char addr[AVAHI_ADDRESS_STR_MAX] = {0};
    if (a) avahi_address_snprint(addr, sizeof(addr), a);
    ctx->ep = discovery_endpoint(host_name ? host_name : "", addr, port);
    ctx->instance = name ? name : "";
    ctx->found = true;
    avahi_simple_poll_quit(ctx->poll);
  } else if (event == AVAHI_RESOLVER_FAILURE) {
    sync_log(LOG_LVL_DEBUG, "discovery", "cannot resolve %s: %s", name ? name : "?",
             avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(r))));
  }
  avahi_service_resolver_free(r);
}

void on_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol proto, AvahiBrowserEvent event,
               const char *name, const char *type, const char *domain, AvahiLookupResultFlags,
               void *user) {
  browse_ctx *ctx = (browse_ctx*)user;
  switch (event) {
    case AVAHI_BROWSER_NEW:
      sync_log(LOG_LVL_DEBUG, "discovery", "service %s in %s", name, domain);
      if (!avahi_service_resolver_new(ctx->client, iface, proto, name, type, domain, AVAHI_PROTO_INET,
                                      (AvahiLookupFlags)0, on_resolved, ctx)) {
        sync_log(LOG_LVL_WARN, "discovery", "resolver for %s: %s", name,
                 avahi_strerror(avahi_client_errno(ctx->client)));
      }
      break;
    case AVAHI_BROWSER_FAILURE:
      ctx->failed = true;
      ctx->fail_msg = std::string("browse: ") +
                      avahi_strerror(avahi_client_errno(avahi_service_browser_get_client(b)));
      avahi_simple_poll_quit(ctx->poll);
      break;
    case AVAHI_BROWSER_REMOVE:
    case AVAHI_BROWSER_CACHE_EXHAUSTED:
    case AVAHI_BROWSER_ALL_FOR_NOW:
      break;
  }
}

}  // namespace

bool discover(const std::string &service_type, int timeout_ms, net_endpoint *out, sync_error *err) {
  const std::string type = discovery_service_type(service_type);
  browse_ctx ctx;
  browse_cleanup cleanup{&ctx};

  ctx.poll = avahi_simple_poll_new();
  if (!ctx.poll) return set_error(err, sync_errc::DISCOVERY_TIMEOUT, "avahi: cannot create poll object");

  int aerr = 0;
  ctx.client = avahi_client_new(avahi_simple_poll_get(ctx.poll), (AvahiClientFlags)0, on_browse_client, &ctx, &aerr);
  if (!ctx.client) {
    return set_error(err, sync_errc::DISCOVERY_TIMEOUT, std::string("avahi: ") + avahi_strerror(aerr));
  }
  if (!avahi_service_browser_new(ctx.client, AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC, type.c_str(), NULL,
                                 (AvahiLookupFlags)0, on_browse, &ctx)) {
    return set_error(err, sync_errc::DISCOVERY_TIMEOUT,
                     "browse " + type + ": " + avahi_strerror(avahi_client_errno(ctx.client)));
  }
  sync_log(LOG_LVL_DEBUG, "discovery", "browse %s for %d ms", type.c_str(), timeout_ms);

  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (!ctx.found && !ctx.failed) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) break;
    int left = (int)std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    if (avahi_simple_poll_iterate(ctx.poll, left < k_poll_ms ? left : k_poll_ms) != 0) break;
  }

  if (ctx.found) {
    sync_log(LOG_LVL_INFO, "discovery", "found %s at %s", ctx.instance.c_str(), ctx.ep.to_string().c_str());
    if (out) *out = ctx.ep;
    return true;
  }
  if (ctx.failed) return set_error(err, sync_errc::DISCOVERY_TIMEOUT, ctx.fail_msg);
  return set_error(err, sync_errc::DISCOVERY_TIMEOUT,
                   "no answer for " + type + " within " + std::to_string(timeout_ms) + " ms");
}

// ---------------- responder ----------------
struct responder_impl {
  service_advert advert;
  std::string type;
  std::string name;                 // guarded by the threaded poll lock
  AvahiThreadedPoll *poll = nullptr;
  AvahiClient *client = nullptr;
  AvahiEntryGroup *group = nullptr;
  std::atomic<bool> established{false};

  void create_services(AvahiClient *c);
  void rename();

  static void on_client(AvahiClient *c, AvahiClientState state, void *user);
  static void on_group(AvahiEntryGroup *g, AvahiEntryGroupState state, void *user);
};

void responder_impl::rename() {
  char *alt = avahi_alternative_service_name(name.c_str());
  sync_log(LOG_LVL_WARN, "discovery", "service name collision, renaming '%s' to '%s'", name.c_str(), alt);
  name = alt;
  avahi_free(alt);
}

void responder_impl::create_services(AvahiClient *c) {
  if (!group) {
    group = avahi_entry_group_new(c, on_group, this);
    if (!group) {
      sync_log(LOG_LVL_ERROR, "discovery", "entry group: %s", avahi_strerror(avahi_client_errno(c)));
      return;
    }
  }
  if (!avahi_entry_group_is_empty(group)) return;

  for (;;) {
    int ret = avahi_entry_group_add_service(group, AVAHI_IF_UNSPEC, AVAHI_PROTO_UNSPEC, (AvahiPublishFlags)0,
                                            name.c_str(), type.c_str(), NULL,
                                            advert.host.empty() ? NULL : advert.host.c_str(),
                                            advert.port, "txtvers=1", NULL);
    if (ret == AVAHI_ERR_COLLISION) {
      rename();
      avahi_entry_group_reset(group);
      continue;
    }
    if (ret < 0) {
      sync_log(LOG_LVL_ERROR, "discovery", "add service %s: %s", type.c_str(), avahi_strerror(ret));
      return;
    }
    break;
  }
  int ret = avahi_entry_group_commit(group);
  if (ret < 0) sync_log(LOG_LVL_ERROR, "discovery", "commit %s: %s", type.c_str(), avahi_strerror(ret));
}

void responder_impl::on_group(AvahiEntryGroup *g, AvahiEntryGroupState state, void *user) {
  responder_impl *self = (responder_impl*)user;
  self->group = g;
  switch (state) {
    case AVAHI_ENTRY_GROUP_ESTABLISHED:
      self->established = true;
      sync_log(LOG_LVL_INFO, "discovery", "announce '%s' %s on udp %u", self->name.c_str(), self->type.c_str(),
               (unsigned)self->advert.port);
      break;
    case AVAHI_ENTRY_GROUP_COLLISION:
      self->established = false;
      self->rename();
      avahi_entry_group_reset(g);
      self->create_services(avahi_entry_group_get_client(g));
      break;
    case AVAHI_ENTRY_GROUP_FAILURE:
      self->established = false;
      sync_log(LOG_LVL_ERROR, "discovery", "entry group failure: %s",
               avahi_strerror(avahi_client_errno(avahi_entry_group_get_client(g))));
      break;
    case AVAHI_ENTRY_GROUP_UNCOMMITED:
    case AVAHI_ENTRY_GROUP_REGISTERING:
      break;
  }
}

void responder_impl::on_client(AvahiClient *c, AvahiClientState state, void *user) {
  responder_impl *self = (responder_impl*)user;
  switch (state) {
    case AVAHI_CLIENT_S_RUNNING:
      self->create_services(c);
      break;
    case AVAHI_CLIENT_S_COLLISION:
    case AVAHI_CLIENT_S_REGISTERING:
      // host name changed; publish again once the client is running
      self->established = false;
      if (self->group) avahi_entry_group_reset(self->group);
      break;
    case AVAHI_CLIENT_FAILURE:
      self->established = false;
      sync_log(LOG_LVL_ERROR, "discovery", "avahi client failure: %s", avahi_strerror(avahi_client_errno(c)));
      break;
    case AVAHI_CLIENT_CONNECTING:
      break;
  }
}

discovery_responder::discovery_responder() {}

discovery_responder::~discovery_responder() { stop(); }

bool discovery_responder::start(const service_advert &adv, sync_error *err) {
  if (impl) return true;
  std::unique_ptr<responder_impl> p(new responder_impl());
  p->advert = adv;
  p->type = discovery_service_type(adv.service_type);
  p->name = adv.instance;

  p->poll = avahi_threaded_poll_new();
  if (!p->poll) return set_error(err, sync_errc::TRANSPORT_BIND_FAILURE, "avahi: cannot create poll object");

  int aerr = 0;
  p->client = avahi_client_new(avahi_threaded_poll_get(p->poll), (AvahiClientFlags)0,
                               responder_impl::on_client, p.get(), &aerr);
  if (!p->client) {
    avahi_threaded_poll_free(p->poll);
    return set_error(err, sync_errc::TRANSPORT_BIND_FAILURE, std::string("avahi: ") + avahi_strerror(aerr));
  }
  if (avahi_threaded_poll_start(p->poll) < 0) {
    avahi_client_free(p->client);
    avahi_threaded_poll_free(p->poll);
    return set_error(err, sync_errc::TRANSPORT_BIND_FAILURE, "avahi: cannot start poll thread");
  }
  impl = std::move(p);
  return true;
}

void discovery_responder::stop() {
  if (!impl) return;
  avahi_threaded_poll_stop(impl->poll);
  // frees the entry group with it
  avahi_client_free(impl->client);
  avahi_threaded_poll_free(impl->poll);
  impl.reset();
}

bool discovery_responder::established() const {
  return impl && impl->established.load();
}

std::string discovery_responder::instance_name() const {
  if (!impl) return std::string();
  avahi_threaded_poll_lock(impl->poll);
  std::string n = impl->name;
  avahi_threaded_poll_unlock(impl->poll);
  return n;
}
