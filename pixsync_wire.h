#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "pixsync_errors.h"

// Upper bound for one datagram, both directions. Sized to hold a complete
// image buffer of the target matrix. Authority and mirror builds must agree.
#define PIXSYNC_MAX_PAYLOAD (32 * 1024)

struct net_endpoint {
  std::string host;   // dotted IPv4 or hostname
  uint16_t port = 0;

  bool empty() const { return host.empty(); }
  bool operator==(const net_endpoint &o) const { return host == o.host && port == o.port; }
  bool operator!=(const net_endpoint &o) const { return !(*this == o); }
  std::string to_string() const { return host + ":" + std::to_string(port); }
};

// One decoded OSC message. `pattern` is the command symbol without the
// leading '/'. Immutable once handed to a handler.
struct sync_message {
  std::string pattern;
  std::vector<std::string> args;
  bool has_blob = false;
  std::vector<uint8_t> blob;
  net_endpoint source;
};

// OSC 1.0 encoding: "/" + pattern, type tags (",s...b"), string args, optional blob.
// Fails with PAYLOAD_TOO_LARGE if the datagram would exceed PIXSYNC_MAX_PAYLOAD.
bool wire_encode(const std::string &pattern,
                 const std::vector<std::string> &args,
                 const std::vector<uint8_t> *blob,
                 std::vector<uint8_t> &out,
                 sync_error *err);

bool wire_encode_message(const sync_message &m, std::vector<uint8_t> &out, sync_error *err);

// Decodes one datagram. Accepts s/b plus i/f/T/F/N tags from other OSC
// senders (numbers are converted to their decimal text). Fails with
// MALFORMED_MESSAGE when the address or an argument cannot be extracted.
// A blank address ("/" or whitespace) decodes to an empty pattern.
bool wire_decode(const uint8_t *data, size_t len, sync_message &out, sync_error *err);

bool pattern_is_blank(const std::string &pattern);
