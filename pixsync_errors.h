#pragma once
#include <string>

// Error codes reported by the protocol layer. Only TRANSPORT_BIND_FAILURE and
// BOOTSTRAP_TIMEOUT end a bootstrap session; everything else drops a single
// message (or, for DISCOVERY_TIMEOUT, falls back to the default endpoint).
enum class sync_errc {
  OK = 0,
  MALFORMED_MESSAGE,
  UNKNOWN_COMMAND,
  ARGUMENT_COUNT_MISMATCH,
  DESERIALIZATION_ERROR,
  DISCOVERY_TIMEOUT,
  TRANSPORT_BIND_FAILURE,
  BOOTSTRAP_TIMEOUT,
  PAYLOAD_TOO_LARGE,
  SEND_FAILURE,
};

struct sync_error {
  sync_errc code = sync_errc::OK;
  std::string message;

  bool ok() const { return code == sync_errc::OK; }
  void clear() { code = sync_errc::OK; message.clear(); }
};

const char *sync_errc_name(sync_errc c);

// Fills *err (if non-null) and returns false, so callers can write
// `return set_error(err, sync_errc::X, "...");`
bool set_error(sync_error *err, sync_errc code, const std::string &msg);
