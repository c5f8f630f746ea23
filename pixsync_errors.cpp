#include "pixsync_errors.h"

const char *sync_errc_name(sync_errc c) {
  switch (c) {
    case sync_errc::OK:                      return "OK";
    case sync_errc::MALFORMED_MESSAGE:       return "MalformedMessage";
    case sync_errc::UNKNOWN_COMMAND:         return "UnknownCommand";
    case sync_errc::ARGUMENT_COUNT_MISMATCH: return "ArgumentCountMismatch";
    case sync_errc::DESERIALIZATION_ERROR:   return "DeserializationError";
    case sync_errc::DISCOVERY_TIMEOUT:       return "DiscoveryTimeout";
    case sync_errc::TRANSPORT_BIND_FAILURE:  return "TransportBindFailure";
    case sync_errc::BOOTSTRAP_TIMEOUT:       return "BootstrapTimeout";
    case sync_errc::PAYLOAD_TOO_LARGE:       return "PayloadTooLarge";
    case sync_errc::SEND_FAILURE:            return "SendFailure";
  }
  return "Unknown";
}

bool set_error(sync_error *err, sync_errc code, const std::string &msg) {
  if (err) {
    err->code = code;
    err->message = msg;
  }
  return false;
}
