#include "pixsync_reassembler.h"

using nlohmann::json;

bool reassembler_pack(state_kind kind, const json &data, std::vector<uint8_t> &out, sync_error *err) {
  json env;
  env["kind"] = state_kind_name(kind);
  env["data"] = data;
  try {
    out = json::to_cbor(env);
  } catch (const json::exception &e) {
    out.clear();
    return set_error(err, sync_errc::DESERIALIZATION_ERROR, std::string("cbor encode failed: ") + e.what());
  }
  if (out.size() > PIXSYNC_MAX_PAYLOAD) {
    size_t n = out.size();
    out.clear();
    return set_error(err, sync_errc::PAYLOAD_TOO_LARGE,
                     std::string(state_kind_name(kind)) + " needs " + std::to_string(n) +
                     " bytes, max payload is " + std::to_string(PIXSYNC_MAX_PAYLOAD));
  }
  return true;
}

static bool parse_envelope(const std::vector<uint8_t> &in, json &env, sync_error *err) {
  if (in.empty()) return set_error(err, sync_errc::DESERIALIZATION_ERROR, "empty payload");
  if (in.size() > PIXSYNC_MAX_PAYLOAD) return set_error(err, sync_errc::DESERIALIZATION_ERROR, "payload exceeds max size");
  env = json::from_cbor(in, true, false);
  if (env.is_discarded()) return set_error(err, sync_errc::DESERIALIZATION_ERROR, "payload is not valid CBOR");
  if (!env.is_object() || !env.contains("kind") || !env.contains("data") || !env["kind"].is_string()) {
    return set_error(err, sync_errc::DESERIALIZATION_ERROR, "payload envelope missing kind/data");
  }
  return true;
}

bool reassembler_unpack(const std::vector<uint8_t> &in, state_kind expected, json &data, sync_error *err) {
  json env;
  if (!parse_envelope(in, env, err)) return false;
  std::string kind = env["kind"].get<std::string>();
  if (kind != state_kind_name(expected)) {
    return set_error(err, sync_errc::DESERIALIZATION_ERROR,
                     "expected " + std::string(state_kind_name(expected)) + " payload, got " + kind);
  }
  data = std::move(env["data"]);
  return true;
}

bool reassembler_peek_kind(const std::vector<uint8_t> &in, state_kind *out) {
  json env;
  if (!parse_envelope(in, env, nullptr)) return false;
  return state_kind_from_name(env["kind"].get<std::string>(), out);
}
