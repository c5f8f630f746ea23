#pragma once
#include <stdint.h>
#include <exception>
#include <vector>
#include <nlohmann/json.hpp>
#include "pixsync_errors.h"
#include "pixsync_state.h"
#include "pixsync_wire.h"

// Object <-> blob conversion. A blob is CBOR of
//   {"kind": "<state kind name>", "data": <object>}
// and never larger than PIXSYNC_MAX_PAYLOAD. Larger objects are a deployment
// configuration error (matrix too big for one datagram); they are not split.

bool reassembler_pack(state_kind kind, const nlohmann::json &data, std::vector<uint8_t> &out, sync_error *err);

// Checks envelope and kind; on success `data` holds the inner object.
bool reassembler_unpack(const std::vector<uint8_t> &in, state_kind expected, nlohmann::json &data, sync_error *err);

// Reads only the envelope kind (used for diagnostics).
bool reassembler_peek_kind(const std::vector<uint8_t> &in, state_kind *out);

template <typename T>
bool reassembler_serialize(const T &obj, std::vector<uint8_t> &out, sync_error *err) {
  nlohmann::json data;
  try {
    data = obj;
  } catch (const std::exception &e) {
    return set_error(err, sync_errc::DESERIALIZATION_ERROR,
                     std::string("cannot convert ") + state_kind_name(state_traits<T>::kind) + ": " + e.what());
  }
  return reassembler_pack(state_traits<T>::kind, data, out, err);
}

template <typename T>
bool reassembler_deserialize(const std::vector<uint8_t> &in, T &out, sync_error *err) {
  nlohmann::json data;
  if (!reassembler_unpack(in, state_traits<T>::kind, data, err)) return false;
  try {
    T tmp = data.get<T>();
    out = std::move(tmp);
  } catch (const std::exception &e) {
    return set_error(err, sync_errc::DESERIALIZATION_ERROR,
                     std::string("bad ") + state_kind_name(state_traits<T>::kind) + " payload: " + e.what());
  }
  return true;
}
