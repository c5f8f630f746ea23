#include "pixsync_wire.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>

static size_t pad4(size_t n) { return (n + 3u) & ~(size_t)3u; }

static void put_osc_string(std::vector<uint8_t> &o, const std::string &s) {
  size_t start = o.size();
  o.insert(o.end(), s.begin(), s.end());
  o.push_back(0);
  o.resize(start + pad4(s.size() + 1), 0);
}

static void put_be32(std::vector<uint8_t> &o, uint32_t v) {
  o.push_back((uint8_t)((v >> 24) & 0xFF));
  o.push_back((uint8_t)((v >> 16) & 0xFF));
  o.push_back((uint8_t)((v >> 8) & 0xFF));
  o.push_back((uint8_t)(v & 0xFF));
}

static uint32_t get_be32(const uint8_t *p) {
  return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

static bool get_osc_string(const uint8_t *data, size_t len, size_t *pos, std::string *out) {
  if (*pos >= len) return false;
  const uint8_t *start = data + *pos;
  const void *nul = memchr(start, 0, len - *pos);
  if (!nul) return false;
  size_t slen = (size_t)((const uint8_t*)nul - start);
  out->assign((const char*)start, slen);
  size_t next = *pos + pad4(slen + 1);
  // Tolerate a missing pad at the very end of the datagram.
  *pos = next > len ? len : next;
  return true;
}

bool pattern_is_blank(const std::string &pattern) {
  for (char c : pattern) {
    if (!isspace((unsigned char)c)) return false;
  }
  return true;
}

bool wire_encode(const std::string &pattern,
                 const std::vector<std::string> &args,
                 const std::vector<uint8_t> *blob,
                 std::vector<uint8_t> &out,
                 sync_error *err) {
  out.clear();
  put_osc_string(out, "/" + pattern);

  std::string tags = ",";
  tags.append(args.size(), 's');
  if (blob) tags.push_back('b');
  put_osc_string(out, tags);

  for (const auto &a : args) put_osc_string(out, a);

  if (blob) {
    put_be32(out, (uint32_t)blob->size());
    size_t start = out.size();
    out.insert(out.end(), blob->begin(), blob->end());
    out.resize(start + pad4(blob->size()), 0);
  }

  if (out.size() > PIXSYNC_MAX_PAYLOAD) {
    size_t n = out.size();
    out.clear();
    return set_error(err, sync_errc::PAYLOAD_TOO_LARGE,
                     "message " + pattern + " is " + std::to_string(n) + " bytes, limit is " +
                     std::to_string(PIXSYNC_MAX_PAYLOAD));
  }
  return true;
}

bool wire_encode_message(const sync_message &m, std::vector<uint8_t> &out, sync_error *err) {
  return wire_encode(m.pattern, m.args, m.has_blob ? &m.blob : nullptr, out, err);
}

bool wire_decode(const uint8_t *data, size_t len, sync_message &out, sync_error *err) {
  out = sync_message();
  if (!data || len == 0) return set_error(err, sync_errc::MALFORMED_MESSAGE, "empty datagram");

  size_t pos = 0;
  std::string addr;
  if (!get_osc_string(data, len, &pos, &addr)) {
    return set_error(err, sync_errc::MALFORMED_MESSAGE, "unterminated address pattern");
  }
  if (addr.empty() || addr[0] != '/') {
    return set_error(err, sync_errc::MALFORMED_MESSAGE, "address pattern must start with '/'");
  }
  out.pattern = addr.substr(1);
  if (pattern_is_blank(out.pattern)) out.pattern.clear();

  // Type tags are optional for very old senders: no tags means no arguments.
  if (pos >= len) return true;

  std::string tags;
  if (!get_osc_string(data, len, &pos, &tags) || tags.empty() || tags[0] != ',') {
    return set_error(err, sync_errc::MALFORMED_MESSAGE, "missing type tag string");
  }

  for (size_t t = 1; t < tags.size(); t++) {
    char tag = tags[t];
    switch (tag) {
      case 's':
      case 'S': {
        std::string s;
        if (!get_osc_string(data, len, &pos, &s)) {
          return set_error(err, sync_errc::MALFORMED_MESSAGE, "string argument out of bounds");
        }
        out.args.push_back(s);
        break;
      }
      case 'i': {
        if (pos + 4 > len) return set_error(err, sync_errc::MALFORMED_MESSAGE, "int argument out of bounds");
        int32_t v = (int32_t)get_be32(data + pos);
        pos += 4;
        out.args.push_back(std::to_string(v));
        break;
      }
      case 'f': {
        if (pos + 4 > len) return set_error(err, sync_errc::MALFORMED_MESSAGE, "float argument out of bounds");
        uint32_t bits = get_be32(data + pos);
        pos += 4;
        float f;
        memcpy(&f, &bits, sizeof(f));
        char buf[32];
        snprintf(buf, sizeof(buf), "%g", (double)f);
        out.args.push_back(buf);
        break;
      }
      case 'T': out.args.push_back("true"); break;
      case 'F': out.args.push_back("false"); break;
      case 'N': out.args.push_back(""); break;
      case 'b': {
        if (pos + 4 > len) return set_error(err, sync_errc::MALFORMED_MESSAGE, "blob size out of bounds");
        uint32_t n = get_be32(data + pos);
        pos += 4;
        if (n > len - pos) return set_error(err, sync_errc::MALFORMED_MESSAGE, "blob data out of bounds");
        out.blob.assign(data + pos, data + pos + n);
        out.has_blob = true;
        pos += pad4(n);
        if (pos > len) pos = len;
        break;
      }
      default: {
        char msg[64];
        snprintf(msg, sizeof(msg), "unsupported type tag '%c'", tag);
        return set_error(err, sync_errc::MALFORMED_MESSAGE, msg);
      }
    }
  }
  return true;
}
