
#include "util.hpp"
#include <cstdio>
#include <stdexcept>

namespace hdlcd {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  if (s.empty())
    return false;
  auto pos = s.rfind(':');
  if (pos == std::string::npos) {
    host = s;
    return true;
  }
  if (pos == 0)
    return false;
  try {
    size_t used = 0;
    std::string digits = s.substr(pos + 1);
    int p = std::stoi(digits, &used);
    if (used != digits.size() || p <= 0 || p > 65535)
      return false;
    host = s.substr(0, pos);
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string bytes_to_hex(const uint8_t *data, size_t len, size_t max_bytes) {
  std::string out;
  size_t n = len < max_bytes ? len : max_bytes;
  out.reserve(n * 3 + 4);
  char buf[4];
  for (size_t i = 0; i < n; i++) {
    std::snprintf(buf, sizeof(buf), i ? " %02x" : "%02x", data[i]);
    out += buf;
  }
  if (n < len)
    out += " ...";
  return out;
}

uint16_t read_be16(const uint8_t *p) {
  return (uint16_t)(((uint16_t)p[0] << 8) | p[1]);
}

} // namespace hdlcd
