
#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace hdlcd {

// Accepts "host" or "host:port"; port is left untouched when absent.
bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::string bytes_to_hex(const uint8_t* data, size_t len, size_t max_bytes = 64);
inline std::string bytes_to_hex(const std::vector<uint8_t>& v, size_t max_bytes = 64) {
    return bytes_to_hex(v.data(), v.size(), max_bytes);
}
uint16_t read_be16(const uint8_t* p);

} // namespace hdlcd
