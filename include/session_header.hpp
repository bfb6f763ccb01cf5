
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace hdlcd {

class ByteStream;

struct SessionOptions {
    uint8_t version{kSessionVersion};
    TypeOfData type_of_data{TypeOfData::Payload};
    bool invalids{false};
    bool tx_data{false};
    bool rx_data{true};
};

// First message on every connection to the daemon: version, SAP byte,
// length-prefixed serial port name.
class SessionHeader {
public:
    explicit SessionHeader(std::string port_name, const SessionOptions& opts = SessionOptions{});
    const std::string& port_name() const { return port_name_; }
    const SessionOptions& options() const { return opts_; }
    uint8_t sap() const;
    std::vector<uint8_t> serialize() const;
    static SessionHeader deserialize(ByteStream& in);
private:
    std::string port_name_;
    SessionOptions opts_;
};

} // namespace hdlcd
