
#include "session_header.hpp"
#include "byte_stream.hpp"

namespace hdlcd {

SessionHeader::SessionHeader(std::string port_name, const SessionOptions &opts)
    : port_name_(std::move(port_name)), opts_(opts) {
  if (port_name_.size() > kMaxPortNameLength)
    throw std::invalid_argument("serial port name longer than 255 bytes");
  if ((uint8_t)opts_.type_of_data > kMaxTypeOfData)
    throw std::invalid_argument("invalid type of data: " +
                                std::to_string((int)opts_.type_of_data));
}

uint8_t SessionHeader::sap() const {
  uint8_t sap = 0;
  if (opts_.rx_data)
    sap |= SAP_RX_DATA;
  if (opts_.tx_data)
    sap |= SAP_TX_DATA;
  if (opts_.invalids)
    sap |= SAP_INVALIDS;
  sap |= (uint8_t)((uint8_t)opts_.type_of_data << 4);
  return sap;
}

std::vector<uint8_t> SessionHeader::serialize() const {
  std::vector<uint8_t> out;
  out.reserve(3 + port_name_.size());
  out.push_back(opts_.version);
  out.push_back(sap());
  out.push_back((uint8_t)port_name_.size());
  out.insert(out.end(), port_name_.begin(), port_name_.end());
  return out;
}

SessionHeader SessionHeader::deserialize(ByteStream &in) {
  auto fixed = in.read_exactly(3);
  uint8_t sap = fixed[1];
  uint8_t type = sap >> 4;
  if (type > kMaxTypeOfData)
    throw ProtocolError("session header: invalid type of data " +
                        std::to_string((int)type));
  SessionOptions opts;
  opts.version = fixed[0];
  opts.type_of_data = (TypeOfData)type;
  opts.rx_data = (sap & SAP_RX_DATA) != 0;
  opts.tx_data = (sap & SAP_TX_DATA) != 0;
  opts.invalids = (sap & SAP_INVALIDS) != 0;
  auto name = in.read_exactly(fixed[2]);
  return SessionHeader(std::string(name.begin(), name.end()), opts);
}

} // namespace hdlcd
