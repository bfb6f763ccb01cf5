
#include "byte_stream.hpp"
#include "packet_reader.hpp"
#include "logging.hpp"

namespace hdlcd {

bool matches(const Packet &packet, PacketFilter filter) {
  switch (filter) {
  case PacketFilter::Data:
    return dynamic_cast<const DataPacket *>(&packet) != nullptr;
  case PacketFilter::Control:
    return dynamic_cast<const ControlPacket *>(&packet) != nullptr;
  default:
    return true;
  }
}

std::unique_ptr<Packet> PacketReader::next() {
  for (;;) {
    in_.begin_packet();
    auto packet = Packet::decode_one(in_);
    auto &log = Logger::instance();
    if (log.enabled(LogLevel::TRACE))
      log.log(LogLevel::TRACE, "%s", packet->to_string().c_str());
    if (matches(*packet, filter_))
      return packet;
  }
}

void for_each_packet(ByteStream &in, PacketFilter filter,
                     const std::function<void(const Packet &)> &fn) {
  PacketReader reader(in, filter);
  for (;;) {
    auto packet = reader.next();
    fn(*packet);
  }
}

} // namespace hdlcd
