
#include "packet.hpp"
#include "byte_stream.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace hdlcd {

namespace {

using Decoder = std::unique_ptr<Packet> (*)(ByteStream &);

struct DecoderEntry {
  ContentId id;
  Decoder decode;
};

const DecoderEntry kDecoders[] = {
    {ContentId::Data,
     [](ByteStream &in) -> std::unique_ptr<Packet> {
       return DataPacket::decode(in);
     }},
    {ContentId::Control,
     [](ByteStream &in) -> std::unique_ptr<Packet> {
       return ControlPacket::decode(in);
     }},
};

Decoder find_decoder(uint8_t content_id) {
  for (const auto &e : kDecoders)
    if ((uint8_t)e.id == content_id)
      return e.decode;
  return nullptr;
}

struct CommandCode {
  ControlCommand command;
  uint8_t code;
};

// Outbound commands
const CommandCode kCommands[] = {
    {ControlCommand::Lock, 0x01},
    {ControlCommand::Release, 0x00},
    {ControlCommand::Echo, 0x10},
    {ControlCommand::KeepAlive, 0x20},
    {ControlCommand::PortKillRequest, 0x30},
};

// Inbound indications and confirmations, matched on the upper nibble
const CommandCode kIndications[] = {
    {ControlCommand::PortStatus, 0x00},
    {ControlCommand::Echo, 0x10},
    {ControlCommand::KeepAlive, 0x20},
};

const CommandCode *find_command(ControlCommand c) {
  for (const auto &e : kCommands)
    if (e.command == c)
      return &e;
  return nullptr;
}

std::vector<uint8_t> read_field(ByteStream &in, size_t n, const char *what) {
  try {
    return in.read_exactly(n);
  } catch (const StreamEof &e) {
    throw StreamEof(std::string("unexpected EOF while reading ") + what +
                    ": " + e.what());
  }
}

} // namespace

std::string PortStatus::to_string() const {
  std::string s = alive ? "alive" : "dead";
  if (locked_by_me)
    s += ", locked by me";
  if (locked_by_others)
    s += ", locked by others";
  if (!locked_by_me && !locked_by_others)
    s += ", unlocked";
  return s;
}

uint8_t Packet::type_field() const {
  uint8_t t = (uint8_t)(content_id_ << 4);
  if (reliable_)
    t |= TF_RELIABLE;
  if (invalid_)
    t |= TF_INVALID;
  if (was_sent_)
    t |= TF_WAS_SENT;
  return t;
}

std::vector<uint8_t> Packet::serialize() const {
  throw UnsupportedOperation(std::string(name()) +
                             " does not support serialization");
}

std::string Packet::to_string() const {
  std::string s = was_sent_ ? "-> " : "<- ";
  s += name();
  s += reliable_ ? " [reliable, " : " [unreliable, ";
  s += invalid_ ? "invalid]" : "valid]";
  std::string d = detail();
  if (!d.empty()) {
    s += ' ';
    s += d;
  }
  return s;
}

void Packet::set_fields(uint8_t content_id, bool reliable, bool invalid,
                        bool was_sent) {
  content_id_ = content_id;
  reliable_ = reliable;
  invalid_ = invalid;
  was_sent_ = was_sent;
}

std::unique_ptr<Packet> Packet::decode_one(ByteStream &in) {
  uint8_t type = in.read_byte();
  uint8_t content_id = type >> 4;

  std::unique_ptr<Packet> packet;
  if (Decoder decode = find_decoder(content_id)) {
    packet = decode(in);
  } else {
    Logger::instance().log(LogLevel::WARN,
                           "no decoder for content id %u, assuming empty body",
                           (unsigned)content_id);
    packet.reset(new Packet());
  }
  packet->set_fields(content_id, (type & TF_RELIABLE) != 0,
                     (type & TF_INVALID) != 0, (type & TF_WAS_SENT) != 0);
  return packet;
}

DataPacket::DataPacket(std::vector<uint8_t> payload, bool reliable)
    : Packet((uint8_t)ContentId::Data, reliable), payload_(std::move(payload)) {
}

std::unique_ptr<DataPacket> DataPacket::decode(ByteStream &in) {
  auto len = read_field(in, 2, "DataPacket length");
  auto payload = read_field(in, read_be16(len.data()), "DataPacket payload");
  return std::unique_ptr<DataPacket>(new DataPacket(std::move(payload)));
}

std::string DataPacket::detail() const {
  std::string s = std::to_string(payload_.size()) + " bytes";
  if (!payload_.empty())
    s += ": " + bytes_to_hex(payload_);
  return s;
}

// control packets always carry zero flags
ControlPacket::ControlPacket(ControlCommand command)
    : Packet((uint8_t)ContentId::Control, false), command_(command) {
  if (!find_command(command))
    throw std::invalid_argument(std::string("invalid control command: ") +
                                hdlcd::to_string(command));
}

std::vector<uint8_t> ControlPacket::serialize() const {
  const CommandCode *cc = find_command(command_);
  if (!cc)
    throw UnsupportedOperation(std::string("cannot send control indication ") +
                               hdlcd::to_string(command_));
  return {type_field(), cc->code};
}

std::unique_ptr<ControlPacket> ControlPacket::decode(ByteStream &in) {
  uint8_t data = in.read_byte();
  std::unique_ptr<ControlPacket> packet(new ControlPacket());
  packet->command_ = ControlCommand::Unknown;
  for (const auto &e : kIndications) {
    if (e.code == (data & 0xF0)) {
      packet->command_ = e.command;
      break;
    }
  }
  if (packet->command_ == ControlCommand::PortStatus) {
    PortStatus ps;
    ps.alive = (data & PS_ALIVE) != 0;
    ps.locked_by_others = (data & PS_LOCKED_BY_OTHERS) != 0;
    ps.locked_by_me = (data & PS_LOCKED_BY_ME) != 0;
    packet->information_ = ps;
  }
  return packet;
}

std::string ControlPacket::detail() const {
  std::string s = hdlcd::to_string(command_);
  if (information_)
    s += " (" + information_->to_string() + ")";
  return s;
}

} // namespace hdlcd
