
#include "protocol.hpp"

namespace hdlcd {

namespace {
struct TypeOfDataName {
  TypeOfData type;
  const char *name;
};
const TypeOfDataName kTypeOfDataNames[] = {
    {TypeOfData::Payload, "payload"},
    {TypeOfData::PortStatusOnly, "port_status_only"},
    {TypeOfData::PayloadRaw, "payload_raw"},
    {TypeOfData::HdlcRaw, "hdlc_raw"},
    {TypeOfData::HdlcDissected, "hdlc_dissected"},
};
} // namespace

const char *to_string(TypeOfData t) {
  for (const auto &e : kTypeOfDataNames)
    if (e.type == t)
      return e.name;
  return "unknown";
}

bool parse_type_of_data(const std::string &name, TypeOfData &out) {
  for (const auto &e : kTypeOfDataNames) {
    if (name == e.name) {
      out = e.type;
      return true;
    }
  }
  return false;
}

const char *to_string(ControlCommand c) {
  switch (c) {
  case ControlCommand::PortStatus:
    return "port_status";
  case ControlCommand::Release:
    return "release";
  case ControlCommand::Lock:
    return "lock";
  case ControlCommand::Echo:
    return "echo";
  case ControlCommand::KeepAlive:
    return "keep_alive";
  case ControlCommand::PortKillRequest:
    return "port_kill_request";
  default:
    return "unknown";
  }
}

} // namespace hdlcd
