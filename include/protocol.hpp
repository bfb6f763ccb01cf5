
#pragma once
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace hdlcd {

constexpr uint16_t kDefaultPort = 36962;
constexpr const char* kDefaultHost = "localhost";
constexpr uint8_t  kSessionVersion = 0;
constexpr size_t   kMaxPortNameLength = 255;
constexpr size_t   kMaxPayloadLength = 65535;

// Session header, byte 1 (SAP)
enum SapFlags : uint8_t {
    SAP_RX_DATA  = 0x01,
    SAP_TX_DATA  = 0x02,
    SAP_INVALIDS = 0x04
};

enum class TypeOfData : uint8_t {
    Payload        = 0,
    PortStatusOnly = 1,
    PayloadRaw     = 2,
    HdlcRaw        = 3,
    HdlcDissected  = 4
};
constexpr uint8_t kMaxTypeOfData = 4;

// Packet type field: upper nibble is the content id
enum TypeFlags : uint8_t {
    TF_WAS_SENT = 0x01,
    TF_INVALID  = 0x02,
    TF_RELIABLE = 0x04
};

enum class ContentId : uint8_t { Data = 0, Control = 1 };

// Control packet body: upper nibble selects the command or indication
enum class ControlCommand : uint8_t {
    PortStatus,
    Release,
    Lock,
    Echo,
    KeepAlive,
    PortKillRequest,
    Unknown
};

enum PortStatusFlags : uint8_t {
    PS_LOCKED_BY_ME     = 0x01,
    PS_LOCKED_BY_OTHERS = 0x02,
    PS_ALIVE            = 0x04
};

const char* to_string(TypeOfData t);
const char* to_string(ControlCommand c);
bool parse_type_of_data(const std::string& name, TypeOfData& out);

struct StreamError : std::runtime_error { using std::runtime_error::runtime_error; };
struct StreamEof : StreamError { using StreamError::StreamError; };
struct ReadCancelled : std::runtime_error { using std::runtime_error::runtime_error; };
struct ProtocolError : std::runtime_error { using std::runtime_error::runtime_error; };
struct UnsupportedOperation : std::logic_error { using std::logic_error::logic_error; };

} // namespace hdlcd
