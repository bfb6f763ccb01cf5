
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace hdlcd {

class ByteStream;

struct PortStatus {
    bool alive{false};
    bool locked_by_others{false};
    bool locked_by_me{false};

    bool operator==(const PortStatus& o) const {
        return alive == o.alive && locked_by_others == o.locked_by_others &&
               locked_by_me == o.locked_by_me;
    }
    bool operator!=(const PortStatus& o) const { return !(*this == o); }
    std::string to_string() const;
};

// A message exchanged with the daemon: one type byte
// (content id | reliable | invalid | was_sent) followed by a variant body.
class Packet {
public:
    Packet() = default;
    virtual ~Packet() = default;

    uint8_t content_id() const { return content_id_; }
    bool reliable() const { return reliable_; }
    bool invalid() const { return invalid_; }
    bool valid() const { return !invalid_; }
    bool was_sent() const { return was_sent_; }
    uint8_t type_field() const;

    virtual bool contains_data() const { return false; }
    virtual const char* name() const { return "Packet"; }
    // Throws UnsupportedOperation unless the variant can be sent.
    virtual std::vector<uint8_t> serialize() const;
    std::string to_string() const;

    // Reads the type byte and the variant body. A content id without a
    // decoder yields a bare Packet and consumes nothing further.
    static std::unique_ptr<Packet> decode_one(ByteStream& in);

protected:
    Packet(uint8_t content_id, bool reliable) : content_id_(content_id), reliable_(reliable) {}
    virtual std::string detail() const { return {}; }

private:
    void set_fields(uint8_t content_id, bool reliable, bool invalid, bool was_sent);

    uint8_t content_id_{0};
    bool reliable_{true};
    bool invalid_{false};
    bool was_sent_{false};
};

class DataPacket : public Packet {
public:
    explicit DataPacket(std::vector<uint8_t> payload = {}, bool reliable = true);
    const std::vector<uint8_t>& payload() const { return payload_; }
    bool contains_data() const override { return !payload_.empty(); }
    const char* name() const override { return "DataPacket"; }
    static std::unique_ptr<DataPacket> decode(ByteStream& in);
protected:
    std::string detail() const override;
private:
    std::vector<uint8_t> payload_;
};

class ControlPacket : public Packet {
public:
    // Only lock, release, echo, keep_alive and port_kill_request can be sent;
    // anything else throws std::invalid_argument.
    explicit ControlPacket(ControlCommand command = ControlCommand::Release);
    ControlCommand command() const { return command_; }
    // Set only for decoded port_status indications.
    const std::optional<PortStatus>& information() const { return information_; }
    const char* name() const override { return "ControlPacket"; }
    std::vector<uint8_t> serialize() const override;
    static std::unique_ptr<ControlPacket> decode(ByteStream& in);
protected:
    std::string detail() const override;
private:
    ControlCommand command_;
    std::optional<PortStatus> information_;
};

} // namespace hdlcd
