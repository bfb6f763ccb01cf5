#include <doctest/doctest.h>
#include "byte_stream.hpp"
#include "packet.hpp"

using namespace hdlcd;

static std::unique_ptr<Packet> decode(std::vector<uint8_t> bytes) {
    MemoryStream in(std::move(bytes));
    return Packet::decode_one(in);
}

TEST_CASE("Empty unreliable data packet") {
    auto p = decode({0x00, 0x00, 0x00});
    auto* d = dynamic_cast<DataPacket*>(p.get());
    REQUIRE(d != nullptr);
    CHECK(d->content_id() == 0);
    CHECK(d->reliable() == false);
    CHECK(d->valid() == true);
    CHECK(d->was_sent() == false);
    CHECK(d->contains_data() == false);
    CHECK(d->payload().empty());
}

TEST_CASE("Reliable data packet with payload") {
    auto p = decode({0x04, 0x00, 0x03, 0x01, 0x02, 0x03});
    auto* d = dynamic_cast<DataPacket*>(p.get());
    REQUIRE(d != nullptr);
    CHECK(d->reliable() == true);
    CHECK(d->valid() == true);
    CHECK(d->contains_data() == true);
    CHECK(d->payload() == std::vector<uint8_t>{0x01, 0x02, 0x03});
}

TEST_CASE("Invalid and was_sent flags are taken from the type byte") {
    auto p = decode({0x07, 0x00, 0x00});
    REQUIRE(dynamic_cast<DataPacket*>(p.get()) != nullptr);
    CHECK(p->reliable());
    CHECK(p->invalid());
    CHECK_FALSE(p->valid());
    CHECK(p->was_sent());
    CHECK(p->type_field() == 0x07);
}

TEST_CASE("Port status control packet") {
    auto p = decode({0x10, 0x05});
    auto* c = dynamic_cast<ControlPacket*>(p.get());
    REQUIRE(c != nullptr);
    CHECK(c->content_id() == 1);
    CHECK(c->reliable() == false);
    CHECK(c->valid() == true);
    CHECK(c->contains_data() == false);
    CHECK(c->command() == ControlCommand::PortStatus);
    REQUIRE(c->information().has_value());
    CHECK(c->information()->alive == true);
    CHECK(c->information()->locked_by_others == false);
    CHECK(c->information()->locked_by_me == true);
}

TEST_CASE("Control confirmations carry no port information") {
    auto echo = decode({0x10, 0x10});
    auto* c = dynamic_cast<ControlPacket*>(echo.get());
    REQUIRE(c != nullptr);
    CHECK(c->command() == ControlCommand::Echo);
    CHECK_FALSE(c->information().has_value());

    auto unknown = decode({0x10, 0x70});
    c = dynamic_cast<ControlPacket*>(unknown.get());
    REQUIRE(c != nullptr);
    CHECK(c->command() == ControlCommand::Unknown);
    CHECK_FALSE(c->information().has_value());
}

TEST_CASE("Outbound control commands encode as type byte plus command byte") {
    CHECK(ControlPacket(ControlCommand::Lock).serialize() == std::vector<uint8_t>{0x10, 0x01});
    CHECK(ControlPacket(ControlCommand::Release).serialize() == std::vector<uint8_t>{0x10, 0x00});
    CHECK(ControlPacket(ControlCommand::Echo).serialize() == std::vector<uint8_t>{0x10, 0x10});
    CHECK(ControlPacket(ControlCommand::KeepAlive).serialize() == std::vector<uint8_t>{0x10, 0x20});
    CHECK(ControlPacket(ControlCommand::PortKillRequest).serialize() == std::vector<uint8_t>{0x10, 0x30});
    CHECK(ControlPacket().command() == ControlCommand::Release);
}

TEST_CASE("Echo and keep alive survive encode then decode") {
    for (auto cmd : {ControlCommand::Echo, ControlCommand::KeepAlive}) {
        ControlPacket out(cmd);
        auto in = decode(out.serialize());
        auto* c = dynamic_cast<ControlPacket*>(in.get());
        REQUIRE(c != nullptr);
        CHECK(c->command() == cmd);
        CHECK(c->reliable() == out.reliable());
        CHECK(c->invalid() == out.invalid());
        CHECK(c->was_sent() == out.was_sent());
    }
}

TEST_CASE("Control packets only accept the outbound command set") {
    CHECK_THROWS_AS(ControlPacket(ControlCommand::PortStatus), std::invalid_argument);
    CHECK_THROWS_AS(ControlPacket(ControlCommand::Unknown), std::invalid_argument);
    CHECK_THROWS_AS(ControlPacket((ControlCommand)42), std::invalid_argument);
}

TEST_CASE("Data packets and bare packets cannot be serialized") {
    CHECK_THROWS_AS(DataPacket(std::vector<uint8_t>{0x01, 0x02}).serialize(), UnsupportedOperation);
    CHECK_THROWS_AS(Packet().serialize(), UnsupportedOperation);

    auto status = decode({0x10, 0x04});
    CHECK_THROWS_AS(status->serialize(), UnsupportedOperation);
}

TEST_CASE("Unknown content id yields a bodiless packet") {
    MemoryStream in({0x24, 0x10, 0x05});
    auto p = Packet::decode_one(in);
    CHECK(dynamic_cast<DataPacket*>(p.get()) == nullptr);
    CHECK(dynamic_cast<ControlPacket*>(p.get()) == nullptr);
    CHECK(p->content_id() == 2);
    CHECK(p->reliable());

    // nothing beyond the type byte was consumed
    auto next = Packet::decode_one(in);
    CHECK(dynamic_cast<ControlPacket*>(next.get()) != nullptr);
}

TEST_CASE("Truncated data packets fail with end of stream") {
    CHECK_THROWS_AS(decode({}), StreamEof);
    CHECK_THROWS_AS(decode({0x00, 0x00}), StreamEof);
    CHECK_THROWS_AS(decode({0x04, 0x00, 0x05, 0x01, 0x02}), StreamEof);
    CHECK_THROWS_AS(decode({0x10}), StreamEof);
}

TEST_CASE("Debug rendering") {
    CHECK(decode({0x04, 0x00, 0x03, 0x01, 0x02, 0x03})->to_string() ==
          "<- DataPacket [reliable, valid] 3 bytes: 01 02 03");
    CHECK(decode({0x03, 0x00, 0x00})->to_string() ==
          "-> DataPacket [unreliable, invalid] 0 bytes");
    CHECK(decode({0x10, 0x05})->to_string() ==
          "<- ControlPacket [unreliable, valid] port_status (alive, locked by me)");
    CHECK(ControlPacket(ControlCommand::Lock).to_string() ==
          "<- ControlPacket [unreliable, valid] lock");
}

TEST_CASE("Port status equality is by value") {
    PortStatus a{true, false, true};
    PortStatus b{true, false, true};
    PortStatus c{true, true, false};
    CHECK(a == b);
    CHECK(a != c);
    CHECK(c.to_string() == "alive, locked by others");
    CHECK(PortStatus{}.to_string() == "dead, unlocked");
}
