#include <doctest/doctest.h>
#include "byte_stream.hpp"
#include "packet_reader.hpp"

using namespace hdlcd;

// data(AA), port status, data(empty), echo, data(BB CC)
static std::vector<uint8_t> mixed_stream() {
    return {0x04, 0x00, 0x01, 0xAA,
            0x10, 0x05,
            0x00, 0x00, 0x00,
            0x10, 0x10,
            0x04, 0x00, 0x02, 0xBB, 0xCC};
}

TEST_CASE("Reader yields every packet in order without a filter") {
    MemoryStream in(mixed_stream());
    PacketReader reader(in);

    CHECK(dynamic_cast<DataPacket*>(reader.next().get()) != nullptr);
    CHECK(dynamic_cast<ControlPacket*>(reader.next().get()) != nullptr);
    CHECK(dynamic_cast<DataPacket*>(reader.next().get()) != nullptr);
    CHECK(dynamic_cast<ControlPacket*>(reader.next().get()) != nullptr);
    CHECK(dynamic_cast<DataPacket*>(reader.next().get()) != nullptr);
    CHECK_THROWS_AS(reader.next(), StreamEof);
}

TEST_CASE("Data filter skips control packets but keeps alignment") {
    MemoryStream in(mixed_stream());
    std::vector<std::vector<uint8_t>> payloads;

    CHECK_THROWS_AS(for_each_packet(in, PacketFilter::Data, [&](const Packet& p) {
        payloads.push_back(static_cast<const DataPacket&>(p).payload());
    }), StreamEof);

    REQUIRE(payloads.size() == 3);
    CHECK(payloads[0] == std::vector<uint8_t>{0xAA});
    CHECK(payloads[1].empty());
    CHECK(payloads[2] == std::vector<uint8_t>{0xBB, 0xCC});
    CHECK(in.remaining() == 0);
}

TEST_CASE("Control filter yields only control packets") {
    MemoryStream in(mixed_stream());
    PacketReader reader(in, PacketFilter::Control);

    auto first = reader.next();
    auto* c = dynamic_cast<ControlPacket*>(first.get());
    REQUIRE(c != nullptr);
    CHECK(c->command() == ControlCommand::PortStatus);

    auto second = reader.next();
    c = dynamic_cast<ControlPacket*>(second.get());
    REQUIRE(c != nullptr);
    CHECK(c->command() == ControlCommand::Echo);

    // the trailing data packet is consumed before the stream runs dry
    CHECK_THROWS_AS(reader.next(), StreamEof);
    CHECK(in.remaining() == 0);
}

TEST_CASE("Truncated payload ends the iteration with end of stream") {
    MemoryStream in({0x00, 0x00, 0x01, 0x11, 0x04, 0x00, 0x08, 0x01, 0x02});
    int seen = 0;
    CHECK_THROWS_AS(for_each_packet(in, PacketFilter::All, [&](const Packet&) { ++seen; }),
                    StreamEof);
    CHECK(seen == 1);
}

TEST_CASE("Filter matching") {
    DataPacket d;
    ControlPacket c;
    CHECK(matches(d, PacketFilter::All));
    CHECK(matches(d, PacketFilter::Data));
    CHECK_FALSE(matches(d, PacketFilter::Control));
    CHECK(matches(c, PacketFilter::Control));
    CHECK_FALSE(matches(c, PacketFilter::Data));
}
