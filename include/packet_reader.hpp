
#pragma once
#include <functional>
#include <memory>
#include "packet.hpp"

namespace hdlcd {

class ByteStream;

enum class PacketFilter { All, Data, Control };

bool matches(const Packet& packet, PacketFilter filter);

// Pulls packets off a stream one at a time. Packets rejected by the filter
// are still fully consumed. There is no end of sequence: next() blocks until
// a matching packet arrives or throws once the stream fails.
class PacketReader {
public:
    PacketReader(ByteStream& in, PacketFilter filter = PacketFilter::All)
        : in_(in), filter_(filter) {}
    std::unique_ptr<Packet> next();
private:
    ByteStream& in_;
    PacketFilter filter_;
};

// Invokes fn for every matching packet until the stream throws.
void for_each_packet(ByteStream& in, PacketFilter filter,
                     const std::function<void(const Packet&)>& fn);

} // namespace hdlcd
