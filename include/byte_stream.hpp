
#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

namespace hdlcd {

// Blocking byte source. Both reads throw StreamEof on a short read.
class ByteStream {
public:
    virtual ~ByteStream() = default;
    virtual uint8_t read_byte() = 0;
    virtual std::vector<uint8_t> read_exactly(size_t n) = 0;
    // Called before the first byte of each packet.
    virtual void begin_packet() {}
};

class MemoryStream : public ByteStream {
public:
    explicit MemoryStream(std::vector<uint8_t> data) : data_(std::move(data)) {}
    uint8_t read_byte() override;
    std::vector<uint8_t> read_exactly(size_t n) override;
    size_t remaining() const { return data_.size() - pos_; }
private:
    std::vector<uint8_t> data_;
    size_t pos_{0};
};

} // namespace hdlcd
