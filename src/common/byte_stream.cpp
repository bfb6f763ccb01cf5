
#include "byte_stream.hpp"
#include "protocol.hpp"

namespace hdlcd {

uint8_t MemoryStream::read_byte() {
  if (pos_ >= data_.size())
    throw StreamEof("end of buffer");
  return data_[pos_++];
}

std::vector<uint8_t> MemoryStream::read_exactly(size_t n) {
  if (remaining() < n) {
    pos_ = data_.size();
    throw StreamEof("end of buffer");
  }
  std::vector<uint8_t> out(data_.begin() + pos_, data_.begin() + pos_ + n);
  pos_ += n;
  return out;
}

} // namespace hdlcd
