
#include "connection.hpp"
#include "logging.hpp"
#include <chrono>

namespace hdlcd {

static constexpr auto kPollInterval = std::chrono::milliseconds(50);

Connection::Connection(std::string host, uint16_t port)
    : sock_(io_), host_(std::move(host)), port_(port),
      endpoint_(host_ + ":" + std::to_string(port_)) {}

Connection::~Connection() { close(); }

void Connection::open(const SessionHeader &header) {
  if (closed_)
    throw StreamEof(endpoint_ + ": connection closed");
  try {
    tcp::resolver resolver(io_);
    asio::connect(sock_, resolver.resolve(host_, std::to_string(port_)));
    sock_.set_option(tcp::no_delay(true));
  } catch (const asio::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "connect to %s failed: %s",
                           endpoint_.c_str(), e.what());
    throw StreamError(endpoint_ + ": connect failed: " + e.what());
  }
  Logger::instance().log(LogLevel::INFO, "connected to %s", endpoint_.c_str());

  // no reader exists yet, a plain blocking write is enough
  auto bytes = header.serialize();
  std::error_code ec;
  asio::write(sock_, asio::buffer(bytes), ec);
  if (ec)
    throw StreamError(endpoint_ + ": session header write failed: " +
                      ec.message());
  Logger::instance().log(LogLevel::DEBUG,
                         "session header sent to %s: port=%s type=%s sap=0x%02x",
                         endpoint_.c_str(), header.port_name().c_str(),
                         to_string(header.options().type_of_data),
                         (unsigned)header.sap());
}

void Connection::run_until(const bool &done) {
  while (!done) {
    if (io_.stopped())
      io_.restart();
    io_.run_one();
  }
}

void Connection::write(const std::vector<uint8_t> &bytes) {
  writers_.fetch_add(1);
  std::unique_lock<std::mutex> lk(mtx_);
  bool done = false;
  std::error_code wec;
  if (!closed_) {
    asio::async_write(sock_, asio::buffer(bytes),
                      [&](const std::error_code &ec, std::size_t) {
                        done = true;
                        wec = ec;
                      });
    run_until(done);
  }
  writers_.fetch_sub(1);
  lk.unlock();
  cv_.notify_all();
  if (closed_)
    throw StreamEof(endpoint_ + ": connection closed");
  if (wec)
    throw StreamError(endpoint_ + ": write failed: " + wec.message());
}

void Connection::fill(const std::atomic<bool> *stop) {
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait(lk, [this] { return writers_ == 0; });
  if (closed_)
    throw StreamEof(endpoint_ + ": connection closed");
  if (stop && *stop)
    throw ReadCancelled(endpoint_ + ": read cancelled");

  bool done = false;
  std::error_code rec;
  size_t got = 0;
  sock_.async_read_some(asio::buffer(chunk_),
                        [&](const std::error_code &ec, std::size_t n) {
                          done = true;
                          rec = ec;
                          got = n;
                        });
  while (!done) {
    if (io_.stopped())
      io_.restart();
    io_.run_for(kPollInterval);
    if (done)
      break;
    if (closed_ || (stop && *stop)) {
      std::error_code ignored;
      sock_.cancel(ignored);
      run_until(done);
      break;
    }
    if (writers_ > 0)
      cv_.wait(lk, [this] { return writers_ == 0; });
  }

  // bytes that arrived before a cancel are kept for the next reader
  if (got > 0) {
    if (mark_ > 0) {
      rbuf_.erase(rbuf_.begin(), rbuf_.begin() + mark_);
      rpos_ -= mark_;
      mark_ = 0;
    }
    rbuf_.insert(rbuf_.end(), chunk_.begin(), chunk_.begin() + got);
    return;
  }
  if (!rec)
    return;
  if (rec == asio::error::operation_aborted) {
    if (closed_)
      throw StreamEof(endpoint_ + ": connection closed");
    throw ReadCancelled(endpoint_ + ": read cancelled");
  }
  if (rec == asio::error::eof)
    throw StreamEof(endpoint_ + ": connection closed by peer");
  throw StreamError(endpoint_ + ": read failed: " + rec.message());
}

void Connection::close() {
  if (closed_.exchange(true))
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  if (!sock_.is_open())
    return;
  std::error_code ec;
  sock_.shutdown(tcp::socket::shutdown_both, ec);
  sock_.close(ec);
  Logger::instance().log(LogLevel::INFO, "closed connection to %s",
                         endpoint_.c_str());
}

void Connection::Reader::fill() {
  try {
    conn_.fill(stop_);
  } catch (const ReadCancelled &) {
    conn_.rpos_ = conn_.mark_;
    throw;
  }
}

uint8_t Connection::Reader::read_byte() {
  while (conn_.rpos_ >= conn_.rbuf_.size())
    fill();
  return conn_.rbuf_[conn_.rpos_++];
}

std::vector<uint8_t> Connection::Reader::read_exactly(size_t n) {
  while (conn_.rbuf_.size() - conn_.rpos_ < n)
    fill();
  auto first = conn_.rbuf_.begin() + conn_.rpos_;
  std::vector<uint8_t> out(first, first + n);
  conn_.rpos_ += n;
  return out;
}

} // namespace hdlcd
