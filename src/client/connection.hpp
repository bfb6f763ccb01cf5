
#pragma once
#include <asio.hpp>
#include <array>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>
#include "byte_stream.hpp"
#include "session_header.hpp"

namespace hdlcd {

// One TCP session with the daemon. At most one Reader may be active at a
// time; write() and close() may be called from any thread. A pending read
// notices close() or its stop flag within one poll interval.
class Connection {
public:
    using tcp = asio::ip::tcp;

    class Reader : public ByteStream {
    public:
        explicit Reader(Connection& conn, const std::atomic<bool>* stop = nullptr)
            : conn_(conn), stop_(stop) {}
        uint8_t read_byte() override;
        std::vector<uint8_t> read_exactly(size_t n) override;
        // A cancelled read rewinds to here so the next reader sees the
        // whole packet.
        void begin_packet() override { conn_.mark_ = conn_.rpos_; }
    private:
        void fill();

        Connection& conn_;
        const std::atomic<bool>* stop_;
    };

    Connection(std::string host, uint16_t port);
    ~Connection();
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Connects and sends the session header as the first bytes on the wire.
    void open(const SessionHeader& header);
    void write(const std::vector<uint8_t>& bytes);
    void close();
    bool closed() const { return closed_; }
    const std::string& endpoint() const { return endpoint_; }

private:
    void fill(const std::atomic<bool>* stop);
    void run_until(const bool& done);

    asio::io_context io_;
    tcp::socket sock_;
    std::string host_;
    uint16_t port_;
    std::string endpoint_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::atomic<int> writers_{0};
    std::atomic<bool> closed_{false};

    std::array<uint8_t, 4096> chunk_{};
    std::vector<uint8_t> rbuf_;
    size_t rpos_{0};
    size_t mark_{0};
};

} // namespace hdlcd
