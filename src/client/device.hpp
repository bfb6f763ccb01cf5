
#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "packet.hpp"
#include "packet_reader.hpp"
#include "protocol.hpp"
#include "session_header.hpp"

namespace hdlcd {

class Connection;

struct DeviceConfig {
    std::string host{kDefaultHost};
    uint16_t port{kDefaultPort};
    SessionOptions data_options{};
};

// Access to one serial port through the daemon. Owns a data connection and
// a control connection, each opened on first use and never reopened. While
// nobody iterates the control connection explicitly, a background thread
// reads it and keeps port_status() current.
class Device {
public:
    Device(std::string port_name, const DeviceConfig& cfg = DeviceConfig{});
    ~Device();
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    void lock() { send_control(ControlCommand::Lock); }
    void release() { send_control(ControlCommand::Release); }
    void echo() { send_control(ControlCommand::Echo); }
    void keep_alive() { send_control(ControlCommand::KeepAlive); }
    void kill_port() { send_control(ControlCommand::PortKillRequest); }
    void send_control(ControlCommand command);

    // The each_* calls block until the connection fails or is closed and
    // report that by throwing StreamError.
    void each_data_packet(const std::function<void(const DataPacket&)>& fn);
    void each_control_packet(const std::function<void(const ControlPacket&)>& fn);
    void each_packet(const std::function<void(const Packet&)>& fn);
    void port_status_changed(const std::function<void(const PortStatus&)>& fn);

    std::optional<PortStatus> port_status() const;
    const std::string& port_name() const { return port_name_; }

    // Stops the status reader and closes both connections. Blocked readers
    // fail with StreamEof. The device cannot be used afterwards.
    void close();

private:
    Connection& data_connection();
    Connection& control_connection(bool read);
    std::unique_ptr<Connection> connect(const SessionOptions& opts);
    void record_status(const ControlPacket& packet);
    void start_status_task();
    void stop_status_task();
    void run_status_task();

    std::string port_name_;
    DeviceConfig cfg_;
    std::atomic<bool> closed_{false};

    std::mutex conn_mtx_;
    std::unique_ptr<Connection> data_;
    std::unique_ptr<Connection> control_;
    std::atomic<bool> control_reading_{false};

    std::thread status_task_;
    std::atomic<bool> status_stop_{false};

    mutable std::mutex status_mtx_;
    std::optional<PortStatus> status_;
};

// Runs fn with a fresh device; the device is closed on every exit path.
void open(const std::string& port_name, const DeviceConfig& cfg,
          const std::function<void(Device&)>& fn);

} // namespace hdlcd
