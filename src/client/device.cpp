
#include "device.hpp"
#include "connection.hpp"
#include "logging.hpp"

namespace hdlcd {

namespace {
struct ClearOnExit {
  std::atomic<bool> &flag;
  ~ClearOnExit() { flag = false; }
};
} // namespace

Device::Device(std::string port_name, const DeviceConfig &cfg)
    : port_name_(std::move(port_name)), cfg_(cfg) {
  if (port_name_.size() > kMaxPortNameLength)
    throw std::invalid_argument("serial port name longer than 255 bytes");
}

Device::~Device() { close(); }

std::unique_ptr<Connection> Device::connect(const SessionOptions &opts) {
  SessionHeader header(port_name_, opts);
  std::unique_ptr<Connection> conn(new Connection(cfg_.host, cfg_.port));
  conn->open(header);
  return conn;
}

Connection &Device::data_connection() {
  std::lock_guard<std::mutex> lk(conn_mtx_);
  if (closed_)
    throw StreamEof(port_name_ + ": device closed");
  if (!data_)
    data_ = connect(cfg_.data_options);
  return *data_;
}

Connection &Device::control_connection(bool read) {
  std::lock_guard<std::mutex> lk(conn_mtx_);
  if (closed_)
    throw StreamEof(port_name_ + ": device closed");
  if (!control_) {
    SessionOptions opts;
    opts.type_of_data = TypeOfData::PortStatusOnly;
    opts.rx_data = false;
    control_ = connect(opts);
  }
  // one reader per socket: an explicit reader replaces the status task
  if (read) {
    stop_status_task();
    control_reading_ = true;
  } else if (!control_reading_ && !status_task_.joinable())
    start_status_task();
  return *control_;
}

void Device::send_control(ControlCommand command) {
  ControlPacket packet(command);
  Connection &conn = control_connection(false);
  Logger::instance().log(LogLevel::DEBUG, "sending %s to %s",
                         to_string(command), conn.endpoint().c_str());
  conn.write(packet.serialize());
}

void Device::each_data_packet(
    const std::function<void(const DataPacket &)> &fn) {
  Connection::Reader reader(data_connection());
  for_each_packet(reader, PacketFilter::Data, [&fn](const Packet &p) {
    fn(static_cast<const DataPacket &>(p));
  });
}

void Device::each_packet(const std::function<void(const Packet &)> &fn) {
  Connection::Reader reader(data_connection());
  for_each_packet(reader, PacketFilter::All, fn);
}

void Device::each_control_packet(
    const std::function<void(const ControlPacket &)> &fn) {
  Connection &conn = control_connection(true);
  ClearOnExit guard{control_reading_};
  Connection::Reader reader(conn);
  for_each_packet(reader, PacketFilter::Control, [this, &fn](const Packet &p) {
    const auto &cp = static_cast<const ControlPacket &>(p);
    record_status(cp);
    fn(cp);
  });
}

void Device::port_status_changed(
    const std::function<void(const PortStatus &)> &fn) {
  std::optional<PortStatus> last;
  each_control_packet([&](const ControlPacket &p) {
    const auto &info = p.information();
    if (!info || info == last)
      return;
    last = info;
    fn(*info);
  });
}

std::optional<PortStatus> Device::port_status() const {
  std::lock_guard<std::mutex> lk(status_mtx_);
  return status_;
}

void Device::record_status(const ControlPacket &packet) {
  if (!packet.information())
    return;
  std::lock_guard<std::mutex> lk(status_mtx_);
  status_ = packet.information();
}

void Device::start_status_task() {
  status_stop_ = false;
  status_task_ = std::thread(&Device::run_status_task, this);
  Logger::instance().log(LogLevel::DEBUG, "status reader for %s started",
                         port_name_.c_str());
}

void Device::stop_status_task() {
  if (!status_task_.joinable())
    return;
  status_stop_ = true;
  status_task_.join();
}

void Device::run_status_task() {
  Connection::Reader reader(*control_, &status_stop_);
  try {
    for_each_packet(reader, PacketFilter::Control, [this](const Packet &p) {
      record_status(static_cast<const ControlPacket &>(p));
    });
  } catch (const ReadCancelled &) {
    Logger::instance().log(LogLevel::DEBUG, "status reader for %s stopped",
                           port_name_.c_str());
  } catch (const StreamError &e) {
    if (!closed_)
      Logger::instance().log(LogLevel::WARN,
                             "status reader for %s terminated: %s",
                             port_name_.c_str(), e.what());
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "status reader for %s failed: %s",
                           port_name_.c_str(), e.what());
  }
}

void Device::close() {
  std::lock_guard<std::mutex> lk(conn_mtx_);
  closed_ = true;
  stop_status_task();
  if (data_)
    data_->close();
  if (control_)
    control_->close();
}

void open(const std::string &port_name, const DeviceConfig &cfg,
          const std::function<void(Device &)> &fn) {
  Device dev(port_name, cfg);
  fn(dev);
}

} // namespace hdlcd
