
#include "device.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>

using namespace hdlcd;

static void usage() {
  std::cerr << "usage: hdlcd_print [--server host[:port]] "
               "[--mode data|control|status|all]\n"
               "                   [--type payload|payload_raw|hdlc_raw|"
               "hdlc_dissected] [--lock]\n"
               "                   [--log-level trace|debug|info|warn|error] "
               "<serial-port>\n";
}

int main(int argc, char **argv) {
  std::string server = std::string(kDefaultHost);
  std::string mode = "all";
  std::string type = "payload";
  std::string port_name;
  bool lock = false;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--server")
      server = next(i);
    else if (a == "--mode")
      mode = next(i);
    else if (a == "--type")
      type = next(i);
    else if (a == "--lock")
      lock = true;
    else if (a == "--log-level") {
      LogLevel lvl;
      if (!parse_log_level(next(i), lvl)) {
        std::cerr << "bad log level" << std::endl;
        return 1;
      }
      Logger::instance().set_level(lvl);
    } else if (a == "-h" || a == "--help") {
      usage();
      return 0;
    } else if (!a.empty() && a[0] != '-' && port_name.empty())
      port_name = a;
    else {
      std::cerr << "unknown argument " << a << "\n";
      usage();
      return 1;
    }
  }
  if (port_name.empty()) {
    usage();
    return 1;
  }

  DeviceConfig cfg;
  if (!parse_host_port(server, cfg.host, cfg.port)) {
    std::cerr << "bad server" << std::endl;
    return 1;
  }
  if (!parse_type_of_data(type, cfg.data_options.type_of_data) ||
      cfg.data_options.type_of_data == TypeOfData::PortStatusOnly) {
    std::cerr << "bad type of data" << std::endl;
    return 1;
  }
  if (mode != "data" && mode != "control" && mode != "status" &&
      mode != "all") {
    std::cerr << "bad mode" << std::endl;
    return 1;
  }

  try {
    hdlcd::open(port_name, cfg, [&](Device &dev) {
      if (lock)
        dev.lock();
      auto print = [](const Packet &p) {
        std::printf("%s\n", p.to_string().c_str());
        std::fflush(stdout);
      };
      if (mode == "data")
        dev.each_data_packet(print);
      else if (mode == "control")
        dev.each_control_packet(print);
      else if (mode == "status")
        dev.port_status_changed([](const PortStatus &s) {
          std::printf("port status: %s\n", s.to_string().c_str());
          std::fflush(stdout);
        });
      else
        dev.each_packet(print);
    });
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "%s", e.what());
    return 1;
  }
  return 0;
}
