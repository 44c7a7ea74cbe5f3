#include "peerlink/connector.hpp"
#include "peerlink/util.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

using namespace peerlink;

int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "Usage: peerlink-echo <tcp|zmq> <listen_port> <target_port> [target_host] [--option value ...]\n";
    std::cerr << "Echoes every message back to the peer until the link goes down, then\n";
    std::cerr << "prints the timing report as JSON on stdout.\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  peerlink-echo zmq 20001 20000\n";
    return 1;
  }

  try {
    const TransportKind kind = parse_transport_kind(argv[1]);
    const int listen_port = std::stoi(argv[2]);
    const int target_port = std::stoi(argv[3]);
    std::string target_host = "127.0.0.1";
    int i = 4;
    if (i < argc && std::string(argv[i]).rfind("--", 0) != 0) target_host = argv[i++];

    auto logger = spdlog::stderr_color_mt("peerlink");
    ConnectorOptions opts;
    for (; i + 1 < argc; i += 2) {
      std::string key = argv[i];
      ensure(key.rfind("--", 0) == 0, "options take the form --key value");
      key = key.substr(2);
      if (key == "log-level") logger->set_level(spdlog::level::from_str(argv[i + 1]));
      else ensure(parse_option(opts, key, argv[i + 1]), "unknown option");
    }
    ensure(i == argc, "option without a value");

    auto obs = std::make_shared<LogObserver>(logger);
    Connector conn(kind, opts, obs);
    conn.connect(listen_port, target_port, target_host);

    std::size_t echoed = 0;
    try {
      for (;;) {
        Message m;
        try {
          m = conn.receive();
        } catch (const NotConnectedError&) {
          logger->info("waiting for peer");
          continue;
        }
        logger->info("echo '{}' ({} bytes, sha256 {})", m.tag, m.payload.size(),
                     to_hex(sha256(m.payload)).substr(0, 16));
        conn.send(m.tag, m.payload);
        ++echoed;
      }
    } catch (const ConnectionLostError& e) {
      std::cerr << "[echo] " << e.what() << "\n";
    }

    std::cerr << "[echo] " << echoed << " messages echoed\n";
    conn.close();
    std::cout << obs->report_json(2) << std::endl;
    return 0;

  } catch (const std::exception& e) {
    std::cerr << "[echo] error: " << e.what() << "\n";
    return 1;
  }
}
