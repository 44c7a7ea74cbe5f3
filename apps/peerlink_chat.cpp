#include "peerlink/connector.hpp"
#include "peerlink/util.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace peerlink;

static void usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  peerlink-chat <tcp|zmq> <listen_port> <target_port> [target_host] [--option value ...]\n\n";
  std::cerr << "Options:\n";
  std::cerr << "  --log-level <trace|debug|info|warn|err>\n";
  std::cerr << "  --dial-timeout-ms, --retry-backoff-ms, --poll-interval-ms,\n";
  std::cerr << "  --connect-wait-ms, --close-drain-ms, --max-frame-size, --bind-host\n\n";
  std::cerr << "Input lines:\n";
  std::cerr << "  <tag> <text>     send text as the payload\n";
  std::cerr << "  <tag> @<file>    send the file contents as the payload\n";
  std::cerr << "  <tag>            send without payload\n\n";
  std::cerr << "Example:\n";
  std::cerr << "  peerlink-chat tcp 20000 20001            (other side: tcp 20001 20000)\n";
}

static void print_message(const Message& m) {
  bool printable = true;
  for (std::uint8_t c : m.payload) {
    if (c < 0x20 && c != '\n' && c != '\t') { printable = false; break; }
  }
  std::cout << "<< " << m.tag << " (" << m.payload.size() << " bytes";
  if (!m.payload.empty()) std::cout << ", sha256 " << to_hex(sha256(m.payload)).substr(0, 16);
  std::cout << ")";
  if (printable && !m.payload.empty())
    std::cout << ": " << std::string(m.payload.begin(), m.payload.end());
  std::cout << std::endl;
}

// Sends one message per stdin line until EOF or until the link is lost.
static void read_lines(Connector& conn) {
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) continue;
    const std::size_t sp = line.find(' ');
    const std::string tag = line.substr(0, sp);
    Bytes payload;
    if (sp != std::string::npos) {
      const std::string rest = line.substr(sp + 1);
      if (!rest.empty() && rest[0] == '@') {
        if (!read_file(rest.substr(1), payload)) {
          std::cerr << "[chat] cannot read " << rest.substr(1) << "\n";
          continue;
        }
      } else {
        payload.assign(rest.begin(), rest.end());
      }
    }
    try {
      conn.send(tag, payload);
    } catch (const ConnectionLostError& e) {
      std::cerr << "[chat] " << e.what() << "\n";
      return;
    } catch (const Error& e) {
      std::cerr << "[chat] " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
      std::cerr << "[chat] bad line: " << e.what() << "\n";
    }
  }
}

int main(int argc, char** argv) {
  if (argc < 4) {
    usage();
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
    for (; i < argc; i += 2) {
      std::string key = argv[i];
      ensure(key.rfind("--", 0) == 0 && i + 1 < argc, "options take the form --key value");
      key = key.substr(2);
      if (key == "log-level") {
        logger->set_level(spdlog::level::from_str(argv[i + 1]));
      } else if (!parse_option(opts, key, argv[i + 1])) {
        usage();
        return 1;
      }
    }

    Connector conn(kind, opts, std::make_shared<LogObserver>(logger));
    conn.connect(listen_port, target_port, target_host);
    std::cerr << "[chat] connecting, type lines (Ctrl+D to quit)\n";

    std::thread rx([&conn] {
      try {
        for (;;) {
          try {
            print_message(conn.receive());
          } catch (const NotConnectedError&) {
            // peer not up yet
          }
        }
      } catch (const ClosedError&) {
        // main thread closed the connector
      } catch (const Error& e) {
        std::cerr << "[chat] receive stopped: " << e.what() << "\n";
      }
    });

    int rc = 0;
    try {
      read_lines(conn);
    } catch (const std::exception& e) {
      std::cerr << "[chat] error: " << e.what() << "\n";
      rc = 1;
    }

    conn.close();
    rx.join();
    return rc;

  } catch (const std::exception& e) {
    std::cerr << "[chat] error: " << e.what() << "\n";
    return 1;
  }
}
