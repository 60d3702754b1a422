#include "cli/cli.hpp"
#include "config/client_config.hpp"
#include "crypto/ec_key_signer.hpp"
#include "logger/logger.hpp"
#include "session/session.hpp"
#include "transport/tcp_transport.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string host;
  uint16_t port{0};
  std::string key_path;
  sevault::config::ClientConfig config;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -h <host> -p <port> -k <key.pem> [options]\n"
        << "Required arguments:\n"
        << "  -h, --host        Card reader relay address\n"
        << "  -p, --port        Card reader relay port\n"
        << "  -k, --key         EC private key (PEM) used to sign read requests\n"
        << "Options:\n"
        << "  -c, --chunk-size  Store chunk size in bytes (1-255, default 200)\n"
        << "  -d, --digest      What is signed: message | sha256 (default message)\n"
        << "  -i, --identity    Fixed record username packing: pad | sha256 (default pad)\n"
        << "  -l, --log-level   trace | debug | info | warning | error | fatal (default info)\n"
        << "  --log-file        Log file path (default sevault.log)\n"
        << "Example: " << program_name << " -h 127.0.0.1 -p 35963 -k private_key.pem\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> known_flags = {
    "-h", "--host", "-p", "--port", "-k", "--key",
    "-c", "--chunk-size", "-d", "--digest", "-i", "--identity", "-l", "--log-level", "--log-file"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (known_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    try {
      if (flag == "-h" || flag == "--host") {
        options.host = value;
      } else if (flag == "-p" || flag == "--port") {
        int port = std::stoi(value);
        if (port <= 0 || port > 0xFFFF) {
          throw std::out_of_range("port");
        }
        options.port = static_cast<uint16_t>(port);
      } else if (flag == "-k" || flag == "--key") {
        options.key_path = value;
      } else if (flag == "-c" || flag == "--chunk-size") {
        options.config.store_chunk_size = static_cast<std::size_t>(std::stoul(value));
      } else if (flag == "-d" || flag == "--digest") {
        options.config.digest_policy = sevault::config::parse_digest_policy(value);
      } else if (flag == "-i" || flag == "--identity") {
        options.config.identity_encoding = sevault::config::parse_identity_encoding(value);
      } else if (flag == "-l" || flag == "--log-level") {
        sevault::logging::parse_severity(value);
        options.config.log_level = value;
      } else if (flag == "--log-file") {
        options.config.log_file = value;
      }
    } catch (const std::exception& e) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.host.empty() || options.port == 0 || options.key_path.empty()) {
    std::cerr << "Error: Host, port and key are required\n";
    print_usage(argv[0]);
    return options;
  }

  try {
    options.config.validate();
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_client(const ProgramOptions& options) {
  try {
    sevault::logging::init_logging(options.config.log_file,
                                   sevault::logging::parse_severity(options.config.log_level));

    std::shared_ptr<sevault::crypto::SignatureProvider> signer =
      sevault::crypto::EcKeySigner::from_pem_file(options.key_path);

    sevault::transport::TcpTransport transport;
    if (!transport.connect(options.host, options.port)) {
      std::cerr << "Error: Failed to connect to " << options.host << ":" << options.port << '\n';
      return false;
    }

    sevault::session::Session session(transport, signer, options.config);
    sevault::cli::CLI cli(session);
    cli.run();

    transport.disconnect();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start client: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_client(options)) {
    return 1;
  }
  return 0;
}
