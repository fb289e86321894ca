#include "quicgate/config.hpp"

#include "quicgate/log.hpp"

#include <getopt.h>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>

namespace quicgate {

namespace {

constexpr std::string_view kLogName = "quicgate.config";

enum LongOnly : int { kOptHost = 256, kOptPort };

const struct option kOptions[] = {
    {"host", required_argument, nullptr, kOptHost},
    {"port", required_argument, nullptr, kOptPort},
    {"certificate", required_argument, nullptr, 'c'},
    {"private-key", required_argument, nullptr, 'k'},
    {"secrets-log", required_argument, nullptr, 'l'},
    {"quic-log", required_argument, nullptr, 'q'},
    {"stateless-retry", no_argument, nullptr, 'r'},
    {"verbose", no_argument, nullptr, 'v'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

bool parse_port(const char* text, uint16_t& port) {
  errno = 0;
  char* end = nullptr;
  long value = std::strtol(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || value < 1 || value > 65535) {
    return false;
  }
  port = static_cast<uint16_t>(value);
  return true;
}

}  // namespace

expected<ServerConfig, ErrorCode> parse_command_line(int argc, char* argv[]) {
  using Result = expected<ServerConfig, ErrorCode>;
  ServerConfig config;

  // Full rescan, so the parser can run more than once per process
  optind = 0;
  opterr = 0;

  int opt;
  while ((opt = getopt_long(argc, argv, "c:k:l:q:rvh", kOptions, nullptr)) != -1) {
    switch (opt) {
      case kOptHost:
        config.host = optarg;
        break;
      case kOptPort:
        if (!parse_port(optarg, config.port)) {
          QUICGATE_LOG_ERROR(kLogName, std::string("invalid port: ") + optarg);
          return Result::error(ErrorCode::kConfigError);
        }
        break;
      case 'c':
        config.certificate = optarg;
        break;
      case 'k':
        config.private_key = optarg;
        break;
      case 'l':
        config.secrets_log = optarg;
        break;
      case 'q':
        config.quic_log = optarg;
        break;
      case 'r':
        config.stateless_retry = true;
        break;
      case 'v':
        config.verbose = true;
        break;
      case 'h':
        config.show_help = true;
        break;
      default:
        QUICGATE_LOG_ERROR(kLogName, "unrecognized option");
        return Result::error(ErrorCode::kConfigError);
    }
  }

  if (optind < argc) {
    QUICGATE_LOG_ERROR(kLogName, std::string("unexpected argument: ") + argv[optind]);
    return Result::error(ErrorCode::kConfigError);
  }

  if (!config.show_help) {
    if (config.certificate.empty()) {
      QUICGATE_LOG_ERROR(kLogName, "--certificate is required");
      return Result::error(ErrorCode::kConfigError);
    }
    if (config.private_key.empty()) {
      QUICGATE_LOG_ERROR(kLogName, "--private-key is required");
      return Result::error(ErrorCode::kConfigError);
    }
  }

  return Result::success(std::move(config));
}

void usage(std::ostream& out, const char* program) {
  out << "Usage: " << program << " -c CERT -k KEY [options]\n"
      << "QUIC server\n\n"
      << "  --host HOST                listen on this address (default: ::)\n"
      << "  --port PORT                listen on this port (default: 4433)\n"
      << "  -c, --certificate FILE     load the TLS certificate from the specified file\n"
      << "  -k, --private-key FILE     load the TLS private key from the specified file\n"
      << "  -l, --secrets-log FILE     log secrets to a file, for use with Wireshark\n"
      << "  -q, --quic-log FILE        log QUIC events to a file in QLOG format\n"
      << "  -r, --stateless-retry      send a stateless retry for new connections\n"
      << "  -v, --verbose              increase logging verbosity\n"
      << "  -h, --help                 show this help\n";
}

}  // namespace quicgate
