/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_CONFIG_HPP_
#define QUICGATE_CONFIG_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <ostream>
#include <string>
#include <vector>

namespace quicgate {

struct ServerConfig {
  std::string host = "::";
  uint16_t port = 4433;
  std::string certificate;   // PEM certificate chain
  std::string private_key;   // PEM private key
  std::string secrets_log;   // TLS key log, appended to (empty: off)
  std::string quic_log;      // qlog output written on shutdown (empty: off)
  bool stateless_retry = false;
  bool verbose = false;
  bool show_help = false;

  std::vector<std::string> alpn_protocols = {"h3-22", "hq-22"};
  std::string server_name = "quicgate";
};

// Parses the server's command line with getopt_long. Certificate and key are
// required unless --help is given. Errors are logged.
expected<ServerConfig, ErrorCode> parse_command_line(int argc, char* argv[]);

void usage(std::ostream& out, const char* program);

}  // namespace quicgate

#endif  // QUICGATE_CONFIG_HPP_
