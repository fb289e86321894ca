/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef QUICGATE_TLS_HPP_
#define QUICGATE_TLS_HPP_

// ============================================================================
// TLS credentials for the QUIC handshake
// ============================================================================
//
// The handshake itself runs inside the QUIC engine; quicgate only loads and
// checks the server's certificate chain and private key with mbedTLS and
// hands them over.
//
// Usage:
//   quicgate::TlsCredentials creds;
//   auto loaded = creds.load("cert.pem", "key.pem");
//

#include "vocabulary.hpp"

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/pk.h>
#include <mbedtls/x509_crt.h>

#include <string>
#include <vector>

namespace quicgate {

class TlsCredentials {
 public:
  TlsCredentials();
  ~TlsCredentials();

  // Non-copyable
  TlsCredentials(const TlsCredentials&) = delete;
  TlsCredentials& operator=(const TlsCredentials&) = delete;

  // Load a PEM certificate chain and its private key. Fails with kTlsError
  // when either file cannot be parsed or the key does not match the leaf
  // certificate.
  expected<void, ErrorCode> load(const std::string& cert_path, const std::string& key_path);

  bool loaded() const { return loaded_; }

  // DER encoding of every certificate of the chain, leaf first.
  std::vector<std::string> certificate_chain_der() const;

  const mbedtls_x509_crt* certificate() const { return loaded_ ? &chain_ : nullptr; }

  mbedtls_pk_context* private_key() { return loaded_ ? &key_ : nullptr; }

  // mbedTLS error code of the last failed load (0 if none)
  int last_error() const { return last_error_; }

  static std::string error_string(int ret);

 private:
  expected<void, ErrorCode> fail(int ret, const std::string& what);

  mbedtls_x509_crt chain_;
  mbedtls_pk_context key_;
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context ctr_drbg_;
  bool seeded_ = false;
  bool loaded_ = false;
  int last_error_ = 0;
};

}  // namespace quicgate

#endif  // QUICGATE_TLS_HPP_
