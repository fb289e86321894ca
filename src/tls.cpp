#include "quicgate/tls.hpp"

#include "quicgate/log.hpp"

#include <mbedtls/error.h>

#include <cstring>

namespace quicgate {

namespace {

constexpr std::string_view kLogName = "quicgate.tls";

}  // namespace

TlsCredentials::TlsCredentials() {
  mbedtls_x509_crt_init(&chain_);
  mbedtls_pk_init(&key_);
  mbedtls_entropy_init(&entropy_);
  mbedtls_ctr_drbg_init(&ctr_drbg_);
}

TlsCredentials::~TlsCredentials() {
  mbedtls_x509_crt_free(&chain_);
  mbedtls_pk_free(&key_);
  mbedtls_entropy_free(&entropy_);
  mbedtls_ctr_drbg_free(&ctr_drbg_);
}

std::string TlsCredentials::error_string(int ret) {
  char buf[128];
  mbedtls_strerror(ret, buf, sizeof(buf));
  return std::string(buf);
}

expected<void, ErrorCode> TlsCredentials::fail(int ret, const std::string& what) {
  last_error_ = ret;
  QUICGATE_LOG_ERROR(kLogName, what + ": " + error_string(ret));

  // Leave the object reusable for another load()
  mbedtls_x509_crt_free(&chain_);
  mbedtls_pk_free(&key_);
  mbedtls_x509_crt_init(&chain_);
  mbedtls_pk_init(&key_);
  loaded_ = false;
  return expected<void, ErrorCode>::error(ErrorCode::kTlsError);
}

expected<void, ErrorCode> TlsCredentials::load(const std::string& cert_path, const std::string& key_path) {
  if (loaded_) {
    mbedtls_x509_crt_free(&chain_);
    mbedtls_pk_free(&key_);
    mbedtls_x509_crt_init(&chain_);
    mbedtls_pk_init(&key_);
    loaded_ = false;
  }

  int ret = 0;
  if (!seeded_) {
    const char* pers = "quicgate_tls";
    ret = mbedtls_ctr_drbg_seed(&ctr_drbg_, mbedtls_entropy_func, &entropy_,
                                reinterpret_cast<const unsigned char*>(pers), strlen(pers));
    if (ret != 0) return fail(ret, "seeding the random generator failed");
    seeded_ = true;
  }

  ret = mbedtls_x509_crt_parse_file(&chain_, cert_path.c_str());
  if (ret != 0) return fail(ret, "cannot load certificate " + cert_path);

  ret = mbedtls_pk_parse_keyfile(&key_, key_path.c_str(), nullptr, mbedtls_ctr_drbg_random, &ctr_drbg_);
  if (ret != 0) return fail(ret, "cannot load private key " + key_path);

  ret = mbedtls_pk_check_pair(&chain_.pk, &key_, mbedtls_ctr_drbg_random, &ctr_drbg_);
  if (ret != 0) return fail(ret, "private key does not match certificate");

  loaded_ = true;
  last_error_ = 0;
  QUICGATE_LOG_DEBUG(kLogName, "loaded certificate " + cert_path);
  return expected<void, ErrorCode>::success();
}

std::vector<std::string> TlsCredentials::certificate_chain_der() const {
  std::vector<std::string> chain;
  if (!loaded_) {
    return chain;
  }
  for (const mbedtls_x509_crt* crt = &chain_; crt != nullptr && crt->raw.len > 0; crt = crt->next) {
    chain.emplace_back(reinterpret_cast<const char*>(crt->raw.p), crt->raw.len);
  }
  return chain;
}

}  // namespace quicgate
