#ifndef SHA256CALCULATOR_HPP
#define SHA256CALCULATOR_HPP

#include "ihashcalculator.hpp"

#include <memory>
#include <openssl/evp.h>

/**
 * @brief SHA-256 digest accumulator backed by OpenSSL EVP
 *
 * Default hash for duplicate detection. The EVP context is created in the
 * constructor and released by the owning unique_ptr, so the context is freed
 * on every exit path.
 *
 * @throws HashError if OpenSSL fails to allocate, update or finalize
 */
class Sha256Calculator : public IHashCalculator {
private:
  struct ContextDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
  };

  std::unique_ptr<EVP_MD_CTX, ContextDeleter> m_ctx;

public:
  Sha256Calculator();

  void update(const char *data, std::size_t size) override;
  std::string hexDigest() override;
  std::string name() const override { return "sha256"; }
};

#endif // SHA256CALCULATOR_HPP
