#include "sha256calculator.hpp"
#include "searcherrors.hpp"
#include "utils.hpp"

Sha256Calculator::Sha256Calculator() : m_ctx(EVP_MD_CTX_new()) {
  if (!m_ctx) {
    throw HashError("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw HashError("EVP_DigestInit_ex failed for sha256");
  }
}

void Sha256Calculator::update(const char *data, std::size_t size) {
  if (size == 0)
    return;

  if (EVP_DigestUpdate(m_ctx.get(), data, size) != 1) {
    throw HashError("EVP_DigestUpdate failed for sha256");
  }
}

std::string Sha256Calculator::hexDigest() {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (EVP_DigestFinal_ex(m_ctx.get(), hash, &hash_len) != 1) {
    throw HashError("EVP_DigestFinal_ex failed for sha256");
  }

  return toHex(hash, hash_len);
}
