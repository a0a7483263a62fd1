#ifndef FNV1A_HPP
#define FNV1A_HPP

#include "ihashcalculator.hpp"
#include "utils.hpp"
#include <cstdint>

/**
 * @brief Streaming implementation of the FNV-1a (Fowler-Noll-Vo) hash
 *
 * FNV-1a is a non-cryptographic hash function designed for fast hash table
 * lookup. This implementation uses the 64-bit version of the algorithm with:
 * - FNV prime: 2^40 + 2^8 + 0xb3 (1099511628211)
 * - FNV offset basis: 14695981039346656037
 *
 * The digest is the 64-bit state written big-endian as 16 lowercase hex
 * characters.
 *
 * @note Fast but not collision resistant; SHA-256 remains the default
 * @see http://www.isthe.com/chongo/tech/comp/fnv/
 */
class FNV1A : public IHashCalculator {
private:
  static constexpr uint64_t FNV_prime = 1099511628211u;
  static constexpr uint64_t FNV_offset = 14695981039346656037u;

  uint64_t m_hash = FNV_offset;

public:
  void update(const char *data, std::size_t size) override {
    for (std::size_t i = 0; i < size; ++i) {
      m_hash ^= static_cast<unsigned char>(data[i]);
      m_hash *= FNV_prime;
    }
  }

  std::string hexDigest() override {
    unsigned char bytes[8];
    for (int i = 0; i < 8; ++i) {
      bytes[i] = static_cast<unsigned char>(m_hash >> (56 - 8 * i));
    }
    return toHex(bytes, sizeof(bytes));
  }

  std::string name() const override { return "fnv1a"; }
};

#endif // FNV1A_HPP
