#ifndef IHASHCALCULATOR_HPP
#define IHASHCALCULATOR_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

/**
 * @brief Streaming digest accumulator
 *
 * Bytes are fed incrementally with update(); hexDigest() finalizes and
 * returns the digest as lowercase hex. An instance is used for exactly one
 * file.
 */
class IHashCalculator {
public:
  virtual void update(const char *data, std::size_t size) = 0;
  virtual std::string hexDigest() = 0;
  virtual std::string name() const = 0;
  virtual ~IHashCalculator() = default;
};

/** @brief Produces a fresh calculator for every hashed file */
using HashCalculatorFactory = std::function<std::unique_ptr<IHashCalculator>()>;

#endif // IHASHCALCULATOR_HPP
