/**
 * @file utils.hpp
 * @brief Small formatting helpers shared by the library and the CLI
 *
 * Key utilities:
 * - toHex: Lowercase hex encoding of digest bytes
 * - formatBytes: Human-readable file size formatting
 *
 * @see toHex()
 * @see formatBytes()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstddef> // size_t
#include <cstdio>
#include <string>

/**
 * @brief Encodes raw bytes as a lowercase hexadecimal string
 *
 * Used by every IHashCalculator to render its final digest, so that digests
 * from different algorithms share one textual form for dedup keys and
 * display.
 *
 * @param data Pointer to the bytes to encode
 * @param size Number of bytes
 *
 * @return std::string of length 2 * size
 */
inline std::string toHex(const unsigned char *data, std::size_t size) {
  static const char digits[] = "0123456789abcdef";

  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0f]);
  }
  return out;
}

/**
 * @brief Formats byte count into human-readable size string
 *
 * Converts a byte count into a string with one decimal place, picking the
 * largest binary unit (1024 bytes = 1 KB) that keeps the value >= 1.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512.0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1073741824) → "1.0 GB"
 *
 * @note Maximum unit is TB (terabytes)
 */
inline std::string formatBytes(long long bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

#endif // UTILS_HPP
