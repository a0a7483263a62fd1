#include "filehasher.hpp"
#include "searcherrors.hpp"

#include <cerrno>
#include <fstream>
#include <vector>

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

// errno is the only cause std::ifstream leaves behind on POSIX
std::error_code lastStreamError() {
  if (errno != 0) {
    return std::error_code(errno, std::generic_category());
  }
  return std::make_error_code(std::io_errc::stream);
}

} // namespace

std::string hashFile(const std::filesystem::path &filePath,
                     IHashCalculator &calculator) {
  errno = 0;
  std::ifstream file(filePath, std::ios::binary);
  if (!file) {
    throw IOError(filePath, lastStreamError());
  }

  std::vector<char> buffer(kChunkSize);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (file.bad()) {
      throw IOError(filePath, lastStreamError());
    }

    std::streamsize n = file.gcount();
    if (n > 0) {
      calculator.update(buffer.data(), static_cast<std::size_t>(n));
    }
  }

  return calculator.hexDigest();
}
