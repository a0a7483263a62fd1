#ifndef FILEHASHER_HPP
#define FILEHASHER_HPP

#include <filesystem>
#include <string>

#include "ihashcalculator.hpp"

/**
 * @brief Streams a file's full contents through a hash calculator
 *
 * Reads the file from start to end in fixed-size chunks, so memory use does
 * not depend on file size. The stream is closed when the function returns,
 * whether it succeeds or throws.
 *
 * @param filePath Path of the file to hash
 * @param calculator Fresh calculator; it is finalized by this call
 *
 * @return Lowercase hex digest of the file contents
 *
 * @throws IOError if the file cannot be opened or a read fails
 */
std::string hashFile(const std::filesystem::path &filePath,
                     IHashCalculator &calculator);

#endif // FILEHASHER_HPP
