#ifndef STATEFULFILEINFO_HPP
#define STATEFULFILEINFO_HPP

#include <cstdint>
#include <filesystem>
#include <string>

/**
 * @brief Metadata of a visited file, as reported by the traversal
 *
 * Taken from the directory entry without following symlinks, so it describes
 * the entry itself.
 */
struct FileMetadata {
  std::string name;
  std::uintmax_t size = 0;
  std::filesystem::file_type type = std::filesystem::file_type::none;
  std::filesystem::perms permissions = std::filesystem::perms::unknown;
  std::filesystem::file_time_type lastWriteTime;

  bool isRegular() const { return type == std::filesystem::file_type::regular; }
  bool isEmpty() const { return size == 0; }
};

/**
 * @brief One report produced for every file accepted by the include predicate
 *
 * Carries the file's location, its content digest, and whether an identical
 * digest was already reported earlier in the same walk.
 *
 * @see StatefulFileWalker
 */
struct StatefulFileInfo {
  /** @brief True if a file with the same hash was reported earlier.
   *  Always false when duplicates are allowed. */
  bool alreadySeen = false;

  /** @brief Path of the first occurrence, relative to the search root.
   *  Empty unless alreadySeen is true. */
  std::string previousFilePath;

  /** @brief Absolute path of this file */
  std::string filePath;

  /** @brief Directory containing this file */
  std::string parentDirPath;

  /** @brief Lowercase hex digest; empty when duplicates are allowed */
  std::string hash;

  FileMetadata info;

  /** @brief Absolute path of the directory the search started from */
  std::string absSearchDirPath;

  /**
   * @brief This file's path relative to the search root
   *
   * Same form as previousFilePath, so the two can be compared directly.
   */
  std::string relativePath() const {
    return std::filesystem::path(filePath)
        .lexically_relative(absSearchDirPath)
        .string();
  }
};

#endif // STATEFULFILEINFO_HPP
