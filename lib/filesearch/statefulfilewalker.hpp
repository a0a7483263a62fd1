/**
 * @file statefulfilewalker.hpp
 * @brief Directory walk that reports files and tracks duplicate content
 *
 * This header defines the StatefulFileWalker class, which traverses a
 * directory tree, hashes accepted files and reports each one to a callback
 * together with whether its content was already seen during the walk.
 */

#ifndef STATEFULFILEWALKER_HPP
#define STATEFULFILEWALKER_HPP

#include <filesystem>
#include <string>
#include <unordered_map>

#include "findconfig.hpp"
#include "statefulfileinfo.hpp"

/**
 * @class StatefulFileWalker
 * @brief Walks a directory tree and classifies files by content hash
 *
 * The walker performs a depth-first traversal (directory listing order, not
 * sorted) of the configured root and, for every regular file accepted by
 * the include predicate:
 * 1. Hashes its contents (unless duplicates are allowed)
 * 2. Looks the digest up in the dedup index
 * 3. Reports a StatefulFileInfo to the found-callback
 *
 * The first file with a given digest populates the index with its path
 * relative to the root; every later file with that digest is reported with
 * alreadySeen set and that relative path as previousFilePath.
 *
 * Error handling: the first error ends the walk. Nothing is retried and no
 * further files are reported.
 *
 * Thread-safety: none. One walker serves one synchronous search at a time.
 *
 * @note Symbolic links and other non-regular entries are skipped, never
 *       followed
 *
 * @see FindUniqueFilesConfig
 * @see StatefulFileInfo
 */
class StatefulFileWalker {
private:
  FindUniqueFilesConfig m_config;

  /** @brief Absolute, normalized search root */
  std::filesystem::path m_absTargetDirPath;

  /** @brief Digest → first relative path; reset by every search() */
  std::unordered_map<std::string, std::string> m_fileHashesToPrevious;

  /** @brief Number of files reported during the current search */
  std::size_t m_reported = 0;

public:
  /**
   * @brief Validates the config and resolves the search root
   *
   * Validation happens before any filesystem access.
   *
   * @param config Search configuration (copied)
   *
   * @throws ValidationError if includeFileFn or foundFileFn is empty
   * @throws PathResolutionError if the root cannot be made absolute
   */
  explicit StatefulFileWalker(FindUniqueFilesConfig config);

  /**
   * @brief Runs one complete walk
   *
   * Clears the dedup index, then visits every entry under the root.
   *
   * @throws TraversalError if the filesystem iteration reports an error
   * @throws IOError if a file cannot be opened or read while hashing
   * @throws HashError if the digest backend fails
   * @throws any exception thrown by the found-callback, unchanged
   */
  void search();

  const std::filesystem::path &absTargetDirPath() const {
    return m_absTargetDirPath;
  }

private:
  static std::filesystem::path resolveRoot(const std::string &targetDirPath);

  /**
   * @brief Classifies one entry produced by the directory iterator
   *
   * Prunes sub-directories in non-recursive mode, skips directories and
   * non-regular entries, and passes regular files on to visitFile().
   */
  void visitEntry(const std::filesystem::directory_entry &entry,
                  std::filesystem::recursive_directory_iterator &it);

  /**
   * @brief Filters, hashes and reports one regular file
   *
   * @param filePath Absolute path of the file
   * @param status Status of the entry, not following symlinks
   */
  void visitFile(const std::filesystem::path &filePath,
                 const std::filesystem::file_status &status);

  FileMetadata readMetadata(const std::filesystem::path &filePath,
                            const std::filesystem::file_status &status) const;
};

/**
 * @brief Searches a directory for files, optionally ignoring duplicates
 *
 * Convenience wrapper that constructs a StatefulFileWalker and runs
 * search() once.
 *
 * @throws Everything StatefulFileWalker's constructor and search() throw
 */
void findUniqueFiles(const FindUniqueFilesConfig &config);

#endif // STATEFULFILEWALKER_HPP
