/**
 * @file findconfig.hpp
 * @brief Configuration for a unique-file search
 */

#ifndef FINDCONFIG_HPP
#define FINDCONFIG_HPP

#include <functional>
#include <memory>
#include <string>

#include "ihashcalculator.hpp"
#include "statefulfileinfo.hpp"

/**
 * @brief Predicate deciding whether a file takes part in the search
 *
 * Function signature: bool(const std::string& fullFilePath)
 * - fullFilePath: absolute path of a regular file
 */
using IncludeFileFn = std::function<bool(const std::string &fullFilePath)>;

/**
 * @brief Consumer of search results
 *
 * Invoked once per accepted file. Throwing from the callback aborts the
 * search; the exception leaves StatefulFileWalker::search() unchanged.
 */
using FoundFileFn = std::function<void(const StatefulFileInfo &)>;

/**
 * @struct FindUniqueFilesConfig
 * @brief Caller-supplied settings for one search
 *
 * The config is copied into the walker and not modified during the walk.
 *
 * Example usage:
 * @code
 * FindUniqueFilesConfig config;
 * config.targetDirPath = "/home/user/photos";
 * config.recursive = true;
 * config.includeFileFn = includeAll();
 * config.foundFileFn = [](const StatefulFileInfo &info) {
 *   if (info.alreadySeen)
 *     std::cout << info.filePath << " == " << info.previousFilePath << "\n";
 * };
 * findUniqueFiles(config);
 * @endcode
 */
struct FindUniqueFilesConfig {
  /** @brief Directory to search; resolved to an absolute path */
  std::string targetDirPath;

  /** @brief Descend into sub-directories when true */
  bool recursive = false;

  /** @brief Skip hashing and report every file as never seen */
  bool allowDupes = false;

  /** @brief Hash calculator factory; SHA-256 is used when empty */
  HashCalculatorFactory hasherFn;

  /** @brief Required include predicate */
  IncludeFileFn includeFileFn;

  /** @brief Required result callback */
  FoundFileFn foundFileFn;

  /**
   * @brief Checks that both required callbacks are set
   * @throws ValidationError naming the first missing callback
   */
  void validate() const;

  /**
   * @brief Creates the calculator used for one file
   *
   * @return The product of hasherFn, or a Sha256Calculator if hasherFn is
   *         empty
   * @throws ValidationError if hasherFn returns a null calculator
   */
  std::unique_ptr<IHashCalculator> pickHasher() const;
};

#endif // FINDCONFIG_HPP
