/**
 * @file searcherrors.hpp
 * @brief Exception types thrown by the file search library
 *
 * Every failure during a search is fatal to the whole walk. The walker never
 * retries and never continues after an error; it throws one of the types
 * below (or lets the found-callback's own exception through unchanged).
 *
 * Hierarchy:
 * - SearchError (std::runtime_error)
 *   - ValidationError: required callbacks missing
 *   - PathResolutionError: root could not be made absolute
 *   - TraversalError: directory iteration or status query failed
 *   - IOError: opening or reading a file for hashing failed
 *   - HashError: the digest backend failed
 *   - CallbackError: convenience type for found-callbacks to throw
 */

#ifndef SEARCHERRORS_HPP
#define SEARCHERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

class SearchError : public std::runtime_error {
public:
  explicit SearchError(const std::string &message)
      : std::runtime_error(message) {}
};

class ValidationError : public SearchError {
public:
  explicit ValidationError(const std::string &message)
      : SearchError(message) {}
};

/**
 * @brief Base for errors that concern one filesystem path
 *
 * Keeps the offending path and the underlying std::error_code so callers can
 * inspect the cause (e.g. std::errc::permission_denied) without parsing the
 * message.
 */
class PathError : public SearchError {
private:
  std::filesystem::path m_path;
  std::error_code m_code;

public:
  PathError(const std::string &message, const std::filesystem::path &path,
            std::error_code code)
      : SearchError(message), m_path(path), m_code(code) {}

  const std::filesystem::path &path() const { return m_path; }
  const std::error_code &code() const { return m_code; }
};

class PathResolutionError : public PathError {
public:
  PathResolutionError(const std::filesystem::path &path, std::error_code code)
      : PathError("failed to resolve absolute path of '" + path.string() +
                      "' - " + code.message(),
                  path, code) {}
};

class TraversalError : public PathError {
public:
  TraversalError(const std::filesystem::path &path, std::error_code code)
      : PathError(path.string() + ": " + code.message(), path, code) {}
};

class IOError : public PathError {
public:
  IOError(const std::filesystem::path &path, std::error_code code)
      : PathError("failed to hash file '" + path.string() + "' - " +
                      code.message(),
                  path, code) {}
};

class HashError : public SearchError {
public:
  explicit HashError(const std::string &message) : SearchError(message) {}
};

/**
 * @brief Failure raised by a found-callback
 *
 * The walker does not wrap callback exceptions; throwing CallbackError is
 * simply a convenient way for a callback to abort a search with a message.
 */
class CallbackError : public SearchError {
public:
  explicit CallbackError(const std::string &message) : SearchError(message) {}
};

#endif // SEARCHERRORS_HPP
