/**
 * @file statefulfilewalker.cpp
 * @brief Implementation of the stateful directory walk
 */

#include "statefulfilewalker.hpp"
#include "filehasher.hpp"
#include "logger.hpp"
#include "searcherrors.hpp"

#include <utility>

namespace fs = std::filesystem;

StatefulFileWalker::StatefulFileWalker(FindUniqueFilesConfig config)
    : m_config(std::move(config)) {
  m_config.validate();
  m_absTargetDirPath = resolveRoot(m_config.targetDirPath);
}

/**
 * @brief Makes the configured root absolute and lexically clean
 *
 * An empty path means the current directory. A trailing separator is
 * removed so that relative paths computed against the root never start
 * with one.
 */
fs::path StatefulFileWalker::resolveRoot(const std::string &targetDirPath) {
  fs::path target = targetDirPath.empty() ? fs::path(".") : fs::path(targetDirPath);

  std::error_code ec;
  fs::path absolute = fs::absolute(target, ec);
  if (ec) {
    throw PathResolutionError(target, ec);
  }

  absolute = absolute.lexically_normal();
  if (!absolute.has_filename() && absolute.has_relative_path()) {
    absolute = absolute.parent_path();
  }
  return absolute;
}

void StatefulFileWalker::search() {
  auto log = Logger::get();

  m_fileHashesToPrevious.clear();
  m_reported = 0;

  log->debug("Searching {} (recursive: {}, allow dupes: {})",
             m_absTargetDirPath.string(), m_config.recursive,
             m_config.allowDupes);

  std::error_code ec;
  fs::file_status rootStatus = fs::symlink_status(m_absTargetDirPath, ec);
  if (!ec && rootStatus.type() == fs::file_type::not_found) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
  }
  if (ec) {
    throw TraversalError(m_absTargetDirPath, ec);
  }

  if (fs::is_regular_file(rootStatus)) {
    visitFile(m_absTargetDirPath, rootStatus);
  } else if (fs::is_directory(rootStatus)) {
    fs::recursive_directory_iterator it(m_absTargetDirPath,
                                        fs::directory_options::none, ec);
    if (ec) {
      throw TraversalError(m_absTargetDirPath, ec);
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
      const fs::path current = it->path();
      visitEntry(*it, it);

      it.increment(ec);
      if (ec) {
        throw TraversalError(current, ec);
      }
    }
  } else {
    log->debug("Search root {} is not a directory or regular file, nothing to do",
               m_absTargetDirPath.string());
  }

  log->debug("Search of {} finished: {} files reported, {} unique hashes",
             m_absTargetDirPath.string(), m_reported,
             m_fileHashesToPrevious.size());
}

void StatefulFileWalker::visitEntry(const fs::directory_entry &entry,
                                    fs::recursive_directory_iterator &it) {
  std::error_code ec;
  fs::file_status status = entry.symlink_status(ec);
  if (ec) {
    throw TraversalError(entry.path(), ec);
  }

  if (fs::is_directory(status)) {
    if (!m_config.recursive) {
      Logger::get()->debug("Pruning {}", entry.path().string());
      it.disable_recursion_pending();
    }
    return;
  }

  // Symlinks, devices, FIFOs and sockets are not supported
  if (!fs::is_regular_file(status)) {
    Logger::get()->debug("Skipping non-regular entry {}", entry.path().string());
    return;
  }

  visitFile(entry.path(), status);
}

void StatefulFileWalker::visitFile(const fs::path &filePath,
                                   const fs::file_status &status) {
  FileMetadata metadata = readMetadata(filePath, status);

  if (!m_config.includeFileFn(filePath.string())) {
    return;
  }

  StatefulFileInfo info;
  info.filePath = filePath.string();
  info.parentDirPath = filePath.parent_path().string();
  info.info = std::move(metadata);
  info.absSearchDirPath = m_absTargetDirPath.string();

  if (!m_config.allowDupes) {
    auto calculator = m_config.pickHasher();
    info.hash = hashFile(filePath, *calculator);

    auto found = m_fileHashesToPrevious.find(info.hash);
    if (found == m_fileHashesToPrevious.end()) {
      m_fileHashesToPrevious.emplace(
          info.hash, filePath.lexically_relative(m_absTargetDirPath).string());
    } else {
      info.alreadySeen = true;
      info.previousFilePath = found->second;
      Logger::get()->debug("{} duplicates {}", info.filePath,
                           info.previousFilePath);
    }
  }

  ++m_reported;
  m_config.foundFileFn(info);
}

FileMetadata
StatefulFileWalker::readMetadata(const fs::path &filePath,
                                 const fs::file_status &status) const {
  FileMetadata metadata;
  metadata.name = filePath.filename().string();
  metadata.type = status.type();
  metadata.permissions = status.permissions();

  std::error_code ec;
  metadata.size = fs::file_size(filePath, ec);
  if (ec) {
    throw TraversalError(filePath, ec);
  }

  metadata.lastWriteTime = fs::last_write_time(filePath, ec);
  if (ec) {
    throw TraversalError(filePath, ec);
  }

  return metadata;
}

void findUniqueFiles(const FindUniqueFilesConfig &config) {
  StatefulFileWalker walker(config);
  walker.search();
}
