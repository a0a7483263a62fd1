#include "includefilters.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_set>

namespace {

std::string normalizeExtension(std::string ext) {
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (!ext.empty() && ext.front() != '.') {
    ext.insert(ext.begin(), '.');
  }
  return ext;
}

} // namespace

IncludeFileFn includeAll() {
  return [](const std::string &) { return true; };
}

IncludeFileFn matchExtensions(const std::vector<std::string> &extensions) {
  std::unordered_set<std::string> wanted;
  for (const auto &ext : extensions) {
    if (!ext.empty()) {
      wanted.insert(normalizeExtension(ext));
    }
  }

  return [wanted](const std::string &fullFilePath) {
    std::string ext = std::filesystem::path(fullFilePath).extension().string();
    if (ext.empty())
      return false;
    return wanted.count(normalizeExtension(ext)) > 0;
  };
}

IncludeFileFn excludeHidden(IncludeFileFn inner) {
  return [inner](const std::string &fullFilePath) {
    std::string name = std::filesystem::path(fullFilePath).filename().string();
    if (!name.empty() && name.front() == '.')
      return false;
    return inner(fullFilePath);
  };
}
