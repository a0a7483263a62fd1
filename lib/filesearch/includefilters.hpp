#ifndef INCLUDEFILTERS_HPP
#define INCLUDEFILTERS_HPP

#include <string>
#include <vector>

#include "findconfig.hpp"

/**
 * @brief Accepts every file
 */
IncludeFileFn includeAll();

/**
 * @brief Accepts files whose extension is in the given list
 *
 * Matching is case-insensitive and the leading dot is optional, so "jpg",
 * ".JPG" and ".jpg" all match "photo.Jpg". Files without an extension never
 * match.
 *
 * @param extensions Extensions to accept
 */
IncludeFileFn matchExtensions(const std::vector<std::string> &extensions);

/**
 * @brief Rejects dot-files, deferring every other file to another predicate
 *
 * Only the file name is checked; files inside hidden directories are still
 * passed on to the inner predicate.
 */
IncludeFileFn excludeHidden(IncludeFileFn inner);

#endif // INCLUDEFILTERS_HPP
