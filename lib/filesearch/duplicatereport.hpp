#ifndef DUPLICATEREPORT_HPP
#define DUPLICATEREPORT_HPP

#include "statefulfileinfo.hpp"
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Collects search results into duplicate groups
 *
 * DuplicateReport is fed every StatefulFileInfo a search produces (usually
 * from inside the found-callback) and groups duplicates under the file that
 * was seen first. It provides:
 * - Duplicate groups in first-seen order
 * - Counts of reported files and duplicates
 * - Wasted disk space, i.e. the bytes held by every copy but the original
 *
 * @note Results without a hash (duplicates allowed) are counted but never
 *       grouped
 *
 * Example usage:
 * @code
 * DuplicateReport report;
 * config.foundFileFn = [&report](const StatefulFileInfo &info) {
 *     report.add(info);
 * };
 * findUniqueFiles(config);
 * std::cout << "Wasted space: " << formatBytes(report.wastedSpace()) << "\n";
 * @endcode
 */
class DuplicateReport {
public:
    struct DuplicateGroup {
        std::string hash;
        std::string originalPath;                 // relative to search root
        std::vector<std::string> duplicatePaths;  // relative to search root
        long long fileSize = 0;
        long long wastedSpace = 0;  // fileSize * duplicatePaths.size()
    };

    /**
     * @brief Records one search result
     *
     * A result that was not seen before opens a group for its hash; a
     * result marked alreadySeen is added to the group of its original.
     */
    void add(const StatefulFileInfo& info) {
        ++m_fileCount;

        if (info.hash.empty()) {
            return;
        }

        if (!info.alreadySeen) {
            if (m_index.count(info.hash) == 0) {
                DuplicateGroup group;
                group.hash = info.hash;
                group.originalPath = info.relativePath();
                group.fileSize = static_cast<long long>(info.info.size);
                m_index.emplace(info.hash, m_groups.size());
                m_groups.push_back(group);
            }
            return;
        }

        auto found = m_index.find(info.hash);
        if (found == m_index.end()) {
            // Original was reported before this report started collecting
            DuplicateGroup group;
            group.hash = info.hash;
            group.originalPath = info.previousFilePath;
            group.fileSize = static_cast<long long>(info.info.size);
            found = m_index.emplace(info.hash, m_groups.size()).first;
            m_groups.push_back(group);
        }

        DuplicateGroup& group = m_groups[found->second];
        group.duplicatePaths.push_back(info.relativePath());
        group.wastedSpace += static_cast<long long>(info.info.size);
        ++m_duplicateCount;
    }

    /**
     * @brief Groups that contain at least one duplicate, in first-seen order
     */
    std::vector<DuplicateGroup> groups() const {
        std::vector<DuplicateGroup> result;
        for (const auto& group : m_groups) {
            if (!group.duplicatePaths.empty()) {
                result.push_back(group);
            }
        }
        return result;
    }

    std::size_t fileCount() const { return m_fileCount; }
    std::size_t duplicateCount() const { return m_duplicateCount; }

    long long wastedSpace() const {
        return calculateWastedSpace(groups());
    }

    /**
     * @brief Calculate total wasted space
     */
    static long long calculateWastedSpace(const std::vector<DuplicateGroup>& groups) {
        long long total = 0;
        for (const auto& group : groups) {
            total += group.wastedSpace;
        }
        return total;
    }

private:
    std::vector<DuplicateGroup> m_groups;
    std::unordered_map<std::string, std::size_t> m_index;
    std::size_t m_fileCount = 0;
    std::size_t m_duplicateCount = 0;
};

#endif // DUPLICATEREPORT_HPP
