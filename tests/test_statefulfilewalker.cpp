/**
 * @file test_statefulfilewalker.cpp
 * @brief Unit tests for the StatefulFileWalker class
 *
 * ## Test Coverage
 *
 * ### Duplicate tracking
 * - ReportsDuplicateWithFirstRelativePath: identical files, one original
 * - EmptyAndNonEmptyFilesHaveDistinctHashes: empty file still hashed
 * - DuplicatesAcrossDirectoriesUseRelativePaths: nested duplicates
 * - AllowDupesReportsEverythingUnseen: hashing disabled
 * - SearchResetsDedupIndex: repeated search() on one walker
 *
 * ### Traversal
 * - NonRecursiveSkipsSubdirectories / RecursiveVisitsEveryFileOnce
 * - SkipsSymbolicLinks, RegularFileRoot, TrailingSeparatorInRoot
 *
 * ### Filtering
 * - RejectedFilesAreNeitherReportedNorHashed
 *
 * ### Errors
 * - Validation, missing root, vanished file, callback failures,
 *   unreadable directory
 *
 * @note Tests run in an isolated temporary directory with automatic cleanup
 *
 * @see StatefulFileWalker
 * @see findUniqueFiles()
 */

#include <gtest/gtest.h>
#include "fnv1a.hpp"
#include "includefilters.hpp"
#include "searcherrors.hpp"
#include "sha256calculator.hpp"
#include "statefulfilewalker.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

/**
 * @class StatefulFileWalkerTest
 * @brief Test fixture providing a scratch directory and result collection
 */
class StatefulFileWalkerTest : public ::testing::Test {
protected:
    /** @brief Path to temporary test directory */
    fs::path test_dir;

    /** @brief Every result reported by the last search */
    std::vector<StatefulFileInfo> results;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
                   (std::string("statefulfilewalker_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        // Restore permissions changed by individual tests before cleanup
        for (auto it = fs::recursive_directory_iterator(test_dir, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            fs::permissions(it->path(), fs::perms::owner_all,
                            fs::perm_options::add, ec);
        }
        fs::remove_all(test_dir, ec);
    }

    void createFile(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    void createDir(const std::string& name) {
        fs::create_directories(test_dir / name);
    }

    /**
     * @brief Config that accepts every file and collects into results
     */
    FindUniqueFilesConfig makeConfig(bool recursive = false) {
        FindUniqueFilesConfig config;
        config.targetDirPath = test_dir.string();
        config.recursive = recursive;
        config.includeFileFn = includeAll();
        config.foundFileFn = [this](const StatefulFileInfo& info) {
            results.push_back(info);
        };
        return config;
    }

    const StatefulFileInfo* findResult(const std::string& relative) const {
        for (const auto& info : results) {
            if (info.relativePath() == relative)
                return &info;
        }
        return nullptr;
    }
};

/**
 * @test ReportsDuplicateWithFirstRelativePath
 * @brief Two files with identical content: one original, one duplicate
 *
 * The duplicate must carry the original's path relative to the root.
 */
TEST_F(StatefulFileWalkerTest, ReportsDuplicateWithFirstRelativePath) {
    createFile("a.txt", "hello");
    createFile("b.txt", "hello");

    findUniqueFiles(makeConfig());

    ASSERT_EQ(results.size(), 2u);
    const StatefulFileInfo& first = results[0];
    const StatefulFileInfo& second = results[1];

    EXPECT_FALSE(first.alreadySeen);
    EXPECT_TRUE(first.previousFilePath.empty());

    EXPECT_TRUE(second.alreadySeen);
    EXPECT_EQ(second.previousFilePath, first.relativePath());
    EXPECT_EQ(second.hash, first.hash);
    EXPECT_EQ(second.hash,
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST_F(StatefulFileWalkerTest, NonRecursiveSkipsSubdirectories) {
    createFile("top.txt", "top");
    createFile("sub/c.txt", "nested");

    std::vector<std::string> offered;
    auto config = makeConfig(false);
    config.includeFileFn = [&offered](const std::string& path) {
        offered.push_back(path);
        return true;
    };

    findUniqueFiles(config);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(fs::path(results[0].filePath).filename().string(), "top.txt");

    // Never even offered to the predicate
    ASSERT_EQ(offered.size(), 1u);
    EXPECT_EQ(fs::path(offered[0]).filename().string(), "top.txt");
}

TEST_F(StatefulFileWalkerTest, RecursiveVisitsEveryFileOnce) {
    createFile("one.txt", "1");
    createFile("level1/two.txt", "2");
    createFile("level1/level2/three.txt", "3");
    createFile("level1/level2/level3/four.txt", "4");
    createDir("empty");

    std::map<std::string, int> offered;
    auto config = makeConfig(true);
    config.includeFileFn = [&offered](const std::string& path) {
        offered[path]++;
        return true;
    };

    findUniqueFiles(config);

    EXPECT_EQ(results.size(), 4u);
    ASSERT_EQ(offered.size(), 4u);
    for (const auto& [path, count] : offered) {
        EXPECT_EQ(count, 1) << path;
        EXPECT_TRUE(fs::path(path).is_absolute()) << path;
    }

    EXPECT_NE(findResult("level1/level2/level3/four.txt"), nullptr);
}

/**
 * @test EmptyAndNonEmptyFilesHaveDistinctHashes
 * @brief Empty files are hashed like any other file
 */
TEST_F(StatefulFileWalkerTest, EmptyAndNonEmptyFilesHaveDistinctHashes) {
    createFile("empty.txt", "");
    createFile("full.txt", "content");

    findUniqueFiles(makeConfig());

    ASSERT_EQ(results.size(), 2u);
    const auto* empty = findResult("empty.txt");
    const auto* full = findResult("full.txt");
    ASSERT_NE(empty, nullptr);
    ASSERT_NE(full, nullptr);

    EXPECT_FALSE(empty->hash.empty());
    EXPECT_FALSE(full->hash.empty());
    EXPECT_NE(empty->hash, full->hash);
    EXPECT_EQ(empty->hash,
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    EXPECT_FALSE(empty->alreadySeen);
    EXPECT_FALSE(full->alreadySeen);
}

TEST_F(StatefulFileWalkerTest, DuplicatesAcrossDirectoriesUseRelativePaths) {
    createFile("a.txt", "same");
    createFile("sub/deep/b.txt", "same");
    createFile("sub/c.txt", "same");
    createFile("sub/unique.txt", "different");

    findUniqueFiles(makeConfig(true));

    ASSERT_EQ(results.size(), 4u);

    std::vector<const StatefulFileInfo*> originals;
    std::vector<const StatefulFileInfo*> duplicates;
    for (const auto& info : results) {
        if (fs::path(info.filePath).filename() == "unique.txt") {
            EXPECT_FALSE(info.alreadySeen);
            continue;
        }
        (info.alreadySeen ? duplicates : originals).push_back(&info);
    }

    ASSERT_EQ(originals.size(), 1u);
    ASSERT_EQ(duplicates.size(), 2u);

    std::string originalPath = originals[0]->relativePath();
    EXPECT_TRUE(fs::path(originalPath).is_relative());
    for (const auto* dup : duplicates) {
        EXPECT_EQ(dup->previousFilePath, originalPath);
    }

    // The relative path points at the original
    EXPECT_TRUE(fs::exists(test_dir / originalPath));
}

TEST_F(StatefulFileWalkerTest, AllowDupesReportsEverythingUnseen) {
    createFile("a.txt", "hello");
    createFile("b.txt", "hello");
    createFile("c.txt", "hello");

    int hashersCreated = 0;
    auto config = makeConfig();
    config.allowDupes = true;
    config.hasherFn = [&hashersCreated]() {
        hashersCreated++;
        return std::make_unique<FNV1A>();
    };

    findUniqueFiles(config);

    ASSERT_EQ(results.size(), 3u);
    for (const auto& info : results) {
        EXPECT_FALSE(info.alreadySeen);
        EXPECT_TRUE(info.hash.empty());
        EXPECT_TRUE(info.previousFilePath.empty());
    }
    EXPECT_EQ(hashersCreated, 0);
}

/**
 * @test RejectedFilesAreNeitherReportedNorHashed
 * @brief The include predicate gates both the callback and hashing
 */
TEST_F(StatefulFileWalkerTest, RejectedFilesAreNeitherReportedNorHashed) {
    createFile("keep.txt", "keep");
    createFile("skip.log", "skip");
    createFile("also.txt", "also");

    int hashersCreated = 0;
    auto config = makeConfig();
    config.includeFileFn = matchExtensions({"txt"});
    config.hasherFn = [&hashersCreated]() {
        hashersCreated++;
        return std::make_unique<Sha256Calculator>();
    };

    findUniqueFiles(config);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(findResult("skip.log"), nullptr);
    EXPECT_EQ(hashersCreated, 2);
}

TEST_F(StatefulFileWalkerTest, UsesConfiguredHasher) {
    createFile("a.txt", "a");

    auto config = makeConfig();
    config.hasherFn = []() { return std::make_unique<FNV1A>(); };

    findUniqueFiles(config);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].hash, "af63dc4c8601ec8c");
}

TEST_F(StatefulFileWalkerTest, ReportCarriesFileDetails) {
    createFile("sub/data.bin", std::string(1024, 'x'));

    findUniqueFiles(makeConfig(true));

    ASSERT_EQ(results.size(), 1u);
    const StatefulFileInfo& info = results[0];

    EXPECT_EQ(info.absSearchDirPath, fs::absolute(test_dir).lexically_normal().string());
    EXPECT_EQ(info.filePath, (fs::path(info.absSearchDirPath) / "sub" / "data.bin").string());
    EXPECT_EQ(info.parentDirPath, (fs::path(info.absSearchDirPath) / "sub").string());
    EXPECT_EQ(info.relativePath(), "sub/data.bin");

    EXPECT_EQ(info.info.name, "data.bin");
    EXPECT_EQ(info.info.size, 1024u);
    EXPECT_TRUE(info.info.isRegular());
    EXPECT_FALSE(info.info.isEmpty());
    EXPECT_NE(info.info.permissions & fs::perms::owner_read, fs::perms::none);
}

TEST_F(StatefulFileWalkerTest, SkipsSymbolicLinks) {
    createFile("real.txt", "real");
    createDir("realdir");
    createFile("realdir/inside.txt", "inside");
    fs::create_symlink(test_dir / "real.txt", test_dir / "link.txt");
    fs::create_directory_symlink(test_dir / "realdir", test_dir / "linkdir");

    findUniqueFiles(makeConfig(true));

    ASSERT_EQ(results.size(), 2u);
    EXPECT_NE(findResult("real.txt"), nullptr);
    EXPECT_NE(findResult("realdir/inside.txt"), nullptr);
    EXPECT_EQ(findResult("link.txt"), nullptr);
    EXPECT_EQ(findResult("linkdir/inside.txt"), nullptr);
}

TEST_F(StatefulFileWalkerTest, TrailingSeparatorInRoot) {
    createFile("a.txt", "dup");
    createFile("b.txt", "dup");

    auto config = makeConfig();
    config.targetDirPath = test_dir.string() + "/";

    StatefulFileWalker walker(config);
    EXPECT_EQ(walker.absTargetDirPath().string(), fs::absolute(test_dir).lexically_normal().string());
    walker.search();

    ASSERT_EQ(results.size(), 2u);
    const auto& dup = results[1];
    EXPECT_TRUE(dup.alreadySeen);
    EXPECT_EQ(dup.previousFilePath, fs::path(results[0].filePath).filename().string());
}

TEST_F(StatefulFileWalkerTest, RegularFileRoot) {
    createFile("single.txt", "one");

    auto config = makeConfig();
    config.targetDirPath = (test_dir / "single.txt").string();

    findUniqueFiles(config);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].alreadySeen);
    EXPECT_EQ(results[0].relativePath(), ".");
}

TEST_F(StatefulFileWalkerTest, SearchResetsDedupIndex) {
    createFile("a.txt", "same");
    createFile("b.txt", "same");

    StatefulFileWalker walker(makeConfig());
    walker.search();
    walker.search();

    ASSERT_EQ(results.size(), 4u);
    EXPECT_FALSE(results[0].alreadySeen);
    EXPECT_TRUE(results[1].alreadySeen);
    EXPECT_FALSE(results[2].alreadySeen);
    EXPECT_TRUE(results[3].alreadySeen);
}

TEST_F(StatefulFileWalkerTest, RelativeRootResolvedToAbsolute) {
    auto config = makeConfig();
    config.targetDirPath = ".";

    StatefulFileWalker walker(config);
    EXPECT_TRUE(walker.absTargetDirPath().is_absolute());
    EXPECT_EQ(walker.absTargetDirPath().string(), fs::current_path().lexically_normal().string());

    config.targetDirPath = "";
    StatefulFileWalker emptyRoot(config);
    EXPECT_EQ(emptyRoot.absTargetDirPath().string(), fs::current_path().lexically_normal().string());
}

// ============================================================================
// ERRORS
// ============================================================================

/**
 * @test MissingIncludePredicateFailsValidation
 * @brief Construction fails before the filesystem is touched
 *
 * The root does not exist; a ValidationError (not a TraversalError) proves
 * validation runs first.
 */
TEST_F(StatefulFileWalkerTest, MissingIncludePredicateFailsValidation) {
    auto config = makeConfig();
    config.targetDirPath = (test_dir / "does-not-exist").string();
    config.includeFileFn = nullptr;

    EXPECT_THROW(StatefulFileWalker walker(config), ValidationError);
    EXPECT_THROW(findUniqueFiles(config), ValidationError);
    EXPECT_TRUE(results.empty());
}

TEST_F(StatefulFileWalkerTest, MissingFoundCallbackFailsValidation) {
    auto config = makeConfig();
    config.foundFileFn = nullptr;

    EXPECT_THROW(StatefulFileWalker walker(config), ValidationError);
}

TEST_F(StatefulFileWalkerTest, MissingRootThrowsTraversalError) {
    auto config = makeConfig();
    config.targetDirPath = (test_dir / "does-not-exist").string();

    StatefulFileWalker walker(config);
    try {
        walker.search();
        FAIL() << "expected TraversalError";
    } catch (const TraversalError& e) {
        EXPECT_TRUE(e.code() == std::errc::no_such_file_or_directory);
        EXPECT_EQ(e.path().string(), walker.absTargetDirPath().string());
    }
}

/**
 * @test CallbackFailureStopsSearch
 * @brief A throwing callback aborts the walk after the first file
 */
TEST_F(StatefulFileWalkerTest, CallbackFailureStopsSearch) {
    createFile("a.txt", "a");
    createFile("b.txt", "b");
    createFile("c.txt", "c");

    int calls = 0;
    auto config = makeConfig();
    config.foundFileFn = [&calls](const StatefulFileInfo&) {
        calls++;
        throw CallbackError("stop here");
    };

    try {
        findUniqueFiles(config);
        FAIL() << "expected CallbackError";
    } catch (const CallbackError& e) {
        EXPECT_STREQ(e.what(), "stop here");
    }
    EXPECT_EQ(calls, 1);
}

TEST_F(StatefulFileWalkerTest, CallbackExceptionPropagatesUnchanged) {
    createFile("a.txt", "a");

    auto config = makeConfig();
    config.foundFileFn = [](const StatefulFileInfo&) {
        throw std::logic_error("caller failure");
    };

    EXPECT_THROW(findUniqueFiles(config), std::logic_error);
}

TEST_F(StatefulFileWalkerTest, VanishedFileThrowsIOError) {
    createFile("gone.txt", "soon gone");

    auto config = makeConfig();
    // Delete the file between the include check and hashing
    config.includeFileFn = [](const std::string& path) {
        fs::remove(path);
        return true;
    };

    try {
        findUniqueFiles(config);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.path().filename().string(), "gone.txt");
        EXPECT_NE(std::string(e.what()).find("failed to hash file"), std::string::npos);
    }
    EXPECT_TRUE(results.empty());
}

TEST_F(StatefulFileWalkerTest, UnreadableDirectoryThrowsTraversalError) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }

    createFile("locked/secret.txt", "secret");
    fs::permissions(test_dir / "locked", fs::perms::none);

    StatefulFileWalker walker(makeConfig(true));
    try {
        walker.search();
        FAIL() << "expected TraversalError";
    } catch (const TraversalError& e) {
        EXPECT_TRUE(e.code() == std::errc::permission_denied);
    }

    // Non-recursive walks never open the directory
    results.clear();
    EXPECT_NO_THROW(findUniqueFiles(makeConfig(false)));
}
