#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include "duplicatereport.hpp"
#include "fnv1a.hpp"
#include "includefilters.hpp"
#include "logger.hpp"
#include "sha256calculator.hpp"
#include "statefulfilewalker.hpp"
#include "utils.hpp"

/**
 * @struct Options
 * @brief Command-line settings for one uniqfind run
 */
struct Options {
  std::string startPath;
  bool recursive = false;
  bool allowDupes = false;
  bool includeHidden = false;
  bool dupesOnly = false;
  bool verbose = false;
  std::string hashName = "sha256";
  std::vector<std::string> extensions;
};

/**
 * @class Application
 * @brief Runs a unique-file search and prints the results.
 *
 * Every reported file is printed to stdout as one line:
 *  - "  <relative path>" for a file whose content was not seen before
 *  - "D <relative path> -> <previous path>" for a duplicate
 *
 * When the walk completes, a bordered summary (files, duplicates, groups,
 * wasted space, algorithm) is rendered with FTXUI.
 *
 * Error handling
 *  - Errors from the walk are not caught here; main() logs them and exits
 *    with status 1.
 */
class Application {
private:
  Options m_options;
  DuplicateReport m_report;

public:
  explicit Application(Options options) : m_options(std::move(options)) {}

  void run() {
    FindUniqueFilesConfig config;
    config.targetDirPath = m_options.startPath;
    config.recursive = m_options.recursive;
    config.allowDupes = m_options.allowDupes;
    config.hasherFn = hasherFactory(m_options.hashName);

    IncludeFileFn include = m_options.extensions.empty()
                                ? includeAll()
                                : matchExtensions(m_options.extensions);
    if (!m_options.includeHidden) {
      include = excludeHidden(include);
    }
    config.includeFileFn = include;

    config.foundFileFn = [this](const StatefulFileInfo &info) {
      m_report.add(info);
      printEntry(info);
    };

    StatefulFileWalker walker(config);
    std::cout << "Scan directory: " << walker.absTargetDirPath().string()
              << std::endl;
    walker.search();

    showSummary();
  }

  static HashCalculatorFactory hasherFactory(const std::string &name) {
    if (name == "fnv1a") {
      return [] { return std::make_unique<FNV1A>(); };
    }
    return [] { return std::make_unique<Sha256Calculator>(); };
  }

private:
  void printEntry(const StatefulFileInfo &info) const {
    if (info.alreadySeen) {
      std::cout << "D " << info.relativePath() << " -> "
                << info.previousFilePath << std::endl;
    } else if (!m_options.dupesOnly) {
      std::cout << "  " << info.relativePath() << std::endl;
    }
  }

  void showSummary() const {
    using namespace ftxui;

    auto groups = m_report.groups();
    std::string algorithm = m_options.allowDupes ? "none (duplicates allowed)"
                                                 : m_options.hashName;

    auto row = [](const std::string &label, const std::string &value) {
      return hbox({text(label) | size(WIDTH, EQUAL, 18),
                   text(value) | color(Color::Cyan)});
    };

    auto document =
        vbox({text("Search summary") | bold | color(Color::Green), separator(),
              row("Files reported", std::to_string(m_report.fileCount())),
              row("Duplicates", std::to_string(m_report.duplicateCount())) |
                  color(m_report.duplicateCount() > 0 ? Color::Yellow
                                                      : Color::Default),
              row("Duplicate groups", std::to_string(groups.size())),
              row("Wasted space",
                  formatBytes(DuplicateReport::calculateWastedSpace(groups))),
              row("Hash", algorithm)}) |
        border;

    auto screen = Screen::Create(Dimension::Fit(document));
    Render(screen, document);
    std::cout << std::endl;
    screen.Print();
    std::cout << std::endl;
  }
};

static void printUsage() {
  std::cout
      << "uniqfind [-p DIR] [-r] [-a] [--hash sha256|fnv1a] [-e EXT]...\n"
      << "         [--hidden] [--dupes-only] [-v] [-h]\n\n"
      << "  -p, --path DIR     directory to search (default: current)\n"
      << "  -r, --recursive    descend into sub-directories\n"
      << "  -a, --allow-dupes  do not hash, report every file as unique\n"
      << "      --hash NAME    sha256 (default) or fnv1a\n"
      << "  -e, --ext EXT      only include this extension (repeatable)\n"
      << "      --hidden       include dot-files\n"
      << "      --dupes-only   print only duplicates\n"
      << "  -v, --verbose      debug logging on stderr\n";
}

int main(int argc, char *argv[]) {
  Options options;

  // Simple argument parser
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool hasValue = i + 1 < argc;

    if (arg == "-r" || arg == "--recursive") {
      options.recursive = true;
    } else if (arg == "-a" || arg == "--allow-dupes") {
      options.allowDupes = true;
    } else if (arg == "--hidden") {
      options.includeHidden = true;
    } else if (arg == "--dupes-only") {
      options.dupesOnly = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if ((arg == "-p" || arg == "--path") && hasValue) {
      options.startPath = argv[++i];
    } else if ((arg == "-e" || arg == "--ext") && hasValue) {
      options.extensions.push_back(argv[++i]);
    } else if (arg == "--hash" && hasValue) {
      options.hashName = argv[++i];
      if (options.hashName != "sha256" && options.hashName != "fnv1a") {
        std::cerr << "Unknown hash algorithm: " << options.hashName << "\n";
        return 2;
      }
    } else if (arg == "-h" || arg == "--help") {
      printUsage();
      return 0;
    } else {
      std::cerr << "Unknown or incomplete option: " << arg << "\n";
      printUsage();
      return 2;
    }
  }

  Logger::init(options.verbose ? spdlog::level::debug : spdlog::level::warn);

  try {
    Application app(options);
    app.run();
  } catch (const std::exception &e) {
    Logger::get()->error("Search failed: {}", e.what());
    return 1;
  }

  return 0;
}
