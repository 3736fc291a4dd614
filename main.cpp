#include "report_io.hpp"
#include "report_scanner.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char* prog) {
  std::cerr << "Usage: " << prog << " [--out=file] [--out-dir=dir] [--stdout] [--quiet] [report.txt]\n";
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::string reportPath;
    std::string outPath;
    std::string outDir;
    bool toStdout = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "--stdout") {
        toStdout = true;
      } else if (arg == "--quiet") {
        quiet = true;
      } else if (arg.rfind("--out=", 0) == 0) {
        outPath = arg.substr(std::string("--out=").size());
      } else if (arg.rfind("--out-dir=", 0) == 0) {
        outDir = arg.substr(std::string("--out-dir=").size());
      } else if (reportPath.empty()) {
        reportPath = arg;
      }
    }

    if (reportPath.empty()) {
      reportPath = "reporte.txt";
    }
    if (toStdout) quiet = true;

    if (!std::filesystem::exists(reportPath)) {
      std::cerr << "Report not found: " << reportPath << "\n";
      printUsage(argv[0]);
      return 2;
    }

    auto started = std::chrono::steady_clock::now();

    std::vector<std::string> lines = readReportLines(reportPath);
    if (!quiet) std::cout << "Loaded " << lines.size() << " lines from " << reportPath << "\n";

    ParseResult result = parseReportLines(lines);
    const ScanStats& stats = result.stats;

    if (stats.orphanAtEnd) {
      std::cerr << "Warning: Odd number of data lines (" << stats.dataLines << "). Dropping last orphan line.\n";
    }
    if (stats.rejectedRs > 0) {
      std::cerr << "Warning: Dropped " << stats.rejectedRs << " records with invalid (non-numeric) RS values.\n";
    }
    if (result.rows.empty()) {
      std::cerr << "Warning: No data rows found.\n";
    }

    if (!quiet) {
      std::cout << "Parsed " << result.rows.size() << " records (" << stats.headersSeen << " cardholders, "
                << stats.bannersSeen << " page banners skipped)\n";
    }

    if (toStdout) {
      writeRowsAsCsv(result.rows, std::cout);
      return 0;
    }

    if (outPath.empty()) {
      outPath = defaultOutputFilename(std::time(nullptr), outDir);
    }
    writeRowsAsCsv(result.rows, outPath);

    if (!quiet) {
      double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
      std::cout << "Output saved to '" << outPath << "' in " << secs << " seconds\n";
    }
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
