#include "report_io.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";
const std::string kOutputBaseName = "BASE 1 PENDIENTES DE CONCILIAR LINEALIZADO";

void writeCsvRow(std::ostream& out, const std::vector<std::string>& cells) {
  for (size_t i = 0; i < cells.size(); ++i) {
    const std::string& cell = cells[i];
    bool needQuotes = cell.find_first_of(",\"\r\n") != std::string::npos;
    if (needQuotes) {
      std::string escaped;
      for (char ch : cell) {
        if (ch == '"') escaped += '"';
        escaped += ch;
      }
      out << '"' << escaped << '"';
    } else {
      out << cell;
    }
    if (i + 1 < cells.size()) out << ',';
  }
  out << "\n";
}

std::tm toLocalTime(std::time_t t) {
  std::tm out{};
  localtime_r(&t, &out);
  return out;
}

} // namespace

std::vector<std::string> readReportLines(std::istream& in) {
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (lines.empty() && line.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
      line.erase(0, kUtf8Bom.size());
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
  }
  return lines;
}

std::vector<std::string> readReportLines(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open report: " + path);
  }
  std::vector<std::string> lines = readReportLines(in);
  if (in.bad()) {
    throw std::runtime_error("Failed to read report: " + path);
  }
  return lines;
}

void writeRowsAsCsv(const std::vector<OutputRow>& rows, std::ostream& out) {
  writeCsvRow(out, outputColumnNames());
  for (const auto& r : rows) {
    writeCsvRow(out, std::vector<std::string>(r.begin(), r.end()));
  }
}

void writeRowsAsCsv(const std::vector<OutputRow>& rows, const std::string& path) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("Failed to create directory " + parent.string() + ": " + ec.message());
    }
  }

  std::ofstream ofs(path, std::ios::binary);
  if (!ofs) {
    throw std::runtime_error("Failed to open output file: " + path);
  }
  writeRowsAsCsv(rows, ofs);
  ofs.flush();
  if (!ofs) {
    throw std::runtime_error("Failed to write output file: " + path);
  }
}

std::tm lastBusinessDay(std::time_t now) {
  std::tm today = toLocalTime(now);
  int offset = 1;
  if (today.tm_wday == 1) offset = 3;       // Monday
  else if (today.tm_wday == 0) offset = 2;  // Sunday

  std::tm day = today;
  day.tm_mday -= offset;
  day.tm_isdst = -1;
  std::mktime(&day);
  return day;
}

std::string defaultOutputFilename(std::time_t now, const std::string& outDir) {
  std::tm day = lastBusinessDay(now);
  char date[16];
  std::strftime(date, sizeof(date), "%d-%m-%Y", &day);
  std::string filename = kOutputBaseName + " (" + date + ").csv";
  if (outDir.empty()) return filename;
  return (std::filesystem::path(outDir) / filename).string();
}
