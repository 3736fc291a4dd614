#pragma once

#include "report_fields.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct ReportLine {
  std::string text;
  std::size_t indentLen = 0;
  std::string card;  // cardholder in effect when the line was read
  std::string name;
};

// Two data lines of one candidate record. indentLen, card and name come from line1.
struct RawPair {
  std::string line1;
  std::string line2;
  std::size_t indentLen = 0;
  std::string card;
  std::string name;
};

struct ScanState {
  bool inSkipMode = false;
  int dashCount = 0;
  std::string currentCard;
  std::string currentName;
  std::optional<ReportLine> pendingLine1;
};

enum class LineKind {
  Banner,        // asterisk run; opens (or restarts) a skipped region
  Skipped,       // inside a banner region, including its closing separators
  Blank,
  Header,        // "- TARJETA ..." line
  Separator,     // stray dash or asterisk run outside a banner
  Unattributed,  // data-looking line before any cardholder header
  Data
};

struct ScanStats {
  std::size_t linesRead = 0;
  std::size_t bannersSeen = 0;
  std::size_t headersSeen = 0;
  std::size_t dataLines = 0;
  std::size_t pairsAssembled = 0;
  std::size_t rejectedRs = 0;
  bool orphanAtEnd = false;
};

// Ordered, growable table of accepted rows.
class OutputTable {
public:
  explicit OutputTable(std::size_t expectedRows = 256);

  void append(OutputRow row);
  std::size_t size() const { return rows_.size(); }
  bool empty() const { return rows_.empty(); }
  const std::vector<OutputRow>& rows() const { return rows_; }
  std::vector<OutputRow> release() { return std::move(rows_); }

private:
  std::vector<OutputRow> rows_;
};

struct ParseResult {
  std::vector<OutputRow> rows;
  ScanStats stats;
};

// Updates the skip-mode state for `line` and reports its role.
// Header lines are recognised here but applied separately by applyHeader().
LineKind classifyLine(const std::string& line, ScanState& state);

// Reads card id (third token) and name (text after "NOMBRE") from a header line.
// The previous name is kept when the NOMBRE marker is missing.
void applyHeader(const std::string& trimmedHeader, ScanState& state);

// Holds the first data line with the current cardholder; returns the pair once the second arrives.
std::optional<RawPair> submitDataLine(const std::string& line, ScanState& state);

// True when the RS value is non-empty and made only of ASCII digits.
bool isValidRs(const std::string& rs);

// Slices the pair into a row prefixed with card and name.
OutputRow buildRow(const std::string& card, const std::string& name, const RawPair& pair);

// Single-use line scanner. Feed every report line in order, then call finish().
class ReportScanner {
public:
  ReportScanner() = default;

  void feed(const std::string& line);
  ParseResult finish();

  const ScanState& state() const { return state_; }
  const ScanStats& stats() const { return stats_; }

private:
  void acceptPair(const RawPair& pair);

  ScanState state_;
  ScanStats stats_;
  OutputTable table_;
};

ParseResult parseReportLines(const std::vector<std::string>& lines);
