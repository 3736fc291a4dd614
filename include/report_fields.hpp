#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

constexpr std::size_t kOutputColumnCount = 29;

// One output record: TARJETA, NOMBRE, then the 27 sliced fields in layout order.
using OutputRow = std::array<std::string, kOutputColumnCount>;

enum class SourceLine { Line1, Line2 };

// Fixed column of the two-line record. `start` is 1-based.
struct FieldSpec {
  const char* name;
  SourceLine source;
  std::size_t start;
  std::size_t length;
  bool monetary;
};

// The 27 data fields in output order (line 1 fields first, then line 2).
const std::vector<FieldSpec>& fieldLayout();

// Column headers of an OutputRow, in order.
const std::vector<std::string>& outputColumnNames();

std::optional<std::size_t> outputColumnIndex(const std::string& name);

std::string trim(const std::string& s);

// Number of leading whitespace characters, matching what trim() removes.
std::size_t leadingWhitespace(const std::string& s);

// Drops exactly `indentLen` characters; empty if the line is shorter.
std::string stripIndent(const std::string& line, std::size_t indentLen);

// Substring at 1-based `start` of `length` chars, clamped to the line and trimmed.
// Never throws for out-of-range columns.
std::string sliceField(const std::string& clean, std::size_t start, std::size_t length);

// Keeps only digits, '.' and '-'. Returns "0" when nothing is left.
std::string sanitizeAmount(const std::string& raw);
