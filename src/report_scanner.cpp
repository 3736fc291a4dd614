#include "report_scanner.hpp"

#include <cctype>
#include <utility>

namespace {

const std::string kBannerMarker = "*****";
const std::string kDashMarker = "-----";
const std::string kHeaderPrefix = "- TARJETA";
const std::string kNameMarker = "NOMBRE";

constexpr int kClosingSeparators = 2;
constexpr size_t kCardTokenIndex = 2;

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

// A stray separator outside a banner: leading asterisk run, or a line of dashes only.
bool isSeparator(const std::string& trimmed) {
  if (trimmed.empty()) return false;
  if (trimmed[0] == '*') return true;
  return trimmed.find_first_not_of('-') == std::string::npos;
}

struct Token {
  size_t start;
  size_t length;
};

std::vector<Token> splitWhitespace(const std::string& s) {
  std::vector<Token> tokens;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
    if (i == s.size()) break;
    size_t start = i;
    while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) i++;
    tokens.push_back(Token{start, i - start});
  }
  return tokens;
}

// Position of RS in fieldLayout().
constexpr size_t kRsLayoutIndex = 1;

} // namespace

OutputTable::OutputTable(std::size_t expectedRows) {
  rows_.reserve(expectedRows);
}

void OutputTable::append(OutputRow row) {
  rows_.push_back(std::move(row));
}

LineKind classifyLine(const std::string& line, ScanState& state) {
  const std::string trimmed = trim(line);

  if (trimmed.find(kBannerMarker) != std::string::npos) {
    state.inSkipMode = true;
    state.dashCount = 0;
    return LineKind::Banner;
  }

  if (state.inSkipMode) {
    if (trimmed.find(kDashMarker) != std::string::npos) {
      state.dashCount++;
      if (state.dashCount >= kClosingSeparators) {
        state.inSkipMode = false;
        state.dashCount = 0;
      }
    }
    return LineKind::Skipped;
  }

  if (trimmed.empty()) return LineKind::Blank;
  if (startsWith(trimmed, kHeaderPrefix)) return LineKind::Header;
  if (isSeparator(trimmed)) return LineKind::Separator;
  if (state.currentCard.empty()) return LineKind::Unattributed;
  return LineKind::Data;
}

void applyHeader(const std::string& trimmedHeader, ScanState& state) {
  std::vector<Token> tokens = splitWhitespace(trimmedHeader);
  if (tokens.size() <= kCardTokenIndex) return;

  const Token& card = tokens[kCardTokenIndex];
  state.currentCard = trimmedHeader.substr(card.start, card.length);

  for (size_t i = kCardTokenIndex + 1; i < tokens.size(); ++i) {
    const Token& t = tokens[i];
    if (trimmedHeader.compare(t.start, t.length, kNameMarker) == 0) {
      state.currentName = trim(trimmedHeader.substr(t.start + t.length));
      return;
    }
  }
  // No NOMBRE marker: currentName carries over from the previous header.
}

std::optional<RawPair> submitDataLine(const std::string& line, ScanState& state) {
  if (!state.pendingLine1) {
    state.pendingLine1 = ReportLine{line, leadingWhitespace(line), state.currentCard, state.currentName};
    return std::nullopt;
  }
  RawPair pair;
  pair.indentLen = state.pendingLine1->indentLen;
  pair.line1 = std::move(state.pendingLine1->text);
  pair.line2 = line;
  pair.card = std::move(state.pendingLine1->card);
  pair.name = std::move(state.pendingLine1->name);
  state.pendingLine1.reset();
  return pair;
}

bool isValidRs(const std::string& rs) {
  if (rs.empty()) return false;
  for (char ch : rs) {
    if (ch < '0' || ch > '9') return false;
  }
  return true;
}

OutputRow buildRow(const std::string& card, const std::string& name, const RawPair& pair) {
  const std::string clean1 = stripIndent(pair.line1, pair.indentLen);
  const std::string clean2 = stripIndent(pair.line2, pair.indentLen);

  OutputRow row;
  row[0] = card;
  row[1] = name;
  size_t col = 2;
  for (const auto& f : fieldLayout()) {
    const std::string& src = f.source == SourceLine::Line1 ? clean1 : clean2;
    std::string value = sliceField(src, f.start, f.length);
    if (f.monetary) value = sanitizeAmount(value);
    row[col++] = std::move(value);
  }
  return row;
}

void ReportScanner::feed(const std::string& line) {
  stats_.linesRead++;
  switch (classifyLine(line, state_)) {
    case LineKind::Banner:
      stats_.bannersSeen++;
      break;
    case LineKind::Header:
      stats_.headersSeen++;
      applyHeader(trim(line), state_);
      break;
    case LineKind::Data: {
      stats_.dataLines++;
      std::optional<RawPair> pair = submitDataLine(line, state_);
      if (pair) acceptPair(*pair);
      break;
    }
    case LineKind::Skipped:
    case LineKind::Blank:
    case LineKind::Separator:
    case LineKind::Unattributed:
      break;
  }
}

void ReportScanner::acceptPair(const RawPair& pair) {
  stats_.pairsAssembled++;
  const FieldSpec& rs = fieldLayout()[kRsLayoutIndex];
  std::string value = sliceField(stripIndent(pair.line1, pair.indentLen), rs.start, rs.length);
  if (!isValidRs(value)) {
    stats_.rejectedRs++;
    return;
  }
  table_.append(buildRow(pair.card, pair.name, pair));
}

ParseResult ReportScanner::finish() {
  stats_.orphanAtEnd = state_.pendingLine1.has_value();
  state_.pendingLine1.reset();

  ParseResult result;
  result.rows = table_.release();
  result.stats = stats_;
  return result;
}

ParseResult parseReportLines(const std::vector<std::string>& lines) {
  ReportScanner scanner;
  for (const std::string& line : lines) scanner.feed(line);
  return scanner.finish();
}
