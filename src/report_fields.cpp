#include "report_fields.hpp"

#include <cctype>

namespace {

const std::vector<FieldSpec> kLayout = {
  {"OPERAC",           SourceLine::Line1,   1,  6, false},
  {"RS",               SourceLine::Line1,   9,  2, false},
  {"MOVIM",            SourceLine::Line1,  13,  5, false},
  {"MONEDA ORIGINAL",  SourceLine::Line1,  20,  3, false},
  {"IMPORTE ORIGINAL", SourceLine::Line1,  23, 15, true},
  {"MONEDA VISA",      SourceLine::Line1,  38,  3, false},
  {"IMPORT VISA",      SourceLine::Line1,  41, 15, true},
  {"MONEDA AFECTADO",  SourceLine::Line1,  56,  3, false},
  {"IMPORTE AFECTADO", SourceLine::Line1,  59, 15, true},
  {"TIPO CUENTA",      SourceLine::Line1,  74,  4, false},
  {"CUENTA AFECTADA",  SourceLine::Line1,  78, 20, false},
  {"FECOPE",           SourceLine::Line1,  98,  9, false},
  {"HORA",             SourceLine::Line1, 107,  7, false},
  {"FBASE1",           SourceLine::Line1, 114,  9, false},
  {"EXPIRACION",       SourceLine::Line1, 123,  6, false},
  {"TERMINAL",         SourceLine::Line2,   1, 12, false},
  {"TIPO",             SourceLine::Line2,  13,  5, false},
  {"IDENTIFICACION",   SourceLine::Line2,  18, 15, false},
  {"ESTABLECIMIENTO",  SourceLine::Line2,  33, 26, false},
  {"CIUDAD",           SourceLine::Line2,  59, 14, false},
  {"PAIS",             SourceLine::Line2,  73,  6, false},
  {"BIN ADQUIR.",      SourceLine::Line2,  79, 13, false},
  {"PIN",              SourceLine::Line2,  92,  5, false},
  {"VIS.REFER",        SourceLine::Line2,  97, 12, false},
  {"TRNX",             SourceLine::Line2, 109,  5, false},
  {"CAVV",             SourceLine::Line2, 114,  6, false},
  {"POS.C.CODE",       SourceLine::Line2, 120, 21, false},
};

std::vector<std::string> buildColumnNames() {
  std::vector<std::string> names;
  names.reserve(kOutputColumnCount);
  names.push_back("TARJETA");
  names.push_back("NOMBRE");
  for (const auto& f : kLayout) names.push_back(f.name);
  return names;
}

} // namespace

const std::vector<FieldSpec>& fieldLayout() {
  return kLayout;
}

const std::vector<std::string>& outputColumnNames() {
  static const std::vector<std::string> names = buildColumnNames();
  return names;
}

std::optional<std::size_t> outputColumnIndex(const std::string& name) {
  const auto& names = outputColumnNames();
  for (size_t i = 0; i < names.size(); ++i) {
    if (names[i] == name) return i;
  }
  return std::nullopt;
}

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

std::size_t leadingWhitespace(const std::string& s) {
  size_t n = 0;
  while (n < s.size() && std::isspace(static_cast<unsigned char>(s[n]))) n++;
  return n;
}

std::string stripIndent(const std::string& line, std::size_t indentLen) {
  if (line.size() < indentLen) return std::string();
  return line.substr(indentLen);
}

std::string sliceField(const std::string& clean, std::size_t start, std::size_t length) {
  if (start == 0 || start > clean.size()) return std::string();
  return trim(clean.substr(start - 1, length));
}

std::string sanitizeAmount(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (char ch : raw) {
    if (std::isdigit(static_cast<unsigned char>(ch)) || ch == '.' || ch == '-') out.push_back(ch);
  }
  if (out.empty()) return "0";
  return out;
}
