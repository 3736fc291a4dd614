#include <catch2/catch.hpp>

#include "report_fields.hpp"

#include <string>

TEST_CASE("sanitizeAmount keeps digits, dots and dashes only", "[fields]") {
  REQUIRE(sanitizeAmount(" $1,234.56USD") == "1234.56");
  REQUIRE(sanitizeAmount("0000000000100.00") == "0000000000100.00");
  REQUIRE(sanitizeAmount("-45.10") == "-45.10");

  // Filters characters, does not validate the number
  REQUIRE(sanitizeAmount("----") == "----");
  REQUIRE(sanitizeAmount("1.2.3") == "1.2.3");
  REQUIRE(sanitizeAmount("12-") == "12-");
}

TEST_CASE("sanitizeAmount returns 0 when nothing numeric remains", "[fields]") {
  REQUIRE(sanitizeAmount("") == "0");
  REQUIRE(sanitizeAmount("USD") == "0");
  REQUIRE(sanitizeAmount("   ") == "0");
}

TEST_CASE("sliceField clamps to the available length", "[fields]") {
  const std::string clean = "005695  12";

  REQUIRE(sliceField(clean, 1, 6) == "005695");
  REQUIRE(sliceField(clean, 9, 2) == "12");
  REQUIRE(sliceField(clean, 7, 4) == "12");
  REQUIRE(sliceField(clean, 9, 50) == "12");
  REQUIRE(sliceField(clean, 11, 3).empty());
  REQUIRE(sliceField(clean, 120, 21).empty());
  REQUIRE(sliceField("", 1, 6).empty());
  REQUIRE(sliceField(clean, 0, 6).empty());
}

TEST_CASE("stripIndent removes exactly the requested prefix", "[fields]") {
  REQUIRE(stripIndent("    ABC", 4) == "ABC");
  REQUIRE(stripIndent("  ABC", 4) == "C");
  REQUIRE(stripIndent("ABC", 4).empty());
  REQUIRE(stripIndent("ABCD", 4).empty());
  REQUIRE(stripIndent("ABC", 0) == "ABC");
}

TEST_CASE("leadingWhitespace counts every leading whitespace character", "[fields]") {
  REQUIRE(leadingWhitespace("") == 0);
  REQUIRE(leadingWhitespace("abc") == 0);
  REQUIRE(leadingWhitespace("  abc") == 2);
  REQUIRE(leadingWhitespace("\t abc ") == 2);
  REQUIRE(leadingWhitespace("    ") == 4);
  REQUIRE(leadingWhitespace("\f000001") == 1);
  REQUIRE(leadingWhitespace(" \v\r\fX") == 4);
}

TEST_CASE("field layout matches the fixed report columns", "[fields][layout]") {
  const auto& layout = fieldLayout();
  REQUIRE(layout.size() == 27);

  size_t line1 = 0;
  size_t line2 = 0;
  size_t monetary = 0;
  for (const auto& f : layout) {
    if (f.source == SourceLine::Line1) line1++;
    else line2++;
    if (f.monetary) monetary++;
    REQUIRE(f.start >= 1);
    REQUIRE(f.length >= 1);
  }
  REQUIRE(std::string(layout[1].name) == "RS");
  REQUIRE(line1 == 15);
  REQUIRE(line2 == 12);
  REQUIRE(monetary == 3);

  auto find = [&](const std::string& name) -> const FieldSpec& {
    for (const auto& f : layout) {
      if (name == f.name) return f;
    }
    FAIL("missing field " << name);
    return layout.front();
  };

  REQUIRE(find("RS").start == 9);
  REQUIRE(find("RS").length == 2);
  REQUIRE(find("IMPORTE ORIGINAL").start == 23);
  REQUIRE(find("IMPORTE ORIGINAL").monetary);
  REQUIRE(find("IMPORT VISA").start == 41);
  REQUIRE(find("IMPORTE AFECTADO").start == 59);
  REQUIRE(find("EXPIRACION").start == 123);
  REQUIRE(find("EXPIRACION").length == 6);
  REQUIRE(find("TERMINAL").source == SourceLine::Line2);
  REQUIRE(find("ESTABLECIMIENTO").length == 26);
  REQUIRE(find("POS.C.CODE").start == 120);
  REQUIRE(find("POS.C.CODE").length == 21);
}

TEST_CASE("output columns are card, name and the layout fields in order", "[fields][layout]") {
  const auto& names = outputColumnNames();
  REQUIRE(names.size() == kOutputColumnCount);
  REQUIRE(names.front() == "TARJETA");
  REQUIRE(names[1] == "NOMBRE");
  REQUIRE(names[2] == "OPERAC");
  REQUIRE(names[16] == "EXPIRACION");
  REQUIRE(names[17] == "TERMINAL");
  REQUIRE(names.back() == "POS.C.CODE");

  REQUIRE(outputColumnIndex("RS") == 3u);
  REQUIRE(outputColumnIndex("BIN ADQUIR.") == 23u);
  REQUIRE_FALSE(outputColumnIndex("SALDO").has_value());
}
