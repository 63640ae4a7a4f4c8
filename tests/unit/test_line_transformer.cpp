#include "fieldcut/line_transformer.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

static int failures = 0;

static void expect_eq(const std::string& got, const std::string& want, const std::string& what) {
  if (got != want) {
    std::cerr << "[FAIL] " << what << "\n  got:  [" << got << "]\n  want: [" << want << "]\n";
    ++failures;
  }
}

static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static fc::TransformConfig cfg_with(fc::FieldSelector sel) {
  fc::TransformConfig c;
  c.selector = std::move(sel);
  return c;
}

int main() {
  const std::string users = "id:email:name\n1:a@x.com:alice\n2:b@x.com:bob\n";

  // Basic extraction; header dropped only on the first chunk.
  {
    fc::LineTransformer xf(cfg_with({1, 2}));
    auto out = xf.transform(users, true);
    expect_eq(out.bytes, "a@x.com,alice\nb@x.com,bob\n", "select 1,2");
    check(out.rows == 2, "row count 2");

    auto mid = xf.transform("1:a@x.com:alice\n2:b@x.com:bob\n", false);
    expect_eq(mid.bytes, "a@x.com,alice\nb@x.com,bob\n", "non-first chunk keeps line 0");
  }

  // Reorder and duplicate columns.
  {
    fc::LineTransformer xf(cfg_with({2, 0, 2}));
    expect_eq(xf.transform(users, true).bytes, "alice,1,alice\nbob,2,bob\n", "reorder + duplicate");
  }

  // Filter: unequal columns keep the row, equal ones drop it.
  {
    auto c = cfg_with({1, 2});
    c.filter = fc::FilterPredicate{1, 2};
    fc::LineTransformer xf(c);
    expect_eq(xf.transform(users, true).bytes, "a@x.com,alice\nb@x.com,bob\n", "filter keeps unequal");
    expect_eq(xf.transform("h\n9:same:same\n8:x:y\n", true).bytes, "x,y\n", "filter drops equal");
  }

  // Filter on an out-of-range column never drops.
  {
    auto c = cfg_with({0});
    c.filter = fc::FilterPredicate{0, 9};
    fc::LineTransformer xf(c);
    expect_eq(xf.transform("h\na:a\n", true).bytes, "a\n", "out-of-range filter ignored");
  }

  // Short rows and empty lines vanish silently; last line may lack a terminator.
  {
    fc::LineTransformer xf(cfg_with({1, 2}));
    auto out = xf.transform("h\n1:only\n\n\n2:b:c\n3\n4:d:e", true);
    expect_eq(out.bytes, "b,c\nd,e\n", "short rows, blank lines, unterminated tail");
    check(out.rows == 2, "rows after drops");
  }

  // Omit mode: an empty field loses its value and its separator.
  {
    fc::LineTransformer xf(cfg_with({0, 1, 2}));
    expect_eq(xf.transform("a::c\n", false).bytes, "a,c\n", "empty middle field collapses");
    expect_eq(xf.transform(":b:c\n", false).bytes, ",b,c\n", "empty first field keeps later separators");
    expect_eq(xf.transform("a:b:\n", false).bytes, "a,b\n", "empty last field");
    expect_eq(xf.transform("::\n", false).bytes, "", "all selected fields empty -> row dropped");
  }

  // Keep mode: every selector position becomes a column.
  {
    auto c = cfg_with({0, 1, 2});
    c.empty_fields = fc::EmptyFieldMode::Keep;
    fc::LineTransformer xf(c);
    expect_eq(xf.transform("a::c\n:b:\n::\n", false).bytes, "a,,c\n,b,\n,,\n", "keep placeholders");
  }

  // CRLF handling is opt-in.
  {
    auto c = cfg_with({1});
    c.delimiter = ',';
    fc::LineTransformer raw(c);
    expect_eq(raw.transform("h\r\n1,x\r\n", true).bytes, "x\r\n", "CR kept by default");
    c.strip_cr = true;
    fc::LineTransformer stripped(c);
    expect_eq(stripped.transform("h\r\n1,x\r\n", true).bytes, "x\n", "CR stripped");
  }

  // Header only / empty chunk.
  {
    fc::LineTransformer xf(cfg_with({1, 2}));
    auto a = xf.transform("id:email:name\n", true);
    check(a.bytes.empty() && a.rows == 0, "header-only chunk is empty");
    auto b = xf.transform("", true);
    check(b.bytes.empty() && b.rows == 0, "empty chunk is empty");
  }

  // Row count always equals the terminators written.
  {
    fc::LineTransformer xf(cfg_with({1, 2}));
    auto out = xf.transform("h\n1:a:b\n2:c\n3:d:e\n:::\n", true);
    check(out.rows == static_cast<std::uint64_t>(std::count(out.bytes.begin(), out.bytes.end(), '\n')),
          "rows == terminators");
  }

  // split_fields keeps empty edges.
  {
    std::vector<std::string_view> f;
    fc::split_fields(":a::", ':', f);
    check(f.size() == 4 && f[0].empty() && f[1] == "a" && f[2].empty() && f[3].empty(), "split keeps empties");
  }

  if (failures) return 1;
  std::cout << "[PASS] line transformer\n";
  return 0;
}
