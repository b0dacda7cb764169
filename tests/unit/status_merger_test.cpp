#include "internal/record/status_merger.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using adrgen::record::MergeStatus;
using adrgen::record::ParseRecord;
using adrgen::record::SerializeRecord;
using adrgen::record::SetTitle;

const char* kAccepted =
    "# ADR 001: Use Postgres\n"
    "\n"
    "**Status**: Accepted  \n"
    "**Date**: 2024-01-02\n"
    "\n"
    "## Context\n"
    "\n"
    "Body text.\n";

std::vector<std::string> Lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

int CountPrefix(const std::string& text, const std::string& prefix) {
  int count = 0;
  for (const auto& line : Lines(text)) {
    if (line.compare(0, prefix.size(), prefix) == 0) {
      ++count;
    }
  }
  return count;
}

void TestSameStatusIsNoOp() {
  const std::string body = kAccepted;
  assert(MergeStatus(body, "Accepted") == body);
  assert(MergeStatus(body, "  Accepted ") == body);
}

void TestApplyingTwiceEqualsApplyingOnce() {
  const auto once  = MergeStatus(kAccepted, "Superseded");
  const auto twice = MergeStatus(once, "Superseded");
  assert(once == twice);
}

void TestStatusChangeRecordsPreviousStatus() {
  const auto out = MergeStatus(kAccepted, "Superseded");

  assert(CountPrefix(out, "**Status**:") == 1);
  assert(CountPrefix(out, "**Previous Status**:") == 1);
  assert(out.find("**Status**: Superseded  \n**Previous Status**: Accepted  \n") != std::string::npos);

  const std::string expected =
      "# ADR 001: Use Postgres\n"
      "\n"
      "**Status**: Superseded  \n"
      "**Previous Status**: Accepted  \n"
      "**Date**: 2024-01-02\n"
      "\n"
      "## Context\n"
      "\n"
      "Body text.\n";
  assert(out == expected);
}

void TestPreviousStatusIsOverwrittenNotAccumulated() {
  const auto second = MergeStatus(MergeStatus(kAccepted, "Deprecated"), "Superseded");

  assert(CountPrefix(second, "**Status**:") == 1);
  assert(CountPrefix(second, "**Previous Status**:") == 1);
  assert(second.find("**Status**: Superseded") != std::string::npos);
  assert(second.find("**Previous Status**: Deprecated") != std::string::npos);
  assert(second.find("Accepted") == std::string::npos);
}

void TestDuplicateFieldLinesCollapse() {
  const std::string body =
      "# ADR 002: Caching\n"
      "**Previous Status**: Stale\n"
      "**Status**: Proposed\n"
      "**Previous Status**: Draft\n"
      "text\n"
      "**Status**: Proposed\n"
      "tail\n";

  const auto out = MergeStatus(body, "Accepted");
  const std::string expected =
      "# ADR 002: Caching\n"
      "**Status**: Accepted\n"
      "**Previous Status**: Proposed\n"
      "text\n"
      "tail\n";
  assert(out == expected);
}

void TestMissingStatusInsertedAfterHeading() {
  const std::string body =
      "intro line\n"
      "# ADR 004: No Status\n"
      "\n"
      "content\n";

  const auto out = MergeStatus(body, "Proposed");
  const std::string expected =
      "intro line\n"
      "# ADR 004: No Status\n"
      "**Status**: Proposed\n"
      "\n"
      "content\n";
  assert(out == expected);
  assert(CountPrefix(out, "**Previous Status**:") == 0);
}

void TestMissingStatusAndHeadingInsertedAtTop() {
  const auto out = MergeStatus("loose notes\n**Previous Status**: Old\n", "Accepted");
  assert(out == "**Status**: Accepted\nloose notes\n");

  assert(MergeStatus("", "Accepted") == "**Status**: Accepted");
}

void TestOtherLinesKeepBytesAndOrder() {
  const std::string body =
      "# ADR 005: Order\r\n"
      "**Status**: Proposed\r\n"
      "line  with  spaces   \r\n"
      "last";

  const auto out = MergeStatus(body, "Accepted");
  const std::string expected =
      "# ADR 005: Order\r\n"
      "**Status**: Accepted\r\n"
      "**Previous Status**: Proposed\r\n"
      "line  with  spaces   \r\n"
      "last";
  assert(out == expected);
}

void TestSetTitleKeepsNumberPrefix() {
  auto doc = ParseRecord(kAccepted);
  SetTitle(&doc, "Use MySQL");

  assert(doc.title == "Use MySQL");
  assert(doc.lines[0] == "# ADR 001: Use MySQL");
  assert(SerializeRecord(doc).find("Body text.\n") != std::string::npos);
}

void TestSetTitleWithoutPrefixOrHeading() {
  auto plain = ParseRecord("# Old Title\ntext\n");
  SetTitle(&plain, "New Title");
  assert(SerializeRecord(plain) == "# New Title\ntext\n");

  auto headless = ParseRecord("text\n");
  SetTitle(&headless, "Added");
  assert(SerializeRecord(headless) == "# Added\ntext\n");
  assert(headless.heading_line == 0u);
}

void TestSetTitleReplacesWholePlainHeading() {
  auto doc = ParseRecord("# Cache: Redis\n**Status**: Proposed\n");
  SetTitle(&doc, "Cache: Memcached");
  assert(doc.lines[0] == "# Cache: Memcached");
  assert(doc.title == "Cache: Memcached");

  auto numbered = ParseRecord("# ADR 002: Cache: Redis\n");
  SetTitle(&numbered, "Queue: Kafka");
  assert(numbered.lines[0] == "# ADR 002: Queue: Kafka");
}

} // namespace

int main() {
  TestSameStatusIsNoOp();
  TestApplyingTwiceEqualsApplyingOnce();
  TestStatusChangeRecordsPreviousStatus();
  TestPreviousStatusIsOverwrittenNotAccumulated();
  TestDuplicateFieldLinesCollapse();
  TestMissingStatusInsertedAfterHeading();
  TestMissingStatusAndHeadingInsertedAtTop();
  TestOtherLinesKeepBytesAndOrder();
  TestSetTitleKeepsNumberPrefix();
  TestSetTitleWithoutPrefixOrHeading();
  TestSetTitleReplacesWholePlainHeading();

  std::cout << "adrgen_unit_status_merger: pass\n";
  return 0;
}
