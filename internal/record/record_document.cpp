#include "internal/record/record_document.hpp"

#include <utility>

namespace adrgen::record {
namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r';
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

std::string FieldValue(std::string_view line, std::string_view marker) {
  return Trim(line.substr(marker.size()));
}

std::string TitleFromHeading(std::string_view line) {
  return Trim(line.substr(HeadingTitleOffset(line)));
}

} // namespace

std::size_t HeadingTitleOffset(std::string_view line) {
  auto offset = kHeadingMarker.size();

  auto rest = line.substr(offset);
  if (!StartsWith(rest, kHeadingNumberMarker)) {
    return offset;
  }
  rest = rest.substr(kHeadingNumberMarker.size());

  std::size_t digits = 0;
  while (digits < rest.size() && rest[digits] >= '0' && rest[digits] <= '9') ++digits;
  if (digits == 0 || rest.substr(digits, 2) != ": ") {
    return offset;
  }
  return offset + kHeadingNumberMarker.size() + digits + 2;
}

std::string Trim(std::string_view s) {
  std::size_t begin = 0;
  std::size_t end   = s.size();
  while (begin < end && IsSpace(s[begin])) ++begin;
  while (end > begin && IsSpace(s[end - 1])) --end;
  return std::string(s.substr(begin, end - begin));
}

std::string_view TrailingWhitespace(std::string_view line) {
  std::size_t end = line.size();
  while (end > 0 && IsSpace(line[end - 1])) --end;
  return line.substr(end);
}

bool IsStatusLine(std::string_view line) {
  return StartsWith(line, kStatusMarker);
}

bool IsPreviousStatusLine(std::string_view line) {
  return StartsWith(line, kPreviousStatusMarker);
}

bool IsHeadingLine(std::string_view line) {
  return StartsWith(line, kHeadingMarker);
}

RecordDocument FromLines(std::vector<std::string> lines, bool trailing_newline) {
  RecordDocument doc;
  doc.lines            = std::move(lines);
  doc.trailing_newline = trailing_newline;

  for (std::size_t i = 0; i < doc.lines.size(); ++i) {
    const auto& line = doc.lines[i];

    if (!doc.heading_line && IsHeadingLine(line)) {
      doc.heading_line = i;
      doc.title        = TitleFromHeading(line);
    } else if (!doc.status_line && IsStatusLine(line)) {
      doc.status_line = i;
      doc.status      = FieldValue(line, kStatusMarker);
    } else if (!doc.previous_status_line && IsPreviousStatusLine(line)) {
      doc.previous_status_line = i;
      doc.previous_status      = FieldValue(line, kPreviousStatusMarker);
    }
  }
  return doc;
}

RecordDocument ParseRecord(std::string_view text) {
  std::vector<std::string> lines;
  bool                     trailing_newline = false;

  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      lines.emplace_back(text.substr(pos));
      break;
    }
    lines.emplace_back(text.substr(pos, nl - pos));
    pos = nl + 1;
    if (pos == text.size()) {
      trailing_newline = true;
    }
  }

  return FromLines(std::move(lines), trailing_newline);
}

std::string SerializeRecord(const RecordDocument& doc) {
  std::string out;
  for (std::size_t i = 0; i < doc.lines.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    out.append(doc.lines[i]);
  }
  if (doc.trailing_newline) {
    out.push_back('\n');
  }
  return out;
}

} // namespace adrgen::record
