#include "internal/record/status_merger.hpp"

#include <utility>
#include <vector>

namespace adrgen::record {
namespace {

std::string FieldLine(std::string_view marker, std::string_view value, std::string_view suffix) {
  std::string line(marker);
  line.push_back(' ');
  line.append(value);
  line.append(suffix);
  return line;
}

} // namespace

bool MergeStatus(RecordDocument* doc, std::string_view new_status) {
  const auto status = Trim(new_status);
  if (status == doc->status) {
    return false;
  }

  const std::string old_status = doc->status;

  std::string suffix;
  if (doc->status_line) {
    suffix = std::string(TrailingWhitespace(doc->lines[*doc->status_line]));
  }

  std::vector<std::string> replacement;
  replacement.push_back(FieldLine(kStatusMarker, status, suffix));
  if (!old_status.empty()) {
    replacement.push_back(FieldLine(kPreviousStatusMarker, old_status, suffix));
  }

  std::vector<std::string> lines;
  lines.reserve(doc->lines.size() + replacement.size());

  bool inserted = false;
  if (!doc->status_line && !doc->heading_line) {
    lines.insert(lines.end(), replacement.begin(), replacement.end());
    inserted = true;
  }

  for (std::size_t i = 0; i < doc->lines.size(); ++i) {
    auto& line = doc->lines[i];

    if (IsStatusLine(line)) {
      if (!inserted) {
        lines.insert(lines.end(), replacement.begin(), replacement.end());
        inserted = true;
      }
      continue;
    }
    if (IsPreviousStatusLine(line)) {
      continue;
    }

    lines.push_back(std::move(line));

    if (!inserted && !doc->status_line && doc->heading_line && *doc->heading_line == i) {
      lines.insert(lines.end(), replacement.begin(), replacement.end());
      inserted = true;
    }
  }

  *doc = FromLines(std::move(lines), doc->trailing_newline);
  return true;
}

std::string MergeStatus(std::string_view body, std::string_view new_status) {
  auto doc = ParseRecord(body);
  if (!MergeStatus(&doc, new_status)) {
    return std::string(body);
  }
  return SerializeRecord(doc);
}

void SetTitle(RecordDocument* doc, std::string_view title) {
  const auto new_title = Trim(title);

  auto lines = std::move(doc->lines);
  if (doc->heading_line) {
    const std::string_view heading = lines[*doc->heading_line];
    const auto             suffix  = std::string(TrailingWhitespace(heading));

    const auto prefix_end = HeadingTitleOffset(heading);
    lines[*doc->heading_line] = std::string(heading.substr(0, prefix_end)) + new_title + suffix;
  } else {
    lines.insert(lines.begin(), std::string(kHeadingMarker) + new_title);
  }

  *doc = FromLines(std::move(lines), doc->trailing_newline);
}

} // namespace adrgen::record
