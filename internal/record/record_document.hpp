#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adrgen::record {

inline constexpr std::string_view kHeadingMarker        = "# ";
inline constexpr std::string_view kHeadingNumberMarker  = "ADR ";
inline constexpr std::string_view kStatusMarker         = "**Status**:";
inline constexpr std::string_view kPreviousStatusMarker = "**Previous Status**:";

/*
  Structured view over a record's markdown.

  The text is kept as its original lines; the structured fields are
  read out of them. Serializing an unmodified document reproduces the
  input byte for byte, including a missing final newline or CRLF endings.
*/
struct RecordDocument {
  std::vector<std::string> lines;
  bool                     trailing_newline = false;

  // First "# " line and the title read from it ("# ADR 001: <title>" or "# <title>").
  std::optional<std::size_t> heading_line;
  std::string                title;

  // First "**Status**:" line. Empty status when absent.
  std::optional<std::size_t> status_line;
  std::string                status;

  std::optional<std::size_t> previous_status_line;
  std::optional<std::string> previous_status;
};

RecordDocument ParseRecord(std::string_view text);

// Rebuilds the field view after the lines were edited.
RecordDocument FromLines(std::vector<std::string> lines, bool trailing_newline);

std::string SerializeRecord(const RecordDocument& doc);

bool IsStatusLine(std::string_view line);
bool IsPreviousStatusLine(std::string_view line);
bool IsHeadingLine(std::string_view line);

/*
  Where the title starts in a heading line: after "# ADR <digits>: " for
  the built-in heading, otherwise right after "# ". Any other ": " is
  part of the title.
*/
std::size_t HeadingTitleOffset(std::string_view line);

// Trailing spaces, tabs and '\r' of a line (markdown hard break, CRLF).
std::string_view TrailingWhitespace(std::string_view line);

std::string Trim(std::string_view s);

} // namespace adrgen::record
