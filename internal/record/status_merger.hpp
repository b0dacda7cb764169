#pragma once

#include <string>
#include <string_view>

#include "internal/record/record_document.hpp"

namespace adrgen::record {

/*
  Status history rewrite.

  Same status as the current one: the document is left untouched.
  Otherwise every "**Status**:" and "**Previous Status**:" line is dropped
  and one status line plus one previous-status line are written where the
  first status line was (after the "# " heading when there was none, else
  at the top). The previous-status line is only written when the old
  status was non-empty. Other lines keep their order and bytes.

  Returns true when the document changed.
*/
bool MergeStatus(RecordDocument* doc, std::string_view new_status);

// Text-in/text-out form of MergeStatus.
std::string MergeStatus(std::string_view body, std::string_view new_status);

/*
  Rewrites the title in the "# " heading, keeping a "# ADR 001: " style
  prefix. A document without heading gets one at the top.
*/
void SetTitle(RecordDocument* doc, std::string_view title);

} // namespace adrgen::record
