#pragma once

#include <string>
#include <string_view>

namespace adrgen::text {

/*
  Title → filename fragment.

  ASCII letters are lowercased; spaces and underscores become hyphens.
  Everything else (punctuation, repeated or edge hyphens, UTF-8 bytes)
  is copied as is, so an already normalized slug maps to itself.
*/
std::string Slugify(std::string_view title);

} // namespace adrgen::text
